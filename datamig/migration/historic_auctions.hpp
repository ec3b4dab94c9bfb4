// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>

#include <datamig/db/competition_auctions.hpp>
#include <datamig/db/solver_competitions.hpp>
#include <datamig/migration/data_migration.hpp>
#include <datamig/model/solver_competition.hpp>

namespace datamig::migration {

//! \brief Builds the competition_auctions row of one solver competition
//! \details Price tokens and values follow the address order of the auction prices
//! \throws std::out_of_range if the auction start block does not fit a signed 64-bit integer
db::competition_auctions::Auction make_auction(AuctionId id,
                                               const model::SolverCompetitionDB& competition,
                                               int64_t deadline,
                                               std::vector<evmc::address> surplus_capturing_jit_order_owners);

//! Tables read and written by HistoricAuctionsMigration, within the current batch transaction
class HistoricAuctionsStorage : public BatchStorage {
  public:
    //! \return The lowest id in competition_auctions or std::nullopt if the table is empty
    virtual std::optional<AuctionId> min_auction_id() = 0;

    //! \brief Solver competitions with id < auction_id, highest id first
    virtual std::vector<db::solver_competitions::RichSolverCompetition> fetch_batch(AuctionId auction_id,
                                                                                   int64_t batch_size) = 0;

    //! \brief Inserts one auction, leaving the batch transaction usable when the insert fails
    //! \throws db::Exception if the row cannot be inserted
    virtual void save(const db::competition_auctions::Auction& auction) = 0;
};

//! Backfills competition_auctions from solver_competitions, below the lowest auction already present
class HistoricAuctionsMigration : public DataMigration {
  public:
    HistoricAuctionsMigration(std::unique_ptr<HistoricAuctionsStorage> storage,
                              const Settings& settings,
                              const std::atomic_bool& stop_requested)
        : DataMigration{settings, stop_requested}, storage_{std::move(storage)} {}

    std::string_view name() const override { return "historic-auctions"; }

    size_t saved() const noexcept { return saved_; }
    size_t skipped() const noexcept { return skipped_; }

  protected:
    void begin() override { storage_->begin(); }
    void commit() override { storage_->commit(); }
    std::optional<AuctionId> start_cursor() override;
    std::optional<AuctionId> migrate(AuctionId cursor, int64_t batch_size) override;

  private:
    std::unique_ptr<HistoricAuctionsStorage> storage_;
    size_t saved_{0};
    size_t skipped_{0};
};

}  // namespace datamig::migration
