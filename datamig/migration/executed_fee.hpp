// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <datamig/db/order_executions.hpp>
#include <datamig/db/orders.hpp>
#include <datamig/db/solver_competitions.hpp>
#include <datamig/migration/data_migration.hpp>
#include <datamig/model/solver_competition.hpp>

namespace datamig::migration {

enum class FeeConversionStatus {
    kConverted,       // fee expressed in the buy token
    kNotApplicable,   // buy order or fee not in the sell token, left untouched
    kNoSolution,      // the competition has no solution to read clearing prices from
    kMissingPrice,    // sell or buy token has no clearing price
    kNonIntegralFee,  // the stored fee is not a non-negative integer
    kZeroBuyPrice,
    kOverflow,        // the converted fee does not fit 256 bits
};

struct FeeConversion {
    FeeConversionStatus status{FeeConversionStatus::kNotApplicable};
    //! The updated row when converted, the input row unchanged otherwise
    db::order_executions::OrderExecution execution;
};

//! \brief Expresses the executed fee of a sell order in its buy token
//! \details fee_in_buy = executed_fee * price(sell) / price(buy), using the clearing prices of the winning (last) solution
FeeConversion convert_fee(const db::order_executions::OrderExecution& execution,
                          const db::orders::Order& order,
                          const model::SolverCompetitionDB& competition);

//! Tables read and written by ExecutedFeeMigration, within the current batch transaction
class ExecutedFeeStorage : public BatchStorage {
  public:
    //! \return The highest id in solver_competitions or std::nullopt if the table is empty
    virtual std::optional<AuctionId> max_competition_id() = 0;

    //! \brief Solver competitions with id < auction_id, highest id first
    virtual std::vector<db::solver_competitions::StoredCompetition> fetch_competitions(AuctionId auction_id,
                                                                                      int64_t batch_size) = 0;

    virtual std::vector<db::order_executions::OrderExecution> fetch_executions(AuctionId auction_id) = 0;

    virtual std::optional<db::orders::Order> fetch_order(const OrderUid& uid) = 0;
    virtual std::optional<db::orders::Order> fetch_jit_order(const OrderUid& uid) = 0;

    //! \return false if no row matched the execution key
    virtual bool update_execution(const db::order_executions::OrderExecution& execution) = 0;
};

//! Rewrites order_execution.executed_fee in the buy token, below the highest solver competition
class ExecutedFeeMigration : public DataMigration {
  public:
    ExecutedFeeMigration(std::unique_ptr<ExecutedFeeStorage> storage,
                         const Settings& settings,
                         const std::atomic_bool& stop_requested)
        : DataMigration{settings, stop_requested}, storage_{std::move(storage)} {}

    std::string_view name() const override { return "executed-fee"; }

    size_t converted() const noexcept { return converted_; }
    //! Order executions left as they are, whatever the reason
    size_t unchanged() const noexcept { return unchanged_; }
    //! Competitions without usable json
    size_t skipped() const noexcept { return skipped_; }

  protected:
    void begin() override { storage_->begin(); }
    void commit() override { storage_->commit(); }
    std::optional<AuctionId> start_cursor() override;
    std::optional<AuctionId> migrate(AuctionId cursor, int64_t batch_size) override;

  private:
    void migrate_competition(AuctionId id, const model::SolverCompetitionDB& competition);

    std::unique_ptr<ExecutedFeeStorage> storage_;
    size_t converted_{0};
    size_t unchanged_{0};
    size_t skipped_{0};
};

}  // namespace datamig::migration
