// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <datamig/db/postgres.hpp>
#include <datamig/infra/common/ensure.hpp>
#include <datamig/migration/executed_fee.hpp>
#include <datamig/migration/historic_auctions.hpp>

namespace datamig::migration {

//! \brief Runs each batch of a migration storage in its own PostgreSQL transaction
template <class Storage>
class PostgresStorage : public Storage {
  public:
    explicit PostgresStorage(db::Postgres& db) : db_{db} {}

    void begin() override {
        tx_ = std::make_unique<db::Transaction>(db_);
    }

    void commit() override {
        ensure(tx_ && tx_->is_active(), "PostgresStorage: no active transaction to commit");
        tx_->commit();
        tx_.reset();
    }

  protected:
    db::Transaction& tx() {
        ensure(tx_ && tx_->is_active(), "PostgresStorage: no active transaction");
        return *tx_;
    }

  private:
    db::Postgres& db_;
    std::unique_ptr<db::Transaction> tx_;
};

class PostgresHistoricAuctionsStorage : public PostgresStorage<HistoricAuctionsStorage> {
  public:
    using PostgresStorage::PostgresStorage;

    std::optional<AuctionId> min_auction_id() override;
    std::vector<db::solver_competitions::RichSolverCompetition> fetch_batch(AuctionId auction_id,
                                                                           int64_t batch_size) override;
    //! \details The insert runs inside a savepoint which is rolled back on failure
    void save(const db::competition_auctions::Auction& auction) override;
};

class PostgresExecutedFeeStorage : public PostgresStorage<ExecutedFeeStorage> {
  public:
    using PostgresStorage::PostgresStorage;

    std::optional<AuctionId> max_competition_id() override;
    std::vector<db::solver_competitions::StoredCompetition> fetch_competitions(AuctionId auction_id,
                                                                              int64_t batch_size) override;
    std::vector<db::order_executions::OrderExecution> fetch_executions(AuctionId auction_id) override;
    std::optional<db::orders::Order> fetch_order(const OrderUid& uid) override;
    std::optional<db::orders::Order> fetch_jit_order(const OrderUid& uid) override;
    bool update_execution(const db::order_executions::OrderExecution& execution) override;
};

}  // namespace datamig::migration
