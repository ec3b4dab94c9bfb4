// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "postgres_storage.hpp"

namespace datamig::migration {

std::optional<AuctionId> PostgresHistoricAuctionsStorage::min_auction_id() {
    return db::solver_competitions::min_auction_id(tx());
}

std::vector<db::solver_competitions::RichSolverCompetition> PostgresHistoricAuctionsStorage::fetch_batch(
    AuctionId auction_id, int64_t batch_size) {
    return db::solver_competitions::fetch_batch(tx(), auction_id, batch_size);
}

void PostgresHistoricAuctionsStorage::save(const db::competition_auctions::Auction& auction) {
    db::Savepoint savepoint{tx(), "save_auction"};
    db::competition_auctions::save(tx(), auction);
    savepoint.release();
}

std::optional<AuctionId> PostgresExecutedFeeStorage::max_competition_id() {
    return db::solver_competitions::max_competition_id(tx());
}

std::vector<db::solver_competitions::StoredCompetition> PostgresExecutedFeeStorage::fetch_competitions(
    AuctionId auction_id, int64_t batch_size) {
    return db::solver_competitions::fetch_competitions(tx(), auction_id, batch_size);
}

std::vector<db::order_executions::OrderExecution> PostgresExecutedFeeStorage::fetch_executions(AuctionId auction_id) {
    return db::order_executions::fetch(tx(), auction_id);
}

std::optional<db::orders::Order> PostgresExecutedFeeStorage::fetch_order(const OrderUid& uid) {
    return db::orders::fetch_from_orders(tx(), uid);
}

std::optional<db::orders::Order> PostgresExecutedFeeStorage::fetch_jit_order(const OrderUid& uid) {
    return db::orders::fetch_from_jit_orders(tx(), uid);
}

bool PostgresExecutedFeeStorage::update_execution(const db::order_executions::OrderExecution& execution) {
    return db::order_executions::update(tx(), execution);
}

}  // namespace datamig::migration
