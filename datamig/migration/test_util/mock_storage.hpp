// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <gmock/gmock.h>

#include <datamig/migration/executed_fee.hpp>
#include <datamig/migration/historic_auctions.hpp>

namespace datamig::migration::test_util {

class MockHistoricAuctionsStorage : public HistoricAuctionsStorage {
  public:
    MOCK_METHOD(void, begin, (), (override));
    MOCK_METHOD(void, commit, (), (override));
    MOCK_METHOD((std::optional<AuctionId>), min_auction_id, (), (override));
    MOCK_METHOD((std::vector<db::solver_competitions::RichSolverCompetition>), fetch_batch, (AuctionId, int64_t),
                (override));
    MOCK_METHOD(void, save, (const db::competition_auctions::Auction&), (override));
};

class MockExecutedFeeStorage : public ExecutedFeeStorage {
  public:
    MOCK_METHOD(void, begin, (), (override));
    MOCK_METHOD(void, commit, (), (override));
    MOCK_METHOD((std::optional<AuctionId>), max_competition_id, (), (override));
    MOCK_METHOD((std::vector<db::solver_competitions::StoredCompetition>), fetch_competitions, (AuctionId, int64_t),
                (override));
    MOCK_METHOD((std::vector<db::order_executions::OrderExecution>), fetch_executions, (AuctionId), (override));
    MOCK_METHOD((std::optional<db::orders::Order>), fetch_order, (const OrderUid&), (override));
    MOCK_METHOD((std::optional<db::orders::Order>), fetch_jit_order, (const OrderUid&), (override));
    MOCK_METHOD(bool, update_execution, (const db::order_executions::OrderExecution&), (override));
};

}  // namespace datamig::migration::test_util
