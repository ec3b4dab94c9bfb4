// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "executed_fee.hpp"

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <datamig/core/types/uint256.hpp>
#include <datamig/infra/test_util/log.hpp>
#include <datamig/migration/test_util/mock_storage.hpp>

namespace datamig::migration {

using namespace evmc::literals;
using db::orders::OrderKind;

TEST_CASE("convert_fee", "[migration][executed_fee]") {
    const auto usdc{0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48_address};
    const auto weth{0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2_address};
    const auto cow{0xdef1ca1fb7fbcdc777520aa7f396b4e015f497ab_address};

    OrderUid uid;
    uid.bytes.fill(0xab);
    const db::order_executions::OrderExecution execution{
        .order_uid = uid,
        .auction_id = 9000,
        .executed_fee = "2000000",  // 2 USDC
        .executed_fee_token = usdc,
    };
    const db::orders::Order sell_order{.sell_token = usdc, .buy_token = weth, .kind = OrderKind::kSell};

    model::SolverCompetitionDB competition;
    model::SolverSettlement losing;
    losing.clearing_prices = {{usdc, 1}, {weth, 1}};
    model::SolverSettlement winning;
    // 1 WETH = 2000 USDC
    winning.clearing_prices = {{usdc, intx::uint256{1000000000000000000}}, {weth, intx::uint256{2000000000}}};
    competition.solutions = {losing, winning};

    SECTION("sell order with fee in sell token uses the winning solution") {
        const auto conversion{convert_fee(execution, sell_order, competition)};
        CHECK(conversion.status == FeeConversionStatus::kConverted);
        // 2000000 * 1e18 / 2e9 = 1e15 wei, i.e. 0.001 WETH
        CHECK(conversion.execution.executed_fee == "1000000000000000");
        CHECK(conversion.execution.executed_fee_token == weth);
        CHECK(conversion.execution.order_uid == uid);
        CHECK(conversion.execution.auction_id == 9000);
    }

    SECTION("integral numeric text with zero scale is accepted") {
        auto stored{execution};
        stored.executed_fee = "2000000.000";
        CHECK(convert_fee(stored, sell_order, competition).status == FeeConversionStatus::kConverted);
    }

    SECTION("result is rounded down") {
        auto stored{execution};
        stored.executed_fee = "3";
        competition.solutions.back().clearing_prices = {{usdc, 1}, {weth, 2}};
        const auto conversion{convert_fee(stored, sell_order, competition)};
        CHECK(conversion.status == FeeConversionStatus::kConverted);
        CHECK(conversion.execution.executed_fee == "1");
    }

    SECTION("buy orders are untouched") {
        const db::orders::Order buy_order{.sell_token = usdc, .buy_token = weth, .kind = OrderKind::kBuy};
        const auto conversion{convert_fee(execution, buy_order, competition)};
        CHECK(conversion.status == FeeConversionStatus::kNotApplicable);
        CHECK(conversion.execution.executed_fee == execution.executed_fee);
        CHECK(conversion.execution.executed_fee_token == usdc);
    }

    SECTION("fee in another token is untouched") {
        auto stored{execution};
        stored.executed_fee_token = cow;
        CHECK(convert_fee(stored, sell_order, competition).status == FeeConversionStatus::kNotApplicable);
    }

    SECTION("no solution") {
        competition.solutions.clear();
        CHECK(convert_fee(execution, sell_order, competition).status == FeeConversionStatus::kNoSolution);
    }

    SECTION("missing price") {
        competition.solutions.back().clearing_prices.erase(weth);
        CHECK(convert_fee(execution, sell_order, competition).status == FeeConversionStatus::kMissingPrice);

        competition.solutions.back().clearing_prices = {{weth, 1}};
        CHECK(convert_fee(execution, sell_order, competition).status == FeeConversionStatus::kMissingPrice);
    }

    SECTION("non integral fee") {
        for (const auto* fee : {"1.5", "-1", "NaN", ""}) {
            auto stored{execution};
            stored.executed_fee = fee;
            const auto conversion{convert_fee(stored, sell_order, competition)};
            CHECK(conversion.status == FeeConversionStatus::kNonIntegralFee);
            CHECK(conversion.execution.executed_fee == fee);
        }
    }

    SECTION("zero buy price") {
        competition.solutions.back().clearing_prices[weth] = 0;
        CHECK(convert_fee(execution, sell_order, competition).status == FeeConversionStatus::kZeroBuyPrice);
    }

    SECTION("overflow") {
        auto stored{execution};
        stored.executed_fee = to_decimal(std::numeric_limits<intx::uint256>::max());
        competition.solutions.back().clearing_prices = {{usdc, 2}, {weth, 1}};
        CHECK(convert_fee(stored, sell_order, competition).status == FeeConversionStatus::kOverflow);
    }
}

static OrderUid uid_filled_with(uint8_t value) {
    OrderUid uid;
    uid.bytes.fill(value);
    return uid;
}

TEST_CASE("ExecutedFeeMigration", "[migration][executed_fee]") {
    using testing::_;
    using testing::Invoke;
    using testing::Return;

    const auto usdc{0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48_address};
    const auto weth{0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2_address};
    // 1 WETH = 2000 USDC
    const std::string competition_json{R"({
        "auctionStartBlock": 1,
        "competitionSimulationBlock": 1,
        "auction": {"orders": [], "prices": {}},
        "solutions": [{
            "solver": "winner",
            "clearingPrices": {
                "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48": "1000000000000000000",
                "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2": "2000000000"
            },
            "orders": []
        }]
    })"};

    const auto in_orders{uid_filled_with(0x01)};
    const auto in_jit_orders{uid_filled_with(0x02)};
    const auto in_neither{uid_filled_with(0x03)};
    const auto buy_order{uid_filled_with(0x04)};
    const auto execution_of = [&](const OrderUid& uid) {
        return db::order_executions::OrderExecution{
            .order_uid = uid, .auction_id = 47, .executed_fee = "2000000", .executed_fee_token = usdc};
    };
    const db::orders::Order sell{.sell_token = usdc, .buy_token = weth, .kind = OrderKind::kSell};
    const db::orders::Order buy{.sell_token = usdc, .buy_token = weth, .kind = OrderKind::kBuy};

    datamig::test_util::LogCapture log_capture{log::Level::kWarning};
    std::atomic_bool stop_requested{false};
    const Settings settings{.batch_size = 10, .batch_delay = std::chrono::milliseconds{0}};

    auto storage{std::make_unique<testing::NiceMock<test_util::MockExecutedFeeStorage>>()};
    auto& mock{*storage};
    ExecutedFeeMigration migration{std::move(storage), settings, stop_requested};

    ON_CALL(mock, max_competition_id()).WillByDefault(Return(AuctionId{50}));
    ON_CALL(mock, fetch_competitions(50, 10))
        .WillByDefault(Return(std::vector<db::solver_competitions::StoredCompetition>{
            {.id = 49, .json = std::nullopt},
            {.id = 48, .json = "not json"},
            {.id = 47, .json = competition_json},
        }));
    ON_CALL(mock, fetch_competitions(47, 10)).WillByDefault(Return(std::vector<db::solver_competitions::StoredCompetition>{}));

    std::vector<AuctionId> fetched_executions;
    ON_CALL(mock, fetch_executions(_)).WillByDefault(Invoke([&](AuctionId auction_id) {
        fetched_executions.push_back(auction_id);
        return std::vector<db::order_executions::OrderExecution>{
            execution_of(in_orders), execution_of(in_jit_orders), execution_of(in_neither), execution_of(buy_order)};
    }));
    ON_CALL(mock, fetch_order(in_orders)).WillByDefault(Return(sell));
    ON_CALL(mock, fetch_order(buy_order)).WillByDefault(Return(buy));

    std::vector<OrderUid> jit_lookups;
    ON_CALL(mock, fetch_jit_order(_)).WillByDefault(Invoke([&](const OrderUid& uid) -> std::optional<db::orders::Order> {
        jit_lookups.push_back(uid);
        if (uid == in_jit_orders) return sell;
        return std::nullopt;
    }));

    // the jit order execution disappears before being rewritten
    std::vector<db::order_executions::OrderExecution> updates;
    ON_CALL(mock, update_execution(_)).WillByDefault(Invoke([&](const db::order_executions::OrderExecution& update) {
        updates.push_back(update);
        return update.order_uid == in_orders;
    }));

    EXPECT_CALL(mock, begin()).Times(2);
    EXPECT_CALL(mock, commit()).Times(2);

    const auto result{migration.run()};
    CHECK(result.status == MigrationStatus::kCompleted);
    CHECK(result.batches == 1);

    SECTION("competitions without usable json are skipped") {
        CHECK(migration.skipped() == 2);
        CHECK(fetched_executions == std::vector<AuctionId>{47});
    }

    SECTION("jit_orders is only looked up for orders missing from orders") {
        CHECK(jit_lookups == std::vector<OrderUid>{in_jit_orders, in_neither});
    }

    SECTION("fees are rewritten in the buy token") {
        REQUIRE(updates.size() == 2);
        CHECK(updates[0].order_uid == in_orders);
        CHECK(updates[0].executed_fee == "1000000000000000");
        CHECK(updates[0].executed_fee_token == weth);
        CHECK(updates[1].order_uid == in_jit_orders);
    }

    SECTION("missing orders, vanished rows and buy orders stay unchanged") {
        CHECK(migration.converted() == 1);
        CHECK(migration.unchanged() == 3);
        const auto log{log_capture.err()};
        CHECK(log.find("order not found") != std::string::npos);
        CHECK(log.find("order execution vanished before update") != std::string::npos);
    }

    CHECK(testing::Mock::VerifyAndClearExpectations(&mock));
}

}  // namespace datamig::migration
