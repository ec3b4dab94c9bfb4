// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "historic_auctions.hpp"

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <datamig/infra/test_util/log.hpp>
#include <datamig/migration/test_util/mock_storage.hpp>

namespace datamig::migration {

using namespace evmc::literals;

static OrderUid uid_filled_with(uint8_t value) {
    OrderUid uid;
    uid.bytes.fill(value);
    return uid;
}

TEST_CASE("make_auction", "[migration][historic_auctions]") {
    const auto weth{0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2_address};
    const auto dai{0x6b175474e89094c44da98b954eedeac495271d0f_address};
    const auto owner{0x9008d19f58aabd9ed0d60971565aa8510560ab41_address};

    model::SolverCompetitionDB competition;
    competition.auction_start_block = 20'000'000;
    competition.auction.orders = {uid_filled_with(0x01), uid_filled_with(0x02)};
    competition.auction.prices = {{weth, intx::uint256{1000000000000000000}}, {dai, 400000000000000}};

    SECTION("copies auction data") {
        const auto auction{make_auction(42, competition, 20'000'005, {owner})};
        CHECK(auction.id == 42);
        CHECK(auction.block == 20'000'000);
        CHECK(auction.deadline == 20'000'005);
        CHECK(auction.order_uids == competition.auction.orders);
        CHECK(auction.surplus_capturing_jit_order_owners == std::vector<evmc::address>{owner});
    }

    SECTION("prices are split in address order") {
        const auto auction{make_auction(42, competition, 0, {})};
        REQUIRE(auction.price_tokens.size() == 2);
        CHECK(auction.price_tokens[0] == dai);
        CHECK(auction.price_tokens[1] == weth);
        CHECK(auction.price_values == std::vector<intx::uint256>{400000000000000, intx::uint256{1000000000000000000}});
    }

    SECTION("empty auction") {
        const auto auction{make_auction(1, model::SolverCompetitionDB{}, 0, {})};
        CHECK(auction.block == 0);
        CHECK(auction.order_uids.empty());
        CHECK(auction.price_tokens.empty());
        CHECK(auction.price_values.empty());
    }

    SECTION("block must fit int64") {
        competition.auction_start_block = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        CHECK(make_auction(1, competition, 0, {}).block == std::numeric_limits<int64_t>::max());

        competition.auction_start_block += 1;
        CHECK_THROWS_AS(make_auction(1, competition, 0, {}), std::out_of_range);
    }
}

static std::string competition_json(const std::string& start_block) {
    return R"({
        "auctionStartBlock": )" + start_block + R"(,
        "competitionSimulationBlock": 0,
        "auction": {"orders": [], "prices": {"0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2": "1000"}},
        "solutions": []
    })";
}

static db::solver_competitions::RichSolverCompetition stored_competition(AuctionId id,
                                                                         std::optional<std::string> json) {
    return {.id = id, .json = std::move(json), .deadline = id + 5, .surplus_capturing_jit_order_owners = {}};
}

TEST_CASE("HistoricAuctionsMigration", "[migration][historic_auctions]") {
    using testing::_;
    using testing::Invoke;
    using testing::Return;

    datamig::test_util::LogCapture log_capture{log::Level::kWarning};
    std::atomic_bool stop_requested{false};
    const Settings settings{.batch_size = 10, .batch_delay = std::chrono::milliseconds{0}};

    auto storage{std::make_unique<testing::NiceMock<test_util::MockHistoricAuctionsStorage>>()};
    auto& mock{*storage};
    HistoricAuctionsMigration migration{std::move(storage), settings, stop_requested};

    SECTION("empty competition_auctions") {
        EXPECT_CALL(mock, begin()).Times(1);
        EXPECT_CALL(mock, commit()).Times(1);
        EXPECT_CALL(mock, min_auction_id()).WillOnce(Return(std::nullopt));
        EXPECT_CALL(mock, fetch_batch(_, _)).Times(0);

        CHECK(migration.run().status == MigrationStatus::kNothingToMigrate);
        CHECK(testing::Mock::VerifyAndClearExpectations(&mock));
    }

    SECTION("rows that cannot be migrated are skipped and the batch goes on") {
        EXPECT_CALL(mock, begin()).Times(2);
        EXPECT_CALL(mock, commit()).Times(2);
        ON_CALL(mock, min_auction_id()).WillByDefault(Return(AuctionId{100}));
        ON_CALL(mock, fetch_batch(100, 10))
            .WillByDefault(Return(std::vector<db::solver_competitions::RichSolverCompetition>{
                stored_competition(99, competition_json("19000000")),
                stored_competition(98, std::nullopt),
                stored_competition(97, "{\"auctionStartBlock\": "),
                stored_competition(96, competition_json("19000003")),
                stored_competition(95, competition_json("19000004")),
                stored_competition(94, competition_json("18446744073709551615")),
            }));
        ON_CALL(mock, fetch_batch(94, 10)).WillByDefault(Return(std::vector<db::solver_competitions::RichSolverCompetition>{}));

        std::vector<db::competition_auctions::Auction> saved;
        ON_CALL(mock, save(_)).WillByDefault(Invoke([&saved](const db::competition_auctions::Auction& auction) {
            if (auction.id == 96) {
                throw db::Exception{"duplicate key value violates unique constraint", "23505"};
            }
            saved.push_back(auction);
        }));

        const auto result{migration.run()};
        CHECK(result.status == MigrationStatus::kCompleted);
        CHECK(result.batches == 1);
        CHECK(migration.saved() == 2);
        CHECK(migration.skipped() == 4);

        REQUIRE(saved.size() == 2);
        CHECK(saved[0].id == 99);
        CHECK(saved[0].block == 19'000'000);
        CHECK(saved[0].deadline == 104);
        CHECK(saved[0].price_values == std::vector<intx::uint256>{1000});
        CHECK(saved[1].id == 95);

        const auto log{log_capture.err()};
        CHECK(log.find("skipping competition with null json") != std::string::npos);
        CHECK(log.find("skipping undecodable competition") != std::string::npos);
        CHECK(log.find("skipping invalid competition") != std::string::npos);
        CHECK(log.find("sql_state=23505") != std::string::npos);
        CHECK(testing::Mock::VerifyAndClearExpectations(&mock));
    }
}

}  // namespace datamig::migration
