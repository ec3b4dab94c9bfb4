// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "solver_competitions.hpp"

#include <datamig/db/codec.hpp>

namespace datamig::db::solver_competitions {

static constexpr const char* kFetchBatchQuery{R"(
    SELECT
        sc.id AS id,
        sc.json AS json,
        COALESCE(ss.block_deadline, 0) AS deadline,
        COALESCE(jit.owners, ARRAY[]::bytea[]) AS surplus_capturing_jit_order_owners
    FROM solver_competitions sc
    LEFT JOIN settlement_scores ss ON sc.id = ss.auction_id
    LEFT JOIN surplus_capturing_jit_order_owners jit ON sc.id = jit.auction_id
    WHERE sc.id < $1
    ORDER BY sc.id DESC
    LIMIT $2)"};

static constexpr const char* kFetchCompetitionsQuery{R"(
    SELECT id, json
    FROM solver_competitions
    WHERE id < $1
    ORDER BY id DESC
    LIMIT $2)"};

static std::optional<std::string> json_column(const Result& result, size_t row, size_t column) {
    const auto value{result.optional_value(row, column)};
    if (!value) return std::nullopt;
    return std::string{*value};
}

std::vector<RichSolverCompetition> fetch_batch(Transaction& tx, AuctionId auction_id, int64_t batch_size) {
    const auto result{tx.query(kFetchBatchQuery, {std::to_string(auction_id), std::to_string(batch_size)})};

    std::vector<RichSolverCompetition> competitions;
    competitions.reserve(result.rows());
    for (size_t row{0}; row < result.rows(); ++row) {
        competitions.push_back(RichSolverCompetition{
            .id = result.int64_value(row, 0),
            .json = json_column(result, row, 1),
            .deadline = result.int64_value(row, 2),
            .surplus_capturing_jit_order_owners = decode_address_array(result.value(row, 3)),
        });
    }
    return competitions;
}

std::vector<StoredCompetition> fetch_competitions(Transaction& tx, AuctionId auction_id, int64_t batch_size) {
    const auto result{tx.query(kFetchCompetitionsQuery, {std::to_string(auction_id), std::to_string(batch_size)})};

    std::vector<StoredCompetition> competitions;
    competitions.reserve(result.rows());
    for (size_t row{0}; row < result.rows(); ++row) {
        competitions.push_back(StoredCompetition{
            .id = result.int64_value(row, 0),
            .json = json_column(result, row, 1),
        });
    }
    return competitions;
}

std::optional<AuctionId> min_auction_id(Transaction& tx) {
    const auto result{tx.query("SELECT MIN(id) FROM competition_auctions")};
    return result.optional_int64_value(0, 0);
}

std::optional<AuctionId> max_competition_id(Transaction& tx) {
    const auto result{tx.query("SELECT MAX(id) FROM solver_competitions")};
    return result.optional_int64_value(0, 0);
}

}  // namespace datamig::db::solver_competitions
