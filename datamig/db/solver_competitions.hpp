// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <datamig/core/common/base.hpp>
#include <datamig/db/postgres.hpp>

// Read access to solver_competitions and the tables joined to it
namespace datamig::db::solver_competitions {

//! A solver_competitions row joined with its settlement deadline and surplus capturing JIT owners
struct RichSolverCompetition {
    AuctionId id{0};
    std::optional<std::string> json;  // NULL json column
    int64_t deadline{0};              // 0 when no settlement score exists
    std::vector<evmc::address> surplus_capturing_jit_order_owners;
};

struct StoredCompetition {
    AuctionId id{0};
    std::optional<std::string> json;
};

//! \brief Fetches at most batch_size competitions with id < auction_id, from the highest id downward
std::vector<RichSolverCompetition> fetch_batch(Transaction& tx, AuctionId auction_id, int64_t batch_size);

//! \brief Same ordering and bound as fetch_batch, without the joined columns
std::vector<StoredCompetition> fetch_competitions(Transaction& tx, AuctionId auction_id, int64_t batch_size);

//! \return MIN(id) of competition_auctions or std::nullopt if the table is empty
std::optional<AuctionId> min_auction_id(Transaction& tx);

//! \return MAX(id) of solver_competitions or std::nullopt if the table is empty
std::optional<AuctionId> max_competition_id(Transaction& tx);

}  // namespace datamig::db::solver_competitions
