// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <datamig/core/types/order_uid.hpp>

namespace datamig::model {

//! Token prices keyed by token address, kept in address order
using Prices = std::map<evmc::address, intx::uint256>;

struct CompetitionAuction {
    std::vector<OrderUid> orders;
    Prices prices;

    friend bool operator==(const CompetitionAuction&, const CompetitionAuction&) = default;
};

//! Score of a solution, stored flattened into the settlement object under a kind-specific key
struct Score {
    enum class Kind {
        kSolver,                  // provided by the solver
        kProtocol,                // computed by the protocol (objective value)
        kProtocolWithSolverRisk,  // computed by the protocol, weighted by solver success probability
        kDiscounted,              // deprecated, still accepted when decoding
    };

    Kind kind{Kind::kProtocol};
    intx::uint256 value{0};

    static std::string_view json_key(Kind kind) noexcept;

    friend bool operator==(const Score&, const Score&) = default;
};

struct ColocatedOrder {
    OrderUid id;
    //! The effective amount that left the user's wallet including all fees
    intx::uint256 sell_amount{0};
    //! The effective amount the user received after all fees
    intx::uint256 buy_amount{0};

    friend bool operator==(const ColocatedOrder&, const ColocatedOrder&) = default;
};

struct LegacyOrder {
    OrderUid id;
    intx::uint256 executed_amount{0};

    friend bool operator==(const LegacyOrder&, const LegacyOrder&) = default;
};

using SettledOrder = std::variant<ColocatedOrder, LegacyOrder>;

const OrderUid& order_id(const SettledOrder& order) noexcept;

struct SolverSettlement {
    std::string solver;
    evmc::address solver_address;
    std::optional<Score> score;
    size_t ranking{0};
    Prices clearing_prices;
    std::vector<SettledOrder> orders;

    friend bool operator==(const SolverSettlement&, const SolverSettlement&) = default;
};

//! The document stored per auction in solver_competitions.json
struct SolverCompetitionDB {
    uint64_t auction_start_block{0};
    uint64_t competition_simulation_block{0};
    CompetitionAuction auction;
    std::vector<SolverSettlement> solutions;

    friend bool operator==(const SolverCompetitionDB&, const SolverCompetitionDB&) = default;
};

void to_json(nlohmann::json& json, const CompetitionAuction& auction);
void from_json(const nlohmann::json& json, CompetitionAuction& auction);

void to_json(nlohmann::json& json, const SettledOrder& order);
void from_json(const nlohmann::json& json, SettledOrder& order);

void to_json(nlohmann::json& json, const SolverSettlement& settlement);
void from_json(const nlohmann::json& json, SolverSettlement& settlement);

void to_json(nlohmann::json& json, const SolverCompetitionDB& competition);
void from_json(const nlohmann::json& json, SolverCompetitionDB& competition);

//! \brief Decodes the text of a solver_competitions.json column
//! \throws DecodingException when the document is null, malformed or misses/garbles a required field
SolverCompetitionDB decode_solver_competition(std::string_view json_text);

}  // namespace datamig::model
