// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "solver_competition.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <datamig/core/types/address.hpp>
#include <datamig/core/types/uint256.hpp>
#include <datamig/infra/common/decoding_exception.hpp>

namespace datamig::model {

static constexpr std::array kScoreKinds{
    Score::Kind::kSolver,
    Score::Kind::kProtocol,
    Score::Kind::kProtocolWithSolverRisk,
    Score::Kind::kDiscounted,
};

std::string_view Score::json_key(Kind kind) noexcept {
    switch (kind) {
        case Kind::kSolver:
            return "score";
        case Kind::kProtocol:
            return "scoreProtocol";
        case Kind::kProtocolWithSolverRisk:
            return "scoreProtocolWithSolverRisk";
        case Kind::kDiscounted:
            return "scoreDiscounted";
    }
    return "scoreProtocol";
}

const OrderUid& order_id(const SettledOrder& order) noexcept {
    return std::visit([](const auto& o) -> const OrderUid& { return o.id; }, order);
}

static evmc::address address_from_hex(const std::string& hex) {
    const auto address{hex_to_address(hex)};
    if (!address) {
        throw std::invalid_argument{"invalid address: " + hex};
    }
    return *address;
}

static evmc::address address_from_json(const nlohmann::json& json) {
    return address_from_hex(json.get<std::string>());
}

static intx::uint256 u256_from_json(const nlohmann::json& json) {
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    const auto text{json.get<std::string>()};
    const auto value{parse_hex_or_decimal(text)};
    if (!value) {
        throw std::invalid_argument{"invalid U256 amount: " + text};
    }
    return *value;
}

static uint64_t uint64_from_json(const nlohmann::json& json) {
    if (!json.is_number_unsigned()) {
        throw std::invalid_argument{"expected unsigned integer, got: " + json.dump()};
    }
    return json.get<uint64_t>();
}

static nlohmann::json prices_to_json(const Prices& prices) {
    auto json = nlohmann::json::object();
    for (const auto& [token, price] : prices) {
        json[address_to_hex(token)] = to_decimal(price);
    }
    return json;
}

static Prices prices_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument{"prices must be an object"};
    }
    Prices prices;
    for (const auto& item : json.items()) {
        prices.emplace(address_from_hex(item.key()), u256_from_json(item.value()));
    }
    return prices;
}

void to_json(nlohmann::json& json, const CompetitionAuction& auction) {
    json["orders"] = nlohmann::json::array();
    for (const auto& uid : auction.orders) {
        json["orders"].push_back(uid.to_hex());
    }
    json["prices"] = prices_to_json(auction.prices);
}

void from_json(const nlohmann::json& json, CompetitionAuction& auction) {
    auction.orders.clear();
    for (const auto& uid : json.at("orders")) {
        auction.orders.push_back(OrderUid::from_hex(uid.get<std::string>()));
    }
    auction.prices = prices_from_json(json.at("prices"));
}

void to_json(nlohmann::json& json, const SettledOrder& order) {
    if (const auto* colocated = std::get_if<ColocatedOrder>(&order)) {
        json["id"] = colocated->id.to_hex();
        json["sellAmount"] = to_decimal(colocated->sell_amount);
        json["buyAmount"] = to_decimal(colocated->buy_amount);
    } else {
        const auto& legacy = std::get<LegacyOrder>(order);
        json["id"] = legacy.id.to_hex();
        json["executedAmount"] = to_decimal(legacy.executed_amount);
    }
}

void from_json(const nlohmann::json& json, SettledOrder& order) {
    const auto id{OrderUid::from_hex(json.at("id").get<std::string>())};
    if (json.contains("sellAmount") && json.contains("buyAmount")) {
        order = ColocatedOrder{id, u256_from_json(json["sellAmount"]), u256_from_json(json["buyAmount"])};
    } else if (json.contains("executedAmount")) {
        order = LegacyOrder{id, u256_from_json(json["executedAmount"])};
    } else {
        throw std::invalid_argument{"order " + id.to_hex() + " matches neither colocated nor legacy layout"};
    }
}

void to_json(nlohmann::json& json, const SolverSettlement& settlement) {
    json["solver"] = settlement.solver;
    json["solverAddress"] = address_to_hex(settlement.solver_address);
    if (settlement.score) {
        json[std::string{Score::json_key(settlement.score->kind)}] = to_decimal(settlement.score->value);
    }
    json["ranking"] = settlement.ranking;
    json["clearingPrices"] = prices_to_json(settlement.clearing_prices);
    json["orders"] = settlement.orders;
}

void from_json(const nlohmann::json& json, SolverSettlement& settlement) {
    settlement.solver = json.at("solver").get<std::string>();
    settlement.solver_address = json.contains("solverAddress") ? address_from_json(json["solverAddress"]) : evmc::address{};

    settlement.score.reset();
    for (const auto kind : kScoreKinds) {
        const auto key{std::string{Score::json_key(kind)}};
        if (!json.contains(key)) continue;
        if (settlement.score) {
            throw std::invalid_argument{"settlement of " + settlement.solver + " has more than one score"};
        }
        settlement.score = Score{kind, u256_from_json(json[key])};
    }

    settlement.ranking = json.contains("ranking") ? uint64_from_json(json["ranking"]) : 0;
    settlement.clearing_prices = prices_from_json(json.at("clearingPrices"));
    settlement.orders = json.at("orders").get<std::vector<SettledOrder>>();
}

void to_json(nlohmann::json& json, const SolverCompetitionDB& competition) {
    json["auctionStartBlock"] = competition.auction_start_block;
    json["competitionSimulationBlock"] = competition.competition_simulation_block;
    json["auction"] = competition.auction;
    json["solutions"] = competition.solutions;
}

void from_json(const nlohmann::json& json, SolverCompetitionDB& competition) {
    competition.auction_start_block = uint64_from_json(json.at("auctionStartBlock"));
    competition.competition_simulation_block = uint64_from_json(json.at("competitionSimulationBlock"));
    competition.auction = json.at("auction").get<CompetitionAuction>();
    competition.solutions = json.at("solutions").get<std::vector<SolverSettlement>>();
}

SolverCompetitionDB decode_solver_competition(std::string_view json_text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& pe) {
        throw DecodingException{DecodingError::kMalformedJson, pe.what()};
    }
    if (json.is_null()) {
        throw DecodingException{DecodingError::kNullDocument};
    }
    try {
        return json.get<SolverCompetitionDB>();
    } catch (const nlohmann::json::exception& je) {
        throw DecodingException{DecodingError::kInvalidField, je.what()};
    } catch (const std::invalid_argument& ia) {
        throw DecodingException{DecodingError::kInvalidField, ia.what()};
    }
}

}  // namespace datamig::model
