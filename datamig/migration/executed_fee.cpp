// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "executed_fee.hpp"

#include <string>

#include <magic_enum.hpp>

#include <datamig/core/types/address.hpp>
#include <datamig/core/types/uint256.hpp>
#include <datamig/infra/common/decoding_exception.hpp>
#include <datamig/infra/common/log.hpp>

namespace datamig::migration {

FeeConversion convert_fee(const db::order_executions::OrderExecution& execution,
                          const db::orders::Order& order,
                          const model::SolverCompetitionDB& competition) {
    FeeConversion conversion{.execution = execution};
    if (order.kind != db::orders::OrderKind::kSell || execution.executed_fee_token != order.sell_token) {
        conversion.status = FeeConversionStatus::kNotApplicable;
        return conversion;
    }
    if (competition.solutions.empty()) {
        conversion.status = FeeConversionStatus::kNoSolution;
        return conversion;
    }

    const auto& clearing_prices{competition.solutions.back().clearing_prices};
    const auto sell_price{clearing_prices.find(order.sell_token)};
    const auto buy_price{clearing_prices.find(order.buy_token)};
    if (sell_price == clearing_prices.end() || buy_price == clearing_prices.end()) {
        conversion.status = FeeConversionStatus::kMissingPrice;
        return conversion;
    }

    const auto fee{decimal_to_u256(execution.executed_fee)};
    if (!fee) {
        conversion.status = FeeConversionStatus::kNonIntegralFee;
        return conversion;
    }
    if (buy_price->second == 0) {
        conversion.status = FeeConversionStatus::kZeroBuyPrice;
        return conversion;
    }

    const auto fee_in_buy_token{mul_div(*fee, sell_price->second, buy_price->second)};
    if (!fee_in_buy_token) {
        conversion.status = FeeConversionStatus::kOverflow;
        return conversion;
    }

    conversion.status = FeeConversionStatus::kConverted;
    conversion.execution.executed_fee = to_decimal(*fee_in_buy_token);
    conversion.execution.executed_fee_token = order.buy_token;
    return conversion;
}

std::optional<AuctionId> ExecutedFeeMigration::start_cursor() {
    return storage_->max_competition_id();
}

std::optional<AuctionId> ExecutedFeeMigration::migrate(AuctionId cursor, int64_t batch_size) {
    const auto competitions{storage_->fetch_competitions(cursor, batch_size)};
    if (competitions.empty()) {
        return std::nullopt;
    }
    DATAMIG_DEBUG_M(name(), {"competitions", std::to_string(competitions.size())}) << "processing batch";

    for (const auto& competition : competitions) {
        if (!competition.json) {
            DATAMIG_WARN_M(name(), {"auction", std::to_string(competition.id)}) << "skipping competition with null json";
            ++skipped_;
            continue;
        }
        try {
            migrate_competition(competition.id, model::decode_solver_competition(*competition.json));
        } catch (const DecodingException& ex) {
            DATAMIG_WARN_M(name(), {"auction", std::to_string(competition.id), "error", ex.what()})
                << "skipping undecodable competition";
            ++skipped_;
        }
    }

    return competitions.back().id;
}

void ExecutedFeeMigration::migrate_competition(AuctionId id, const model::SolverCompetitionDB& competition) {
    const std::string auction_id{std::to_string(id)};

    for (const auto& execution : storage_->fetch_executions(id)) {
        auto order{storage_->fetch_order(execution.order_uid)};
        if (!order) {
            order = storage_->fetch_jit_order(execution.order_uid);
        }
        if (!order) {
            DATAMIG_WARN_M(name(), {"auction", auction_id, "order", execution.order_uid.to_hex()}) << "order not found";
            ++unchanged_;
            continue;
        }

        const auto conversion{convert_fee(execution, *order, competition)};
        switch (conversion.status) {
            case FeeConversionStatus::kConverted:
                if (storage_->update_execution(conversion.execution)) {
                    ++converted_;
                    DATAMIG_TRACE_M(name(), {"auction", auction_id,
                                             "order", execution.order_uid.to_hex(),
                                             "fee", conversion.execution.executed_fee,
                                             "token", address_to_hex(conversion.execution.executed_fee_token)});
                } else {
                    DATAMIG_WARN_M(name(), {"auction", auction_id, "order", execution.order_uid.to_hex()})
                        << "order execution vanished before update";
                    ++unchanged_;
                }
                break;
            case FeeConversionStatus::kNotApplicable:
                ++unchanged_;
                break;
            default:
                ++unchanged_;
                DATAMIG_WARN_M(name(), {"auction", auction_id,
                                        "order", execution.order_uid.to_hex(),
                                        "reason", std::string{magic_enum::enum_name(conversion.status)}})
                    << "executed fee left unchanged";
                break;
        }
    }
}

}  // namespace datamig::migration
