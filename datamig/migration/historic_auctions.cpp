// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "historic_auctions.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <datamig/infra/common/decoding_exception.hpp>
#include <datamig/infra/common/log.hpp>

namespace datamig::migration {

db::competition_auctions::Auction make_auction(AuctionId id,
                                               const model::SolverCompetitionDB& competition,
                                               int64_t deadline,
                                               std::vector<evmc::address> surplus_capturing_jit_order_owners) {
    if (competition.auction_start_block > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range{"auction start block overflow: " + std::to_string(competition.auction_start_block)};
    }

    db::competition_auctions::Auction auction{
        .id = id,
        .block = static_cast<int64_t>(competition.auction_start_block),
        .deadline = deadline,
        .order_uids = competition.auction.orders,
        .surplus_capturing_jit_order_owners = std::move(surplus_capturing_jit_order_owners),
    };
    auction.price_tokens.reserve(competition.auction.prices.size());
    auction.price_values.reserve(competition.auction.prices.size());
    for (const auto& [token, price] : competition.auction.prices) {
        auction.price_tokens.push_back(token);
        auction.price_values.push_back(price);
    }
    return auction;
}

std::optional<AuctionId> HistoricAuctionsMigration::start_cursor() {
    return storage_->min_auction_id();
}

std::optional<AuctionId> HistoricAuctionsMigration::migrate(AuctionId cursor, int64_t batch_size) {
    auto competitions{storage_->fetch_batch(cursor, batch_size)};
    if (competitions.empty()) {
        return std::nullopt;
    }
    DATAMIG_DEBUG_M(name(), {"competitions", std::to_string(competitions.size())}) << "processing batch";

    for (auto& competition : competitions) {
        const std::string auction_id{std::to_string(competition.id)};
        if (!competition.json) {
            DATAMIG_WARN_M(name(), {"auction", auction_id}) << "skipping competition with null json";
            ++skipped_;
            continue;
        }

        db::competition_auctions::Auction auction;
        try {
            const auto decoded{model::decode_solver_competition(*competition.json)};
            auction = make_auction(competition.id, decoded, competition.deadline,
                                   std::move(competition.surplus_capturing_jit_order_owners));
        } catch (const DecodingException& ex) {
            DATAMIG_WARN_M(name(), {"auction", auction_id, "error", ex.what()}) << "skipping undecodable competition";
            ++skipped_;
            continue;
        } catch (const std::out_of_range& ex) {
            DATAMIG_WARN_M(name(), {"auction", auction_id, "error", ex.what()}) << "skipping invalid competition";
            ++skipped_;
            continue;
        }

        try {
            storage_->save(auction);
            ++saved_;
        } catch (const db::Exception& ex) {
            DATAMIG_ERROR_M(name(), {"auction", auction_id, "sql_state", ex.sql_state(), "error", ex.what()})
                << "failed to save auction";
            ++skipped_;
        }
    }

    return competitions.back().id;
}

}  // namespace datamig::migration
