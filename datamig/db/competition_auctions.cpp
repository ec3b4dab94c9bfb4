// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "competition_auctions.hpp"

#include <string>

#include <datamig/db/codec.hpp>

namespace datamig::db::competition_auctions {

static constexpr const char* kInsertQuery{R"(
    INSERT INTO competition_auctions
        (id, block, deadline, order_uids, price_tokens, price_values, surplus_capturing_jit_order_owners)
    VALUES ($1, $2, $3, $4::bytea[], $5::bytea[], $6::numeric[], $7::bytea[]))"};

void save(Transaction& tx, const Auction& auction) {
    tx.query(kInsertQuery, {
                               std::to_string(auction.id),
                               std::to_string(auction.block),
                               std::to_string(auction.deadline),
                               encode_order_uid_array(auction.order_uids),
                               encode_address_array(auction.price_tokens),
                               encode_numeric_array(auction.price_values),
                               encode_address_array(auction.surplus_capturing_jit_order_owners),
                           });
}

}  // namespace datamig::db::competition_auctions
