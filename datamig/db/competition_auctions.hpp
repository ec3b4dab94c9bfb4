// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <datamig/core/common/base.hpp>
#include <datamig/core/types/order_uid.hpp>
#include <datamig/db/postgres.hpp>

namespace datamig::db::competition_auctions {

//! A competition_auctions row
struct Auction {
    AuctionId id{0};
    int64_t block{0};
    int64_t deadline{0};
    std::vector<OrderUid> order_uids;
    //! External native prices, price_tokens[i] is priced price_values[i]
    std::vector<evmc::address> price_tokens;
    std::vector<intx::uint256> price_values;
    std::vector<evmc::address> surplus_capturing_jit_order_owners;

    friend bool operator==(const Auction&, const Auction&) = default;
};

//! \throws Exception if the insert fails, e.g. when the auction already exists
void save(Transaction& tx, const Auction& auction);

}  // namespace datamig::db::competition_auctions
