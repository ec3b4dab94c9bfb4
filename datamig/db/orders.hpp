// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include <evmc/evmc.hpp>

#include <datamig/core/types/order_uid.hpp>
#include <datamig/db/postgres.hpp>

namespace datamig::db::orders {

enum class OrderKind {
    kBuy,
    kSell,
};

//! \brief Reads a value of the order_kind PostgreSQL enum, "buy" or "sell"
//! \throws std::invalid_argument for any other text
OrderKind parse_order_kind(std::string_view text);

//! Subset of an orders or jit_orders row needed to convert fees
struct Order {
    evmc::address sell_token;
    evmc::address buy_token;
    OrderKind kind{OrderKind::kSell};

    friend bool operator==(const Order&, const Order&) = default;
};

std::optional<Order> fetch_from_orders(Transaction& tx, const OrderUid& uid);

std::optional<Order> fetch_from_jit_orders(Transaction& tx, const OrderUid& uid);

}  // namespace datamig::db::orders
