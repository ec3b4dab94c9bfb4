// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "orders.hpp"

#include <stdexcept>
#include <string>

#include <datamig/db/codec.hpp>

namespace datamig::db::orders {

OrderKind parse_order_kind(std::string_view text) {
    if (text == "buy") return OrderKind::kBuy;
    if (text == "sell") return OrderKind::kSell;
    throw std::invalid_argument{"unknown order kind: " + std::string{text}};
}

static std::optional<Order> fetch_order(Transaction& tx, const std::string& sql, const OrderUid& uid) {
    const auto result{tx.query(sql, {encode_bytea(uid.view())})};
    if (result.rows() == 0) {
        return std::nullopt;
    }
    return Order{
        .sell_token = decode_address(result.value(0, 0)),
        .buy_token = decode_address(result.value(0, 1)),
        .kind = parse_order_kind(result.value(0, 2)),
    };
}

std::optional<Order> fetch_from_orders(Transaction& tx, const OrderUid& uid) {
    return fetch_order(tx, "SELECT sell_token, buy_token, kind FROM orders WHERE uid = $1", uid);
}

std::optional<Order> fetch_from_jit_orders(Transaction& tx, const OrderUid& uid) {
    return fetch_order(tx, "SELECT sell_token, buy_token, kind FROM jit_orders WHERE uid = $1", uid);
}

}  // namespace datamig::db::orders
