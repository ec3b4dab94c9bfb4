// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "order_executions.hpp"

#include <datamig/db/codec.hpp>

namespace datamig::db::order_executions {

std::vector<OrderExecution> fetch(Transaction& tx, AuctionId auction_id) {
    const auto result{tx.query(
        "SELECT order_uid, auction_id, executed_fee, executed_fee_token FROM order_execution WHERE auction_id = $1",
        {std::to_string(auction_id)})};

    std::vector<OrderExecution> executions;
    executions.reserve(result.rows());
    for (size_t row{0}; row < result.rows(); ++row) {
        executions.push_back(OrderExecution{
            .order_uid = decode_order_uid(result.value(row, 0)),
            .auction_id = result.int64_value(row, 1),
            .executed_fee = std::string{result.value(row, 2)},
            .executed_fee_token = decode_address(result.value(row, 3)),
        });
    }
    return executions;
}

bool update(Transaction& tx, const OrderExecution& order_execution) {
    const auto result{tx.query(
        "UPDATE order_execution SET executed_fee = $1, executed_fee_token = $2 "
        "WHERE order_uid = $3 AND auction_id = $4",
        {
            order_execution.executed_fee,
            encode_bytea(ByteView{order_execution.executed_fee_token.bytes}),
            encode_bytea(order_execution.order_uid.view()),
            std::to_string(order_execution.auction_id),
        })};
    return result.affected_rows() == 1;
}

}  // namespace datamig::db::order_executions
