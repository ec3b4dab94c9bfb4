// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <datamig/core/common/base.hpp>
#include <datamig/core/types/order_uid.hpp>
#include <datamig/db/postgres.hpp>

namespace datamig::db::order_executions {

//! An order_execution row, keyed by (order_uid, auction_id)
struct OrderExecution {
    OrderUid order_uid;
    AuctionId auction_id{0};
    //! numeric column in its text form, not necessarily integral
    std::string executed_fee;
    evmc::address executed_fee_token;
};

std::vector<OrderExecution> fetch(Transaction& tx, AuctionId auction_id);

//! \brief Overwrites executed_fee and executed_fee_token of the row matching (order_uid, auction_id)
//! \return true if one row was updated
bool update(Transaction& tx, const OrderExecution& order_execution);

}  // namespace datamig::db::order_executions
