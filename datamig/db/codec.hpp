// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <datamig/core/common/bytes.hpp>
#include <datamig/core/types/order_uid.hpp>

// Conversions between domain values and the PostgreSQL text wire format
namespace datamig::db {

//! \brief Encodes bytes in the bytea hex format: \x0a1f
std::string encode_bytea(ByteView bytes);

//! \brief Decodes a bytea value in hex format
//! \throws std::invalid_argument if text is not in bytea hex format
Bytes decode_bytea(std::string_view text);

evmc::address decode_address(std::string_view text);
OrderUid decode_order_uid(std::string_view text);

//! \brief Encodes a one-dimensional bytea[] literal: {"\\x0a","\\x1f"}
std::string encode_bytea_array(const std::vector<ByteView>& values);
std::string encode_address_array(const std::vector<evmc::address>& addresses);
std::string encode_order_uid_array(const std::vector<OrderUid>& uids);

//! \brief Encodes a one-dimensional numeric[] literal: {1,2,3}
std::string encode_numeric_array(const std::vector<intx::uint256>& values);

//! \brief Splits a one-dimensional array literal into its elements, NULL elements are std::nullopt
//! \throws std::invalid_argument on malformed input
std::vector<std::optional<std::string>> parse_text_array(std::string_view text);

//! \throws std::invalid_argument on malformed input, NULL elements or invalid addresses
std::vector<evmc::address> decode_address_array(std::string_view text);

}  // namespace datamig::db
