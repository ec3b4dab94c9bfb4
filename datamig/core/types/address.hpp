// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <datamig/core/common/bytes.hpp>

namespace datamig {

//! \brief Converts bytes to evmc::address, short inputs are left-padded with 0s
//! \throws std::invalid_argument if input is longer than an address
evmc::address bytes_to_address(ByteView bytes);

//! \brief Parses a 0x-prefixed hex string of exactly 20 bytes
//! \return The address or std::nullopt if hex is not a valid address encoding
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

}  // namespace datamig

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
