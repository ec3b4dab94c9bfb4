// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <intx/intx.hpp>

namespace datamig {

//! \brief Parses an amount either in 0x-prefixed hex or in plain decimal form
//! \return The value or std::nullopt on invalid digits, signs, fractions or overflow
std::optional<intx::uint256> parse_hex_or_decimal(std::string_view input);

//! \brief Renders the value in base 10, which is also the PostgreSQL numeric text form
std::string to_decimal(const intx::uint256& value);

//! \brief Parses a PostgreSQL numeric text value holding a non-negative integer
//! \details A fractional part is tolerated only if made of zeros (e.g. "12.000")
//! \return The value or std::nullopt for negative, fractional, special (NaN) or too large values
std::optional<intx::uint256> decimal_to_u256(std::string_view numeric);

//! \brief Computes a * b / c with a 512-bit intermediate product
//! \return The quotient or std::nullopt if c is zero or the quotient does not fit 256 bits
std::optional<intx::uint256> mul_div(const intx::uint256& a, const intx::uint256& b, const intx::uint256& c);

}  // namespace datamig
