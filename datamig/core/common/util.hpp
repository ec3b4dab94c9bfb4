// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include <intx/intx.hpp>

#include <datamig/core/common/base.hpp>
#include <datamig/core/common/bytes.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << intx::to_string(value);
    return out;
}

}  // namespace intx

namespace datamig {

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

inline bool is_valid_hex(std::string_view s) {
    static const std::regex kHexRegex("^0x[0-9a-fA-F]+$");
    return std::regex_match(s.begin(), s.end(), kHexRegex);
}

inline bool is_valid_dec(std::string_view s) {
    static const std::regex kDecRegex("^[0-9]+$");
    return std::regex_match(s.begin(), s.end(), kDecRegex);
}

inline bool is_valid_address(std::string_view s) {
    if (s.length() != 2 + kAddressLength * 2) {
        return false;
    }
    return is_valid_hex(s);
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string, with or without 0x prefix, into bytes
//! \remarks Odd length input is treated as having a leading zero nibble
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

}  // namespace datamig
