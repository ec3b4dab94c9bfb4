// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "uint256.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <string_view>

#include <datamig/core/common/util.hpp>

namespace datamig {

// 2^256 - 1
static constexpr std::string_view kMaxDecimal{
    "115792089237316195423570985008687907853269984665640564039457584007913129639935"};

static constexpr size_t kMaxHexDigits{sizeof(intx::uint256) * 2};

static std::string_view strip_leading_zeros(std::string_view digits) {
    const auto first_non_zero{digits.find_first_not_of('0')};
    if (first_non_zero == std::string_view::npos) {
        return digits.empty() ? digits : digits.substr(digits.size() - 1);
    }
    return digits.substr(first_non_zero);
}

// intx::from_string does not detect every decimal overflow, so bounds are checked on the digits
static std::optional<intx::uint256> from_decimal_digits(std::string_view digits) {
    digits = strip_leading_zeros(digits);
    if (digits.size() > kMaxDecimal.size() || (digits.size() == kMaxDecimal.size() && digits > kMaxDecimal)) {
        return std::nullopt;
    }
    return intx::from_string<intx::uint256>(std::string{digits});
}

static std::optional<intx::uint256> from_hex_digits(std::string_view digits) {
    digits = strip_leading_zeros(digits);
    if (digits.size() > kMaxHexDigits) {
        return std::nullopt;
    }
    return intx::from_string<intx::uint256>("0x" + std::string{digits});
}

std::optional<intx::uint256> parse_hex_or_decimal(std::string_view input) {
    if (is_valid_hex(input)) {
        return from_hex_digits(input.substr(2));
    }
    if (is_valid_dec(input)) {
        return from_decimal_digits(input);
    }
    return std::nullopt;
}

std::string to_decimal(const intx::uint256& value) {
    return intx::to_string(value);
}

std::optional<intx::uint256> decimal_to_u256(std::string_view numeric) {
    static const std::regex kNumericRegex{"^([0-9]+)(\\.0*)?$"};
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(numeric.begin(), numeric.end(), match, kNumericRegex)) {
        return std::nullopt;
    }
    return from_decimal_digits(numeric.substr(0, static_cast<size_t>(match.length(1))));
}

std::optional<intx::uint256> mul_div(const intx::uint256& a, const intx::uint256& b, const intx::uint256& c) {
    if (c == 0) {
        return std::nullopt;
    }
    const intx::uint512 quotient{intx::umul(a, b) / intx::uint512{c}};

    uint8_t bytes[sizeof(intx::uint512)];
    intx::be::store(bytes, quotient);
    constexpr size_t kHighHalf{sizeof(intx::uint512) - sizeof(intx::uint256)};
    if (std::any_of(bytes, bytes + kHighHalf, [](uint8_t b) { return b != 0; })) {
        return std::nullopt;
    }
    return intx::be::unsafe::load<intx::uint256>(bytes + kHighHalf);
}

}  // namespace datamig
