// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <sstream>

#include <catch2/catch.hpp>

namespace datamig {

TEST_CASE("Hex") {
    CHECK(decode_hex_digit('g').has_value() == false);
    CHECK(decode_hex_digit('F') == 15);

    auto parsed_bytes = from_hex("");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes->empty()));

    parsed_bytes = from_hex("0x");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes->empty()));

    parsed_bytes = from_hex("0xg");
    CHECK(parsed_bytes.has_value() == false);

    Bytes expected_bytes{0x0};
    parsed_bytes = from_hex("0");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    expected_bytes = Bytes{0x0a};
    parsed_bytes = from_hex("0xa");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    parsed_bytes = from_hex("0X0A");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    expected_bytes = {0x0a, 0x1f};
    parsed_bytes = from_hex("0xa1f");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    parsed_bytes = from_hex("0a1f");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    parsed_bytes = from_hex("0a1z");
    CHECK(parsed_bytes.has_value() == false);

    CHECK(to_hex(expected_bytes) == "0a1f");
    CHECK(to_hex(expected_bytes, /*with_prefix=*/true) == "0x0a1f");
    CHECK(to_hex(Bytes{}, true) == "0x");
}

TEST_CASE("Hex and decimal validation") {
    CHECK(has_hex_prefix("0x"));
    CHECK(has_hex_prefix("0XAB"));
    CHECK_FALSE(has_hex_prefix("x0"));

    CHECK(is_valid_hex("0x1234abCD"));
    CHECK_FALSE(is_valid_hex("0x"));
    CHECK_FALSE(is_valid_hex("1234"));
    CHECK_FALSE(is_valid_hex("0x12g4"));

    CHECK(is_valid_dec("0"));
    CHECK(is_valid_dec("1234567890"));
    CHECK_FALSE(is_valid_dec(""));
    CHECK_FALSE(is_valid_dec("-1"));
    CHECK_FALSE(is_valid_dec("1.0"));

    CHECK(is_valid_address("0x9008d19f58aabd9ed0d60971565aa8510560ab41"));
    CHECK_FALSE(is_valid_address("0x9008d19f58aabd9ed0d60971565aa8510560ab4"));
}

TEST_CASE("iequals") {
    CHECK(iequals("sell", "SELL"));
    CHECK_FALSE(iequals("sell", "buy"));
    CHECK_FALSE(iequals("sell", "sells"));
}

TEST_CASE("abridge") {
    CHECK(abridge("0123456789", 4) == "0123...");
    CHECK(abridge("0123", 4) == "0123");
    CHECK(abridge("", 4).empty());
}

TEST_CASE("print intx::uint256") {
    std::ostringstream out;
    out << intx::uint256{1'000'000};
    CHECK(out.str() == "1000000");
}

}  // namespace datamig
