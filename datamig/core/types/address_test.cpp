// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <sstream>

#include <catch2/catch.hpp>

namespace datamig {

using namespace evmc::literals;

TEST_CASE("hex_to_address") {
    CHECK(hex_to_address("0x9008d19f58aabd9ed0d60971565aa8510560ab41") == 0x9008d19f58aabd9ed0d60971565aa8510560ab41_address);
    CHECK(hex_to_address("0x9008D19F58AABD9ED0D60971565AA8510560AB41") == 0x9008d19f58aabd9ed0d60971565aa8510560ab41_address);

    // missing prefix, wrong length, bad digits
    CHECK_FALSE(hex_to_address("9008d19f58aabd9ed0d60971565aa8510560ab41"));
    CHECK_FALSE(hex_to_address("0x9008d19f58aabd9ed0d60971565aa8510560ab"));
    CHECK_FALSE(hex_to_address("0x9008d19f58aabd9ed0d60971565aa8510560ab4100"));
    CHECK_FALSE(hex_to_address("0x9008d19f58aabd9ed0d60971565aa8510560abzz"));
}

TEST_CASE("bytes_to_address") {
    const Bytes short_input{0x01, 0x02};
    CHECK(bytes_to_address(short_input) == 0x0000000000000000000000000000000000000102_address);
    CHECK(bytes_to_address(Bytes{}) == evmc::address{});

    const Bytes long_input(kAddressLength + 1, 0xff);
    CHECK_THROWS_AS(bytes_to_address(long_input), std::invalid_argument);
}

TEST_CASE("address_to_hex") {
    const auto address{0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2_address};
    CHECK(address_to_hex(address) == "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");

    std::ostringstream out;
    out << address;
    CHECK(out.str() == "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
}

}  // namespace datamig
