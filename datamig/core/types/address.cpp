// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <datamig/core/common/base.hpp>
#include <datamig/core/common/util.hpp>

namespace datamig {

evmc::address bytes_to_address(ByteView bytes) {
    if (bytes.size() > kAddressLength) {
        throw std::invalid_argument("address too long: " + std::to_string(bytes.size()) + " bytes");
    }
    evmc::address out;
    if (!bytes.empty()) {
        std::memcpy(out.bytes + kAddressLength - bytes.size(), bytes.data(), bytes.size());
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    if (!is_valid_address(hex)) {
        return std::nullopt;
    }
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

}  // namespace datamig

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << datamig::address_to_hex(address);
}

}  // namespace evmc
