// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include <datamig/core/common/base.hpp>
#include <datamig/core/common/bytes.hpp>

namespace datamig {

//! \brief Unique identifier of an order: orderDigest (32 bytes) | ownerAddress (20 bytes) | validTo (4 bytes)
struct OrderUid {
    std::array<uint8_t, kOrderUidLength> bytes{};

    //! \brief Parses the 0x-prefixed hex form
    //! \throws std::invalid_argument if hex is not a 0x-prefixed encoding of exactly 56 bytes
    static OrderUid from_hex(std::string_view hex);

    //! \brief Builds an uid from raw bytes
    //! \throws std::invalid_argument if the size is not 56 bytes
    static OrderUid from_bytes(ByteView bytes);

    std::string to_hex() const;

    ByteView view() const noexcept { return ByteView{bytes}; }

    friend auto operator<=>(const OrderUid&, const OrderUid&) = default;
};

std::ostream& operator<<(std::ostream& out, const OrderUid& uid);

}  // namespace datamig

template <>
struct std::hash<datamig::OrderUid> {
    size_t operator()(const datamig::OrderUid& uid) const noexcept {
        return std::hash<std::string_view>{}(
            std::string_view{reinterpret_cast<const char*>(uid.bytes.data()), uid.bytes.size()});
    }
};
