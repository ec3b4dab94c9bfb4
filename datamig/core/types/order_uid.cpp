// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "order_uid.hpp"

#include <algorithm>
#include <stdexcept>

#include <datamig/core/common/util.hpp>

namespace datamig {

OrderUid OrderUid::from_hex(std::string_view hex) {
    if (!hex.starts_with("0x")) {
        throw std::invalid_argument{"\"" + abridge(hex, 2 + kOrderUidLength * 2) +
                                    "\" can't be decoded as hex uid because it does not start with '0x'"};
    }
    const auto bytes{datamig::from_hex(hex)};
    if (!bytes || hex.size() != 2 + kOrderUidLength * 2) {
        throw std::invalid_argument{"failed to decode \"" + abridge(hex, 2 + kOrderUidLength * 2) + "\" as hex uid"};
    }
    return from_bytes(*bytes);
}

OrderUid OrderUid::from_bytes(ByteView bytes) {
    if (bytes.size() != kOrderUidLength) {
        throw std::invalid_argument{"invalid order uid length: " + std::to_string(bytes.size())};
    }
    OrderUid uid;
    std::ranges::copy(bytes, uid.bytes.begin());
    return uid;
}

std::string OrderUid::to_hex() const {
    return datamig::to_hex(view(), /*with_prefix=*/true);
}

std::ostream& operator<<(std::ostream& out, const OrderUid& uid) {
    return out << uid.to_hex();
}

}  // namespace datamig
