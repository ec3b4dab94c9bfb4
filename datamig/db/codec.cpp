// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <datamig/core/common/util.hpp>
#include <datamig/core/types/address.hpp>
#include <datamig/core/types/uint256.hpp>

namespace datamig::db {

std::string encode_bytea(ByteView bytes) {
    return "\\x" + to_hex(bytes);
}

Bytes decode_bytea(std::string_view text) {
    if (!text.starts_with("\\x")) {
        throw std::invalid_argument{"text does not start with \\x: " + abridge(text, 16)};
    }
    text.remove_prefix(2);
    if (text.size() % 2 != 0) {
        throw std::invalid_argument{"odd number of hex digits in bytea value"};
    }
    auto bytes{from_hex(text)};
    if (!bytes) {
        throw std::invalid_argument{"invalid hex digits in bytea value: " + abridge(text, 16)};
    }
    return std::move(*bytes);
}

evmc::address decode_address(std::string_view text) {
    const auto bytes{decode_bytea(text)};
    if (bytes.size() != kAddressLength) {
        throw std::invalid_argument{"invalid address length: " + std::to_string(bytes.size())};
    }
    return bytes_to_address(bytes);
}

OrderUid decode_order_uid(std::string_view text) {
    return OrderUid::from_bytes(decode_bytea(text));
}

std::string encode_bytea_array(const std::vector<ByteView>& values) {
    std::string literal{"{"};
    for (size_t i{0}; i < values.size(); ++i) {
        if (i > 0) literal += ',';
        // backslash must be escaped inside quoted array elements
        literal += "\"\\\\x" + to_hex(values[i]) + "\"";
    }
    literal += '}';
    return literal;
}

std::string encode_address_array(const std::vector<evmc::address>& addresses) {
    std::vector<ByteView> views;
    views.reserve(addresses.size());
    for (const auto& address : addresses) {
        views.emplace_back(address.bytes);
    }
    return encode_bytea_array(views);
}

std::string encode_order_uid_array(const std::vector<OrderUid>& uids) {
    std::vector<ByteView> views;
    views.reserve(uids.size());
    for (const auto& uid : uids) {
        views.push_back(uid.view());
    }
    return encode_bytea_array(views);
}

std::string encode_numeric_array(const std::vector<intx::uint256>& values) {
    std::string literal{"{"};
    for (size_t i{0}; i < values.size(); ++i) {
        if (i > 0) literal += ',';
        literal += to_decimal(values[i]);
    }
    literal += '}';
    return literal;
}

std::vector<std::optional<std::string>> parse_text_array(std::string_view text) {
    if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
        throw std::invalid_argument{"array literal must be enclosed in braces: " + abridge(text, 32)};
    }
    text = text.substr(1, text.size() - 2);

    std::vector<std::optional<std::string>> elements;
    if (text.empty()) {
        return elements;
    }

    size_t pos{0};
    while (true) {
        if (pos < text.size() && text[pos] == '"') {
            std::string element;
            ++pos;
            bool closed{false};
            while (pos < text.size()) {
                const char c{text[pos++]};
                if (c == '\\') {
                    if (pos == text.size()) break;
                    element += text[pos++];
                } else if (c == '"') {
                    closed = true;
                    break;
                } else {
                    element += c;
                }
            }
            if (!closed) {
                throw std::invalid_argument{"unterminated quoted array element"};
            }
            elements.emplace_back(std::move(element));
        } else {
            const size_t end{std::min(text.find(',', pos), text.size())};
            const auto element{text.substr(pos, end - pos)};
            if (element.empty() || element.find_first_of("{}\"\\") != std::string_view::npos) {
                throw std::invalid_argument{"malformed array element: " + std::string{element}};
            }
            if (iequals(element, "NULL")) {
                elements.emplace_back(std::nullopt);
            } else {
                elements.emplace_back(std::string{element});
            }
            pos = end;
        }

        if (pos == text.size()) break;
        if (text[pos] != ',') {
            throw std::invalid_argument{"expected ',' between array elements"};
        }
        ++pos;
    }
    return elements;
}

std::vector<evmc::address> decode_address_array(std::string_view text) {
    std::vector<evmc::address> addresses;
    for (const auto& element : parse_text_array(text)) {
        if (!element) {
            throw std::invalid_argument{"unexpected NULL in address array"};
        }
        addresses.push_back(decode_address(*element));
    }
    return addresses;
}

}  // namespace datamig::db
