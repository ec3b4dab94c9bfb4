// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, types, and constants.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <intx/intx.hpp>

namespace datamig {

using namespace std::string_view_literals;

//! Identifier of one batch auction, as stored in the database
using AuctionId = int64_t;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// uid = 32 bytes order digest + 20 bytes owner address + 4 bytes valid-to
inline constexpr size_t kOrderUidLength{kHashLength + kAddressLength + 4};

}  // namespace datamig
