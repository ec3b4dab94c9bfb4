// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace datamig {

//! Raise a logic error carrying \p message unless \p condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! Same as ensure, for conditions the migration loop itself must keep true across batches
inline void ensure_invariant(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"Invariant violation: " + std::string{message}};
    }
}

}  // namespace datamig
