// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace datamig::migration {

enum class MigrationKind {
    kHistoricAuctions,
    kExecutedFee,
    kAll,  // historic auctions first, then executed fees
};

struct Settings {
    std::string db_url{"postgresql://"};            // libpq connection URI
    MigrationKind kind{MigrationKind::kHistoricAuctions};
    int64_t batch_size{1};                          // competitions per transaction
    std::chrono::milliseconds batch_delay{50};      // pause between two batches
    std::chrono::seconds idle_after{600};           // time to stay alive once done
};

}  // namespace datamig::migration
