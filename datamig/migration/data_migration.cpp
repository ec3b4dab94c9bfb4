// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_migration.hpp"

#include <string>
#include <thread>

#include <absl/strings/str_format.h>

#include <datamig/infra/common/ensure.hpp>
#include <datamig/infra/common/log.hpp>
#include <datamig/infra/common/stopwatch.hpp>

namespace datamig::migration {

double progress_percent(AuctionId start, AuctionId cursor) noexcept {
    if (start == 0) return 0.0;
    return static_cast<double>(start - cursor) / static_cast<double>(start) * 100.0;
}

MigrationResult DataMigration::run() {
    ensure(settings_.batch_size > 0, "DataMigration: batch size must be positive");

    const std::string migration_name{name()};
    StopWatch sw;
    MigrationResult result;

    begin();
    const auto start{start_cursor()};
    if (!start) {
        commit();
        DATAMIG_INFO_M(migration_name) << "source table is empty, nothing to migrate";
        result.status = MigrationStatus::kNothingToMigrate;
        return result;
    }
    DATAMIG_INFO_M(migration_name, {"start", std::to_string(*start), "batch_size", std::to_string(settings_.batch_size)})
        << "migration started";

    AuctionId cursor{*start};
    while (true) {
        DATAMIG_INFO_M(migration_name, {"auction", std::to_string(cursor),
                                        "progress", absl::StrFormat("%.2f%%", progress_percent(*start, cursor))});

        const auto lowest_id{migrate(cursor, settings_.batch_size)};
        if (!lowest_id) {
            commit();
            DATAMIG_INFO_M(migration_name, {"batches", std::to_string(result.batches),
                                            "elapsed", StopWatch::format(sw.elapsed())})
                << "no more competitions to process";
            result.status = MigrationStatus::kCompleted;
            return result;
        }
        ensure_invariant(*lowest_id < cursor, "DataMigration: batch did not move below the cursor");

        commit();
        ++result.batches;
        cursor = *lowest_id;
        DATAMIG_DEBUG_M(migration_name, {"batch", std::to_string(result.batches),
                                         "took", StopWatch::format(sw.lap())})
            << "batch committed";

        if (stop_requested_) {
            DATAMIG_WARN_M(migration_name, {"auction", std::to_string(cursor),
                                            "batches", std::to_string(result.batches),
                                            "elapsed", StopWatch::format(sw.elapsed())})
                << "migration interrupted";
            result.status = MigrationStatus::kInterrupted;
            return result;
        }
        if (settings_.batch_delay.count() > 0) {
            std::this_thread::sleep_for(settings_.batch_delay);
        }
        begin();
    }
}

}  // namespace datamig::migration
