// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <optional>
#include <string_view>

#include <datamig/core/common/base.hpp>
#include <datamig/migration/settings.hpp>

namespace datamig::migration {

enum class MigrationStatus {
    kCompleted,         // every batch down to the lowest id has been migrated
    kNothingToMigrate,  // the table providing the starting cursor is empty
    kInterrupted,       // stop requested, the last batch has been committed
};

struct MigrationResult {
    MigrationStatus status{MigrationStatus::kCompleted};
    size_t batches{0};
};

//! \brief Percentage of the id range [0, start] already walked down to cursor, 0 if start is 0
double progress_percent(AuctionId start, AuctionId cursor) noexcept;

//! \brief Transaction boundaries of a migration, one transaction per batch
class BatchStorage {
  public:
    virtual ~BatchStorage() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
};

//! \brief Batch loop walking auction ids downward, one transaction per batch
//! \details Each batch covers the ids strictly below the cursor, the cursor then moves to the lowest id in the batch
struct DataMigration {
    DataMigration(const Settings& settings, const std::atomic_bool& stop_requested)
        : settings_{settings}, stop_requested_{stop_requested} {}
    virtual ~DataMigration() = default;

    MigrationResult run();

    virtual std::string_view name() const = 0;

  protected:
    virtual void begin() = 0;
    virtual void commit() = 0;

    //! \return The starting cursor or std::nullopt if there is nothing to migrate
    virtual std::optional<AuctionId> start_cursor() = 0;

    //! \brief Migrates at most batch_size competitions with id < cursor
    //! \return The lowest id in the batch or std::nullopt if the batch is empty
    virtual std::optional<AuctionId> migrate(AuctionId cursor, int64_t batch_size) = 0;

    const Settings& settings_;

  private:
    const std::atomic_bool& stop_requested_;
};

}  // namespace datamig::migration
