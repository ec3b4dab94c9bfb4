// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include <datamig/infra/common/log.hpp>
#include <datamig/migration/settings.hpp>

namespace datamig::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up the PostgreSQL connection URL option, also read from the DB_URL environment variable
void add_option_db_url(CLI::App& cli, std::string& db_url);

//! \brief Set up options selecting the migration and pacing its batches
void add_migration_options(CLI::App& cli, migration::Settings& settings);

}  // namespace datamig::cmd::common
