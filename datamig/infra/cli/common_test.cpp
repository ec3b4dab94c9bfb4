// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <algorithm>
#include <vector>

#include <catch2/catch.hpp>

namespace datamig::cmd::common {

//! Parses the arguments with CLI11, which expects them in reverse order
static void parse(CLI::App& cli, std::vector<std::string> args) {
    std::reverse(args.begin(), args.end());
    cli.parse(args);
}

TEST_CASE("add_migration_options", "[infra][cli]") {
    CLI::App cli;
    migration::Settings settings;
    add_migration_options(cli, settings);

    SECTION("defaults") {
        parse(cli, {});
        CHECK(settings.kind == migration::MigrationKind::kHistoricAuctions);
        CHECK(settings.batch_size == 1);
        CHECK(settings.batch_delay == std::chrono::milliseconds{50});
        CHECK(settings.idle_after == std::chrono::seconds{600});
    }

    SECTION("explicit values") {
        parse(cli, {"--migration", "executed-fee", "--batch-size", "10", "--batch-delay", "0", "--idle-after", "5"});
        CHECK(settings.kind == migration::MigrationKind::kExecutedFee);
        CHECK(settings.batch_size == 10);
        CHECK(settings.batch_delay == std::chrono::milliseconds{0});
        CHECK(settings.idle_after == std::chrono::seconds{5});
    }

    SECTION("migration names ignore case") {
        parse(cli, {"--migration", "ALL"});
        CHECK(settings.kind == migration::MigrationKind::kAll);
    }

    SECTION("invalid values") {
        CHECK_THROWS_AS(parse(cli, {"--migration", "unknown"}), CLI::ValidationError);
        CHECK_THROWS_AS(parse(cli, {"--batch-size", "0"}), CLI::ValidationError);
    }
}

TEST_CASE("add_logging_options", "[infra][cli]") {
    CLI::App cli;
    log::Settings settings;
    add_logging_options(cli, settings);

    SECTION("defaults") {
        parse(cli, {});
        CHECK(settings.log_verbosity == log::Level::kInfo);
        CHECK_FALSE(settings.log_local_time);
        CHECK(settings.log_file.empty());
    }

    SECTION("explicit values") {
        parse(cli, {"--log.verbosity", "debug", "--log.nocolor", "--log.threads", "--log.localtime"});
        CHECK(settings.log_verbosity == log::Level::kDebug);
        CHECK(settings.log_nocolor);
        CHECK(settings.log_threads);
        CHECK(settings.log_local_time);
        CHECK_FALSE(settings.log_std_out);
    }
}

TEST_CASE("add_option_db_url", "[infra][cli]") {
    CLI::App cli;
    std::string db_url{"postgresql://"};
    add_option_db_url(cli, db_url);

    parse(cli, {"--db-url", "postgresql://user@db:5432/mainnet"});
    CHECK(db_url == "postgresql://user@db:5432/mainnet");
}

}  // namespace datamig::cmd::common
