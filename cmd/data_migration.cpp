// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <magic_enum.hpp>

#include <datamig/db/postgres.hpp>
#include <datamig/infra/cli/common.hpp>
#include <datamig/infra/cli/shutdown_signal.hpp>
#include <datamig/infra/common/log.hpp>
#include <datamig/migration/executed_fee.hpp>
#include <datamig/migration/historic_auctions.hpp>
#include <datamig/migration/postgres_storage.hpp>
#include <datamig/migration/settings.hpp>

using namespace datamig;
using namespace datamig::cmd::common;
using namespace datamig::migration;

static std::vector<std::unique_ptr<DataMigration>> make_migrations(db::Postgres& db,
                                                                   const Settings& settings,
                                                                   const std::atomic_bool& stop_requested) {
    std::vector<std::unique_ptr<DataMigration>> migrations;
    if (settings.kind == MigrationKind::kHistoricAuctions || settings.kind == MigrationKind::kAll) {
        migrations.push_back(std::make_unique<HistoricAuctionsMigration>(
            std::make_unique<PostgresHistoricAuctionsStorage>(db), settings, stop_requested));
    }
    if (settings.kind == MigrationKind::kExecutedFee || settings.kind == MigrationKind::kAll) {
        migrations.push_back(std::make_unique<ExecutedFeeMigration>(
            std::make_unique<PostgresExecutedFeeStorage>(db), settings, stop_requested));
    }
    return migrations;
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Data migrations for the batch auction database"};

    try {
        Settings settings;
        log::Settings log_settings;
        add_option_db_url(cli, settings.db_url);
        add_migration_options(cli, settings);
        add_logging_options(cli, log_settings);
        cli.parse(argc, argv);

        // Initialize logging with cli settings
        log::init(log_settings);
        log::set_thread_name("main-thread");

        ShutdownSignal shutdown_signal;

        db::Postgres db{settings.db_url};
        for (auto& migration : make_migrations(db, settings, shutdown_signal.stop_requested())) {
            if (shutdown_signal.stop_requested()) break;

            log::Info("Starting data migration", {"migration", std::string{migration->name()}});
            const auto result{migration->run()};
            log::Info("Data migration finished", {"migration", std::string{migration->name()},
                                                  "status", std::string{magic_enum::enum_name(result.status)},
                                                  "batches", std::to_string(result.batches)});
        }

        if (!shutdown_signal.stop_requested() && settings.idle_after.count() > 0) {
            DATAMIG_INFO << "Migrations done, idling for " << settings.idle_after.count() << "s";
            if (shutdown_signal.wait_for(settings.idle_after)) {
                DATAMIG_INFO << "Stop requested while idling";
            }
        }

        DATAMIG_INFO << "Exiting data-migration";
        return 0;
    } catch (const CLI::ParseError& ex) {
        // Let CLI11 handle any error occurred parsing command-line args
        return cli.exit(ex);
    } catch (const db::Exception& ex) {
        DATAMIG_CRIT << "Database failure: " << ex.what() << (ex.sql_state().empty() ? "" : " [" + ex.sql_state() + "]");
        return -1;
    } catch (const std::exception& ex) {
        // Any exception during run leads to termination
        DATAMIG_CRIT << "Unrecoverable failure: " << ex.what();
        return -1;
    } catch (...) {
        DATAMIG_CRIT << "Unrecoverable failure: unexpected exception";
        return -2;
    }
}
