// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "postgres.hpp"

#include <charconv>
#include <system_error>

#include <absl/strings/ascii.h>

#include <datamig/infra/common/log.hpp>

namespace datamig::db {

static std::string trimmed_error(const char* message) {
    return std::string{absl::StripTrailingAsciiWhitespace(message != nullptr ? message : "")};
}

static std::string or_empty(const char* text) {
    return text != nullptr ? text : "";
}

size_t Result::rows() const noexcept {
    return static_cast<size_t>(PQntuples(result_.get()));
}

size_t Result::columns() const noexcept {
    return static_cast<size_t>(PQnfields(result_.get()));
}

void Result::check_bounds(size_t row, size_t column) const {
    if (row >= rows() || column >= columns()) {
        throw Exception{"result access out of range: row " + std::to_string(row) + " column " + std::to_string(column)};
    }
}

bool Result::is_null(size_t row, size_t column) const {
    check_bounds(row, column);
    return PQgetisnull(result_.get(), static_cast<int>(row), static_cast<int>(column)) == 1;
}

std::string_view Result::value(size_t row, size_t column) const {
    const auto value{optional_value(row, column)};
    if (!value) {
        throw Exception{"unexpected NULL in column " + std::string{PQfname(result_.get(), static_cast<int>(column))}};
    }
    return *value;
}

std::optional<std::string_view> Result::optional_value(size_t row, size_t column) const {
    if (is_null(row, column)) {
        return std::nullopt;
    }
    const auto r{static_cast<int>(row)};
    const auto c{static_cast<int>(column)};
    return std::string_view{PQgetvalue(result_.get(), r, c), static_cast<size_t>(PQgetlength(result_.get(), r, c))};
}

int64_t Result::int64_value(size_t row, size_t column) const {
    const auto text{value(row, column)};
    int64_t number{0};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw Exception{"invalid integer \"" + std::string{text} + "\" in column " +
                        std::string{PQfname(result_.get(), static_cast<int>(column))}};
    }
    return number;
}

std::optional<int64_t> Result::optional_int64_value(size_t row, size_t column) const {
    if (is_null(row, column)) {
        return std::nullopt;
    }
    return int64_value(row, column);
}

size_t Result::affected_rows() const {
    const std::string_view tuples{PQcmdTuples(result_.get())};
    size_t count{0};
    // empty for statements which do not affect rows
    if (std::from_chars(tuples.data(), tuples.data() + tuples.size(), count).ec != std::errc{}) {
        return 0;
    }
    return count;
}

Postgres::Postgres(const std::string& url) : connection_{PQconnectdb(url.c_str()), &PQfinish} {
    if (!connection_) {
        throw Exception{"cannot allocate PostgreSQL connection"};
    }
    if (PQstatus(connection_.get()) != CONNECTION_OK) {
        throw Exception{"cannot connect to PostgreSQL: " + trimmed_error(PQerrorMessage(connection_.get()))};
    }
    DATAMIG_DEBUG_M("Connected to PostgreSQL", {"host", or_empty(PQhost(connection_.get())), "db", or_empty(PQdb(connection_.get()))});
}

Result Postgres::query(const std::string& sql, const Params& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param ? param->c_str() : nullptr);
    }

    DATAMIG_TRACE << "PostgreSQL query: " << sql << " params: " << params.size();
    PGresult* raw{PQexecParams(connection_.get(), sql.c_str(), static_cast<int>(values.size()),
                               /*paramTypes=*/nullptr, values.data(), /*paramLengths=*/nullptr,
                               /*paramFormats=*/nullptr, /*resultFormat=*/0)};
    if (raw == nullptr) {
        throw Exception{"PostgreSQL query failed: " + trimmed_error(PQerrorMessage(connection_.get()))};
    }
    Result result{raw};
    const auto status{PQresultStatus(raw)};
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        const char* sql_state{PQresultErrorField(raw, PG_DIAG_SQLSTATE)};
        throw Exception{trimmed_error(PQresultErrorMessage(raw)), sql_state != nullptr ? sql_state : ""};
    }
    return result;
}

Transaction::Transaction(Postgres& db) : db_{db} {
    db_.query("BEGIN");
    active_ = true;
}

Transaction::~Transaction() {
    if (!active_) return;
    try {
        rollback();
    } catch (const Exception& ex) {
        DATAMIG_ERROR << "Transaction rollback failed: " << ex.what();
    }
}

Result Transaction::query(const std::string& sql, const Params& params) {
    if (!active_) {
        throw Exception{"query on inactive transaction"};
    }
    return db_.query(sql, params);
}

void Transaction::commit() {
    if (!active_) {
        throw Exception{"commit on inactive transaction"};
    }
    active_ = false;
    db_.query("COMMIT");
}

void Transaction::rollback() {
    if (!active_) return;
    active_ = false;
    db_.query("ROLLBACK");
}

Savepoint::Savepoint(Transaction& tx, std::string name) : tx_{tx}, name_{std::move(name)} {
    tx_.query("SAVEPOINT " + name_);
    active_ = true;
}

Savepoint::~Savepoint() {
    if (!active_ || !tx_.is_active()) return;
    try {
        rollback();
    } catch (const Exception& ex) {
        DATAMIG_ERROR << "Rollback to savepoint " << name_ << " failed: " << ex.what();
    }
}

void Savepoint::release() {
    if (!active_) return;
    active_ = false;
    tx_.query("RELEASE SAVEPOINT " + name_);
}

void Savepoint::rollback() {
    if (!active_) return;
    active_ = false;
    tx_.query("ROLLBACK TO SAVEPOINT " + name_);
}

}  // namespace datamig::db
