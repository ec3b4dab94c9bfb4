// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <libpq-fe.h>

namespace datamig::db {

//! Error reported by the PostgreSQL client library or server
class Exception : public std::runtime_error {
  public:
    explicit Exception(const std::string& message, std::string sql_state = {})
        : std::runtime_error{message}, sql_state_{std::move(sql_state)} {}

    //! The five-character SQLSTATE code, empty for client-side errors
    const std::string& sql_state() const noexcept { return sql_state_; }

  private:
    std::string sql_state_;
};

//! Query parameters in text format, std::nullopt is bound as SQL NULL
using Params = std::vector<std::optional<std::string>>;

//! Result set of one statement, values are in text format
class Result {
  public:
    explicit Result(PGresult* result) noexcept : result_{result, &PQclear} {}

    size_t rows() const noexcept;
    size_t columns() const noexcept;

    bool is_null(size_t row, size_t column) const;

    //! \throws Exception if value is NULL
    std::string_view value(size_t row, size_t column) const;

    std::optional<std::string_view> optional_value(size_t row, size_t column) const;

    //! \throws Exception if value is NULL or not an integer
    int64_t int64_value(size_t row, size_t column) const;

    std::optional<int64_t> optional_int64_value(size_t row, size_t column) const;

    //! Number of rows affected by INSERT/UPDATE/DELETE
    size_t affected_rows() const;

  private:
    void check_bounds(size_t row, size_t column) const;

    std::unique_ptr<PGresult, decltype(&PQclear)> result_;
};

//! Single connection to a PostgreSQL server
class Postgres {
  public:
    //! \brief Connects to the server
    //! \param url a libpq connection URI, e.g. "postgresql://" for the local server with default settings
    //! \throws Exception if the connection cannot be established
    explicit Postgres(const std::string& url);

    Postgres(const Postgres&) = delete;
    Postgres& operator=(const Postgres&) = delete;

    //! \brief Executes one parameterised statement ($1, $2, ...)
    //! \throws Exception if the statement fails
    Result query(const std::string& sql, const Params& params = {});

  private:
    std::unique_ptr<PGconn, decltype(&PQfinish)> connection_;
};

//! RAII transaction scope: rolled back on destruction unless committed
class Transaction {
  public:
    explicit Transaction(Postgres& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result query(const std::string& sql, const Params& params = {});

    void commit();
    void rollback();

    bool is_active() const noexcept { return active_; }

  private:
    Postgres& db_;
    bool active_{false};
};

//! RAII savepoint scope: rolled back to on destruction unless released
//! \remarks A failed statement aborts the whole transaction, rolling back to a savepoint makes it usable again
class Savepoint {
  public:
    Savepoint(Transaction& tx, std::string name);
    ~Savepoint();

    Savepoint(const Savepoint&) = delete;
    Savepoint& operator=(const Savepoint&) = delete;

    void release();
    void rollback();

  private:
    Transaction& tx_;
    std::string name_;
    bool active_{false};
};

}  // namespace datamig::db
