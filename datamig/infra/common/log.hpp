// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace datamig::log {

//! \brief Available verbosity levels, from the least to the most verbose
enum class Level {
    kCritical,  // The migration cannot go on
    kError,     // A row or a batch failed and has been skipped
    kWarning,   // Data the migration cannot interpret
    kInfo,      // Progress of the migrations
    kDebug,     // Per batch details
    kTrace      // Per row details and SQL statements
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps use the local timezone instead of UTC
    bool log_local_time{false};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Copy every log line to this file when not empty
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \throws std::runtime_error if the log file cannot be opened
//! \note Not thread safe: call it before starting other threads
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe: meant for process start and tests
void set_verbosity(Level level);

//! \brief Checks if a line at \p level would be printed with the current settings
bool test_verbosity(Level level);

//! \brief Names the calling thread in log lines when thread names are enabled
void set_thread_name(std::string_view name);

//! Key-value pairs appended to a log line: key1, value1, key2, value2...
using Args = std::vector<std::string>;

//! \brief Collects one log line and writes it out on destruction
class LineBuffer {
  public:
    LineBuffer(Level level, std::string_view message, const Args& args);
    ~LineBuffer();

    LineBuffer(const LineBuffer&) = delete;
    LineBuffer& operator=(const LineBuffer&) = delete;

    template <class T>
    LineBuffer& operator<<(const T& value) {
        if (enabled_) line_ << value;
        return *this;
    }
    LineBuffer& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    std::string content() const { return line_.str(); }

  private:
    void append_args(const Args& args);

    const bool enabled_;
    const bool colored_;
    std::ostringstream line_;
};

template <Level level>
class LogBuffer : public LineBuffer {
  public:
    LogBuffer() : LineBuffer{level, {}, {}} {}
    explicit LogBuffer(std::string_view message, const Args& args = {}) : LineBuffer{level, message, args} {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;

}  // namespace datamig::log

// Arguments after the level are only evaluated when the level is enabled
#define DATAMIG_LOGBUFFER(level_, ...)           \
    if (!datamig::log::test_verbosity(level_)) { \
    } else                                       \
        datamig::log::LogBuffer<level_>(__VA_ARGS__)

#define DATAMIG_TRACE_M(...) DATAMIG_LOGBUFFER(datamig::log::Level::kTrace, __VA_ARGS__)
#define DATAMIG_DEBUG_M(...) DATAMIG_LOGBUFFER(datamig::log::Level::kDebug, __VA_ARGS__)
#define DATAMIG_INFO_M(...) DATAMIG_LOGBUFFER(datamig::log::Level::kInfo, __VA_ARGS__)
#define DATAMIG_WARN_M(...) DATAMIG_LOGBUFFER(datamig::log::Level::kWarning, __VA_ARGS__)
#define DATAMIG_ERROR_M(...) DATAMIG_LOGBUFFER(datamig::log::Level::kError, __VA_ARGS__)
#define DATAMIG_CRIT_M(...) DATAMIG_LOGBUFFER(datamig::log::Level::kCritical, __VA_ARGS__)

#define DATAMIG_TRACE DATAMIG_TRACE_M()
#define DATAMIG_DEBUG DATAMIG_DEBUG_M()
#define DATAMIG_INFO DATAMIG_INFO_M()
#define DATAMIG_WARN DATAMIG_WARN_M()
#define DATAMIG_ERROR DATAMIG_ERROR_M()
#define DATAMIG_CRIT DATAMIG_CRIT_M()
