// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <datamig/infra/common/terminal.hpp>

namespace datamig::log {

//! Width of the message column, key-value pairs start after it
static constexpr int kMessageWidth{36};

//! Width of the thread name column
static constexpr int kThreadNameWidth{14};

namespace {

    //! Where log lines go: console plus optional file copy
    struct Sink {
        Settings settings;
        std::unique_ptr<std::ofstream> file;
        std::mutex mutex;
    };

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

}  // namespace

static Sink& sink() {
    static Sink instance;
    return instance;
}

thread_local std::string thread_name;

static LevelStyle style_of(Level level) {
    switch (level) {
        case Level::kCritical:
            return {"CRIT ", kBackgroundRed};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kWarning:
            return {"WARN ", kColorOrangeHigh};
        case Level::kInfo:
            return {"INFO ", kColorGreen};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kTrace:
            return {"TRACE", kColorCoal};
    }
    return {"     ", kColorReset};
}

void init(const Settings& settings) {
    Sink& out{sink()};
    out.settings = settings;
    out.file.reset();
    if (!settings.log_file.empty()) {
        auto file{std::make_unique<std::ofstream>(settings.log_file, std::ios::out | std::ios::app)};
        if (!file->is_open()) {
            throw std::runtime_error{"cannot open log file " + settings.log_file};
        }
        out.file = std::move(file);
    }
    // colors are written to the console only and only when it is a terminal
    const bool console_is_terminal{settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    out.settings.log_nocolor = settings.log_nocolor || out.file || !console_is_terminal || is_color_disabled_by_env();
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

void set_thread_name(std::string_view name) {
    thread_name = name;
}

static std::string current_thread_name() {
    if (!thread_name.empty()) {
        return thread_name;
    }
    std::ostringstream id;
    id << std::this_thread::get_id();
    return id.str();
}

LineBuffer::LineBuffer(Level level, std::string_view message, const Args& args)
    : enabled_{test_verbosity(level)}, colored_{!sink().settings.log_nocolor} {
    if (!enabled_) return;

    const Settings& settings{sink().settings};
    const auto [tag, color] = style_of(level);
    if (colored_) {
        line_ << color << tag << kColorReset;
    } else {
        line_ << tag;
    }

    const absl::TimeZone time_zone{settings.log_local_time ? absl::LocalTimeZone() : absl::UTCTimeZone()};
    line_ << " [" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), time_zone) << "] ";

    if (settings.log_threads) {
        line_ << "[" << std::left << std::setw(kThreadNameWidth) << current_thread_name() << "] ";
    }

    if (!message.empty() || !args.empty()) {
        line_ << std::left << std::setw(kMessageWidth) << message;
        append_args(args);
    }
}

void LineBuffer::append_args(const Args& args) {
    if (!enabled_) return;
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key{i % 2 == 0};
        if (is_key) {
            line_ << ' ';
            if (colored_) line_ << kColorGreen;
            line_ << args[i];
            if (colored_) line_ << kColorReset;
            line_ << '=';
        } else {
            line_ << args[i];
        }
    }
}

LineBuffer::~LineBuffer() {
    if (!enabled_) return;

    Sink& out{sink()};
    line_ << '\n';
    const std::string line{line_.str()};

    std::scoped_lock lock{out.mutex};
    auto& console{out.settings.log_std_out ? std::cout : std::cerr};
    console << line;
    if (out.file) {
        *out.file << line;
        out.file->flush();
    }
}

}  // namespace datamig::log
