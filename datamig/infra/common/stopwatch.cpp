// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

#include <absl/strings/str_format.h>

namespace datamig {

using std::chrono::duration_cast;

StopWatch::Duration StopWatch::elapsed() const noexcept {
    return duration_cast<Duration>(Clock::now() - start_time_);
}

StopWatch::Duration StopWatch::lap() noexcept {
    const auto now{Clock::now()};
    const auto lap_duration{duration_cast<Duration>(now - lap_time_)};
    lap_time_ = now;
    return lap_duration;
}

// thousandths of unit, fractional part omitted when zero
static std::string with_fraction(int64_t thousandths, std::string_view unit) {
    if (thousandths % 1000 == 0) {
        return absl::StrFormat("%d%s", thousandths / 1000, unit);
    }
    return absl::StrFormat("%d.%03d%s", thousandths / 1000, thousandths % 1000, unit);
}

std::string StopWatch::format(Duration duration) {
    using namespace std::chrono_literals;
    if (duration < 1ms) {
        return absl::StrFormat("%dus", duration_cast<std::chrono::microseconds>(duration).count());
    }
    if (duration < 1s) {
        return with_fraction(duration_cast<std::chrono::microseconds>(duration).count(), "ms");
    }
    if (duration < 1min) {
        return with_fraction(duration_cast<std::chrono::milliseconds>(duration).count(), "s");
    }

    // whole units only from one minute on
    static constexpr std::array<std::pair<int64_t, char>, 4> kUnits{{{86400, 'd'}, {3600, 'h'}, {60, 'm'}, {1, 's'}}};
    int64_t seconds{duration_cast<std::chrono::seconds>(duration).count()};
    std::string formatted;
    for (const auto& [unit_seconds, suffix] : kUnits) {
        const int64_t count{seconds / unit_seconds};
        seconds %= unit_seconds;
        if (count == 0) continue;
        if (!formatted.empty()) formatted += ' ';
        absl::StrAppendFormat(&formatted, "%d%c", count, suffix);
    }
    return formatted;
}

}  // namespace datamig
