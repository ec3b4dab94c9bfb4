// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace datamig {

//! \brief Measures the time spent by a whole migration and by each of its batches
//! \remarks The clock starts on construction
class StopWatch {
  public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    StopWatch() : start_time_{Clock::now()}, lap_time_{start_time_} {}

    //! \brief Time elapsed since construction
    Duration elapsed() const noexcept;

    //! \brief Closes the current lap
    //! \return Time elapsed since the previous lap, or since construction for the first one
    Duration lap() noexcept;

    //! \brief Renders a duration for log lines, e.g. "1d 2h 3m", "1.200s" or "20us"
    static std::string format(Duration duration);

  private:
    Clock::time_point start_time_;
    Clock::time_point lap_time_;
};

}  // namespace datamig
