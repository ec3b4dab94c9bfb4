// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <datamig/infra/common/log.hpp>

namespace datamig::test_util {

//! \brief Captures the log lines written while alive instead of printing them
//! \details Console streams are swapped with in-memory ones and logging is reinitialized without colors.
//! The previous verbosity and the console streams are restored on destruction.
class LogCapture {
  public:
    explicit LogCapture(log::Level verbosity = log::Level::kInfo, log::Settings settings = {})
        : previous_verbosity_{log::get_verbosity()},
          cout_buffer_{std::cout.rdbuf(out_.rdbuf())},
          cerr_buffer_{std::cerr.rdbuf(err_.rdbuf())} {
        settings.log_verbosity = verbosity;
        settings.log_nocolor = true;
        log::init(settings);
    }
    ~LogCapture() {
        std::cout.rdbuf(cout_buffer_);
        std::cerr.rdbuf(cerr_buffer_);
        log::init(log::Settings{.log_verbosity = previous_verbosity_});
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    //! Lines written to standard output
    std::string out() const { return out_.str(); }
    //! Lines written to standard error, the default console stream
    std::string err() const { return err_.str(); }

  private:
    log::Level previous_verbosity_;
    std::ostringstream out_;
    std::ostringstream err_;
    std::streambuf* cout_buffer_;
    std::streambuf* cerr_buffer_;
};

}  // namespace datamig::test_util
