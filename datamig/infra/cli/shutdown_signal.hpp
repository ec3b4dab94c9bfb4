// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

namespace datamig::cmd::common {

//! \brief Turns the first SIGINT or SIGTERM into a stop request for the running migrations
//! \details Signals are awaited on a dedicated thread running its own io_context for the lifetime of the object.
//! Migrations poll stop_requested() between batches, the idle phase blocks in wait_for().
class ShutdownSignal {
  public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    const std::atomic_bool& stop_requested() const noexcept { return stop_requested_; }

    //! \brief Blocks until a stop is requested or \p timeout expires
    //! \return true if a stop has been requested
    bool wait_for(std::chrono::milliseconds timeout);

    //! \brief Same effect as receiving a signal
    void request_stop();

  private:
    void on_signal(const boost::system::error_code& error, int signal_number);

    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    std::atomic_bool stop_requested_{false};
    std::mutex mutex_;
    std::condition_variable stop_cv_;
    std::thread thread_;
};

}  // namespace datamig::cmd::common
