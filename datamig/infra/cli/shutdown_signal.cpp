// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <csignal>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <datamig/infra/common/log.hpp>

namespace datamig::cmd::common {

ShutdownSignal::ShutdownSignal() : signals_{ioc_, SIGINT, SIGTERM} {
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        on_signal(error, signal_number);
    });
    thread_ = std::thread{[this] {
        log::set_thread_name("signal-handler");
        ioc_.run();
    }};
}

ShutdownSignal::~ShutdownSignal() {
    // the pending wait keeps the io_context running until cancelled
    boost::asio::post(ioc_, [this] { signals_.cancel(); });
    thread_.join();
}

void ShutdownSignal::on_signal(const boost::system::error_code& error, int signal_number) {
    if (error == boost::asio::error::operation_aborted) {
        DATAMIG_DEBUG << "Signal wait cancelled";
        return;
    }
    if (error) {
        DATAMIG_ERROR_M("Signal wait failed", {"error", error.message()});
        return;
    }
    DATAMIG_WARN_M("Signal caught, stopping after the current batch", {"signal", std::to_string(signal_number)});
    request_stop();
}

void ShutdownSignal::request_stop() {
    {
        std::scoped_lock lock{mutex_};
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock{mutex_};
    return stop_cv_.wait_for(lock, timeout, [this] { return stop_requested_.load(); });
}

}  // namespace datamig::cmd::common
