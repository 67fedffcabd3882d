/**
 * @file ConsoleProgressSink.cpp
 * @brief Implementation of the console progress sink
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ConsoleProgressSink.hpp"
#include <iomanip>
#include <sstream>

namespace cadgen {

volatile std::sig_atomic_t ConsoleProgressSink::interrupted_ = 0;

ConsoleProgressSink::ConsoleProgressSink()
    : logger_("Progress") {
    interrupted_ = 0;
    previous_handler_ = std::signal(SIGINT, signal_handler);
    if (previous_handler_ == SIG_ERR) {
        logger_.warning("Cannot install interrupt handler, Ctrl+C will terminate immediately");
        previous_handler_ = SIG_DFL;
    }
}

ConsoleProgressSink::~ConsoleProgressSink() {
    std::signal(SIGINT, previous_handler_);
}

void ConsoleProgressSink::signal_handler(int /*signal_number*/) {
    interrupted_ = 1;
}

void ConsoleProgressSink::request_cancel() {
    interrupted_ = 1;
}

bool ConsoleProgressSink::is_cancelled() const {
    return interrupted_ != 0;
}

void ConsoleProgressSink::report(int percent, const std::string& message) {
    last_percent_ = percent;

    std::ostringstream line;
    line << "[" << std::setw(3) << percent << "%] " << message;
    logger_.info(line.str());
}

void ConsoleProgressSink::report_failure(const std::string& stage, const std::string& message) {
    logger_.error("Stage " + stage + " failed: " + message);
}

} // namespace cadgen
