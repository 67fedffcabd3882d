/**
 * @file ConsoleProgressSink.hpp
 * @brief Progress sink that logs stage progress and honours Ctrl+C
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "ProgressSink.hpp"
#include "../core/Logger.hpp"
#include <csignal>

namespace cadgen {

/**
 * @brief Logs progress lines and turns SIGINT into a cancellation request
 *
 * The SIGINT handler is installed for the lifetime of the sink and the
 * previous handler restored on destruction. Only one sink may be installed
 * at a time. The run stops at the next stage boundary.
 */
class ConsoleProgressSink : public ProgressSink {
public:
    ConsoleProgressSink();
    ~ConsoleProgressSink() override;

    ConsoleProgressSink(const ConsoleProgressSink&) = delete;
    ConsoleProgressSink& operator=(const ConsoleProgressSink&) = delete;

    void report(int percent, const std::string& message) override;
    bool is_cancelled() const override;
    void report_failure(const std::string& stage, const std::string& message) override;

    /**
     * @brief Request cancellation as if SIGINT had been received
     */
    void request_cancel();

    int last_percent() const { return last_percent_; }

private:
    static void signal_handler(int signal_number);
    static volatile std::sig_atomic_t interrupted_;

    using Handler = void (*)(int);
    Handler previous_handler_;
    int last_percent_ = -1;
    Logger logger_;
};

} // namespace cadgen
