/**
 * @file ProgressSink.hpp
 * @brief Progress reporting and cooperative cancellation interface
 */

#pragma once

#include <string>

namespace cadgen {

/**
 * @brief Receiver for pipeline progress, polled for cancellation
 *
 * The pipeline calls report() with non-decreasing percentages and polls
 * is_cancelled() only at stage boundaries.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /**
     * @brief Report progress
     * @param percent Completion in the range 0..100
     * @param message Short description of the stage being entered
     */
    virtual void report(int percent, const std::string& message) = 0;

    /**
     * @brief Poll point for cooperative cancellation
     */
    virtual bool is_cancelled() const = 0;

    /**
     * @brief Notification that a stage failed, sent before the error propagates
     */
    virtual void report_failure(const std::string& /*stage*/, const std::string& /*message*/) {}
};

/**
 * @brief Headless sink: ignores progress and never cancels
 */
class NullProgressSink : public ProgressSink {
public:
    void report(int, const std::string&) override {}
    bool is_cancelled() const override { return false; }
};

} // namespace cadgen
