/**
 * @file StageRunner.hpp
 * @brief Runs one pipeline stage between cancellation, progress and failure reporting
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "GeneratorErrors.hpp"
#include "ProgressSink.hpp"
#include "StageTracker.hpp"
#include "Logger.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace cadgen {

/**
 * @brief Wraps each stage of a run
 *
 * Before the stage: poll for cancellation, report progress, open the stage
 * in the tracker. A GeneratorError leaving the stage is stamped with the
 * stage name; any std::exception is recorded in the tracker and sent to the
 * sink's report_failure() before it propagates.
 */
class StageRunner {
public:
    StageRunner(StageTracker& tracker, ProgressSink& sink, const Logger& logger)
        : tracker_(tracker), sink_(sink), logger_(logger) {}

    template <typename StageFn>
    auto run(const std::string& name, int percent, StageFn&& stage) -> std::invoke_result_t<StageFn&> {
        if (sink_.is_cancelled()) {
            logger_.warning("Cancellation requested, stopping before " + name);
            throw CancelledError(name);
        }

        sink_.report(percent, name);
        tracker_.startStage(name);

        try {
            auto value = stage();
            tracker_.completeStage(name, true);
            return value;
        } catch (GeneratorError& e) {
            e.set_stage(name);
            fail(name, e.what());
            throw;
        } catch (const std::exception& e) {
            fail(name, e.what());
            throw;
        }
    }

private:
    void fail(const std::string& name, const std::string& message) {
        tracker_.completeStage(name, false, message);
        logger_.error(name + " failed: " + message);
        sink_.report_failure(name, message);
    }

    StageTracker& tracker_;
    ProgressSink& sink_;
    const Logger& logger_;
};

} // namespace cadgen
