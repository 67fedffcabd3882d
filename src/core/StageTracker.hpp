/**
 * @file StageTracker.hpp
 * @brief Pipeline stage timing and per-stage data tracking
 *
 * Each pipeline stage records its start and end time, outcome and a list
 * of key/value observations (feature counts, areas). The orchestrator
 * renders the result into GenerationResult::stage_report.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <string>
#include <vector>
#include <utility>
#include <chrono>

namespace cadgen {

/**
 * @brief One pipeline stage
 */
struct PipelineStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::vector<std::pair<std::string, std::string>> stage_data;  // insertion order is report order

    explicit PipelineStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Records the stages of one generation run
 */
class StageTracker {
public:
    StageTracker();
    explicit StageTracker(bool verbose);

    // Stage tracking
    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true, const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key, const std::string& value);

    // State queries for logging
    std::string getPipelineStatus() const;
    std::string getTimingReport() const;
    std::string getDetailedReport() const;

    /**
     * @brief Log one line per stage with its duration and outcome
     */
    void printSummary() const;

    bool isVerbose() const { return verbose_; }

    size_t getCompletedStageCount() const;
    const std::vector<PipelineStage>& getStages() const { return stages_; }
    const PipelineStage* findStage(const std::string& stage_name) const;
    PipelineStage* findStage(const std::string& stage_name);

    std::chrono::milliseconds getElapsed() const;

    void clear();

private:
    bool verbose_;
    std::vector<PipelineStage> stages_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    mutable Logger logger_;

    static std::string formatDuration(std::chrono::milliseconds duration);
    void logMessage(const std::string& message) const;
};

} // namespace cadgen
