/**
 * @file StageTracker.cpp
 * @brief Implementation of pipeline stage tracking
 */

#include "StageTracker.hpp"
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace cadgen {

StageTracker::StageTracker()
    : verbose_(false), tracking_start_time_(std::chrono::steady_clock::now()), logger_("StageTracker") {
}

StageTracker::StageTracker(bool verbose)
    : verbose_(verbose), tracking_start_time_(std::chrono::steady_clock::now()), logger_("StageTracker") {
}

void StageTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    if (verbose_) {
        logMessage("> " + stage_name);
    }
}

void StageTracker::completeStage(const std::string& stage_name, bool successful, const std::string& error) {
    PipelineStage* stage = findStage(stage_name);
    if (!stage) {
        logger_.warning("completeStage called for unknown stage " + stage_name);
        return;
    }

    stage->complete(successful, error);
    if (!verbose_) return;

    logMessage("< " + stage_name + " " + (successful ? "ok" : "failed") + " after " +
               formatDuration(stage->duration()) + (successful ? "" : ": " + error));
}

void StageTracker::addStageData(const std::string& stage_name, const std::string& key, const std::string& value) {
    PipelineStage* stage = findStage(stage_name);
    if (!stage) {
        return;
    }

    auto it = std::find_if(stage->stage_data.begin(), stage->stage_data.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it != stage->stage_data.end()) {
        it->second = value;
    } else {
        stage->stage_data.emplace_back(key, value);
    }

    if (verbose_) {
        logMessage("  " + stage_name + "." + key + " = " + value);
    }
}

std::string StageTracker::getPipelineStatus() const {
    std::string status = std::to_string(getCompletedStageCount()) + " of " +
                         std::to_string(stages_.size()) + " stage(s) finished";
    if (stages_.empty()) return status;

    const PipelineStage& last = stages_.back();
    if (!last.completed) {
        status += ", running " + last.stage_name;
    } else if (!last.successful) {
        status += ", " + last.stage_name + " failed";
    }
    return status;
}

std::string StageTracker::getTimingReport() const {
    std::chrono::milliseconds in_stages(0);
    for (const PipelineStage& stage : stages_) {
        in_stages += stage.duration();
    }
    return "Elapsed " + formatDuration(getElapsed()) + " (" + formatDuration(in_stages) + " in stages)";
}

std::string StageTracker::getDetailedReport() const {
    std::ostringstream out;
    out << "Stage report\n";
    for (const PipelineStage& stage : stages_) {
        out << "  " << stage.stage_name << ": ";
        if (!stage.completed) {
            out << "running";
        } else {
            out << formatDuration(stage.duration());
            if (!stage.successful) out << ", failed (" << stage.error_message << ")";
        }
        out << "\n";

        for (const auto& entry : stage.stage_data) {
            out << "    " << entry.first << " = " << entry.second << "\n";
        }
    }
    out << getTimingReport() << "\n";
    return out.str();
}

void StageTracker::printSummary() const {
    size_t width = 0;
    for (const auto& stage : stages_) {
        width = std::max(width, stage.stage_name.size());
    }

    std::ostringstream summary;
    summary << getPipelineStatus() << "\n";
    for (const auto& stage : stages_) {
        summary << "  " << std::left << std::setw(static_cast<int>(width)) << stage.stage_name << "  "
                << std::right << std::setw(8)
                << (stage.completed ? formatDuration(stage.duration()) : std::string("-"));
        if (stage.completed && !stage.successful) {
            summary << "  FAILED";
        }
        summary << "\n";
    }
    summary << getTimingReport();
    logger_.info(summary.str());
}

size_t StageTracker::getCompletedStageCount() const {
    return std::count_if(stages_.begin(), stages_.end(),
                         [](const PipelineStage& stage) { return stage.completed; });
}

std::chrono::milliseconds StageTracker::getElapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);
}

void StageTracker::clear() {
    stages_.clear();
    tracking_start_time_ = std::chrono::steady_clock::now();
}

std::string StageTracker::formatDuration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms < 1000) return std::to_string(ms) + " ms";

    std::ostringstream out;
    if (ms < 60000) {
        out << std::fixed << std::setprecision(2) << ms / 1000.0 << " s";
    } else {
        out << ms / 60000 << " min " << (ms % 60000) / 1000 << " s";
    }
    return out.str();
}

void StageTracker::logMessage(const std::string& message) const {
    logger_.info(message);
}

PipelineStage* StageTracker::findStage(const std::string& stage_name) {
    // Latest stage with this name wins
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (it->stage_name == stage_name) return &*it;
    }
    return nullptr;
}

const PipelineStage* StageTracker::findStage(const std::string& stage_name) const {
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (it->stage_name == stage_name) return &*it;
    }
    return nullptr;
}

} // namespace cadgen
