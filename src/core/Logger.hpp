/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component owns a Logger named after itself. All output goes through
 * outputMessage(), which holds the single verbosity check, and doOutput(),
 * which holds the single console write.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace cadgen {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (degraded result or skipped input)
 * Level 3: Information (stage-level progress)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,      // default
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Printable tag for a level ("ERROR", "WARN", ...)
 */
const char* log_level_tag(LogLevel level);

/**
 * @brief Logger with a single point of output control
 *
 * Consecutive identical messages are collapsed into one line plus a
 * repeat count, emitted when a different message arrives or on flush.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Logger for a named facility (component)
     * @param component_name Facility name used for level lookup and as output prefix
     */
    Logger(const std::string& component_name);

    ~Logger();

    /**
     * @brief Output a message if it meets the effective verbosity level
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, emitting any pending repeat count
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility
     *
     * @example
     * Logger::setFacilityLevel("ShapeRegularizer", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Fallback level for facilities without a specific level
     */
    static void setDefaultLevel(LogLevel level);
    static LogLevel getDefaultLevel();

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * - "5" sets the default to DEBUG
     * - "ParcelTessellator=6,AreaFilter=3" sets facility levels
     * - "4,ShapeRegularizer=6" mixes both
     * - "default=3" is equivalent to "3"
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Facility level, else instance level, else global default
     */
    LogLevel getEffectiveLevel() const;

    /**
     * @brief Route every Logger's output additionally to a file
     * @param log_file Path to append to, or nullopt to stop
     * @return false if the file could not be opened
     */
    static bool setGlobalLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Suppress console output entirely (file output continues)
     */
    static void setConsoleEnabled(bool enabled);

private:
    LogLevel current_level_;
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility-based logging registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static bool console_enabled_;

    static void flushStreams();
    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace cadgen
