/**
 * @file GeneratorErrors.hpp
 * @brief Exception hierarchy raised by the cadastral generation pipeline
 *
 * Every pipeline failure derives from GeneratorError, which carries the name
 * of the stage that failed. Cancellation is reported separately through
 * CancelledError because it is a user-initiated, neutral outcome.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cadgen {

/**
 * @brief Base class for all pipeline failures
 *
 * The stage is empty when the error is raised and is filled in by the
 * orchestrator before the error leaves CadastralGenerator::run().
 */
class GeneratorError : public std::runtime_error {
public:
    explicit GeneratorError(const std::string& message)
        : std::runtime_error(message) {}

    const std::string& stage() const noexcept { return stage_; }
    void set_stage(const std::string& stage) { stage_ = stage; }

private:
    std::string stage_;
};

/**
 * @brief Invalid parameter or parameter combination
 */
class ConfigError : public GeneratorError {
public:
    explicit ConfigError(const std::string& message)
        : GeneratorError("Configuration error: " + message) {}
};

/**
 * @brief Target reference frame is unparsable or not measured in linear units
 */
class InvalidFrameError : public ConfigError {
public:
    InvalidFrameError(const std::string& frame, const std::string& reason)
        : ConfigError("reference frame '" + frame + "' " + reason), frame_(frame) {}

    const std::string& frame() const noexcept { return frame_; }

private:
    std::string frame_;
};

/**
 * @brief Required input geometry is missing for the selected mode
 */
class InsufficientInputError : public GeneratorError {
public:
    explicit InsufficientInputError(const std::string& message)
        : GeneratorError("Insufficient input: " + message) {}
};

/**
 * @brief A geometry primitive failed or produced unrepairable output
 */
class GeometryEngineError : public GeneratorError {
public:
    explicit GeometryEngineError(const std::string& message)
        : GeneratorError("Geometry engine error: " + message) {}
};

/**
 * @brief Vector dataset could not be opened, read or written
 */
class DatasetError : public GeneratorError {
public:
    explicit DatasetError(const std::string& message)
        : GeneratorError("Dataset error: " + message) {}
};

/**
 * @brief One-line user message: "Error in <stage>: <what>", or without the
 * stage part when the error was raised outside a stage
 */
inline std::string format_error(const GeneratorError& e) {
    std::string text = "Error";
    if (!e.stage().empty()) {
        text += " in " + e.stage();
    }
    return text + ": " + e.what();
}

/**
 * @brief Run aborted because the progress sink requested cancellation
 *
 * Deliberately not a GeneratorError: callers treat it as a neutral outcome.
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& stage)
        : std::runtime_error("Generation cancelled before stage " + stage), stage_(stage) {}

    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

} // namespace cadgen
