/**
 * @file InputValidator.hpp
 * @brief Validation of generator parameters before a run
 *
 * Collects every out-of-range or contradictory parameter into one report
 * with suggested resolutions, instead of failing on the first problem.
 */

#pragma once

#include "cadastral_generator.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cadgen {

/**
 * @brief A parameter (or combination of parameters) that cannot be used
 */
struct ParameterConflict {
    std::string description;
    std::vector<std::string> involved_params;
    std::vector<std::string> suggestions;
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Check parameter ranges and cross-parameter consistency
     */
    ValidationResult validate(const GeneratorConfig& config) const;

    /**
     * @brief Additionally check that the inputs suit the selected mode
     */
    ValidationResult validate(const GeneratorConfig& config, const InputLayers& inputs) const;

private:
    std::optional<ParameterConflict> check_buffer_distance(const GeneratorConfig& config) const;

    /**
     * @brief Area bounds must be non-negative and max >= min unless max is 0
     */
    std::optional<ParameterConflict> check_area_bounds(const GeneratorConfig& config) const;

    std::optional<ParameterConflict> check_regularization(const GeneratorConfig& config) const;

    std::optional<ParameterConflict> check_buffer_style(const GeneratorConfig& config) const;

    std::optional<ParameterConflict> check_extents(const GeneratorConfig& config) const;

    std::optional<ParameterConflict> check_target_frame(const GeneratorConfig& config) const;

    std::optional<ParameterConflict> check_mode_inputs(const GeneratorConfig& config,
                                                       const InputLayers& inputs) const;
};

} // namespace cadgen
