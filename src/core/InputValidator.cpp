/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "GeometryEngine.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace cadgen {

namespace {

void add_if(ValidationResult& result, std::optional<ParameterConflict> conflict) {
    if (conflict) {
        result.conflicts.push_back(std::move(*conflict));
        result.is_valid = false;
    }
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "Invalid parameters:\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "  " << (i + 1) << ". " << conflict.description << "\n";

        for (const auto& param : conflict.involved_params) {
            oss << "       " << param << "\n";
        }

        for (const auto& suggestion : conflict.suggestions) {
            oss << "       -> " << suggestion << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const GeneratorConfig& config) const {
    ValidationResult result;

    add_if(result, check_buffer_distance(config));
    add_if(result, check_area_bounds(config));
    add_if(result, check_regularization(config));
    add_if(result, check_buffer_style(config));
    add_if(result, check_extents(config));
    add_if(result, check_target_frame(config));

    return result;
}

ValidationResult InputValidator::validate(const GeneratorConfig& config, const InputLayers& inputs) const {
    ValidationResult result = validate(config);
    add_if(result, check_mode_inputs(config, inputs));
    return result;
}

std::optional<ParameterConflict> InputValidator::check_buffer_distance(const GeneratorConfig& config) const {
    if (config.road_buffer_distance > 0.0 && std::isfinite(config.road_buffer_distance)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Road buffer distance must be a positive number";
    conflict.involved_params = {"--buffer " + format_number(config.road_buffer_distance)};
    conflict.suggestions = {"Use --buffer 10 (half-width of the road reserve in working units)"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_area_bounds(const GeneratorConfig& config) const {
    if (config.min_area < 0.0 || config.max_area < 0.0) {
        ParameterConflict conflict;
        conflict.description = "Area bounds must not be negative";
        conflict.involved_params = {
            "--min-area " + format_number(config.min_area),
            "--max-area " + format_number(config.max_area)
        };
        conflict.suggestions = {"Use --max-area 0 to disable the upper bound"};
        return conflict;
    }

    if (config.max_area != 0.0 && config.max_area < config.min_area) {
        ParameterConflict conflict;
        conflict.description = "Maximum area is below minimum area";
        conflict.involved_params = {
            "--min-area " + format_number(config.min_area),
            "--max-area " + format_number(config.max_area)
        };
        conflict.suggestions = {
            "Use --max-area " + format_number(config.min_area) + " or larger",
            "Use --min-area " + format_number(config.max_area) + " or smaller",
            "Use --max-area 0 to disable the upper bound"
        };
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_regularization(const GeneratorConfig& config) const {
    ParameterConflict conflict;

    if (config.angle_tolerance < 0.0 || config.angle_tolerance > 45.0) {
        conflict.involved_params.push_back("--angle-tolerance " + format_number(config.angle_tolerance));
        conflict.suggestions.push_back("Use an angle tolerance between 0 and 45 degrees");
    }
    if (config.max_orthogonalize_iterations <= 0) {
        conflict.involved_params.push_back("--max-iterations " +
                                           std::to_string(config.max_orthogonalize_iterations));
        conflict.suggestions.push_back("Use --max-iterations 1000");
    }
    if (!(config.snap_tolerance > 0.0)) {
        conflict.involved_params.push_back("--snap-tolerance " + format_number(config.snap_tolerance));
        conflict.suggestions.push_back("Use --snap-tolerance 0.001");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.description = "Shape regularization parameters out of range";
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_buffer_style(const GeneratorConfig& config) const {
    if (config.buffer_quadrant_segments < 1) {
        ParameterConflict conflict;
        conflict.description = "Buffer arcs need at least one segment per quarter circle";
        conflict.involved_params = {"buffer_quadrant_segments = " +
                                    std::to_string(config.buffer_quadrant_segments)};
        conflict.suggestions = {"Use buffer_quadrant_segments = 8"};
        return conflict;
    }

    if (config.buffer_end_cap == BufferEndCap::FLAT && !GeometryEngine::supports_flat_end_cap()) {
        ParameterConflict conflict;
        conflict.description = "Flat buffer end caps are not supported by the linked GDAL";
        conflict.involved_params = {"--end-cap flat"};
        conflict.suggestions = {"Use --end-cap round", "Rebuild against GDAL 3.10 or newer"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_extents(const GeneratorConfig& config) const {
    ParameterConflict conflict;

    if (config.tessellation_padding_percent < 0.0) {
        conflict.involved_params.push_back("--tessellation-padding " +
                                           format_number(config.tessellation_padding_percent));
        conflict.suggestions.push_back("Use --tessellation-padding 30");
    }
    if (config.block_extent_padding && !(*config.block_extent_padding > 0.0)) {
        conflict.involved_params.push_back("--block-padding " + format_number(*config.block_extent_padding));
        conflict.suggestions.push_back("Omit --block-padding to use five times the buffer distance");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.description = "Extent padding out of range";
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_target_frame(const GeneratorConfig& config) const {
    if (!config.target_frame.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "No target reference frame given";
    conflict.involved_params = {"--target-crs \"\""};
    conflict.suggestions = {"Use a projected frame with linear units, e.g. --target-crs EPSG:32736"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_mode_inputs(const GeneratorConfig& config,
                                                                   const InputLayers& inputs) const {
    if (config.mode != GenerationMode::CADASTRAL || inputs.buildings.has_value()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Cadastral mode needs a building layer";
    conflict.involved_params = {"--mode cadastral"};
    conflict.suggestions = {"Provide --buildings <file>", "Use --mode blocks for road-only input"};
    return conflict;
}

} // namespace cadgen
