/**
 * @file ConfigurationManager.cpp
 * @brief JSON configuration management for the cadastral generator
 */

#include "ConfigurationManager.hpp"
#include "GeneratorErrors.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace cadgen {

namespace {

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "road_buffer_distance", "min_area", "max_area", "target_crs", "mode",
        "orthogonalize", "angle_tolerance", "max_orthogonalize_iterations", "snap_tolerance",
        "buffer_end_cap", "buffer_quadrant_segments",
        "tessellation_padding_percent", "block_extent_padding", "clip_to_blocks",
        "log_level", "log_file",
        "roads", "roads_layer", "buildings", "buildings_layer", "output", "output_format"
    };
    return keys;
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    Logger logger("ConfigurationManager");

    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("Could not open config file: " + filename);
        return false;
    }

    try {
        json parsed;
        file >> parsed;
        if (!parsed.is_object()) {
            logger.error("Config file " + filename + " does not contain a JSON object");
            return false;
        }
        for (const auto& [key, value] : parsed.items()) {
            if (known_keys().count(key) == 0) {
                logger.warning("Ignoring unknown configuration key '" + key + "'");
            }
            document_[key] = value;
        }
    } catch (const json::exception& e) {
        logger.error("Error parsing JSON config file " + filename + ": " + e.what());
        return false;
    }

    logger.detailed("Loaded configuration from " + filename);
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& text) {
    Logger logger("ConfigurationManager");

    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        logger.error("Configuration text is not a JSON object");
        return false;
    }
    for (const auto& [key, value] : parsed.items()) {
        document_[key] = value;
    }
    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Logger("ConfigurationManager").error("Could not write config file: " + filename);
        return false;
    }

    file << document_.dump(2) << std::endl;
    return file.good();
}

bool ConfigurationManager::create_default_file(const std::string& filename) {
    ConfigurationManager manager;
    manager.from_generator_config(GeneratorConfig());

    RunOptions options;
    options.roads_path = "roads.gpkg";
    options.buildings_path = "buildings.gpkg";
    options.output_path = "cadastrals.gpkg";
    manager.from_run_options(options);

    return manager.save_to_file(filename);
}

template <typename T>
void ConfigurationManager::read_into(const std::string& key, T& target) const {
    if (!has_value(key)) return;
    try {
        target = document_.at(key).get<T>();
    } catch (const json::exception&) {
        throw ConfigError("configuration key '" + key + "' has the wrong type (" +
                          std::string(document_.at(key).type_name()) + ")");
    }
}

GeneratorConfig ConfigurationManager::to_generator_config(const GeneratorConfig& base) const {
    GeneratorConfig config = base;

    read_into("road_buffer_distance", config.road_buffer_distance);
    read_into("min_area", config.min_area);
    read_into("max_area", config.max_area);
    read_into("target_crs", config.target_frame);
    read_into("orthogonalize", config.orthogonalize);
    read_into("angle_tolerance", config.angle_tolerance);
    read_into("max_orthogonalize_iterations", config.max_orthogonalize_iterations);
    read_into("snap_tolerance", config.snap_tolerance);
    read_into("buffer_quadrant_segments", config.buffer_quadrant_segments);
    read_into("tessellation_padding_percent", config.tessellation_padding_percent);
    read_into("clip_to_blocks", config.clip_to_blocks);
    read_into("log_level", config.log_level);

    if (has_value("block_extent_padding")) {
        double padding = 0.0;
        read_into("block_extent_padding", padding);
        config.block_extent_padding = padding;
    }

    if (has_value("log_file")) {
        std::string log_file;
        read_into("log_file", log_file);
        config.log_file = log_file;
    }

    if (has_value("mode")) {
        std::string mode_name;
        read_into("mode", mode_name);
        auto mode = parse_generation_mode(mode_name);
        if (!mode) {
            throw ConfigError("unknown mode '" + mode_name + "' (expected cadastral or blocks)");
        }
        config.mode = *mode;
    }

    if (has_value("buffer_end_cap")) {
        std::string cap_name;
        read_into("buffer_end_cap", cap_name);
        auto cap = parse_buffer_end_cap(cap_name);
        if (!cap) {
            throw ConfigError("unknown buffer end cap '" + cap_name + "' (expected round or flat)");
        }
        config.buffer_end_cap = *cap;
    }

    return config;
}

void ConfigurationManager::from_generator_config(const GeneratorConfig& config) {
    document_["road_buffer_distance"] = config.road_buffer_distance;
    document_["min_area"] = config.min_area;
    document_["max_area"] = config.max_area;
    document_["target_crs"] = config.target_frame;
    document_["mode"] = to_string(config.mode);
    document_["orthogonalize"] = config.orthogonalize;
    document_["angle_tolerance"] = config.angle_tolerance;
    document_["max_orthogonalize_iterations"] = config.max_orthogonalize_iterations;
    document_["snap_tolerance"] = config.snap_tolerance;
    document_["buffer_end_cap"] = to_string(config.buffer_end_cap);
    document_["buffer_quadrant_segments"] = config.buffer_quadrant_segments;
    document_["tessellation_padding_percent"] = config.tessellation_padding_percent;
    document_["block_extent_padding"] = config.block_extent_padding ? json(*config.block_extent_padding)
                                                                    : json(nullptr);
    document_["clip_to_blocks"] = config.clip_to_blocks;
    document_["log_level"] = config.log_level;
    document_["log_file"] = config.log_file ? json(*config.log_file) : json(nullptr);
}

RunOptions ConfigurationManager::to_run_options(const RunOptions& base) const {
    RunOptions options = base;
    read_into("roads", options.roads_path);
    read_into("roads_layer", options.roads_layer);
    read_into("buildings", options.buildings_path);
    read_into("buildings_layer", options.buildings_layer);
    read_into("output", options.output_path);
    read_into("output_format", options.output_format);
    return options;
}

void ConfigurationManager::from_run_options(const RunOptions& options) {
    document_["roads"] = options.roads_path;
    document_["roads_layer"] = options.roads_layer;
    document_["buildings"] = options.buildings_path;
    document_["buildings_layer"] = options.buildings_layer;
    document_["output"] = options.output_path;
    document_["output_format"] = options.output_format;
}

} // namespace cadgen
