/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration files for the cadastral generator
 */

#pragma once

#include "cadastral_generator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace cadgen {

/**
 * @brief Input/output settings that live beside GeneratorConfig in a config file
 */
struct RunOptions {
    std::string roads_path;
    std::string roads_layer;
    std::string buildings_path;
    std::string buildings_layer;
    std::string output_path;
    std::string output_format;     ///< Empty: inferred from output_path
    bool dry_run = false;
};

/**
 * @brief Loads, edits and saves JSON configuration documents
 *
 * Keys mirror GeneratorConfig field names ("road_buffer_distance",
 * "min_area", ...), with "target_crs" for the frame and "mode",
 * "buffer_end_cap" as strings. I/O keys: "roads", "roads_layer",
 * "buildings", "buildings_layer", "output", "output_format".
 * Unknown keys are ignored with a warning.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @return true if the file was read and is a JSON object
     */
    bool load_from_file(const std::string& filename);

    bool load_from_string(const std::string& text);

    /**
     * @brief Save configuration to file (pretty-printed)
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Write a configuration file holding every default value
     */
    static bool create_default_file(const std::string& filename);

    /**
     * @brief Overlay the document on base
     * @throws ConfigError for values of the wrong type or unknown enum names
     */
    GeneratorConfig to_generator_config(const GeneratorConfig& base = GeneratorConfig()) const;

    void from_generator_config(const GeneratorConfig& config);

    /**
     * @brief Overlay the I/O keys on base
     */
    RunOptions to_run_options(const RunOptions& base = RunOptions()) const;

    void from_run_options(const RunOptions& options);

    void set_value(const std::string& key, const nlohmann::json& value) {
        document_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return document_.contains(key) && !document_[key].is_null();
    }

    const nlohmann::json& document() const { return document_; }

private:
    nlohmann::json document_ = nlohmann::json::object();

    template <typename T>
    void read_into(const std::string& key, T& target) const;
};

} // namespace cadgen
