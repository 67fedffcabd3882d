/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "GeneratorErrors.hpp"
#include "../core/Logger.hpp"
#include "../export/VectorExporter.hpp"
#include "version.h"
#include <algorithm>
#include <iostream>
#include <cstdlib>

namespace cadgen {

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.begin_section("INPUT/OUTPUT");
    parser.add_option("roads", "r", "Road centerline dataset (any OGR vector format)");
    parser.add_option("roads-layer", "", "Layer to read from the roads dataset (default: first layer)");
    parser.add_option("buildings", "b", "Building point dataset (required in cadastral mode)");
    parser.add_option("buildings-layer", "", "Layer to read from the buildings dataset (default: first layer)");
    parser.add_option("output", "o", "Output dataset path");
    parser.add_option("output-format", "f", "gpkg, shapefile or geojson (default: from the output extension)");
    parser.add_option("target-crs", "", "Projected working frame, e.g. EPSG:32736 (default: EPSG:32736)");

    parser.begin_section("GENERATION");
    parser.add_option("mode", "m", "cadastral or blocks (default: cadastral)");
    parser.add_flag("blocks", "", "Same as --mode blocks");
    parser.add_option("buffer", "", "Road reserve half-width in working units (default: 10)");
    parser.add_option("min-area", "", "Smallest area kept, inclusive (default: 250)");
    parser.add_option("max-area", "", "Largest area kept, inclusive; 0 disables the bound (default: 2000)");
    parser.add_option("end-cap", "", "Road buffer end caps: round or flat (default: round)");
    parser.add_option("tessellation-padding", "", "Tessellation extent padding, percent of the point extent (default: 30)");
    parser.add_option("block-padding", "", "Block extent padding in working units (default: 5 x buffer)");
    parser.add_flag("clip-to-blocks", "", "Confine cadastral parcels to the blocks enclosed by the roads");

    parser.begin_section("SHAPE REGULARIZATION");
    parser.add_flag("orthogonalize", "", "Square near-right corners (default)");
    parser.add_flag("no-orthogonalize", "", "Keep tessellation angles");
    parser.add_option("angle-tolerance", "", "Degrees from 90/180 still squared, 0..45 (default: 15)");
    parser.add_option("max-iterations", "", "Orthogonalization iteration cap (default: 1000)");
    parser.add_option("snap-tolerance", "", "Vertex snapping distance (default: 0.001)");

    parser.begin_section("CONFIGURATION & LOGGING");
    parser.add_option("config", "c", "Load settings from a JSON configuration file");
    parser.add_option("create-config", "", "Write a default configuration file and exit");
    parser.add_flag("dry-run", "", "Validate inputs and settings without processing");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "facility levels as \"3,ShapeRegularizer=5\"");
    parser.add_option("log-file", "", "Append log output to a file");
    parser.add_flag("verbose", "v", "Same as --log-level 6");
    parser.add_flag("silent", "s", "No console output");
    parser.add_flag("version", "", "Show version information");
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("cadastral-gen",
        "Generate cadastral parcel boundaries (or road-enclosed blocks) from road\n"
        "centerlines and building locations");
    register_options(parser);

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? EXIT_OK : EXIT_USAGE_ERROR;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "Cadastral Generator v" << CADGEN_VERSION_STRING << std::endl;
        std::cout << "Built with GDAL/OGR, CGAL, Eigen and nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = EXIT_OK;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!ConfigurationManager::create_default_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = EXIT_USAGE_ERROR;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = EXIT_OK;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        ConfigurationManager manager;
        if (!manager.load_from_file(config_file.value())) {
            return usage_error("Failed to load configuration file: " + config_file.value());
        }
        try {
            config_ = manager.to_generator_config(config_);
            run_options_ = manager.to_run_options(run_options_);
        } catch (const ConfigError& e) {
            return usage_error(std::string(e.what()) + " in " + config_file.value());
        }
    }

    if (!parser.get_positional().empty()) {
        return usage_error("Unexpected argument: " + parser.get_positional().front());
    }

    if (!parse_all_options(parser)) {
        return false;
    }

    if (run_options_.roads_path.empty()) {
        return usage_error("No road layer given (use --roads or the \"roads\" config key)");
    }
    if (run_options_.output_path.empty() && !run_options_.dry_run) {
        return usage_error("No output path given (use --output or the \"output\" config key)");
    }

    if (!run_options_.output_format.empty() &&
        VectorExporter::driver_for(run_options_.output_format).empty()) {
        return usage_error("Unsupported output format '" + run_options_.output_format +
                           "' (use gpkg, shapefile or geojson)");
    }
    if (run_options_.output_format.empty() && !run_options_.output_path.empty() &&
        VectorExporter::driver_for_path(run_options_.output_path).empty()) {
        return usage_error("Cannot infer an output format from '" + run_options_.output_path +
                           "' (use --output-format)");
    }

    return true;
}

bool CommandLineInterface::usage_error(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
    exit_code_ = EXIT_USAGE_ERROR;
    return false;
}

template <typename T>
bool CommandLineInterface::parse_number(const SimpleCommandLineParser& parser, const std::string& name, T& target) {
    if (!parser.get(name)) {
        return true;
    }
    auto value = parser.get_as<T>(name);
    if (!value) {
        return usage_error("Invalid number for --" + name + ": " + parser.get(name).value());
    }
    target = value.value();
    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Input/output
    if (auto value = parser.get("roads")) run_options_.roads_path = value.value();
    if (auto value = parser.get("roads-layer")) run_options_.roads_layer = value.value();
    if (auto value = parser.get("buildings")) run_options_.buildings_path = value.value();
    if (auto value = parser.get("buildings-layer")) run_options_.buildings_layer = value.value();
    if (auto value = parser.get("output")) run_options_.output_path = value.value();
    if (auto value = parser.get("output-format")) run_options_.output_format = value.value();
    if (auto value = parser.get("target-crs")) config_.target_frame = value.value();

    // Mode
    if (auto value = parser.get("mode")) {
        auto mode = parse_generation_mode(value.value());
        if (!mode) {
            return usage_error("Unknown mode '" + value.value() + "' (use cadastral or blocks)");
        }
        config_.mode = *mode;
    }
    if (parser.get_flag("blocks")) {
        if (parser.get("mode") && config_.mode != GenerationMode::BLOCKS) {
            return usage_error("--blocks contradicts --mode " + parser.get("mode").value());
        }
        config_.mode = GenerationMode::BLOCKS;
    }

    // Numeric parameters
    if (!parse_number(parser, "buffer", config_.road_buffer_distance)) return false;
    if (!parse_number(parser, "min-area", config_.min_area)) return false;
    if (!parse_number(parser, "max-area", config_.max_area)) return false;
    if (!parse_number(parser, "tessellation-padding", config_.tessellation_padding_percent)) return false;
    if (!parse_number(parser, "angle-tolerance", config_.angle_tolerance)) return false;
    if (!parse_number(parser, "max-iterations", config_.max_orthogonalize_iterations)) return false;
    if (!parse_number(parser, "snap-tolerance", config_.snap_tolerance)) return false;

    if (parser.get("block-padding")) {
        double padding = 0.0;
        if (!parse_number(parser, "block-padding", padding)) return false;
        config_.block_extent_padding = padding;
    }

    if (auto value = parser.get("end-cap")) {
        auto cap = parse_buffer_end_cap(value.value());
        if (!cap) {
            return usage_error("Unknown end cap '" + value.value() + "' (use round or flat)");
        }
        config_.buffer_end_cap = *cap;
    }

    // Boolean options
    parse_boolean_option(parser, "orthogonalize", "no-orthogonalize", config_.orthogonalize);
    if (parser.get_flag("clip-to-blocks")) {
        config_.clip_to_blocks = true;
    }

    run_options_.dry_run = parser.get_flag("dry-run");

    return parse_logging_options(parser);
}

bool CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    auto apply_level_config = [this](const std::string& text) -> bool {
        log_config_ = text;
        // The leading bare number, if any, is the default level
        const std::string first = text.substr(0, text.find(','));
        if (first.find('=') == std::string::npos) {
            try {
                config_.log_level = std::stoi(first);
            } catch (const std::exception&) {
                return usage_error("Invalid log level: " + text);
            }
        }
        return true;
    };

    // CLI > environment > config file > defaults
    if (const char* env_level = std::getenv("CADGEN_LOG_LEVEL")) {
        if (!apply_level_config(env_level)) return false;
    }
    if (auto value = parser.get("log-level")) {
        if (!apply_level_config(value.value())) return false;
    }

    if (parser.get_flag("silent")) {
        silent_ = true;
        config_.log_level = 1;
    }
    if (parser.get_flag("verbose")) {
        if (silent_) {
            return usage_error("--verbose and --silent are mutually exclusive");
        }
        config_.log_level = 6;
    }

    if (const char* env_file = std::getenv("CADGEN_LOG_FILE")) {
        config_.log_file = std::string(env_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }

    if (config_.log_level < 1 || config_.log_level > 6) {
        return usage_error("Log level must be between 1 and 6, got " + std::to_string(config_.log_level));
    }
    return true;
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
}

void CommandLineInterface::configure_logging() const {
    Logger::setDefaultLevel(static_cast<LogLevel>(std::clamp(config_.log_level, 1, 6)));
    if (!log_config_.empty() && !Logger::parseLogConfig(log_config_)) {
        std::cerr << "Warning: some log level settings in '" << log_config_ << "' were ignored" << std::endl;
    }
    if (silent_) {
        Logger::setConsoleEnabled(false);
    }
    if (config_.log_file && !Logger::setGlobalLogFile(config_.log_file)) {
        std::cerr << "Warning: logging to console only" << std::endl;
    }
}

void CommandLineInterface::print_config() const {
    if (silent_ || config_.log_level < 4) return;

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Mode: " << to_string(config_.mode) << "\n";
    std::cout << "Roads: " << run_options_.roads_path;
    if (!run_options_.roads_layer.empty()) std::cout << " [" << run_options_.roads_layer << "]";
    std::cout << "\n";
    if (!run_options_.buildings_path.empty()) {
        std::cout << "Buildings: " << run_options_.buildings_path;
        if (!run_options_.buildings_layer.empty()) std::cout << " [" << run_options_.buildings_layer << "]";
        std::cout << "\n";
    }
    std::cout << "Output: " << run_options_.output_path;
    if (!run_options_.output_format.empty()) std::cout << " (" << run_options_.output_format << ")";
    std::cout << "\n";
    std::cout << "Working frame: " << config_.target_frame << "\n";
    std::cout << "Road buffer: " << config_.road_buffer_distance << " (" << to_string(config_.buffer_end_cap)
              << " caps)\n";
    std::cout << "Area range: " << config_.min_area << " .. "
              << (config_.max_area == 0.0 ? std::string("unbounded") : std::to_string(config_.max_area)) << "\n";
    std::cout << "Orthogonalize: " << (config_.orthogonalize ? "yes" : "no");
    if (config_.orthogonalize) {
        std::cout << " (tolerance " << config_.angle_tolerance << " deg, max "
                  << config_.max_orthogonalize_iterations << " iterations)";
    }
    std::cout << "\n";
    if (config_.mode == GenerationMode::BLOCKS || config_.clip_to_blocks) {
        std::cout << "Block padding: " << config_.effective_block_padding() << "\n";
    }
    std::cout << "=====================\n\n";
}

} // namespace cadgen
