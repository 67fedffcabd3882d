/**
 * @file main.cpp
 * @brief Main entry point for the cadastral parcel generator
 *
 * Reads road centerlines and building points, derives parcel or block
 * polygons and writes them to a single-layer vector dataset.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cadastral_generator.hpp"
#include "GeneratorErrors.hpp"
#include "core/InputValidator.hpp"
#include "core/VectorLayerReader.hpp"
#include "export/VectorExporter.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConsoleProgressSink.hpp"
#include "version.h"
#include <iostream>
#include <chrono>

using namespace cadgen;

/**
 * @brief Load the road layer and, when configured, the building layer
 */
InputLayers load_inputs(const RunOptions& options) {
    VectorLayerReader reader;

    InputLayers inputs;
    inputs.roads = reader.read_lines(options.roads_path, options.roads_layer);
    if (!options.buildings_path.empty()) {
        inputs.buildings = reader.read_points(options.buildings_path, options.buildings_layer);
    }
    return inputs;
}

void print_summary(const GenerationResult& result, const std::string& output_path, int log_level) {
    std::cout << "\n=== Generation Summary ===\n";
    std::cout << output_layer_name(result.mode) << ": " << result.feature_count << "\n";
    std::cout << "Output: " << output_path << "\n";
    if (log_level >= 4) {
        std::cout << "Road reserve parts: " << result.metrics.reserve_parts << "\n";
        if (result.mode == GenerationMode::CADASTRAL) {
            std::cout << "Cells generated: " << result.metrics.cells_generated << "\n";
        }
        std::cout << "Polygons before filtering: " << result.metrics.polygons_regularized << "\n";
        if (result.metrics.polygons_regularized > 0) {
            std::cout << "Area range before filtering: " << result.metrics.smallest_area << " .. "
                      << result.metrics.largest_area << "\n";
        }
        std::cout << "Total time: " << result.metrics.total_time.count() << "ms\n";
    }
    std::cout << "==========================\n";

    if (log_level >= 5 && !result.stage_report.empty()) {
        std::cout << "\n" << result.stage_report;
    }
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.exit_code();
    }

    cli.configure_logging();

    const GeneratorConfig& config = cli.get_config();
    const RunOptions& run_options = cli.get_run_options();
    const bool chatty = !cli.is_silent();

    if (chatty) {
        std::cout << "Cadastral Generator v" << CADGEN_VERSION_STRING << "\n";
        std::cout << "Parcel boundaries from road centerlines and building locations\n";
    }
    cli.print_config();

    try {
        if (cli.is_dry_run()) {
            InputValidator validator;
            ValidationResult validation = validator.validate(config);
            if (validation.has_errors()) {
                std::cerr << validation.format_error_message();
                return EXIT_USAGE_ERROR;
            }
            if (chatty) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return EXIT_OK;
        }

        const auto start_time = std::chrono::steady_clock::now();

        InputLayers inputs = load_inputs(run_options);

        GenerationResult result;
        {
            ConsoleProgressSink progress;
            CadastralGenerator generator(config);
            result = generator.run(inputs, progress);
        }

        VectorExporter::Options export_options;
        if (!run_options.output_format.empty()) {
            export_options.driver_name = VectorExporter::driver_for(run_options.output_format);
        }
        VectorExporter exporter(export_options);
        if (!exporter.export_result(result, run_options.output_path)) {
            std::cerr << "Error: export to " << run_options.output_path << " failed\n";
            return EXIT_PROCESSING_ERROR;
        }

        if (chatty) {
            print_summary(result, run_options.output_path, config.log_level);

            const auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            std::cout << "\nCompleted successfully in " << total_duration.count() << "ms\n";
        }
        return EXIT_OK;

    } catch (const ConfigError& e) {
        std::cerr << format_error(e) << "\n";
        return EXIT_USAGE_ERROR;
    } catch (const CancelledError& e) {
        std::cerr << "Cancelled before stage " << e.stage() << "\n";
        return EXIT_CANCELLED;
    } catch (const GeneratorError& e) {
        std::cerr << format_error(e) << "\n";
        return EXIT_PROCESSING_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_PROCESSING_ERROR;
    }
}

// Example usage:
//
// Parcels from roads and building points:
// ./cadastral-gen --roads roads.gpkg --buildings buildings.gpkg --output erven.gpkg
//
// Blocks only, wider reserve, shapefile output:
// ./cadastral-gen --roads roads.shp --blocks --buffer 15 --output blocks.shp
