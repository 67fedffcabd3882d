/**
 * @file CadastralGenerator.cpp
 * @brief Pipeline orchestration for cadastral and block generation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cadastral_generator.hpp"
#include "GeneratorErrors.hpp"
#include "ProgressSink.hpp"
#include "StageTracker.hpp"
#include "StageRunner.hpp"
#include "Logger.hpp"
#include "InputValidator.hpp"
#include "CoordinateNormalizer.hpp"
#include "RoadReserveBuilder.hpp"
#include "ParcelTessellator.hpp"
#include "GeometrySubtractor.hpp"
#include "BlockExtentCarver.hpp"
#include "ShapeRegularizer.hpp"
#include "AreaFilter.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace cadgen {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Progress percentages reported when each stage is entered
constexpr int kProgressValidate = 0;
constexpr int kProgressNormalize = 0;
constexpr int kProgressBufferRoads = 10;
constexpr int kProgressTessellate = 25;
constexpr int kProgressSubtract = 45;
constexpr int kProgressClipToBlocks = 60;
constexpr int kProgressCarveBlocks = 35;
constexpr int kProgressRegularizeCadastral = 65;
constexpr int kProgressRegularizeBlocks = 55;
constexpr int kProgressFilter = 85;

} // namespace

// ============================================================================
// CadastralGenerator::Impl - Private implementation
// ============================================================================

class CadastralGenerator::Impl {
public:
    explicit Impl(const GeneratorConfig& config)
        : config_(config),
          logger_("CadastralGenerator"),
          tracker_(config.log_level >= 4) {
        logger_.setLogLevel(static_cast<LogLevel>(std::clamp(config_.log_level, 1, 6)));
    }

    GenerationResult run(const InputLayers& inputs, ProgressSink& sink) {
        // Snapshot: nothing the caller does during the run can reach the stages
        const GeneratorConfig config = config_;
        const auto start_time = std::chrono::steady_clock::now();

        tracker_.clear();

        GenerationResult result;
        result.mode = config.mode;
        result.frame = config.target_frame;
        result.metrics.input_lines = inputs.roads.lines.size();
        result.metrics.input_points = inputs.buildings ? inputs.buildings->points.size() : 0;

        logger_.info("Starting " + to_string(config.mode) + " generation: " +
                     std::to_string(result.metrics.input_lines) + " road(s), " +
                     std::to_string(result.metrics.input_points) + " building point(s)");

        run_stage("Validate", kProgressValidate, sink, [&]() {
            InputValidator validator;
            ValidationResult validation = validator.validate(config, inputs);
            if (validation.has_errors()) {
                throw ConfigError(validation.format_error_message());
            }
            return true;
        });

        InputLayers normalized = run_stage("Normalize", kProgressNormalize, sink, [&]() {
            CoordinateNormalizer normalizer(config.target_frame);
            InputLayers layers;
            layers.roads = normalizer.normalize(inputs.roads);
            if (inputs.buildings) {
                layers.buildings = normalizer.normalize(*inputs.buildings);
            }
            return layers;
        });

        RoadReserve reserve = run_stage("BufferRoads", kProgressBufferRoads, sink, [&]() {
            RoadReserveBuilder::Options options;
            options.buffer_distance = config.road_buffer_distance;
            options.style.end_cap = config.buffer_end_cap;
            options.style.quadrant_segments = config.buffer_quadrant_segments;

            RoadReserve built = RoadReserveBuilder(options).build(normalized.roads.lines);
            tracker_.addStageData("BufferRoads", "reserve_parts", std::to_string(built.size()));
            tracker_.addStageData("BufferRoads", "reserve_area",
                                  std::to_string(GeometryEngine::total_area(built)));
            return built;
        });
        result.metrics.reserve_parts = reserve.size();

        PolygonSet polygons;
        int regularize_progress = kProgressRegularizeCadastral;

        switch (config.mode) {
            case GenerationMode::CADASTRAL:
                polygons = run_cadastral_branch(config, normalized, reserve, sink, result.metrics);
                regularize_progress = kProgressRegularizeCadastral;
                break;
            case GenerationMode::BLOCKS:
                polygons = run_stage("CarveBlocks", kProgressCarveBlocks, sink, [&]() {
                    PolygonSet blocks = BlockExtentCarver(config.effective_block_padding()).carve(reserve);
                    tracker_.addStageData("CarveBlocks", "blocks", std::to_string(blocks.size()));
                    return blocks;
                });
                regularize_progress = kProgressRegularizeBlocks;
                break;
        }

        PolygonSet regularized = run_stage("Regularize", regularize_progress, sink, [&]() {
            ShapeRegularizer::Options options;
            options.orthogonalize = config.orthogonalize;
            options.angle_tolerance = config.angle_tolerance;
            options.max_iterations = config.max_orthogonalize_iterations;
            options.snap_tolerance = config.snap_tolerance;

            // Squaring must not move a building into another cadastral
            std::vector<Point2D> sites;
            if (config.mode == GenerationMode::CADASTRAL && normalized.buildings) {
                sites = normalized.buildings->points;
            }

            ShapeRegularizer regularizer(options);
            PolygonSet out = regularizer.regularize(polygons, sites);

            const RegularizationStats& stats = regularizer.stats();
            tracker_.addStageData("Regularize", "polygons", std::to_string(out.size()));
            tracker_.addStageData("Regularize", "orthogonalized", std::to_string(stats.polygons_orthogonalized));
            tracker_.addStageData("Regularize", "kept_unsquared", std::to_string(stats.squarings_rejected));
            tracker_.addStageData("Regularize", "overlaps_resolved", std::to_string(stats.overlaps_resolved));
            tracker_.addStageData("Regularize", "gaps_filled", std::to_string(stats.gaps_filled));
            return out;
        });
        result.metrics.polygons_regularized = regularized.size();

        if (!regularized.empty()) {
            auto [smallest, largest] = std::minmax_element(
                regularized.begin(), regularized.end(),
                [](const ParcelPolygon& a, const ParcelPolygon& b) { return a.geometry.area() < b.geometry.area(); });
            result.metrics.smallest_area = smallest->geometry.area();
            result.metrics.largest_area = largest->geometry.area();
            logger_.detailed("Area range before filtering: " + std::to_string(result.metrics.smallest_area) +
                             " .. " + std::to_string(result.metrics.largest_area));
        }

        result.features = run_stage("Filter", kProgressFilter, sink, [&]() {
            const AreaFilter filter(config.min_area, config.max_area);
            result.metrics.polygons_in_range = static_cast<size_t>(std::count_if(
                regularized.begin(), regularized.end(),
                [&filter](const ParcelPolygon& p) { return filter.accepts(p.geometry.area()); }));
            logger_.detailed(std::to_string(result.metrics.polygons_in_range) + " of " +
                             std::to_string(regularized.size()) + " polygon(s) inside the target area range");

            std::vector<CadastralFeature> features = filter.apply(regularized);
            tracker_.addStageData("Filter", "kept", std::to_string(features.size()));
            tracker_.addStageData("Filter", "rejected", std::to_string(regularized.size() - features.size()));
            return features;
        });

        result.feature_count = result.features.size();
        result.metrics.features_output = result.feature_count;
        result.metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        result.stage_report = tracker_.getDetailedReport();

        sink.report(100, "Done");

        logger_.info("Generated " + std::to_string(result.feature_count) + " " +
                     to_lower(output_layer_name(config.mode)) + " in " +
                     std::to_string(result.metrics.total_time.count()) + " ms");
        if (tracker_.isVerbose()) {
            tracker_.printSummary();
        }
        return result;
    }

    const GeneratorConfig& config() const { return config_; }
    const StageTracker& tracker() const { return tracker_; }

private:
    GeneratorConfig config_;
    Logger logger_;
    StageTracker tracker_;

    template <typename StageFn>
    auto run_stage(const std::string& name, int percent, ProgressSink& sink, StageFn&& stage)
        -> std::invoke_result_t<StageFn&> {
        return StageRunner(tracker_, sink, logger_).run(name, percent, std::forward<StageFn>(stage));
    }

    PolygonSet run_cadastral_branch(const GeneratorConfig& config, const InputLayers& layers,
                                    const RoadReserve& reserve, ProgressSink& sink,
                                    GenerationMetrics& metrics) {
        PolygonSet cells = run_stage("Tessellate", kProgressTessellate, sink, [&]() {
            if (!layers.buildings || layers.buildings->points.empty()) {
                throw InsufficientInputError("cadastral mode requires at least one building point");
            }

            ParcelTessellator::Options options;
            options.padding_percent = config.tessellation_padding_percent;
            options.minimum_padding = config.road_buffer_distance;

            ParcelTessellator tessellator(options);
            PolygonSet out = tessellator.tessellate(layers.buildings->points);
            tracker_.addStageData("Tessellate", "cells", std::to_string(out.size()));
            tracker_.addStageData("Tessellate", "merged_points", std::to_string(tessellator.merged_point_count()));
            return out;
        });
        metrics.cells_generated = cells.size();

        GeometrySubtractor subtractor;

        PolygonSet parcels = run_stage("Subtract", kProgressSubtract, sink, [&]() {
            PolygonSet out = subtractor.subtract(cells, reserve);
            tracker_.addStageData("Subtract", "parcels", std::to_string(out.size()));
            return out;
        });

        if (config.clip_to_blocks) {
            parcels = run_stage("ClipToBlocks", kProgressClipToBlocks, sink, [&]() {
                if (reserve.empty()) {
                    logger_.warning("No road reserve to derive blocks from, parcels are not clipped");
                    return parcels;
                }
                PolygonSet blocks = BlockExtentCarver(config.effective_block_padding()).carve(reserve);
                PolygonSet out = subtractor.clip(parcels, blocks);
                tracker_.addStageData("ClipToBlocks", "parcels", std::to_string(out.size()));
                return out;
            });
        }

        return parcels;
    }
};

// ============================================================================
// CadastralGenerator - Public interface
// ============================================================================

CadastralGenerator::CadastralGenerator(const GeneratorConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

CadastralGenerator::~CadastralGenerator() = default;

GenerationResult CadastralGenerator::run(const InputLayers& inputs, ProgressSink& sink) {
    return impl_->run(inputs, sink);
}

GenerationResult CadastralGenerator::run(const InputLayers& inputs) {
    NullProgressSink sink;
    return impl_->run(inputs, sink);
}

const GeneratorConfig& CadastralGenerator::get_config() const {
    return impl_->config();
}

const StageTracker& CadastralGenerator::get_stage_tracker() const {
    return impl_->tracker();
}

// ============================================================================
// Utility functions
// ============================================================================

std::string to_string(GenerationMode mode) {
    switch (mode) {
        case GenerationMode::CADASTRAL: return "cadastral";
        case GenerationMode::BLOCKS: return "blocks";
    }
    return "unknown";
}

std::string to_string(BufferEndCap cap) {
    switch (cap) {
        case BufferEndCap::ROUND: return "round";
        case BufferEndCap::FLAT: return "flat";
    }
    return "unknown";
}

std::optional<GenerationMode> parse_generation_mode(const std::string& text) {
    const std::string value = to_lower(text);
    if (value == "cadastral" || value == "cadastrals") return GenerationMode::CADASTRAL;
    if (value == "blocks" || value == "block") return GenerationMode::BLOCKS;
    return std::nullopt;
}

std::optional<BufferEndCap> parse_buffer_end_cap(const std::string& text) {
    const std::string value = to_lower(text);
    if (value == "round") return BufferEndCap::ROUND;
    if (value == "flat") return BufferEndCap::FLAT;
    return std::nullopt;
}

std::string output_layer_name(GenerationMode mode) {
    return mode == GenerationMode::BLOCKS ? "Blocks" : "Cadastrals";
}

GenerationResult generate_cadastrals(const InputLayers& inputs, const GeneratorConfig& config) {
    CadastralGenerator generator(config);
    return generator.run(inputs);
}

} // namespace cadgen
