#pragma once

/**
 * @file cadastral_generator.hpp
 * @brief Main header for the cadastral parcel generator
 *
 * Derives parcel ("cadastral") boundary polygons from road centerlines and
 * building locations by buffering, nearest-site tessellation, boolean
 * subtraction and shape regularization, using GDAL/OGR and CGAL.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <vector>
#include <string>
#include <optional>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <algorithm>
#include <limits>

// Forward declarations
namespace cadgen {
    class StageTracker;
    class ProgressSink;
}

namespace cadgen {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates in the working frame
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }

    bool is_finite() const {
        return std::isfinite(x_) && std::isfinite(y_);
    }
};

/// Ordered vertex list. Rings are stored open (no repeated closing vertex).
using Ring = std::vector<Point2D>;

/// Road centerline vertices in order
using LineString2D = std::vector<Point2D>;

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox()
        : min_x(std::numeric_limits<double>::max()), min_y(std::numeric_limits<double>::max()),
          max_x(std::numeric_limits<double>::lowest()), max_y(std::numeric_limits<double>::lowest()) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool is_empty() const { return min_x > max_x || min_y > max_y; }

    bool contains(const Point2D& point) const {
        return point.x() >= min_x && point.x() <= max_x &&
               point.y() >= min_y && point.y() <= max_y;
    }

    bool intersects(const BoundingBox& other) const {
        return !is_empty() && !other.is_empty() &&
               min_x <= other.max_x && other.min_x <= max_x &&
               min_y <= other.max_y && other.min_y <= max_y;
    }

    void expand(const Point2D& point) {
        min_x = std::min(min_x, point.x());
        min_y = std::min(min_y, point.y());
        max_x = std::max(max_x, point.x());
        max_y = std::max(max_y, point.y());
    }

    void expand(const BoundingBox& other) {
        if (other.is_empty()) return;
        min_x = std::min(min_x, other.min_x);
        min_y = std::min(min_y, other.min_y);
        max_x = std::max(max_x, other.max_x);
        max_y = std::max(max_y, other.max_y);
    }

    BoundingBox padded(double margin) const {
        return BoundingBox(min_x - margin, min_y - margin, max_x + margin, max_y + margin);
    }

    double width() const { return is_empty() ? 0.0 : max_x - min_x; }
    double height() const { return is_empty() ? 0.0 : max_y - min_y; }
};

/**
 * @brief Polygon with exterior ring and optional holes
 *
 * rings[0] is the exterior, rings[1..] are holes. Orientation is not
 * normalized; area() is always non-negative.
 */
struct PolygonData {
    std::vector<Ring> rings;

    PolygonData() = default;
    explicit PolygonData(Ring exterior) { rings.push_back(std::move(exterior)); }

    bool empty() const { return rings.empty() || rings[0].size() < 3; }

    const Ring& exterior() const { return rings[0]; }

    std::vector<Ring> holes() const {
        if (rings.size() <= 1) return {};
        return std::vector<Ring>(rings.begin() + 1, rings.end());
    }

    size_t num_holes() const {
        return rings.size() > 0 ? rings.size() - 1 : 0;
    }

    size_t num_vertices() const {
        size_t count = 0;
        for (const auto& ring : rings) count += ring.size();
        return count;
    }

    /**
     * @brief Shoelace area of a single ring (unsigned)
     */
    static double ring_area(const Ring& ring) {
        double sum = 0.0;
        for (size_t i = 0; i < ring.size(); ++i) {
            size_t j = (i + 1) % ring.size();
            sum += ring[i].x() * ring[j].y();
            sum -= ring[j].x() * ring[i].y();
        }
        return std::abs(sum) / 2.0;
    }

    /**
     * @brief Planar area: exterior minus holes
     */
    double area() const {
        if (empty()) return 0.0;
        double result = ring_area(rings[0]);
        for (size_t r = 1; r < rings.size(); ++r) {
            result -= ring_area(rings[r]);
        }
        return std::max(result, 0.0);
    }

    /**
     * @brief Even-odd point-in-polygon test across all rings
     */
    bool contains(const Point2D& point) const {
        bool inside = false;
        for (const auto& ring : rings) {
            if (ring.size() < 3) continue;
            for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
                const Point2D& a = ring[i];
                const Point2D& b = ring[j];
                if ((a.y() > point.y()) != (b.y() > point.y())) {
                    double x_cross = (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x();
                    if (point.x() < x_cross) {
                        inside = !inside;
                    }
                }
            }
        }
        return inside;
    }

    BoundingBox envelope() const {
        BoundingBox box;
        if (!rings.empty()) {
            for (const auto& p : rings[0]) box.expand(p);
        }
        return box;
    }
};

/**
 * @brief Polygon tagged with the index of the building point it came from
 */
struct ParcelPolygon {
    PolygonData geometry;
    long source_id = -1;  ///< Index into the building layer, -1 when not applicable

    ParcelPolygon() = default;
    ParcelPolygon(PolygonData geom, long source) : geometry(std::move(geom)), source_id(source) {}
};

using PolygonSet = std::vector<ParcelPolygon>;

/// Dissolved road buffers, possibly multi-part, never overlapping
using RoadReserve = std::vector<PolygonData>;

// ============================================================================
// Input Layers
// ============================================================================

/**
 * @brief Building locations tagged with their source reference frame
 */
struct PointLayer {
    std::string name;
    std::string frame;                ///< Anything OGRSpatialReference::SetFromUserInput accepts
    std::vector<Point2D> points;
};

/**
 * @brief Road centerlines tagged with their source reference frame
 */
struct LineLayer {
    std::string name;
    std::string frame;
    std::vector<LineString2D> lines;
};

/**
 * @brief In-memory pipeline input
 */
struct InputLayers {
    LineLayer roads;
    std::optional<PointLayer> buildings;  ///< Required in cadastral mode
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Sub-pipeline selection
 */
enum class GenerationMode {
    CADASTRAL,  ///< One parcel per building, minus road reserve
    BLOCKS      ///< Outer blocks enclosed by the road reserve only
};

/**
 * @brief End cap style of road buffers
 */
enum class BufferEndCap {
    ROUND,  ///< Covers every point within the buffer distance
    FLAT    ///< Square-cut ends at the centerline endpoints
};

/**
 * @brief Immutable per-run configuration
 */
struct GeneratorConfig {
    // Core parameters
    double road_buffer_distance = 10.0;   ///< Half-width of the road reserve, working units
    double min_area = 250.0;              ///< Inclusive lower area bound
    double max_area = 2000.0;             ///< Inclusive upper bound, 0 = unbounded
    std::string target_frame = "EPSG:32736";
    GenerationMode mode = GenerationMode::CADASTRAL;

    // Shape regularization
    bool orthogonalize = true;
    double angle_tolerance = 15.0;        ///< Degrees, 0..45
    int max_orthogonalize_iterations = 1000;
    double snap_tolerance = 0.001;        ///< Vertex snapping distance, working units

    // Buffer shape
    BufferEndCap buffer_end_cap = BufferEndCap::ROUND;
    int buffer_quadrant_segments = 8;

    // Extents
    double tessellation_padding_percent = 30.0;   ///< Padding of the point extent, percent of its larger side
    std::optional<double> block_extent_padding;   ///< Defaults to 5 x road_buffer_distance
    bool clip_to_blocks = false;                  ///< Cadastral mode: intersect parcels with blocks

    // Logging options
    int log_level = 3;
    std::optional<std::string> log_file;

    double effective_block_padding() const {
        return block_extent_padding.value_or(5.0 * road_buffer_distance);
    }
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief One output parcel or block
 */
struct CadastralFeature {
    long id = 0;              ///< Sequential, starting at 1
    PolygonData geometry;
    double area = 0.0;
    long source_id = -1;      ///< Originating building index (cadastral mode)
};

/**
 * @brief Counts and timings collected during a run
 */
struct GenerationMetrics {
    std::chrono::milliseconds total_time{0};

    size_t input_points = 0;
    size_t input_lines = 0;
    size_t reserve_parts = 0;
    size_t cells_generated = 0;
    size_t polygons_regularized = 0;
    size_t features_output = 0;

    double smallest_area = 0.0;   ///< Before filtering
    double largest_area = 0.0;    ///< Before filtering
    size_t polygons_in_range = 0; ///< Before filtering, within min_area..max_area
};

/**
 * @brief Filtered features; ownership passes to the caller
 */
struct GenerationResult {
    std::vector<CadastralFeature> features;
    size_t feature_count = 0;
    GenerationMode mode = GenerationMode::CADASTRAL;
    std::string frame;                ///< Target frame the geometry is expressed in
    GenerationMetrics metrics;
    std::string stage_report;         ///< Per-stage timing and counts
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief Pipeline orchestrator
 *
 * Sequences normalization, road buffering, the mode-specific branch
 * (tessellate and subtract, or carve blocks), regularization and filtering
 * under a configuration copied at construction.
 */
class CadastralGenerator {
public:
    explicit CadastralGenerator(const GeneratorConfig& config);
    ~CadastralGenerator();

    CadastralGenerator(const CadastralGenerator&) = delete;
    CadastralGenerator& operator=(const CadastralGenerator&) = delete;

    /**
     * @brief Run the full pipeline
     * @param inputs Road and building layers tagged with their frames
     * @param sink Progress receiver, polled for cancellation between stages
     * @return Filtered features
     * @throws GeneratorError subclasses annotated with the failing stage
     * @throws CancelledError when the sink requests cancellation
     */
    GenerationResult run(const InputLayers& inputs, ProgressSink& sink);

    /**
     * @brief Run without progress reporting
     */
    GenerationResult run(const InputLayers& inputs);

    const GeneratorConfig& get_config() const;
    const StageTracker& get_stage_tracker() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Mode name as used in configuration files and the CLI
 */
std::string to_string(GenerationMode mode);
std::string to_string(BufferEndCap cap);

/**
 * @brief Parse "cadastral" / "blocks" (case-insensitive)
 */
std::optional<GenerationMode> parse_generation_mode(const std::string& text);
std::optional<BufferEndCap> parse_buffer_end_cap(const std::string& text);

/**
 * @brief Output layer name for a mode ("Cadastrals" or "Blocks")
 */
std::string output_layer_name(GenerationMode mode);

/**
 * @brief Utility function for one-shot generation without progress reporting
 */
GenerationResult generate_cadastrals(const InputLayers& inputs,
                                     const GeneratorConfig& config = GeneratorConfig());

} // namespace cadgen
