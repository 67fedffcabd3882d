/**
 * @file ShapeRegularizer.cpp
 * @brief Implementation of parcel orthogonalization and repair
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ShapeRegularizer.hpp"
#include "GeneratorErrors.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace cadgen {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kScoreEpsilon = 1e-8;
constexpr double kStepFactor = 0.1;

struct CornerThresholds {
    double lower;   ///< |dot| below this: near-right corner
    double upper;   ///< dot at or below -upper: near-straight vertex
};

CornerThresholds thresholds_for(double angle_tolerance) {
    CornerThresholds t;
    t.lower = std::cos((90.0 - angle_tolerance) * kPi / 180.0);
    t.upper = std::cos(angle_tolerance * kPi / 180.0);
    return t;
}

double corner_dot(const Eigen::Vector2d& a, const Eigen::Vector2d& o, const Eigen::Vector2d& b) {
    Eigen::Vector2d p = a - o;
    Eigen::Vector2d q = b - o;
    const double lp = p.norm();
    const double lq = q.norm();
    if (lp == 0.0 || lq == 0.0) {
        return 0.0;
    }
    return p.dot(q) / (lp * lq);
}

double squareness_score(const std::vector<Eigen::Vector2d>& points, const CornerThresholds& t) {
    const size_t n = points.size();
    double score = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dot = corner_dot(points[(i + n - 1) % n], points[i], points[(i + 1) % n]);
        if (std::abs(dot) < t.lower) {
            score += 2.0 * std::abs(dot);
        } else if (dot <= -t.upper) {
            score += 2.0 * std::abs(dot + 1.0);
        }
    }
    return score;
}

} // namespace

ShapeRegularizer::ShapeRegularizer(const Options& options)
    : options_(options), logger_("ShapeRegularizer") {
    if (!(options_.snap_tolerance > 0.0)) {
        throw ConfigError("snap tolerance must be positive");
    }
    if (options_.angle_tolerance < 0.0 || options_.angle_tolerance > 45.0) {
        throw ConfigError("angle tolerance must be within 0..45 degrees");
    }
    if (options_.max_iterations <= 0) {
        throw ConfigError("orthogonalization iteration cap must be positive");
    }
}

// ============================================================================
// Orthogonalization
// ============================================================================

Ring ShapeRegularizer::orthogonalize_ring(const Ring& ring) const {
    const size_t n = ring.size();
    if (n < 4) {
        return ring;
    }

    const CornerThresholds t = thresholds_for(options_.angle_tolerance);

    std::vector<Eigen::Vector2d> points;
    points.reserve(n);
    for (const auto& p : ring) {
        points.emplace_back(p.x(), p.y());
    }

    std::vector<Eigen::Vector2d> best = points;
    double best_score = squareness_score(points, t);
    std::vector<Eigen::Vector2d> motions(n);

    for (int iteration = 0; iteration < options_.max_iterations && best_score >= kScoreEpsilon; ++iteration) {
        for (size_t i = 0; i < n; ++i) {
            motions[i] = Eigen::Vector2d::Zero();

            const Eigen::Vector2d& a = points[(i + n - 1) % n];
            const Eigen::Vector2d& o = points[i];
            const Eigen::Vector2d& b = points[(i + 1) % n];

            Eigen::Vector2d p = a - o;
            Eigen::Vector2d q = b - o;
            const double lp = p.norm();
            const double lq = q.norm();
            if (lp == 0.0 || lq == 0.0) continue;

            const double scale = 2.0 * std::min(lp, lq);
            p /= lp;
            q /= lq;
            const double dot = p.dot(q);

            const Eigen::Vector2d bisector = p + q;
            if (bisector.norm() < 1e-12) continue;

            if (std::abs(dot) < t.lower) {
                motions[i] = bisector.normalized() * (kStepFactor * dot * scale);
            } else if (dot <= -t.upper) {
                motions[i] = bisector.normalized() * (kStepFactor * (dot + 1.0) * scale);
            }
        }

        for (size_t i = 0; i < n; ++i) {
            points[i] += motions[i];
        }

        const double score = squareness_score(points, t);
        if (score < best_score) {
            best = points;
            best_score = score;
        }
    }

    Ring result;
    result.reserve(n);
    for (const auto& p : best) {
        result.emplace_back(p.x(), p.y());
    }
    return result;
}

PolygonData ShapeRegularizer::orthogonalize(const PolygonData& polygon) const {
    if (polygon.empty()) {
        return polygon;
    }

    PolygonData squared;
    squared.rings.reserve(polygon.rings.size());
    for (const auto& ring : polygon.rings) {
        squared.rings.push_back(orthogonalize_ring(ring));
    }

    if (!engine_.is_valid(squared)) {
        logger_.debug("Orthogonalized polygon is invalid, keeping original");
        return polygon;
    }
    return squared;
}

bool ShapeRegularizer::holds_same_sites(const PolygonData& before, const PolygonData& after,
                                        const std::vector<Point2D>& sites) const {
    BoundingBox reach = before.envelope();
    reach.expand(after.envelope());

    for (const auto& site : sites) {
        if (!reach.contains(site)) continue;
        if (before.contains(site) != after.contains(site)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Repair
// ============================================================================

PolygonSet ShapeRegularizer::fix_all(const PolygonSet& polygons) const {
    PolygonSet result;
    result.reserve(polygons.size());

    for (const auto& polygon : polygons) {
        if (engine_.is_valid(polygon.geometry)) {
            result.push_back(polygon);
            continue;
        }
        ++stats_.polygons_repaired;
        for (auto& part : engine_.fix_invalid(polygon.geometry)) {
            result.emplace_back(std::move(part), polygon.source_id);
        }
    }
    return result;
}

PolygonSet ShapeRegularizer::remove_overlaps(const PolygonSet& polygons) const {
    PolygonSet accepted;
    accepted.reserve(polygons.size());

    for (const auto& polygon : polygons) {
        std::vector<PolygonData> pieces{polygon.geometry};
        bool overlapped = false;

        for (const auto& earlier : accepted) {
            std::vector<PolygonData> remaining;
            for (auto& piece : pieces) {
                if (!engine_.interiors_overlap(piece, earlier.geometry)) {
                    remaining.push_back(std::move(piece));
                    continue;
                }
                overlapped = true;
                for (auto& part : engine_.difference(piece, earlier.geometry)) {
                    if (part.area() > 0.0) {
                        remaining.push_back(std::move(part));
                    }
                }
            }
            pieces = std::move(remaining);
            if (pieces.empty()) break;
        }

        if (overlapped) {
            ++stats_.overlaps_resolved;
        }
        for (auto& piece : pieces) {
            accepted.emplace_back(std::move(piece), polygon.source_id);
        }
    }
    return accepted;
}

void ShapeRegularizer::fill_gaps(PolygonSet& polygons, const std::vector<PolygonData>& footprint,
                                 const std::vector<Point2D>& sites) const {
    if (polygons.empty() || footprint.empty()) {
        return;
    }

    std::vector<PolygonData> geometries;
    geometries.reserve(polygons.size());
    for (const auto& polygon : polygons) {
        geometries.push_back(polygon.geometry);
    }
    OGRGeometryUniquePtr covered = engine_.to_ogr(engine_.dissolve(geometries));

    std::vector<PolygonData> gaps;
    for (const auto& part : footprint) {
        auto uncovered = engine_.difference(part, *covered);
        gaps.insert(gaps.end(), std::make_move_iterator(uncovered.begin()),
                    std::make_move_iterator(uncovered.end()));
    }

    const double tolerance = options_.snap_tolerance;
    const double min_gap_area = tolerance * tolerance;

    for (const auto& gap : gaps) {
        if (gap.area() < min_gap_area) continue;

        OGRGeometryUniquePtr grown = engine_.to_ogr(engine_.buffer(gap, tolerance));
        const BoundingBox reach = gap.envelope().padded(tolerance);

        // A gap holding a site may only join the polygon that owns it
        std::vector<long> held;
        for (size_t k = 0; k < sites.size(); ++k) {
            if (reach.contains(sites[k]) && gap.contains(sites[k])) {
                held.push_back(static_cast<long>(k));
            }
        }

        long best = -1;
        double best_shared = 0.0;
        for (size_t i = 0; i < polygons.size(); ++i) {
            if (!polygons[i].geometry.envelope().intersects(reach)) continue;
            const long owner = polygons[i].source_id;
            if (std::any_of(held.begin(), held.end(), [owner](long k) { return k != owner; })) continue;
            const double shared = GeometryEngine::total_area(engine_.intersection(polygons[i].geometry, *grown));
            if (shared > best_shared) {
                best_shared = shared;
                best = static_cast<long>(i);
            }
        }

        if (best < 0) {
            ++stats_.gaps_dropped;
            logger_.debug("Gap of area " + std::to_string(gap.area()) + " has no eligible neighbour, dropped");
            continue;
        }

        std::vector<PolygonData> merged = engine_.merge(polygons[best].geometry, gap);
        if (merged.empty()) {
            ++stats_.gaps_dropped;
            continue;
        }
        std::sort(merged.begin(), merged.end(),
                  [](const PolygonData& a, const PolygonData& b) { return a.area() > b.area(); });

        const long source_id = polygons[best].source_id;
        polygons[best].geometry = std::move(merged.front());
        for (size_t k = 1; k < merged.size(); ++k) {
            polygons.emplace_back(std::move(merged[k]), source_id);
        }
        ++stats_.gaps_filled;
    }
}

PolygonSet ShapeRegularizer::repair_against(const PolygonSet& polygons,
                                            const std::vector<PolygonData>& footprint,
                                            const std::vector<Point2D>& sites) const {
    PolygonSet working = polygons;

    stats_.vertices_snapped += engine_.snap_vertices(working, options_.snap_tolerance);
    working = fix_all(working);
    working = remove_overlaps(working);

    PolygonSet clipped;
    clipped.reserve(working.size());
    if (!footprint.empty()) {
        OGRGeometryUniquePtr footprint_geometry = engine_.to_ogr(footprint);
        for (const auto& polygon : working) {
            for (auto& part : engine_.intersection(polygon.geometry, *footprint_geometry)) {
                if (part.area() > 0.0) {
                    clipped.emplace_back(std::move(part), polygon.source_id);
                }
            }
        }
    }

    fill_gaps(clipped, footprint, sites);

    PolygonSet result;
    result.reserve(clipped.size());
    for (const auto& polygon : clipped) {
        PolygonData cleaned = engine_.remove_duplicate_vertices(polygon.geometry, options_.snap_tolerance);
        if (cleaned.empty()) continue;
        if (engine_.is_valid(cleaned)) {
            result.emplace_back(std::move(cleaned), polygon.source_id);
            continue;
        }
        for (auto& part : engine_.fix_invalid(cleaned)) {
            result.emplace_back(std::move(part), polygon.source_id);
        }
    }
    return result;
}

PolygonSet ShapeRegularizer::repair(const PolygonSet& polygons) const {
    stats_ = RegularizationStats();

    PolygonSet fixed = fix_all(polygons);
    std::vector<PolygonData> geometries;
    geometries.reserve(fixed.size());
    for (const auto& polygon : fixed) {
        geometries.push_back(polygon.geometry);
    }

    return repair_against(fixed, engine_.dissolve(geometries), {});
}

PolygonSet ShapeRegularizer::regularize(const PolygonSet& polygons) const {
    return regularize(polygons, {});
}

PolygonSet ShapeRegularizer::regularize(const PolygonSet& polygons, const std::vector<Point2D>& sites) const {
    stats_ = RegularizationStats();

    PolygonSet working = fix_all(polygons);

    std::vector<PolygonData> geometries;
    geometries.reserve(working.size());
    for (const auto& polygon : working) {
        geometries.push_back(polygon.geometry);
    }
    const std::vector<PolygonData> footprint = engine_.dissolve(geometries);

    if (options_.orthogonalize) {
        for (auto& polygon : working) {
            PolygonData squared = orthogonalize(polygon.geometry);
            if (squared.rings == polygon.geometry.rings) continue;

            if (!holds_same_sites(polygon.geometry, squared, sites)) {
                ++stats_.squarings_rejected;
                logger_.debug("Squaring polygon of site " + std::to_string(polygon.source_id) +
                              " would move a site across its boundary, kept unsquared");
                continue;
            }
            polygon.geometry = std::move(squared);
            ++stats_.polygons_orthogonalized;
        }
    }

    PolygonSet result = repair_against(working, footprint, sites);

    logger_.info("Regularized " + std::to_string(polygons.size()) + " polygon(s) into " +
                 std::to_string(result.size()));
    logger_.detailed("  orthogonalized " + std::to_string(stats_.polygons_orthogonalized) +
                     ", kept unsquared " + std::to_string(stats_.squarings_rejected) +
                     ", repaired " + std::to_string(stats_.polygons_repaired) +
                     ", overlaps resolved " + std::to_string(stats_.overlaps_resolved) +
                     ", gaps filled " + std::to_string(stats_.gaps_filled) +
                     ", gaps dropped " + std::to_string(stats_.gaps_dropped) +
                     ", vertices snapped " + std::to_string(stats_.vertices_snapped));
    return result;
}

} // namespace cadgen
