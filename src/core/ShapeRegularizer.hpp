/**
 * @file ShapeRegularizer.hpp
 * @brief Orthogonalization and topology repair of parcel sets
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "cadastral_generator.hpp"
#include "GeometryEngine.hpp"
#include "Logger.hpp"

namespace cadgen {

/**
 * @brief Counters of the last regularize()/repair() call
 */
struct RegularizationStats {
    size_t vertices_snapped = 0;
    size_t polygons_repaired = 0;
    size_t polygons_orthogonalized = 0;
    size_t squarings_rejected = 0;      ///< Squared rings that would change which site they hold
    size_t overlaps_resolved = 0;
    size_t gaps_filled = 0;
    size_t gaps_dropped = 0;
};

/**
 * @brief Squares near-right corners and restores a clean tiling
 *
 * regularize() runs, in order: validity repair, optional orthogonalization,
 * vertex snapping, validity repair, overlap removal (earlier polygons win),
 * clipping to the input footprint, gap filling and duplicate vertex removal.
 * The footprint is the union of the repaired input, so the output covers
 * exactly what the input covered.
 *
 * When sites are given (indexed by ParcelPolygon::source_id), no step may
 * move a site into or out of a polygon: a squared ring that would is
 * discarded for the unsquared one, and a gap holding a site only goes to
 * the polygon owning that site.
 */
class ShapeRegularizer {
public:
    struct Options {
        bool orthogonalize;
        double angle_tolerance;      ///< Degrees from 90 (or 180) still treated as square (straight)
        int max_iterations;
        double snap_tolerance;

        Options()
            : orthogonalize(true), angle_tolerance(15.0), max_iterations(1000), snap_tolerance(0.001) {}
    };

    explicit ShapeRegularizer(const Options& options);

    PolygonSet regularize(const PolygonSet& polygons) const;
    PolygonSet regularize(const PolygonSet& polygons, const std::vector<Point2D>& sites) const;

    /**
     * @brief Topology repair only (no orthogonalization)
     */
    PolygonSet repair(const PolygonSet& polygons) const;

    /**
     * @brief Iteratively square corners within the angle tolerance
     *
     * Rings with fewer than four vertices are left alone. Returns the input
     * unchanged if squaring would make it invalid.
     */
    PolygonData orthogonalize(const PolygonData& polygon) const;

    const RegularizationStats& stats() const { return stats_; }

private:
    Ring orthogonalize_ring(const Ring& ring) const;

    PolygonSet fix_all(const PolygonSet& polygons) const;
    bool holds_same_sites(const PolygonData& before, const PolygonData& after,
                          const std::vector<Point2D>& sites) const;

    PolygonSet repair_against(const PolygonSet& polygons, const std::vector<PolygonData>& footprint,
                              const std::vector<Point2D>& sites) const;
    PolygonSet remove_overlaps(const PolygonSet& polygons) const;
    void fill_gaps(PolygonSet& polygons, const std::vector<PolygonData>& footprint,
                   const std::vector<Point2D>& sites) const;

    Options options_;
    GeometryEngine engine_;
    Logger logger_;
    mutable RegularizationStats stats_;
};

} // namespace cadgen
