/**
 * @file ParcelTessellator.hpp
 * @brief Nearest-site (Voronoi) tessellation of building points
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "cadastral_generator.hpp"
#include "Logger.hpp"
#include <vector>

namespace cadgen {

/**
 * @brief Produces one cell per distinct building point
 *
 * Built on a CGAL Delaunay triangulation: each cell is the clip extent cut
 * by the perpendicular bisectors towards the point's Delaunay neighbours.
 * Coincident points are merged by the triangulation and the first
 * occurrence owns the cell; there is no separate deduplication pass.
 */
class ParcelTessellator {
public:
    struct Options {
        double padding_percent;    ///< Extent padding as percent of the larger extent side
        double minimum_padding;    ///< Lower bound for the padding, working units

        Options() : padding_percent(30.0), minimum_padding(0.0) {}
    };

    explicit ParcelTessellator(const Options& options);

    /**
     * @brief Tessellate points into cells clipped to clip_extent()
     * @return Cells tagged with the index of their owning point
     * @throws InsufficientInputError if points is empty
     */
    PolygonSet tessellate(const std::vector<Point2D>& points) const;

    /**
     * @brief Finite extent the cells are clipped to
     */
    BoundingBox clip_extent(const std::vector<Point2D>& points) const;

    /**
     * @brief Number of input points that did not receive their own cell in the last call
     */
    size_t merged_point_count() const { return merged_points_; }

private:
    Options options_;
    Logger logger_;
    mutable size_t merged_points_ = 0;
};

} // namespace cadgen
