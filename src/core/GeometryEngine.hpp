/**
 * @file GeometryEngine.hpp
 * @brief Polygon primitives on top of GDAL/OGR (GEOS) and CGAL
 *
 * Converts between the generator's PolygonData and OGR geometries and
 * exposes the boolean, buffer, validity and snapping operations the
 * pipeline stages are built from. Engine failures surface as
 * GeometryEngineError.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "cadastral_generator.hpp"
#include "Logger.hpp"
#include <ogr_geometry.h>
#include <vector>

namespace cadgen {

/**
 * @brief Shape of line buffers
 */
struct BufferStyle {
    BufferEndCap end_cap = BufferEndCap::ROUND;
    int quadrant_segments = 8;   ///< Segments per quarter circle
};

class GeometryEngine {
public:
    GeometryEngine();

    /**
     * @brief Whether the linked GDAL can produce flat-capped buffers
     */
    static bool supports_flat_end_cap();

    // ========================================================================
    // Conversion
    // ========================================================================

    OGRGeometryUniquePtr to_ogr(const PolygonData& polygon) const;

    /**
     * @brief Collect polygons into one OGRMultiPolygon (no union is performed)
     */
    OGRGeometryUniquePtr to_ogr(const std::vector<PolygonData>& polygons) const;

    OGRGeometryUniquePtr to_ogr(const LineString2D& line) const;

    /**
     * @brief Explode any polygonal OGR geometry into single polygons
     *
     * Multi-polygons and collections are flattened; non-polygonal members
     * and rings with fewer than three vertices are dropped.
     */
    std::vector<PolygonData> from_ogr(const OGRGeometry* geometry) const;

    // ========================================================================
    // Primitives
    // ========================================================================

    /**
     * @brief Expand a line by distance on both sides
     *
     * Lines with fewer than two distinct vertices are buffered as points.
     */
    std::vector<PolygonData> buffer(const LineString2D& line, double distance,
                                    const BufferStyle& style) const;

    /**
     * @brief Grow (positive) or shrink (negative) a polygon by distance
     */
    std::vector<PolygonData> buffer(const PolygonData& polygon, double distance,
                                    int quadrant_segments = 8) const;

    /**
     * @brief Union of all polygons with internal boundaries removed
     */
    std::vector<PolygonData> dissolve(const std::vector<PolygonData>& polygons) const;

    std::vector<PolygonData> difference(const PolygonData& polygon, const OGRGeometry& subtrahend) const;
    std::vector<PolygonData> difference(const PolygonData& polygon, const PolygonData& subtrahend) const;

    std::vector<PolygonData> intersection(const PolygonData& polygon, const OGRGeometry& other) const;
    std::vector<PolygonData> intersection(const PolygonData& polygon, const PolygonData& other) const;

    std::vector<PolygonData> merge(const PolygonData& a, const PolygonData& b) const;

    std::vector<PolygonData> symmetric_difference(const PolygonData& a, const PolygonData& b) const;

    bool is_valid(const PolygonData& polygon) const;

    /**
     * @brief True when the interiors share area (touching boundaries do not count)
     */
    bool interiors_overlap(const PolygonData& a, const PolygonData& b) const;

    /**
     * @brief Repair an invalid polygon with CGAL Polygon_repair (even-odd rule)
     *
     * Valid input is returned unchanged. Degenerate input repairs to nothing.
     * @throws GeometryEngineError if the repaired output is still invalid
     */
    std::vector<PolygonData> fix_invalid(const PolygonData& polygon) const;

    /**
     * @brief Snap vertices across the whole set to shared representatives
     *
     * The first vertex seen in a neighbourhood becomes its representative;
     * later vertices within tolerance move onto it.
     * @return Number of vertices moved
     */
    size_t snap_vertices(PolygonSet& polygons, double tolerance) const;

    /**
     * @brief Collapse consecutive vertices closer than tolerance
     *
     * Rings that fall below three vertices are dropped; a dropped exterior
     * yields an empty polygon.
     */
    PolygonData remove_duplicate_vertices(const PolygonData& polygon, double tolerance) const;

    static double total_area(const std::vector<PolygonData>& polygons);
    static BoundingBox envelope(const std::vector<PolygonData>& polygons);
    static PolygonData rectangle(const BoundingBox& box);

private:
    Logger logger_;
};

} // namespace cadgen
