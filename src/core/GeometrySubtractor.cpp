/**
 * @file GeometrySubtractor.cpp
 * @brief Implementation of reserve subtraction
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GeometrySubtractor.hpp"

namespace cadgen {

GeometrySubtractor::GeometrySubtractor()
    : logger_("GeometrySubtractor") {
}

PolygonSet GeometrySubtractor::subtract(const PolygonSet& cells, const RoadReserve& reserve) const {
    if (reserve.empty()) {
        logger_.detailed("Road reserve is empty, cells pass through unchanged");
        return cells;
    }

    // Converted once, reused for every cell
    OGRGeometryUniquePtr reserve_geometry = engine_.to_ogr(reserve);

    PolygonSet result;
    result.reserve(cells.size());
    size_t removed = 0;
    size_t split = 0;

    for (const auto& cell : cells) {
        std::vector<PolygonData> parts = engine_.difference(cell.geometry, *reserve_geometry);

        size_t kept = 0;
        for (auto& part : parts) {
            if (part.empty() || !(part.area() > 0.0)) continue;
            result.emplace_back(std::move(part), cell.source_id);
            ++kept;
        }

        if (kept == 0) {
            ++removed;
        } else if (kept > 1) {
            ++split;
        }
    }

    logger_.info("Subtracted road reserve: " + std::to_string(result.size()) + " parcel(s) from " +
                 std::to_string(cells.size()) + " cell(s)");
    if (removed > 0 || split > 0) {
        logger_.detailed("  " + std::to_string(removed) + " cell(s) covered by roads, " +
                         std::to_string(split) + " cell(s) split");
    }
    return result;
}

PolygonSet GeometrySubtractor::clip(const PolygonSet& polygons, const PolygonSet& blocks) const {
    std::vector<PolygonData> block_geometry;
    block_geometry.reserve(blocks.size());
    for (const auto& block : blocks) {
        block_geometry.push_back(block.geometry);
    }
    OGRGeometryUniquePtr mask = engine_.to_ogr(block_geometry);

    PolygonSet result;
    result.reserve(polygons.size());
    for (const auto& polygon : polygons) {
        for (auto& part : engine_.intersection(polygon.geometry, *mask)) {
            if (part.area() > 0.0) {
                result.emplace_back(std::move(part), polygon.source_id);
            }
        }
    }

    logger_.info("Clipped to blocks: " + std::to_string(result.size()) + " parcel(s) from " +
                 std::to_string(polygons.size()));
    return result;
}

} // namespace cadgen
