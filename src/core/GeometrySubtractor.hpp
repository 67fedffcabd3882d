/**
 * @file GeometrySubtractor.hpp
 * @brief Removal of the road reserve from tessellation cells
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "cadastral_generator.hpp"
#include "GeometryEngine.hpp"
#include "Logger.hpp"

namespace cadgen {

class GeometrySubtractor {
public:
    GeometrySubtractor();

    /**
     * @brief Subtract the reserve from every cell
     *
     * A cell split by a road yields several parcels that keep the cell's
     * source id. Cells fully covered by the reserve disappear.
     */
    PolygonSet subtract(const PolygonSet& cells, const RoadReserve& reserve) const;

    /**
     * @brief Intersect every polygon with the blocks
     *
     * Used to confine parcels to blocks; parts outside every block are dropped.
     */
    PolygonSet clip(const PolygonSet& polygons, const PolygonSet& blocks) const;

private:
    GeometryEngine engine_;
    Logger logger_;
};

} // namespace cadgen
