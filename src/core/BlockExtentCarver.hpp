/**
 * @file BlockExtentCarver.hpp
 * @brief Block extraction from the complement of the road reserve
 */

#pragma once

#include "cadastral_generator.hpp"
#include "GeometryEngine.hpp"
#include "Logger.hpp"

namespace cadgen {

/**
 * @brief Carves blocks out of a padded extent around the road reserve
 *
 * The extent is the reserve envelope grown by the padding; everything in it
 * not covered by the reserve becomes a block. The outermost block wraps the
 * network and touches the extent boundary.
 */
class BlockExtentCarver {
public:
    explicit BlockExtentCarver(double padding);

    /**
     * @throws InsufficientInputError if the reserve is empty
     */
    PolygonSet carve(const RoadReserve& reserve) const;

    BoundingBox extent(const RoadReserve& reserve) const;

private:
    double padding_;
    GeometryEngine engine_;
    Logger logger_;
};

} // namespace cadgen
