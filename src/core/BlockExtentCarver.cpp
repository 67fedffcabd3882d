/**
 * @file BlockExtentCarver.cpp
 * @brief Implementation of block carving
 */

#include "BlockExtentCarver.hpp"
#include "GeneratorErrors.hpp"

namespace cadgen {

BlockExtentCarver::BlockExtentCarver(double padding)
    : padding_(padding), logger_("BlockExtentCarver") {
    if (!(padding_ > 0.0)) {
        throw ConfigError("block extent padding must be positive, got " + std::to_string(padding_));
    }
}

BoundingBox BlockExtentCarver::extent(const RoadReserve& reserve) const {
    BoundingBox box = GeometryEngine::envelope(reserve);
    if (box.is_empty()) {
        return box;
    }
    return box.padded(padding_);
}

PolygonSet BlockExtentCarver::carve(const RoadReserve& reserve) const {
    if (reserve.empty()) {
        throw InsufficientInputError("blocks mode requires at least one road centerline");
    }

    const BoundingBox box = extent(reserve);
    logger_.detailed("Block extent: [" + std::to_string(box.min_x) + ", " + std::to_string(box.min_y) +
                     "] - [" + std::to_string(box.max_x) + ", " + std::to_string(box.max_y) + "]");

    OGRGeometryUniquePtr reserve_geometry = engine_.to_ogr(reserve);
    std::vector<PolygonData> parts = engine_.difference(GeometryEngine::rectangle(box), *reserve_geometry);

    PolygonSet blocks;
    blocks.reserve(parts.size());
    for (auto& part : parts) {
        if (part.area() > 0.0) {
            blocks.emplace_back(std::move(part), -1);
        }
    }

    logger_.info("Carved " + std::to_string(blocks.size()) + " block(s)");
    return blocks;
}

} // namespace cadgen
