/**
 * @file RoadReserveBuilder.cpp
 * @brief Implementation of road reserve construction
 */

#include "RoadReserveBuilder.hpp"
#include "GeneratorErrors.hpp"

namespace cadgen {

RoadReserveBuilder::RoadReserveBuilder(const Options& options)
    : options_(options), logger_("RoadReserveBuilder") {
    if (!(options_.buffer_distance > 0.0)) {
        throw ConfigError("road buffer distance must be positive, got " +
                          std::to_string(options_.buffer_distance));
    }
}

RoadReserve RoadReserveBuilder::build(const std::vector<LineString2D>& lines) const {
    if (lines.empty()) {
        logger_.warning("No road centerlines, road reserve is empty");
        return {};
    }

    std::vector<PolygonData> buffers;
    buffers.reserve(lines.size());

    size_t skipped = 0;
    for (const auto& line : lines) {
        if (line.empty()) {
            ++skipped;
            continue;
        }
        auto parts = engine_.buffer(line, options_.buffer_distance, options_.style);
        buffers.insert(buffers.end(),
                       std::make_move_iterator(parts.begin()),
                       std::make_move_iterator(parts.end()));
    }

    if (skipped > 0) {
        logger_.warning("Skipped " + std::to_string(skipped) + " road feature(s) without vertices");
    }

    logger_.detailed("Dissolving " + std::to_string(buffers.size()) + " road buffers");
    RoadReserve reserve = engine_.dissolve(buffers);

    logger_.info("Road reserve: " + std::to_string(reserve.size()) + " part(s), area " +
                 std::to_string(GeometryEngine::total_area(reserve)));
    return reserve;
}

} // namespace cadgen
