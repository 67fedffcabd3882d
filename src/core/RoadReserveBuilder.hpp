/**
 * @file RoadReserveBuilder.hpp
 * @brief Buffering and dissolving of road centerlines into a road reserve
 */

#pragma once

#include "cadastral_generator.hpp"
#include "GeometryEngine.hpp"
#include "Logger.hpp"

namespace cadgen {

/**
 * @brief Builds the road reserve from centerlines
 *
 * Every line is expanded by the buffer distance on both sides, then all
 * buffers are unioned so the reserve has no internal seams.
 */
class RoadReserveBuilder {
public:
    struct Options {
        double buffer_distance;
        BufferStyle style;

        Options() : buffer_distance(10.0) {}
    };

    explicit RoadReserveBuilder(const Options& options);

    /**
     * @param lines Centerlines in the working frame
     * @return Dissolved reserve; empty when there are no lines
     */
    RoadReserve build(const std::vector<LineString2D>& lines) const;

private:
    Options options_;
    GeometryEngine engine_;
    Logger logger_;
};

} // namespace cadgen
