/**
 * @file CoordinateNormalizer.hpp
 * @brief Reprojection of input layers into the metric working frame
 */

#pragma once

#include "cadastral_generator.hpp"
#include "Logger.hpp"
#include <ogr_spatialref.h>
#include <memory>
#include <string>

namespace cadgen {

/**
 * @brief Re-expresses point and line layers in one linear-unit frame
 *
 * The target frame is parsed and checked at construction: it must be a
 * projected (or local) system measured in linear units. Layers whose
 * frame equals the target pass through unchanged; layers with no frame
 * are assumed to already be in the target frame.
 */
class CoordinateNormalizer {
public:
    /**
     * @throws InvalidFrameError if the frame cannot be parsed or is angular
     */
    explicit CoordinateNormalizer(const std::string& target_frame);
    ~CoordinateNormalizer();

    PointLayer normalize(const PointLayer& layer) const;
    LineLayer normalize(const LineLayer& layer) const;

    const OGRSpatialReference& target() const { return *target_; }
    std::string target_wkt() const;

    /**
     * @brief Metres per working unit of the target frame
     */
    double linear_units() const;

private:
    struct TransformDeleter {
        void operator()(OGRCoordinateTransformation* transform) const;
    };
    using TransformPtr = std::unique_ptr<OGRCoordinateTransformation, TransformDeleter>;

    std::string target_frame_;
    std::unique_ptr<OGRSpatialReference> target_;
    Logger logger_;

    /**
     * @brief Transformation from source to target, or null when they coincide
     */
    TransformPtr transformation_for(const std::string& source_frame, const std::string& layer_name) const;

    void transform_points(OGRCoordinateTransformation* transform, std::vector<Point2D>& points,
                          const std::string& layer_name) const;
};

} // namespace cadgen
