/**
 * @file CoordinateNormalizer.cpp
 * @brief Implementation of layer reprojection
 */

#include "CoordinateNormalizer.hpp"
#include "GeneratorErrors.hpp"
#include <cpl_conv.h>
#include <cmath>

namespace cadgen {

void CoordinateNormalizer::TransformDeleter::operator()(OGRCoordinateTransformation* transform) const {
    OGRCoordinateTransformation::DestroyCT(transform);
}

CoordinateNormalizer::CoordinateNormalizer(const std::string& target_frame)
    : target_frame_(target_frame), target_(std::make_unique<OGRSpatialReference>()),
      logger_("CoordinateNormalizer") {

    if (target_frame.empty()) {
        throw InvalidFrameError(target_frame, "is empty");
    }

    if (target_->SetFromUserInput(target_frame.c_str()) != OGRERR_NONE) {
        throw InvalidFrameError(target_frame, "cannot be parsed");
    }

    if (target_->IsGeographic() || target_->IsGeocentric()) {
        throw InvalidFrameError(target_frame, "is angular; a projected frame with linear units is required");
    }
    if (!target_->IsProjected() && !target_->IsLocal()) {
        throw InvalidFrameError(target_frame, "is not a projected frame");
    }
    if (target_->GetLinearUnits() <= 0.0) {
        throw InvalidFrameError(target_frame, "has no linear unit");
    }

    target_->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    const char* name = target_->GetName();
    logger_.detailed("Working frame: " + std::string(name ? name : target_frame) +
                     " (" + std::to_string(target_->GetLinearUnits()) + " m per unit)");
}

CoordinateNormalizer::~CoordinateNormalizer() = default;

std::string CoordinateNormalizer::target_wkt() const {
    char* wkt = nullptr;
    if (target_->exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        return "";
    }
    std::string result(wkt ? wkt : "");
    CPLFree(wkt);
    return result;
}

double CoordinateNormalizer::linear_units() const {
    return target_->GetLinearUnits();
}

CoordinateNormalizer::TransformPtr CoordinateNormalizer::transformation_for(
    const std::string& source_frame, const std::string& layer_name) const {

    if (source_frame.empty()) {
        logger_.warning("Layer '" + layer_name + "' has no reference frame, assuming " + target_frame_);
        return nullptr;
    }

    OGRSpatialReference source;
    if (source.SetFromUserInput(source_frame.c_str()) != OGRERR_NONE) {
        throw InvalidFrameError(source_frame, "of layer '" + layer_name + "' cannot be parsed");
    }
    source.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    if (source.IsSame(target_.get())) {
        logger_.detailed("Layer '" + layer_name + "' already in working frame");
        return nullptr;
    }

    TransformPtr transform(OGRCreateCoordinateTransformation(&source, target_.get()));
    if (!transform) {
        throw GeometryEngineError("no transformation from frame of layer '" + layer_name +
                                  "' to " + target_frame_);
    }
    return transform;
}

void CoordinateNormalizer::transform_points(OGRCoordinateTransformation* transform,
                                            std::vector<Point2D>& points,
                                            const std::string& layer_name) const {
    if (points.empty()) return;

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.x());
        ys.push_back(p.y());
    }

    if (transform) {
        std::vector<int> success(points.size(), FALSE);
        const int count = static_cast<int>(points.size());
        if (!transform->Transform(count, xs.data(), ys.data(), nullptr, success.data())) {
            throw GeometryEngineError("reprojection of layer '" + layer_name + "' failed");
        }
        for (size_t i = 0; i < success.size(); ++i) {
            if (!success[i]) {
                throw GeometryEngineError("reprojection of vertex " + std::to_string(i) +
                                          " in layer '" + layer_name + "' failed");
            }
        }
    }

    for (size_t i = 0; i < points.size(); ++i) {
        if (!std::isfinite(xs[i]) || !std::isfinite(ys[i])) {
            throw GeometryEngineError("non-finite coordinate in layer '" + layer_name + "'");
        }
        points[i] = Point2D(xs[i], ys[i]);
    }
}

PointLayer CoordinateNormalizer::normalize(const PointLayer& layer) const {
    TransformPtr transform = transformation_for(layer.frame, layer.name);

    PointLayer result;
    result.name = layer.name;
    result.frame = target_frame_;
    result.points = layer.points;
    transform_points(transform.get(), result.points, layer.name);

    logger_.debug("Normalized " + std::to_string(result.points.size()) + " points of layer '" + layer.name + "'");
    return result;
}

LineLayer CoordinateNormalizer::normalize(const LineLayer& layer) const {
    TransformPtr transform = transformation_for(layer.frame, layer.name);

    LineLayer result;
    result.name = layer.name;
    result.frame = target_frame_;
    result.lines = layer.lines;
    for (auto& line : result.lines) {
        transform_points(transform.get(), line, layer.name);
    }

    logger_.debug("Normalized " + std::to_string(result.lines.size()) + " lines of layer '" + layer.name + "'");
    return result;
}

} // namespace cadgen
