/**
 * @file AreaFilter.cpp
 * @brief Implementation of the area filter
 */

#include "AreaFilter.hpp"
#include "GeneratorErrors.hpp"

namespace cadgen {

AreaFilter::AreaFilter(double min_area, double max_area)
    : min_area_(min_area), max_area_(max_area), logger_("AreaFilter") {
    if (min_area_ < 0.0 || max_area_ < 0.0) {
        throw ConfigError("area bounds must not be negative");
    }
    if (max_area_ != 0.0 && max_area_ < min_area_) {
        throw ConfigError("max_area (" + std::to_string(max_area_) + ") is below min_area (" +
                          std::to_string(min_area_) + ")");
    }
}

bool AreaFilter::accepts(double area) const {
    if (area < min_area_) return false;
    if (max_area_ != 0.0 && area > max_area_) return false;
    return true;
}

std::vector<CadastralFeature> AreaFilter::apply(const PolygonSet& polygons) const {
    std::vector<CadastralFeature> features;
    features.reserve(polygons.size());

    size_t too_small = 0;
    size_t too_large = 0;
    long next_id = 1;

    for (const auto& polygon : polygons) {
        const double area = polygon.geometry.area();
        if (!accepts(area)) {
            if (area < min_area_) {
                ++too_small;
            } else {
                ++too_large;
            }
            continue;
        }

        CadastralFeature feature;
        feature.id = next_id++;
        feature.geometry = polygon.geometry;
        feature.area = area;
        feature.source_id = polygon.source_id;
        features.push_back(std::move(feature));
    }

    logger_.info("Kept " + std::to_string(features.size()) + " of " + std::to_string(polygons.size()) +
                 " polygon(s) within area bounds");
    if (too_small > 0 || too_large > 0) {
        logger_.detailed("  " + std::to_string(too_small) + " below " + std::to_string(min_area_) + ", " +
                         std::to_string(too_large) + " above " +
                         (max_area_ == 0.0 ? std::string("unbounded") : std::to_string(max_area_)));
    }
    if (features.empty() && !polygons.empty()) {
        logger_.warning("No polygon falls within the area bounds");
    }
    return features;
}

} // namespace cadgen
