/**
 * @file AreaFilter.hpp
 * @brief Area-bounded selection and numbering of output features
 */

#pragma once

#include "cadastral_generator.hpp"
#include "Logger.hpp"

namespace cadgen {

/**
 * @brief Keeps polygons whose area lies within [min_area, max_area]
 *
 * Bounds are inclusive; max_area == 0 means no upper bound. Survivors are
 * numbered 1..N in input order.
 */
class AreaFilter {
public:
    /**
     * @throws ConfigError for negative bounds or max_area < min_area (max_area != 0)
     */
    AreaFilter(double min_area, double max_area);

    std::vector<CadastralFeature> apply(const PolygonSet& polygons) const;

    bool accepts(double area) const;

    double min_area() const { return min_area_; }
    double max_area() const { return max_area_; }

private:
    double min_area_;
    double max_area_;
    Logger logger_;
};

} // namespace cadgen
