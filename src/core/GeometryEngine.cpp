/**
 * @file GeometryEngine.cpp
 * @brief Implementation of OGR/CGAL polygon primitives
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GeometryEngine.hpp"
#include "GeneratorErrors.hpp"

#include <gdal_version.h>
#include <cpl_string.h>
#include <ogr_core.h>

// CGAL polygon repair
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2.h>
#include <CGAL/Polygon_with_holes_2.h>
#include <CGAL/Multipolygon_with_holes_2.h>
#include <CGAL/Polygon_repair/repair.h>
#include <CGAL/exceptions.h>

#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <utility>

namespace cadgen {

namespace {

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using Point_2 = K::Point_2;
using Polygon_2 = CGAL::Polygon_2<K>;
using Polygon_with_holes_2 = CGAL::Polygon_with_holes_2<K>;
using Multipolygon_with_holes_2 = CGAL::Multipolygon_with_holes_2<K>;

Ring ring_from_ogr(const OGRLinearRing* ring) {
    Ring out;
    if (!ring) return out;

    const int num_points = ring->getNumPoints();
    out.reserve(static_cast<size_t>(num_points));
    for (int i = 0; i < num_points; ++i) {
        out.emplace_back(ring->getX(i), ring->getY(i));
    }
    // Stored open
    if (out.size() > 1 && out.front() == out.back()) {
        out.pop_back();
    }
    return out;
}

Ring drop_exact_repeats(const Ring& ring) {
    Ring out;
    out.reserve(ring.size());
    for (const auto& p : ring) {
        if (out.empty() || !(out.back() == p)) {
            out.push_back(p);
        }
    }
    if (out.size() > 1 && out.front() == out.back()) {
        out.pop_back();
    }
    return out;
}

Polygon_2 ring_to_cgal(const Ring& ring) {
    Polygon_2 polygon;
    for (const auto& p : ring) {
        polygon.push_back(Point_2(p.x(), p.y()));
    }
    return polygon;
}

Ring ring_from_cgal(const Polygon_2& polygon) {
    Ring ring;
    ring.reserve(polygon.size());
    for (auto it = polygon.vertices_begin(); it != polygon.vertices_end(); ++it) {
        ring.emplace_back(CGAL::to_double(it->x()), CGAL::to_double(it->y()));
    }
    return ring;
}

bool envelopes_intersect(const OGRGeometry& a, const OGRGeometry& b) {
    OGREnvelope env_a;
    OGREnvelope env_b;
    a.getEnvelope(&env_a);
    b.getEnvelope(&env_b);
    return env_a.Intersects(env_b);
}

// Unsigned arithmetic wraps; signed products of large cell keys would overflow.
struct GridCellHash {
    size_t operator()(const std::pair<long long, long long>& key) const {
        const auto x = static_cast<std::uint64_t>(key.first) * 73856093ULL;
        const auto y = static_cast<std::uint64_t>(key.second) * 19349663ULL;
        return std::hash<std::uint64_t>()(x ^ y);
    }
};

} // namespace

GeometryEngine::GeometryEngine()
    : logger_("GeometryEngine") {
}

bool GeometryEngine::supports_flat_end_cap() {
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 10, 0)
    return true;
#else
    return false;
#endif
}

// ============================================================================
// Conversion
// ============================================================================

OGRGeometryUniquePtr GeometryEngine::to_ogr(const PolygonData& polygon) const {
    auto ogr_polygon = std::make_unique<OGRPolygon>();

    for (const auto& ring : polygon.rings) {
        if (ring.size() < 3) continue;

        OGRLinearRing ogr_ring;
        for (const auto& p : ring) {
            ogr_ring.addPoint(p.x(), p.y());
        }
        ogr_ring.closeRings();
        if (ogr_polygon->addRing(&ogr_ring) != OGRERR_NONE) {
            throw GeometryEngineError("cannot build OGR polygon ring");
        }
    }

    return OGRGeometryUniquePtr(ogr_polygon.release());
}

OGRGeometryUniquePtr GeometryEngine::to_ogr(const std::vector<PolygonData>& polygons) const {
    auto multi = std::make_unique<OGRMultiPolygon>();

    for (const auto& polygon : polygons) {
        if (polygon.empty()) continue;
        if (multi->addGeometryDirectly(to_ogr(polygon).release()) != OGRERR_NONE) {
            throw GeometryEngineError("cannot build OGR multipolygon");
        }
    }

    return OGRGeometryUniquePtr(multi.release());
}

OGRGeometryUniquePtr GeometryEngine::to_ogr(const LineString2D& line) const {
    auto ogr_line = std::make_unique<OGRLineString>();
    for (const auto& p : line) {
        ogr_line->addPoint(p.x(), p.y());
    }
    return OGRGeometryUniquePtr(ogr_line.release());
}

std::vector<PolygonData> GeometryEngine::from_ogr(const OGRGeometry* geometry) const {
    std::vector<PolygonData> result;
    if (!geometry || geometry->IsEmpty()) {
        return result;
    }

    const OGRwkbGeometryType type = wkbFlatten(geometry->getGeometryType());

    if (OGR_GT_IsSubClassOf(type, wkbPolygon)) {
        const OGRPolygon* polygon = geometry->toPolygon();

        PolygonData data;
        Ring exterior = ring_from_ogr(polygon->getExteriorRing());
        if (exterior.size() < 3) {
            return result;
        }
        data.rings.push_back(std::move(exterior));

        for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
            Ring hole = ring_from_ogr(polygon->getInteriorRing(i));
            if (hole.size() >= 3) {
                data.rings.push_back(std::move(hole));
            }
        }
        result.push_back(std::move(data));
        return result;
    }

    if (OGR_GT_IsSubClassOf(type, wkbGeometryCollection)) {
        const OGRGeometryCollection* collection = geometry->toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            auto parts = from_ogr(collection->getGeometryRef(i));
            result.insert(result.end(),
                          std::make_move_iterator(parts.begin()),
                          std::make_move_iterator(parts.end()));
        }
        return result;
    }

    if (OGR_GT_IsSurface(type)) {
        // Curve polygons and the like
        OGRGeometryUniquePtr linear(geometry->getLinearGeometry());
        if (linear && wkbFlatten(linear->getGeometryType()) != type) {
            return from_ogr(linear.get());
        }
    }

    logger_.trace("Ignoring non-polygonal geometry: " + std::string(OGRGeometryTypeToName(type)));
    return result;
}

// ============================================================================
// Primitives
// ============================================================================

std::vector<PolygonData> GeometryEngine::buffer(const LineString2D& line, double distance,
                                                const BufferStyle& style) const {
    if (line.empty()) {
        return {};
    }

    bool degenerate = true;
    for (const auto& p : line) {
        if (!(p == line.front())) {
            degenerate = false;
            break;
        }
    }

    OGRGeometryUniquePtr buffered;
    if (degenerate) {
        OGRPoint point(line.front().x(), line.front().y());
        buffered.reset(point.Buffer(distance, style.quadrant_segments));
    } else {
        OGRGeometryUniquePtr geometry = to_ogr(line);
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 10, 0)
        CPLStringList options;
        options.SetNameValue("ENDCAP", style.end_cap == BufferEndCap::FLAT ? "FLAT" : "ROUND");
        options.SetNameValue("JOIN_STYLE", "ROUND");
        options.SetNameValue("QUADRANT_SEGMENTS", std::to_string(style.quadrant_segments).c_str());
        buffered.reset(geometry->BufferEx(distance, options.List()));
#else
        if (style.end_cap == BufferEndCap::FLAT) {
            throw GeometryEngineError("flat buffer end caps require GDAL 3.10 or newer");
        }
        buffered.reset(geometry->Buffer(distance, style.quadrant_segments));
#endif
    }

    if (!buffered) {
        throw GeometryEngineError("buffer of " + std::to_string(line.size()) +
                                  "-vertex line by " + std::to_string(distance) + " failed");
    }

    return from_ogr(buffered.get());
}

std::vector<PolygonData> GeometryEngine::buffer(const PolygonData& polygon, double distance,
                                                int quadrant_segments) const {
    if (polygon.empty()) {
        return {};
    }

    OGRGeometryUniquePtr geometry = to_ogr(polygon);
    OGRGeometryUniquePtr buffered(geometry->Buffer(distance, quadrant_segments));
    if (!buffered) {
        throw GeometryEngineError("polygon buffer by " + std::to_string(distance) + " failed");
    }
    return from_ogr(buffered.get());
}

std::vector<PolygonData> GeometryEngine::dissolve(const std::vector<PolygonData>& polygons) const {
    if (polygons.empty()) {
        return {};
    }

    OGRGeometryUniquePtr collection = to_ogr(polygons);
    if (collection->IsEmpty()) {
        return {};
    }

    OGRGeometryUniquePtr merged(collection->UnionCascaded());
    if (!merged) {
        throw GeometryEngineError("dissolve of " + std::to_string(polygons.size()) + " polygons failed");
    }

    return from_ogr(merged.get());
}

std::vector<PolygonData> GeometryEngine::difference(const PolygonData& polygon,
                                                    const OGRGeometry& subtrahend) const {
    if (polygon.empty()) {
        return {};
    }

    OGRGeometryUniquePtr geometry = to_ogr(polygon);
    if (subtrahend.IsEmpty() || !envelopes_intersect(*geometry, subtrahend)) {
        return {polygon};
    }

    OGRGeometryUniquePtr result(geometry->Difference(&subtrahend));
    if (!result) {
        throw GeometryEngineError("polygon difference failed");
    }

    return from_ogr(result.get());
}

std::vector<PolygonData> GeometryEngine::difference(const PolygonData& polygon,
                                                    const PolygonData& subtrahend) const {
    OGRGeometryUniquePtr other = to_ogr(subtrahend);
    return difference(polygon, *other);
}

std::vector<PolygonData> GeometryEngine::intersection(const PolygonData& polygon,
                                                      const OGRGeometry& other) const {
    if (polygon.empty() || other.IsEmpty()) {
        return {};
    }

    OGRGeometryUniquePtr geometry = to_ogr(polygon);
    if (!envelopes_intersect(*geometry, other)) {
        return {};
    }

    OGRGeometryUniquePtr result(geometry->Intersection(&other));
    if (!result) {
        throw GeometryEngineError("polygon intersection failed");
    }

    return from_ogr(result.get());
}

std::vector<PolygonData> GeometryEngine::intersection(const PolygonData& polygon,
                                                      const PolygonData& other) const {
    OGRGeometryUniquePtr other_geometry = to_ogr(other);
    return intersection(polygon, *other_geometry);
}

std::vector<PolygonData> GeometryEngine::merge(const PolygonData& a, const PolygonData& b) const {
    OGRGeometryUniquePtr geometry_a = to_ogr(a);
    OGRGeometryUniquePtr geometry_b = to_ogr(b);

    OGRGeometryUniquePtr result(geometry_a->Union(geometry_b.get()));
    if (!result) {
        throw GeometryEngineError("polygon union failed");
    }

    return from_ogr(result.get());
}

std::vector<PolygonData> GeometryEngine::symmetric_difference(const PolygonData& a,
                                                              const PolygonData& b) const {
    OGRGeometryUniquePtr geometry_a = to_ogr(a);
    OGRGeometryUniquePtr geometry_b = to_ogr(b);

    OGRGeometryUniquePtr result(geometry_a->SymDifference(geometry_b.get()));
    if (!result) {
        throw GeometryEngineError("polygon symmetric difference failed");
    }

    return from_ogr(result.get());
}

bool GeometryEngine::is_valid(const PolygonData& polygon) const {
    if (polygon.empty()) {
        return false;
    }
    OGRGeometryUniquePtr geometry = to_ogr(polygon);
    return geometry->IsValid();
}

bool GeometryEngine::interiors_overlap(const PolygonData& a, const PolygonData& b) const {
    if (a.empty() || b.empty() || !a.envelope().intersects(b.envelope())) {
        return false;
    }

    OGRGeometryUniquePtr geometry_a = to_ogr(a);
    OGRGeometryUniquePtr geometry_b = to_ogr(b);
    return geometry_a->Intersects(geometry_b.get()) && !geometry_a->Touches(geometry_b.get());
}

std::vector<PolygonData> GeometryEngine::fix_invalid(const PolygonData& polygon) const {
    if (polygon.empty()) {
        return {};
    }
    if (is_valid(polygon)) {
        return {polygon};
    }

    logger_.debug("Repairing invalid polygon with " + std::to_string(polygon.num_vertices()) + " vertices");

    std::vector<PolygonData> repaired_parts;
    try {
        Ring exterior = drop_exact_repeats(polygon.exterior());
        if (exterior.size() < 3) {
            return {};
        }

        std::vector<Polygon_2> holes;
        for (size_t r = 1; r < polygon.rings.size(); ++r) {
            Ring hole = drop_exact_repeats(polygon.rings[r]);
            if (hole.size() >= 3) {
                holes.push_back(ring_to_cgal(hole));
            }
        }

        Polygon_with_holes_2 input(ring_to_cgal(exterior), holes.begin(), holes.end());
        Multipolygon_with_holes_2 repaired =
            CGAL::Polygon_repair::repair(input, CGAL::Polygon_repair::Even_odd_rule());

        for (const auto& part : repaired.polygons_with_holes()) {
            PolygonData data;
            data.rings.push_back(ring_from_cgal(part.outer_boundary()));
            for (const auto& hole : part.holes()) {
                data.rings.push_back(ring_from_cgal(hole));
            }
            if (!data.empty()) {
                repaired_parts.push_back(std::move(data));
            }
        }
    } catch (const CGAL::Failure_exception& e) {
        throw GeometryEngineError(std::string("polygon repair failed: ") + e.what());
    }

    for (const auto& part : repaired_parts) {
        if (!is_valid(part)) {
            throw GeometryEngineError("polygon repair produced an invalid polygon");
        }
    }

    logger_.debug("  Repair produced " + std::to_string(repaired_parts.size()) + " polygon(s)");
    return repaired_parts;
}

size_t GeometryEngine::snap_vertices(PolygonSet& polygons, double tolerance) const {
    if (tolerance <= 0.0) {
        return 0;
    }

    const double tolerance_sq = tolerance * tolerance;
    std::unordered_map<std::pair<long long, long long>, std::vector<Point2D>, GridCellHash> grid;
    size_t moved = 0;

    for (auto& parcel : polygons) {
        for (auto& ring : parcel.geometry.rings) {
            for (auto& vertex : ring) {
                const long long cell_x = static_cast<long long>(std::floor(vertex.x() / tolerance));
                const long long cell_y = static_cast<long long>(std::floor(vertex.y() / tolerance));

                const Point2D* representative = nullptr;
                for (long long dx = -1; dx <= 1 && !representative; ++dx) {
                    for (long long dy = -1; dy <= 1 && !representative; ++dy) {
                        auto it = grid.find({cell_x + dx, cell_y + dy});
                        if (it == grid.end()) continue;
                        for (const auto& candidate : it->second) {
                            const double ddx = candidate.x() - vertex.x();
                            const double ddy = candidate.y() - vertex.y();
                            if (ddx * ddx + ddy * ddy <= tolerance_sq) {
                                representative = &candidate;
                                break;
                            }
                        }
                    }
                }

                if (representative) {
                    if (!(*representative == vertex)) {
                        vertex = *representative;
                        ++moved;
                    }
                } else {
                    grid[{cell_x, cell_y}].push_back(vertex);
                }
            }
        }
    }

    if (moved > 0) {
        logger_.debug("Snapped " + std::to_string(moved) + " vertices within " + std::to_string(tolerance));
    }
    return moved;
}

PolygonData GeometryEngine::remove_duplicate_vertices(const PolygonData& polygon, double tolerance) const {
    const double tolerance_sq = tolerance * tolerance;
    auto close = [tolerance_sq](const Point2D& a, const Point2D& b) {
        const double dx = a.x() - b.x();
        const double dy = a.y() - b.y();
        return dx * dx + dy * dy <= tolerance_sq;
    };

    PolygonData result;
    for (size_t r = 0; r < polygon.rings.size(); ++r) {
        Ring cleaned;
        cleaned.reserve(polygon.rings[r].size());
        for (const auto& p : polygon.rings[r]) {
            if (cleaned.empty() || !close(cleaned.back(), p)) {
                cleaned.push_back(p);
            }
        }
        while (cleaned.size() > 1 && close(cleaned.back(), cleaned.front())) {
            cleaned.pop_back();
        }

        if (cleaned.size() < 3) {
            if (r == 0) {
                return PolygonData();
            }
            continue;
        }
        result.rings.push_back(std::move(cleaned));
    }
    return result;
}

double GeometryEngine::total_area(const std::vector<PolygonData>& polygons) {
    double area = 0.0;
    for (const auto& polygon : polygons) {
        area += polygon.area();
    }
    return area;
}

BoundingBox GeometryEngine::envelope(const std::vector<PolygonData>& polygons) {
    BoundingBox box;
    for (const auto& polygon : polygons) {
        box.expand(polygon.envelope());
    }
    return box;
}

PolygonData GeometryEngine::rectangle(const BoundingBox& box) {
    return PolygonData(Ring{
        Point2D(box.min_x, box.min_y),
        Point2D(box.max_x, box.min_y),
        Point2D(box.max_x, box.max_y),
        Point2D(box.min_x, box.max_y)
    });
}

} // namespace cadgen
