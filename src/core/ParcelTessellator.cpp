/**
 * @file ParcelTessellator.cpp
 * @brief Implementation of the Voronoi cell construction
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ParcelTessellator.hpp"
#include "GeneratorErrors.hpp"
#include "GeometryEngine.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Delaunay_triangulation_2.h>
#include <CGAL/Triangulation_vertex_base_with_info_2.h>
#include <CGAL/exceptions.h>

#include <unordered_map>

namespace cadgen {

namespace {

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using Vb = CGAL::Triangulation_vertex_base_with_info_2<size_t, K>;
using Tds = CGAL::Triangulation_data_structure_2<Vb>;
using Delaunay = CGAL::Delaunay_triangulation_2<K, Tds>;
using Point_2 = K::Point_2;

/**
 * @brief Keep the part of a convex ring on the site's side of the bisector
 *
 * Half-plane: (q - p) . x <= (|q|^2 - |p|^2) / 2
 */
Ring clip_to_bisector(const Ring& ring, const Point2D& site, const Point2D& neighbour) {
    const double nx = neighbour.x() - site.x();
    const double ny = neighbour.y() - site.y();
    const double limit = (neighbour.x() * neighbour.x() + neighbour.y() * neighbour.y() -
                          site.x() * site.x() - site.y() * site.y()) / 2.0;

    auto side = [&](const Point2D& v) { return nx * v.x() + ny * v.y() - limit; };

    Ring clipped;
    clipped.reserve(ring.size() + 1);

    for (size_t i = 0; i < ring.size(); ++i) {
        const Point2D& current = ring[i];
        const Point2D& next = ring[(i + 1) % ring.size()];
        const double s_current = side(current);
        const double s_next = side(next);

        if (s_current <= 0.0) {
            clipped.push_back(current);
        }
        if ((s_current < 0.0 && s_next > 0.0) || (s_current > 0.0 && s_next < 0.0)) {
            const double t = s_current / (s_current - s_next);
            clipped.emplace_back(current.x() + t * (next.x() - current.x()),
                                 current.y() + t * (next.y() - current.y()));
        }
    }

    return clipped;
}

} // namespace

ParcelTessellator::ParcelTessellator(const Options& options)
    : options_(options), logger_("ParcelTessellator") {
}

BoundingBox ParcelTessellator::clip_extent(const std::vector<Point2D>& points) const {
    BoundingBox box;
    for (const auto& p : points) {
        box.expand(p);
    }
    if (box.is_empty()) {
        return box;
    }

    const double larger_side = std::max(box.width(), box.height());
    const double padding = std::max(larger_side * options_.padding_percent / 100.0,
                                    options_.minimum_padding);
    return box.padded(padding);
}

PolygonSet ParcelTessellator::tessellate(const std::vector<Point2D>& points) const {
    merged_points_ = 0;

    if (points.empty()) {
        throw InsufficientInputError("cadastral mode requires at least one building point");
    }

    const BoundingBox extent = clip_extent(points);
    if (!(extent.width() > 0.0) || !(extent.height() > 0.0)) {
        throw InsufficientInputError("building points span a degenerate clip extent");
    }

    Delaunay triangulation;
    std::vector<size_t> owner_index;

    try {
        for (size_t i = 0; i < points.size(); ++i) {
            const size_t before = triangulation.number_of_vertices();
            Delaunay::Vertex_handle vertex = triangulation.insert(Point_2(points[i].x(), points[i].y()));
            if (triangulation.number_of_vertices() > before) {
                vertex->info() = i;
                owner_index.push_back(i);
            } else {
                ++merged_points_;
                logger_.trace("Point " + std::to_string(i) + " coincides with point " +
                              std::to_string(vertex->info()));
            }
        }
    } catch (const CGAL::Failure_exception& e) {
        throw GeometryEngineError(std::string("Delaunay triangulation failed: ") + e.what());
    }

    // Delaunay neighbours of each owning point
    std::unordered_map<size_t, std::vector<size_t>> neighbours;
    if (triangulation.dimension() >= 1) {
        for (auto edge = triangulation.finite_edges_begin(); edge != triangulation.finite_edges_end(); ++edge) {
            const auto face = edge->first;
            const int index = edge->second;
            const size_t a = face->vertex(face->cw(index))->info();
            const size_t b = face->vertex(face->ccw(index))->info();
            neighbours[a].push_back(b);
            neighbours[b].push_back(a);
        }
    }

    const Ring frame = GeometryEngine::rectangle(extent).exterior();

    PolygonSet cells;
    cells.reserve(owner_index.size());

    for (size_t site_index : owner_index) {
        const Point2D& site = points[site_index];
        Ring cell = frame;

        auto it = neighbours.find(site_index);
        if (it != neighbours.end()) {
            for (size_t other : it->second) {
                cell = clip_to_bisector(cell, site, points[other]);
                if (cell.size() < 3) break;
            }
        }

        if (cell.size() < 3) {
            logger_.warning("Cell of point " + std::to_string(site_index) + " collapsed during clipping");
            continue;
        }
        cells.emplace_back(PolygonData(std::move(cell)), static_cast<long>(site_index));
    }

    if (cells.size() < points.size()) {
        logger_.warning("Tessellation produced " + std::to_string(cells.size()) + " cells for " +
                        std::to_string(points.size()) + " points (" + std::to_string(merged_points_) +
                        " coincident point(s) merged)");
    } else {
        logger_.info("Tessellation produced " + std::to_string(cells.size()) + " cells");
    }

    return cells;
}

} // namespace cadgen
