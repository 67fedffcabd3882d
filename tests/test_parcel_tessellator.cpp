#include <catch2/catch.hpp>

#include "core/ParcelTessellator.hpp"
#include "core/GeometryEngine.hpp"
#include "GeneratorErrors.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace cadgen;

TEST_CASE("Tessellation needs at least one point", "[tessellator]") {
    ParcelTessellator tessellator{ParcelTessellator::Options()};
    CHECK_THROWS_AS(tessellator.tessellate({}), InsufficientInputError);
}

TEST_CASE("A single point with zero extent needs minimum padding", "[tessellator]") {
    ParcelTessellator::Options options;
    ParcelTessellator without_padding(options);
    CHECK_THROWS_AS(without_padding.tessellate({Point2D(5, 5)}), InsufficientInputError);

    options.minimum_padding = 10.0;
    ParcelTessellator tessellator(options);
    PolygonSet cells = tessellator.tessellate({Point2D(5, 5)});

    REQUIRE(cells.size() == 1);
    CHECK(cells[0].source_id == 0);
    CHECK(cells[0].geometry.area() == Approx(400.0));
    CHECK(cells[0].geometry.contains(Point2D(5, 5)));
}

TEST_CASE("Clip extent is padded by a share of the larger side", "[tessellator]") {
    ParcelTessellator::Options options;
    options.padding_percent = 30.0;
    ParcelTessellator tessellator(options);

    BoundingBox box = tessellator.clip_extent({Point2D(0, 0), Point2D(200, 100)});
    CHECK(box.min_x == Approx(-60.0));
    CHECK(box.min_y == Approx(-60.0));
    CHECK(box.max_x == Approx(260.0));
    CHECK(box.max_y == Approx(160.0));

    options.minimum_padding = 100.0;
    BoundingBox wide = ParcelTessellator(options).clip_extent({Point2D(0, 0), Point2D(200, 100)});
    CHECK(wide.min_x == Approx(-100.0));
}

TEST_CASE("Two points split the extent on their bisector", "[tessellator]") {
    ParcelTessellator tessellator{ParcelTessellator::Options()};
    PolygonSet cells = tessellator.tessellate({Point2D(0, 0), Point2D(100, 0)});

    REQUIRE(cells.size() == 2);

    // Extent -30..130 x -30..30
    CHECK(cells[0].geometry.area() == Approx(4800.0));
    CHECK(cells[1].geometry.area() == Approx(4800.0));
    CHECK(testing::total_area(cells) == Approx(160.0 * 60.0));

    for (const auto& cell : cells) {
        const Point2D own = cell.source_id == 0 ? Point2D(0, 0) : Point2D(100, 0);
        const Point2D other = cell.source_id == 0 ? Point2D(100, 0) : Point2D(0, 0);
        CHECK(cell.geometry.contains(own));
        CHECK_FALSE(cell.geometry.contains(other));

        BoundingBox box = cell.geometry.envelope();
        if (cell.source_id == 0) {
            CHECK(box.max_x == Approx(50.0));
        } else {
            CHECK(box.min_x == Approx(50.0));
        }
    }
}

TEST_CASE("Coincident points share one cell", "[tessellator]") {
    ParcelTessellator tessellator{ParcelTessellator::Options()};
    PolygonSet cells = tessellator.tessellate({Point2D(0, 0), Point2D(0, 0), Point2D(100, 0)});

    REQUIRE(cells.size() == 2);
    CHECK(tessellator.merged_point_count() == 1);

    std::vector<long> sources;
    for (const auto& cell : cells) {
        sources.push_back(cell.source_id);
    }
    std::sort(sources.begin(), sources.end());
    CHECK(sources == std::vector<long>{0, 2});
}

TEST_CASE("Collinear points", "[tessellator]") {
    ParcelTessellator tessellator{ParcelTessellator::Options()};
    PolygonSet cells = tessellator.tessellate({Point2D(0, 0), Point2D(50, 0), Point2D(100, 0)});

    REQUIRE(cells.size() == 3);
    for (const auto& cell : cells) {
        if (cell.source_id == 1) {
            // Between the bisectors x = 25 and x = 75, over -30..30
            CHECK(cell.geometry.area() == Approx(50.0 * 60.0));
        }
    }
    CHECK(testing::total_area(cells) == Approx(160.0 * 60.0));
}

TEST_CASE("Cells of a point grid partition the extent", "[tessellator]") {
    std::vector<Point2D> points;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            points.emplace_back(i * 40.0 + (j % 2) * 7.0, j * 35.0);
        }
    }

    ParcelTessellator tessellator{ParcelTessellator::Options()};
    PolygonSet cells = tessellator.tessellate(points);
    REQUIRE(cells.size() == points.size());

    const BoundingBox extent = tessellator.clip_extent(points);
    CHECK(testing::total_area(cells) == Approx(extent.width() * extent.height()));

    GeometryEngine engine;
    for (size_t a = 0; a < cells.size(); ++a) {
        CHECK(cells[a].geometry.contains(points[static_cast<size_t>(cells[a].source_id)]));
        for (size_t b = a + 1; b < cells.size(); ++b) {
            CHECK(GeometryEngine::total_area(engine.intersection(cells[a].geometry, cells[b].geometry)) ==
                  Approx(0.0).margin(1e-6));
        }
    }
}
