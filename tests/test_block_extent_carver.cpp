#include <catch2/catch.hpp>

#include "core/BlockExtentCarver.hpp"
#include "core/RoadReserveBuilder.hpp"
#include "GeneratorErrors.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace cadgen;

namespace {

RoadReserve reserve_for(const std::vector<LineString2D>& lines, double distance) {
    RoadReserveBuilder::Options options;
    options.buffer_distance = distance;
    return RoadReserveBuilder(options).build(lines);
}

} // namespace

TEST_CASE("Block padding must be positive", "[blocks]") {
    CHECK_THROWS_AS(BlockExtentCarver(0.0), ConfigError);
    CHECK_THROWS_AS(BlockExtentCarver(-1.0), ConfigError);
    CHECK_NOTHROW(BlockExtentCarver(0.5));
}

TEST_CASE("Carving needs a road reserve", "[blocks]") {
    BlockExtentCarver carver(10.0);
    CHECK_THROWS_AS(carver.carve(RoadReserve()), InsufficientInputError);
    CHECK(carver.extent(RoadReserve()).is_empty());
}

TEST_CASE("Block extent is the padded reserve envelope", "[blocks]") {
    RoadReserve reserve{testing::rect(0, 0, 100, 10)};
    BoundingBox box = BlockExtentCarver(25.0).extent(reserve);

    CHECK(box.min_x == Approx(-25.0));
    CHECK(box.min_y == Approx(-25.0));
    CHECK(box.max_x == Approx(125.0));
    CHECK(box.max_y == Approx(35.0));
}

TEST_CASE("A lone road leaves one block around it", "[blocks]") {
    RoadReserve reserve = reserve_for({{Point2D(0, 0), Point2D(100, 0)}}, 5.0);
    REQUIRE(reserve.size() == 1);

    PolygonSet blocks = BlockExtentCarver(25.0).carve(reserve);
    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].geometry.num_holes() == 1);
    CHECK(blocks[0].source_id == -1);

    // Extent -30..130 x -30..30 minus the reserve
    CHECK(blocks[0].geometry.area() == Approx(160.0 * 60.0 - reserve[0].area()).epsilon(1e-6));
}

TEST_CASE("A road grid encloses four blocks plus the outer ring", "[blocks]") {
    RoadReserve reserve = reserve_for(testing::road_grid(), 5.0);
    PolygonSet blocks = BlockExtentCarver(25.0).carve(reserve);

    REQUIRE(blocks.size() == 5);

    const auto inner = std::count_if(blocks.begin(), blocks.end(), [](const ParcelPolygon& block) {
        return block.geometry.area() == Approx(90.0 * 90.0).epsilon(1e-6);
    });
    CHECK(inner == 4);

    const auto ring = std::count_if(blocks.begin(), blocks.end(), [](const ParcelPolygon& block) {
        return block.geometry.num_holes() == 1;
    });
    CHECK(ring == 1);

    for (const auto& block : blocks) {
        CHECK(block.source_id == -1);
    }
}
