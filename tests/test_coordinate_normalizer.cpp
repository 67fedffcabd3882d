#include <catch2/catch.hpp>

#include "core/CoordinateNormalizer.hpp"
#include "GeneratorErrors.hpp"

using namespace cadgen;

TEST_CASE("Target frame must be projected", "[normalizer]") {
    CHECK_THROWS_AS(CoordinateNormalizer(""), InvalidFrameError);
    CHECK_THROWS_AS(CoordinateNormalizer("not a reference frame"), InvalidFrameError);
    CHECK_THROWS_AS(CoordinateNormalizer("EPSG:4326"), InvalidFrameError);

    // InvalidFrameError is a ConfigError
    CHECK_THROWS_AS(CoordinateNormalizer("EPSG:4326"), ConfigError);
}

TEST_CASE("Projected target frame", "[normalizer]") {
    CoordinateNormalizer normalizer("EPSG:32736");

    CHECK(normalizer.linear_units() == Approx(1.0));
    CHECK(normalizer.target().IsProjected());
    CHECK_FALSE(normalizer.target_wkt().empty());
}

TEST_CASE("Layers without a frame are taken as already normalized", "[normalizer]") {
    CoordinateNormalizer normalizer("EPSG:32736");

    PointLayer layer;
    layer.name = "buildings";
    layer.points = {Point2D(1.5, 2.5), Point2D(-10.0, 4.0)};

    PointLayer result = normalizer.normalize(layer);
    REQUIRE(result.points.size() == 2);
    CHECK(result.points[0] == Point2D(1.5, 2.5));
    CHECK(result.points[1] == Point2D(-10.0, 4.0));
    CHECK(result.frame == "EPSG:32736");
    CHECK(result.name == "buildings");
}

TEST_CASE("Layers in the target frame are not transformed", "[normalizer]") {
    CoordinateNormalizer normalizer("EPSG:32736");

    LineLayer layer;
    layer.name = "roads";
    layer.frame = "EPSG:32736";
    layer.lines = {{Point2D(500000.0, 7000000.0), Point2D(500100.0, 7000000.0)}};

    LineLayer result = normalizer.normalize(layer);
    REQUIRE(result.lines.size() == 1);
    REQUIRE(result.lines[0].size() == 2);
    CHECK(result.lines[0][1] == Point2D(500100.0, 7000000.0));
}

TEST_CASE("Geographic layers are reprojected", "[normalizer]") {
    CoordinateNormalizer normalizer("EPSG:32736");

    // Central meridian of UTM zone 36 on the equator
    PointLayer layer;
    layer.name = "buildings";
    layer.frame = "EPSG:4326";
    layer.points = {Point2D(33.0, 0.0)};

    PointLayer result = normalizer.normalize(layer);
    REQUIRE(result.points.size() == 1);
    CHECK(result.points[0].x() == Approx(500000.0).margin(0.01));
    CHECK(result.points[0].y() == Approx(10000000.0).margin(0.01));
}

TEST_CASE("Unparsable source frames are rejected", "[normalizer]") {
    CoordinateNormalizer normalizer("EPSG:32736");

    LineLayer layer;
    layer.name = "roads";
    layer.frame = "definitely not a frame";
    layer.lines = {{Point2D(0, 0), Point2D(1, 1)}};

    CHECK_THROWS_AS(normalizer.normalize(layer), InvalidFrameError);
}
