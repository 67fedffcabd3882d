#include <catch2/catch.hpp>

#include "core/InputValidator.hpp"
#include "core/GeometryEngine.hpp"
#include "test_helpers.hpp"

using namespace cadgen;

TEST_CASE("Default configuration is valid", "[validator]") {
    InputValidator validator;
    ValidationResult result = validator.validate(GeneratorConfig());

    CHECK(result.is_valid);
    CHECK_FALSE(result.has_errors());
    CHECK(result.format_error_message().empty());
}

TEST_CASE("Road buffer distance must be positive", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;

    config.road_buffer_distance = 0.0;
    ValidationResult result = validator.validate(config);
    REQUIRE(result.has_errors());
    REQUIRE(result.conflicts.size() == 1);
    CHECK(result.conflicts[0].description.find("buffer") != std::string::npos);

    config.road_buffer_distance = -3.0;
    CHECK(validator.validate(config).has_errors());
}

TEST_CASE("Area bounds", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;

    SECTION("max below min is rejected") {
        config.min_area = 500.0;
        config.max_area = 100.0;
        CHECK(validator.validate(config).has_errors());
    }

    SECTION("max of zero disables the upper bound") {
        config.min_area = 500.0;
        config.max_area = 0.0;
        CHECK(validator.validate(config).is_valid);
    }

    SECTION("equal bounds are accepted") {
        config.min_area = 300.0;
        config.max_area = 300.0;
        CHECK(validator.validate(config).is_valid);
    }

    SECTION("negative bounds are rejected") {
        config.min_area = -1.0;
        CHECK(validator.validate(config).has_errors());
    }
}

TEST_CASE("Regularization parameters are checked together", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;
    config.angle_tolerance = 60.0;
    config.max_orthogonalize_iterations = 0;
    config.snap_tolerance = 0.0;

    ValidationResult result = validator.validate(config);
    REQUIRE(result.conflicts.size() == 1);
    CHECK(result.conflicts[0].involved_params.size() == 3);
    CHECK(result.conflicts[0].suggestions.size() == 3);
}

TEST_CASE("Angle tolerance range is inclusive", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;

    config.angle_tolerance = 0.0;
    CHECK(validator.validate(config).is_valid);
    config.angle_tolerance = 45.0;
    CHECK(validator.validate(config).is_valid);
    config.angle_tolerance = 45.5;
    CHECK(validator.validate(config).has_errors());
}

TEST_CASE("All conflicts are reported at once", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;
    config.road_buffer_distance = -1.0;
    config.angle_tolerance = 90.0;
    config.target_frame = "";

    ValidationResult result = validator.validate(config);
    REQUIRE(result.conflicts.size() == 3);

    const std::string message = result.format_error_message();
    CHECK(message.rfind("Invalid parameters:\n", 0) == 0);
    CHECK(message.find("  1. ") != std::string::npos);
    CHECK(message.find("  3. ") != std::string::npos);
    CHECK(message.find("->") != std::string::npos);
}

TEST_CASE("Extent padding", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;

    config.block_extent_padding = 0.0;
    CHECK(validator.validate(config).has_errors());

    config.block_extent_padding = 12.5;
    CHECK(validator.validate(config).is_valid);
    CHECK(config.effective_block_padding() == Approx(12.5));

    config.block_extent_padding.reset();
    config.road_buffer_distance = 8.0;
    CHECK(config.effective_block_padding() == Approx(40.0));

    config.tessellation_padding_percent = -5.0;
    CHECK(validator.validate(config).has_errors());
}

TEST_CASE("Buffer style", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;

    config.buffer_quadrant_segments = 0;
    CHECK(validator.validate(config).has_errors());

    config.buffer_quadrant_segments = 8;
    config.buffer_end_cap = BufferEndCap::FLAT;
    CHECK(validator.validate(config).is_valid == GeometryEngine::supports_flat_end_cap());
}

TEST_CASE("Mode must match the supplied layers", "[validator]") {
    InputValidator validator;
    GeneratorConfig config;
    InputLayers roads_only = testing::make_road_inputs({{Point2D(0, 0), Point2D(10, 0)}});

    SECTION("cadastral mode without a building layer") {
        config.mode = GenerationMode::CADASTRAL;
        ValidationResult result = validator.validate(config, roads_only);
        REQUIRE(result.has_errors());
        CHECK(result.format_error_message().find("building layer") != std::string::npos);
    }

    SECTION("blocks mode needs roads only") {
        config.mode = GenerationMode::BLOCKS;
        CHECK(validator.validate(config, roads_only).is_valid);
    }

    SECTION("cadastral mode with a building layer") {
        InputLayers inputs = testing::make_inputs({}, {Point2D(1, 1)});
        CHECK(validator.validate(config, inputs).is_valid);
    }
}
