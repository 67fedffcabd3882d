#include <catch2/catch.hpp>

#include "cli/ConfigurationManager.hpp"
#include "GeneratorErrors.hpp"
#include "test_helpers.hpp"

using namespace cadgen;

TEST_CASE("Only JSON objects are accepted", "[config]") {
    ConfigurationManager manager;

    CHECK_FALSE(manager.load_from_string("not json at all"));
    CHECK_FALSE(manager.load_from_string("[1, 2, 3]"));
    CHECK(manager.load_from_string("{}"));
    CHECK_FALSE(manager.load_from_file("/nonexistent/cadgen/config.json"));
}

TEST_CASE("Document values overlay the base configuration", "[config]") {
    ConfigurationManager manager;
    REQUIRE(manager.load_from_string(R"({
        "road_buffer_distance": 12.5,
        "min_area": 300,
        "target_crs": "EPSG:22235",
        "mode": "BLOCKS",
        "orthogonalize": false,
        "buffer_end_cap": "flat",
        "block_extent_padding": 40,
        "clip_to_blocks": true,
        "log_file": "cadgen.log"
    })"));

    GeneratorConfig base;
    base.max_area = 5000.0;
    base.angle_tolerance = 20.0;

    GeneratorConfig config = manager.to_generator_config(base);

    CHECK(config.road_buffer_distance == Approx(12.5));
    CHECK(config.min_area == Approx(300.0));
    CHECK(config.target_frame == "EPSG:22235");
    CHECK(config.mode == GenerationMode::BLOCKS);
    CHECK_FALSE(config.orthogonalize);
    CHECK(config.buffer_end_cap == BufferEndCap::FLAT);
    REQUIRE(config.block_extent_padding.has_value());
    CHECK(*config.block_extent_padding == Approx(40.0));
    CHECK(config.clip_to_blocks);
    CHECK(config.log_file == std::optional<std::string>("cadgen.log"));

    // Untouched keys keep the base values
    CHECK(config.max_area == Approx(5000.0));
    CHECK(config.angle_tolerance == Approx(20.0));
}

TEST_CASE("Null values leave optional settings unset", "[config]") {
    ConfigurationManager manager;
    REQUIRE(manager.load_from_string(R"({"block_extent_padding": null, "log_file": null})"));

    GeneratorConfig config = manager.to_generator_config();
    CHECK_FALSE(config.block_extent_padding.has_value());
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(manager.has_value("block_extent_padding"));
}

TEST_CASE("Badly typed values are configuration errors", "[config]") {
    ConfigurationManager manager;

    SECTION("string for a number") {
        REQUIRE(manager.load_from_string(R"({"min_area": "large"})"));
        CHECK_THROWS_AS(manager.to_generator_config(), ConfigError);
    }

    SECTION("unknown mode") {
        REQUIRE(manager.load_from_string(R"({"mode": "parcels"})"));
        CHECK_THROWS_AS(manager.to_generator_config(), ConfigError);
    }

    SECTION("unknown end cap") {
        REQUIRE(manager.load_from_string(R"({"buffer_end_cap": "square"})"));
        CHECK_THROWS_AS(manager.to_generator_config(), ConfigError);
    }
}

TEST_CASE("Saved configuration loads back", "[config]") {
    const auto dir = testing::scratch_dir("config_save");
    const std::string path = (dir / "saved.json").string();

    GeneratorConfig original;
    original.road_buffer_distance = 15.0;
    original.mode = GenerationMode::BLOCKS;
    original.max_orthogonalize_iterations = 250;
    original.block_extent_padding = 60.0;

    RunOptions options;
    options.roads_path = "roads.gpkg";
    options.roads_layer = "centerlines";
    options.output_path = "blocks.shp";
    options.output_format = "shapefile";

    ConfigurationManager writer;
    writer.from_generator_config(original);
    writer.from_run_options(options);
    REQUIRE(writer.save_to_file(path));

    ConfigurationManager reader;
    REQUIRE(reader.load_from_file(path));

    GeneratorConfig config = reader.to_generator_config();
    CHECK(config.road_buffer_distance == Approx(15.0));
    CHECK(config.mode == GenerationMode::BLOCKS);
    CHECK(config.max_orthogonalize_iterations == 250);
    REQUIRE(config.block_extent_padding.has_value());
    CHECK(*config.block_extent_padding == Approx(60.0));
    CHECK_FALSE(config.log_file.has_value());

    RunOptions loaded = reader.to_run_options();
    CHECK(loaded.roads_path == "roads.gpkg");
    CHECK(loaded.roads_layer == "centerlines");
    CHECK(loaded.buildings_path.empty());
    CHECK(loaded.output_path == "blocks.shp");
    CHECK(loaded.output_format == "shapefile");
}

TEST_CASE("Default configuration file", "[config]") {
    const auto dir = testing::scratch_dir("config_default");
    const std::string path = (dir / "default.json").string();

    REQUIRE(ConfigurationManager::create_default_file(path));

    ConfigurationManager manager;
    REQUIRE(manager.load_from_file(path));

    const GeneratorConfig defaults;
    GeneratorConfig config = manager.to_generator_config();
    CHECK(config.min_area == Approx(defaults.min_area));
    CHECK(config.max_area == Approx(defaults.max_area));
    CHECK(config.snap_tolerance == Approx(defaults.snap_tolerance));
    CHECK(config.buffer_quadrant_segments == defaults.buffer_quadrant_segments);
    CHECK(config.mode == defaults.mode);
    CHECK(manager.document().at("mode") == "cadastral");
    CHECK(manager.document().at("buffer_end_cap") == "round");
}
