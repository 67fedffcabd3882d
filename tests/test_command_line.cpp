#include <catch2/catch.hpp>

#include "cli/CommandLineInterface.hpp"
#include "cli/SimpleCommandLineParser.hpp"
#include "cli/ConfigurationManager.hpp"
#include "cli/ConsoleProgressSink.hpp"
#include "test_helpers.hpp"

#include <csignal>
#include <fstream>

using namespace cadgen;
using testing::Arguments;

// ============================================================================
// SimpleCommandLineParser
// ============================================================================

TEST_CASE("Parser reads values, flags and defaults", "[cli][parser]") {
    SimpleCommandLineParser parser("tool", "Test tool");
    parser.add_option("count", "n", "How many");
    parser.add_option("level", "", "Level", false, "3");
    parser.add_flag("fast", "", "Go fast");

    SECTION("long options with inline values") {
        Arguments args{"--count=12", "--fast"};
        REQUIRE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.get_as<int>("count") == 12);
        CHECK(parser.get_flag("fast"));
        CHECK(parser.get("level") == "3");
    }

    SECTION("short options and negative numbers") {
        Arguments args{"-n", "-4"};
        REQUIRE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.get_as<int>("count") == -4);
        CHECK_FALSE(parser.get_flag("fast"));
    }

    SECTION("trailing garbage is not a number") {
        Arguments args{"--count", "12abc"};
        REQUIRE(parser.parse(args.argc(), args.argv()));
        CHECK_FALSE(parser.get_as<int>("count").has_value());
    }

    SECTION("positional arguments are collected") {
        Arguments args{"stray", "--fast"};
        REQUIRE(parser.parse(args.argc(), args.argv()));
        REQUIRE(parser.get_positional().size() == 1);
        CHECK(parser.get_positional()[0] == "stray");
    }
}

TEST_CASE("Parser usage errors", "[cli][parser]") {
    SimpleCommandLineParser parser("tool", "Test tool");
    parser.add_option("input", "i", "Input", true);
    parser.add_flag("fast", "", "Go fast");

    SECTION("unknown option") {
        Arguments args{"--input", "a", "--bogus"};
        CHECK_FALSE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.error() == "Unknown option: --bogus");
        CHECK_FALSE(parser.help_requested());
    }

    SECTION("flag given a value") {
        Arguments args{"--input", "a", "--fast=yes"};
        CHECK_FALSE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.error().find("does not take a value") != std::string::npos);
    }

    SECTION("missing value") {
        Arguments args{"--input"};
        CHECK_FALSE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.error().find("requires a value") != std::string::npos);
    }

    SECTION("missing required option") {
        Arguments args{"--fast"};
        CHECK_FALSE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.error().find("--input") != std::string::npos);
    }

    SECTION("help") {
        Arguments args{"--help"};
        CHECK_FALSE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.help_requested());
        CHECK(parser.error().empty());
    }
}

// ============================================================================
// CommandLineInterface
// ============================================================================

TEST_CASE("Minimal command line", "[cli]") {
    CommandLineInterface cli;
    Arguments args{"--roads", "roads.gpkg", "--output", "erven.gpkg"};

    REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
    CHECK(cli.get_run_options().roads_path == "roads.gpkg");
    CHECK(cli.get_run_options().output_path == "erven.gpkg");
    CHECK_FALSE(cli.is_dry_run());
    CHECK_FALSE(cli.is_silent());

    const GeneratorConfig& config = cli.get_config();
    CHECK(config.road_buffer_distance == Approx(10.0));
    CHECK(config.min_area == Approx(250.0));
    CHECK(config.max_area == Approx(2000.0));
    CHECK(config.target_frame == "EPSG:32736");
    CHECK(config.mode == GenerationMode::CADASTRAL);
    CHECK(config.orthogonalize);
}

TEST_CASE("Generation options", "[cli]") {
    CommandLineInterface cli;
    Arguments args{"-r", "roads.shp", "-b", "points.shp", "-o", "out.geojson",
                   "--buffer=7.5", "--min-area", "100", "--max-area", "0",
                   "--target-crs", "EPSG:2048", "--end-cap", "flat",
                   "--no-orthogonalize", "--angle-tolerance", "10", "--max-iterations", "50",
                   "--snap-tolerance", "0.01", "--tessellation-padding", "20",
                   "--block-padding", "30", "--clip-to-blocks"};

    REQUIRE(cli.parse_arguments(args.argc(), args.argv()));

    const GeneratorConfig& config = cli.get_config();
    CHECK(config.road_buffer_distance == Approx(7.5));
    CHECK(config.min_area == Approx(100.0));
    CHECK(config.max_area == Approx(0.0));
    CHECK(config.target_frame == "EPSG:2048");
    CHECK(config.buffer_end_cap == BufferEndCap::FLAT);
    CHECK_FALSE(config.orthogonalize);
    CHECK(config.angle_tolerance == Approx(10.0));
    CHECK(config.max_orthogonalize_iterations == 50);
    CHECK(config.snap_tolerance == Approx(0.01));
    CHECK(config.tessellation_padding_percent == Approx(20.0));
    REQUIRE(config.block_extent_padding.has_value());
    CHECK(*config.block_extent_padding == Approx(30.0));
    CHECK(config.clip_to_blocks);
    CHECK(cli.get_run_options().buildings_path == "points.shp");
}

TEST_CASE("Mode selection", "[cli]") {
    CommandLineInterface cli;

    SECTION("--blocks") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--blocks"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.get_config().mode == GenerationMode::BLOCKS);
    }

    SECTION("--mode is case-insensitive") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--mode", "Blocks"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.get_config().mode == GenerationMode::BLOCKS);
    }

    SECTION("--blocks contradicting --mode") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--mode", "cadastral", "--blocks"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.exit_code() == EXIT_USAGE_ERROR);
    }

    SECTION("unknown mode") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--mode", "parcels"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.exit_code() == EXIT_USAGE_ERROR);
    }
}

TEST_CASE("Usage errors exit with status 2", "[cli]") {
    CommandLineInterface cli;

    SECTION("no roads") {
        Arguments args{"--output", "o.gpkg"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("no output") {
        Arguments args{"--roads", "r.gpkg"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("unsupported output format") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.dat", "--output-format", "dxf"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("output extension without a driver") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.xyz"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("malformed number") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--buffer", "wide"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("unknown end cap") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--end-cap", "square"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("stray argument") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "extra"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("verbose and silent") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--verbose", "--silent"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("log level out of range") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--log-level", "9"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }

    CHECK(cli.exit_code() == EXIT_USAGE_ERROR);
}

TEST_CASE("Informational options exit with status 0", "[cli]") {
    CommandLineInterface cli;

    SECTION("help") {
        Arguments args{"--help"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
    SECTION("version") {
        Arguments args{"--version"};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }

    CHECK(cli.exit_code() == EXIT_OK);
}

TEST_CASE("Logging options", "[cli]") {
    CommandLineInterface cli;

    SECTION("numeric level with facility overrides") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--log-level", "5,ShapeRegularizer=6"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.get_config().log_level == 5);
    }

    SECTION("silent") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--silent"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.is_silent());
        CHECK(cli.get_config().log_level == 1);
    }

    SECTION("verbose") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "-v"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.get_config().log_level == 6);
    }

    SECTION("log file") {
        Arguments args{"--roads", "r.gpkg", "--output", "o.gpkg", "--log-file", "run.log"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        CHECK(cli.get_config().log_file == std::optional<std::string>("run.log"));
    }
}

TEST_CASE("Dry run does not need an output", "[cli]") {
    CommandLineInterface cli;
    Arguments args{"--roads", "r.gpkg", "--dry-run"};

    REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
    CHECK(cli.is_dry_run());
}

TEST_CASE("Configuration files sit below command-line options", "[cli][config]") {
    const auto dir = testing::scratch_dir("cli_config");
    const std::string path = (dir / "township.json").string();
    {
        std::ofstream file(path);
        file << R"({
            "road_buffer_distance": 6.0,
            "mode": "blocks",
            "max_area": 0,
            "roads": "township_roads.shp",
            "output": "township_blocks.gpkg"
        })";
    }

    CommandLineInterface cli;
    Arguments args{"--config", path, "--buffer", "8"};
    REQUIRE(cli.parse_arguments(args.argc(), args.argv()));

    CHECK(cli.get_config().road_buffer_distance == Approx(8.0));
    CHECK(cli.get_config().mode == GenerationMode::BLOCKS);
    CHECK(cli.get_config().max_area == Approx(0.0));
    CHECK(cli.get_run_options().roads_path == "township_roads.shp");
    CHECK(cli.get_run_options().output_path == "township_blocks.gpkg");
}

TEST_CASE("Broken configuration files are usage errors", "[cli][config]") {
    const auto dir = testing::scratch_dir("cli_bad_config");
    CommandLineInterface cli;

    SECTION("missing file") {
        const std::string path = (dir / "missing.json").string();
        Arguments args{"--config", path};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }

    SECTION("unknown mode") {
        const std::string path = (dir / "bad.json").string();
        {
            std::ofstream file(path);
            file << R"({"mode": "parcels", "roads": "r.gpkg", "output": "o.gpkg"})";
        }
        Arguments args{"--config", path};
        CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }

    CHECK(cli.exit_code() == EXIT_USAGE_ERROR);
}

TEST_CASE("--create-config writes a loadable default file", "[cli][config]") {
    const auto dir = testing::scratch_dir("cli_create_config");
    const std::string path = (dir / "default.json").string();

    CommandLineInterface cli;
    Arguments args{"--create-config", path};
    CHECK_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    CHECK(cli.exit_code() == EXIT_OK);

    ConfigurationManager manager;
    REQUIRE(manager.load_from_file(path));
    GeneratorConfig loaded = manager.to_generator_config();
    CHECK(loaded.road_buffer_distance == Approx(GeneratorConfig().road_buffer_distance));
    CHECK(loaded.target_frame == GeneratorConfig().target_frame);
}

// ============================================================================
// ConsoleProgressSink
// ============================================================================

TEST_CASE("Console progress sink", "[cli][progress]") {
    SECTION("starts uncancelled and records progress") {
        ConsoleProgressSink sink;
        CHECK_FALSE(sink.is_cancelled());
        sink.report(45, "Subtract");
        CHECK(sink.last_percent() == 45);
    }

    SECTION("SIGINT requests cancellation") {
        ConsoleProgressSink sink;
        std::raise(SIGINT);
        CHECK(sink.is_cancelled());
    }

    SECTION("explicit cancellation") {
        {
            ConsoleProgressSink sink;
            sink.request_cancel();
            CHECK(sink.is_cancelled());
        }

        // A new sink starts a new run
        ConsoleProgressSink fresh;
        CHECK_FALSE(fresh.is_cancelled());
    }
}
