#include <catch2/catch.hpp>

#include "core/Logger.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <sstream>

using namespace cadgen;

namespace {

// Puts the registry back the way test_main left it
struct LoggerRegistryGuard {
    LogLevel saved = Logger::getDefaultLevel();
    ~LoggerRegistryGuard() {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(saved);
        Logger::setGlobalLogFile(std::nullopt);
        Logger::setConsoleEnabled(true);
    }
};

std::string read_all(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("Log configuration strings", "[logger]") {
    LoggerRegistryGuard guard;

    SECTION("plain default level") {
        CHECK(Logger::parseLogConfig("5"));
        CHECK(Logger::getDefaultLevel() == LogLevel::DEBUG);
    }

    SECTION("facility levels mixed with a default") {
        CHECK(Logger::parseLogConfig("4, ShapeRegularizer=6,AreaFilter=2"));
        CHECK(Logger::getDefaultLevel() == LogLevel::DETAILED);
        CHECK(Logger::getFacilityLevel("ShapeRegularizer") == LogLevel::TRACE);
        CHECK(Logger::getFacilityLevel("AreaFilter") == LogLevel::WARNING);
        CHECK(Logger::getFacilityLevel("ParcelTessellator") == LogLevel::DETAILED);
    }

    SECTION("default= form") {
        CHECK(Logger::parseLogConfig("default=1"));
        CHECK(Logger::getDefaultLevel() == LogLevel::ERROR);
    }

    SECTION("out of range levels are clamped") {
        CHECK(Logger::parseLogConfig("9"));
        CHECK(Logger::getDefaultLevel() == LogLevel::TRACE);
    }

    SECTION("bad tokens are reported but good ones still apply") {
        CHECK_FALSE(Logger::parseLogConfig("loud,GeometrySubtractor=5"));
        CHECK(Logger::getFacilityLevel("GeometrySubtractor") == LogLevel::DEBUG);
        CHECK_FALSE(Logger::parseLogConfig("AreaFilter=3x"));
        CHECK(Logger::getFacilityLevel("AreaFilter") == Logger::getDefaultLevel());
    }

    SECTION("empty string is a no-op") {
        const LogLevel before = Logger::getDefaultLevel();
        CHECK(Logger::parseLogConfig(""));
        CHECK(Logger::getDefaultLevel() == before);
    }
}

TEST_CASE("Effective level resolution", "[logger]") {
    LoggerRegistryGuard guard;
    Logger::setDefaultLevel(LogLevel::INFO);

    Logger unnamed;
    CHECK(unnamed.getEffectiveLevel() == LogLevel::INFO);

    Logger component("BlockExtentCarver");
    component.setLogLevel(LogLevel::DEBUG);
    CHECK(component.getEffectiveLevel() == LogLevel::DEBUG);
    CHECK(component.shouldOutput(LogLevel::DEBUG));
    CHECK_FALSE(component.shouldOutput(LogLevel::TRACE));

    // A facility level beats the instance level
    Logger::setFacilityLevel("BlockExtentCarver", LogLevel::ERROR);
    CHECK(component.getEffectiveLevel() == LogLevel::ERROR);
    CHECK_FALSE(component.shouldOutput(LogLevel::WARNING));
}

TEST_CASE("Global log file receives filtered output", "[logger]") {
    LoggerRegistryGuard guard;
    const auto dir = testing::scratch_dir("logger_file");
    const std::string path = (dir / "nested" / "cadgen.log").string();

    Logger::setConsoleEnabled(false);
    REQUIRE(Logger::setGlobalLogFile(path));
    Logger::setDefaultLevel(LogLevel::INFO);

    {
        Logger logger("RoadReserveBuilder");
        logger.info("reserve ready");
        logger.debug("not at this level");
        logger.warning("same");
        logger.warning("same");
        logger.warning("same");
        logger.flush();
    }
    Logger::setGlobalLogFile(std::nullopt);

    const std::string content = read_all(path);
    CHECK(content.find("INFO [RoadReserveBuilder] reserve ready") != std::string::npos);
    CHECK(content.find("not at this level") == std::string::npos);
    CHECK(content.find("WARN [RoadReserveBuilder] same") != std::string::npos);
    CHECK(content.find("occurred 3 times") != std::string::npos);
}
