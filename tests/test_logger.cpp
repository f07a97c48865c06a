/**
 * @file test_logger.cpp
 * @brief Tests for facility-based log configuration
 */

#include <catch2/catch.hpp>
#include "core/Logger.hpp"

using namespace brew;

namespace {

// Restores the runner's quiet default when a test finishes
struct LevelGuard {
    LevelGuard() { Logger::resetLevels(); }
    ~LevelGuard() {
        Logger::resetLevels();
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
};

} // namespace

TEST_CASE("Plain number sets the default level", "[logger]") {
    LevelGuard guard;
    Logger::parseLogConfig("5");
    CHECK(Logger::getFacilityLevel("Anything") == LogLevel::DEBUG);
}

TEST_CASE("Facility entries override the default", "[logger]") {
    LevelGuard guard;
    Logger::parseLogConfig("2, FeatureLayer=6 ,Controller=3");

    CHECK(Logger::getFacilityLevel("FeatureLayer") == LogLevel::TRACE);
    CHECK(Logger::getFacilityLevel("Controller") == LogLevel::INFO);
    CHECK(Logger::getFacilityLevel("MapView") == LogLevel::WARNING);

    Logger layerLog("FeatureLayer");
    Logger viewLog("MapView");
    CHECK(layerLog.shouldOutput(LogLevel::TRACE));
    CHECK_FALSE(viewLog.shouldOutput(LogLevel::INFO));
}

TEST_CASE("Explicit default entry and clamping", "[logger]") {
    LevelGuard guard;
    Logger::parseLogConfig("default=9,PortalItem=0");
    CHECK(Logger::getFacilityLevel("Other") == LogLevel::TRACE);
    CHECK(Logger::getFacilityLevel("PortalItem") == LogLevel::ERROR);
}

TEST_CASE("Invalid entries are skipped", "[logger]") {
    LevelGuard guard;
    Logger::parseLogConfig("loud,MapView=verbose,Projection=4");
    CHECK(Logger::getFacilityLevel("Other") == LogLevel::INFO);
    CHECK(Logger::getFacilityLevel("MapView") == LogLevel::INFO);
    CHECK(Logger::getFacilityLevel("Projection") == LogLevel::DETAILED);
}

TEST_CASE("Empty configuration leaves levels alone", "[logger]") {
    LevelGuard guard;
    Logger::setFacilityLevel("Controller", LogLevel::DEBUG);
    Logger::parseLogConfig("");
    CHECK(Logger::getFacilityLevel("Controller") == LogLevel::DEBUG);
}
