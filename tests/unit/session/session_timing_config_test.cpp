// =============================================================================
// SessionTimingConfig Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "SessionTimingConfig.h"
#include "test_helpers/temp_directory.h"

#include <fstream>

using namespace bhvd;

TEST_CASE("SessionTimingConfig reads thresholds", "[session][config]") {
    const auto config = SessionTimingConfig::fromJson(ofJson{
        {"totalDurationSeconds", 600},
        {"entryEndSeconds", 60},
        {"immersionEndSeconds", 540},
    });
    const auto effective = config.effectiveConfig();
    CHECK(effective.totalDurationSeconds == 600);
    CHECK(effective.entryEndSeconds == 60);
    CHECK(effective.immersionEndSeconds == 540);
    CHECK_FALSE(config.testModeEnabled());
}

TEST_CASE("SessionTimingConfig falls back to defaults", "[session][config]") {
    const SessionConfig defaults;

    SECTION("out of order thresholds") {
        const auto config = SessionTimingConfig::fromJson(ofJson{
            {"totalDurationSeconds", 600},
            {"entryEndSeconds", 700},
            {"immersionEndSeconds", 540},
        });
        CHECK(config.effectiveConfig().totalDurationSeconds == defaults.totalDurationSeconds);
        CHECK(config.effectiveConfig().entryEndSeconds == defaults.entryEndSeconds);
    }

    SECTION("not an object") {
        const auto config = SessionTimingConfig::fromJson(ofJson::array());
        CHECK(config.effectiveConfig().immersionEndSeconds == defaults.immersionEndSeconds);
    }

    SECTION("missing file") {
        test::TempDirectory dir("timing_missing");
        const auto config = SessionTimingConfig::load(dir / "nope.json");
        CHECK(config.effectiveConfig().totalDurationSeconds == defaults.totalDurationSeconds);
    }

    SECTION("unparsable file") {
        test::TempDirectory dir("timing_broken");
        const auto path = dir / "session_timing.json";
        std::ofstream(path) << "{ totalDurationSeconds: ";
        const auto config = SessionTimingConfig::load(path);
        CHECK(config.effectiveConfig().totalDurationSeconds == defaults.totalDurationSeconds);
    }
}

TEST_CASE("SessionTimingConfig test mode scales every threshold", "[session][config]") {
    const ofJson json{
        {"totalDurationSeconds", 1200},
        {"entryEndSeconds", 120},
        {"immersionEndSeconds", 1080},
        {"testMode", {{"enabled", true}, {"scaleFactor", 0.05}}},
    };
    const auto config = SessionTimingConfig::fromJson(json);
    REQUIRE(config.testModeEnabled());

    const auto effective = config.effectiveConfig();
    CHECK(effective.totalDurationSeconds == 60);
    CHECK(effective.entryEndSeconds == 6);
    CHECK(effective.immersionEndSeconds == 54);
    CHECK(config.baseConfig().totalDurationSeconds == 1200);

    SECTION("a scale that collapses the ordering is ignored") {
        auto tiny = json;
        tiny["testMode"]["scaleFactor"] = 0.001;
        const auto collapsed = SessionTimingConfig::fromJson(tiny).effectiveConfig();
        CHECK(collapsed.totalDurationSeconds == 1200);
    }
}

TEST_CASE("SessionTimingConfig loads from disk", "[session][config]") {
    test::TempDirectory dir("timing_load");
    const auto path = dir / "session_timing.json";
    std::ofstream(path) << R"({"totalDurationSeconds": 900, "entryEndSeconds": 90, "immersionEndSeconds": 810})";

    const auto config = SessionTimingConfig::load(path);
    CHECK(config.effectiveConfig().totalDurationSeconds == 900);
    CHECK(config.effectiveConfig().immersionEndSeconds == 810);
}
