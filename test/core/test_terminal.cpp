#include <catch2/catch_test_macros.hpp>

#include <slack_mcp/core/clock.hpp>
#include <slack_mcp/core/terminal.hpp>

#include <cstdlib>
#include <string>

using namespace slack_mcp;

// ===========================================================================
// Terminal detection
// ===========================================================================

TEST_CASE("NoColorEnvSet: follows NO_COLOR", "[core][terminal]") {
    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    CHECK_FALSE(ShouldColorLogs());

    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
    CHECK(ShouldColorLogs() == IsStderrTty());
}

TEST_CASE("IsStdinTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStdinTty();
    CHECK((result == true || result == false));
}

// ===========================================================================
// Clock
// ===========================================================================

TEST_CASE("Iso8601Now: UTC with milliseconds", "[core][clock]") {
    auto ts = Iso8601Now();
    // 2024-05-01T12:34:56.789Z
    REQUIRE(ts.size() == 24);
    CHECK(ts[4] == '-');
    CHECK(ts[10] == 'T');
    CHECK(ts[19] == '.');
    CHECK(ts.back() == 'Z');
}

TEST_CASE("HhMmSsNow: short wall-clock time", "[core][clock]") {
    auto ts = HhMmSsNow();
    REQUIRE(ts.size() == 8);
    CHECK(ts[2] == ':');
    CHECK(ts[5] == ':');
}
