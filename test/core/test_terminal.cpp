#include <catch2/catch_test_macros.hpp>

#include <azlist/core/terminal.hpp>

#include <cstdlib>

using namespace azlist;

// ===========================================================================
// ShouldUseColor
// ===========================================================================

TEST_CASE("ShouldUseColor: Never disables color", "[core][terminal]") {
    CHECK_FALSE(ShouldUseColor(ColorMode::Never, 2));
}

TEST_CASE("ShouldUseColor: Always enables color unless NO_COLOR is set", "[core][terminal]") {
    unsetenv("NO_COLOR");
    CHECK(ShouldUseColor(ColorMode::Always, 2));

    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    CHECK_FALSE(ShouldUseColor(ColorMode::Always, 2));
    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}

TEST_CASE("ShouldUseColor: Auto follows terminal detection", "[core][terminal]") {
    unsetenv("NO_COLOR");
    // An invalid descriptor is never a terminal.
    CHECK_FALSE(IsTerminal(-1));
    CHECK_FALSE(ShouldUseColor(ColorMode::Auto, -1));
}
