#include <catch2/catch_test_macros.hpp>

#include <synthetic_mcp/core/terminal.hpp>

#include <cstdlib>
#include <string>

using namespace synthetic_mcp;

// ===========================================================================
// Terminal detection
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    const char* saved = std::getenv("NO_COLOR");
    const std::string previous = saved ? saved : "";

    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());

    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());

    if (saved != nullptr) {
        setenv("NO_COLOR", previous.c_str(), 1);
    }
}
