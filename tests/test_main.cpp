// Catch2WithMain provides main(); shared fixtures live under tests/utils.

#include <catch2/catch_test_macros.hpp>

#include "tether/Version.hpp"

#include <string>

TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}

TEST_CASE("Version string is populated", "[smoke]") {
    REQUIRE(std::string(TETHER_VERSION_STRING).size() > 0);
}
