#include <catch2/catch_test_macros.hpp>
#include <cjb/version.h>

#include <string>

TEST_CASE("Linked library matches the headers", "[version]") {
    auto v = cjb::header_version();
    std::string expected = std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
    REQUIRE(cjb::library_version() == expected);
}

TEST_CASE("cJSON is new enough for the binding", "[version]") {
    auto v = cjb::header_version();
    REQUIRE(v.major == 1);
    REQUIRE((v.minor > 7 or (v.minor == 7 and v.patch >= 15)));
}

TEST_CASE("Nesting limit is exposed", "[version][limits]") {
    REQUIRE(cjb::nesting_limit() >= 1000);
}
