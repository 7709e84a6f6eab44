#include <catch2/catch_test_macros.hpp>

#include "pricesched/core/utils.hpp"

using namespace pricesched;

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(utils::trim("  12:00  ") == "12:00");
    CHECK(utils::trim("\t\n06:00\r\n") == "06:00");
    CHECK(utils::trim("   ") == "");
}

TEST_CASE("split keeps empty interior fields", "[utils]") {
    auto parts = utils::split("06:00,,18:00", ',');
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == "06:00");
    CHECK(parts[1] == "");
    CHECK(parts[2] == "18:00");
}

TEST_CASE("glob_match", "[utils]") {
    SECTION("literal") {
        CHECK(utils::glob_match("PriceMonitor_0600", "PriceMonitor_0600"));
        CHECK_FALSE(utils::glob_match("PriceMonitor_0600", "PriceMonitor_0601"));
    }

    SECTION("star") {
        CHECK(utils::glob_match("PriceMonitor_*", "PriceMonitor_0600"));
        CHECK(utils::glob_match("PriceMonitor_*", "PriceMonitor_"));
        CHECK(utils::glob_match("*", ""));
        CHECK(utils::glob_match("*_06*", "PriceMonitor_0600"));
        CHECK_FALSE(utils::glob_match("PriceMonitor_*", "OtherJob_0600"));
    }

    SECTION("question mark") {
        CHECK(utils::glob_match("PriceMonitor_????", "PriceMonitor_1800"));
        CHECK_FALSE(utils::glob_match("PriceMonitor_????", "PriceMonitor_180"));
        CHECK_FALSE(utils::glob_match("PriceMonitor_????", "PriceMonitor_18000"));
    }
}

TEST_CASE("shell_quote", "[utils]") {
    CHECK(utils::shell_quote("systemctl") == "'systemctl'");
    CHECK(utils::shell_quote("it's") == "'it'\\''s'");
    CHECK(utils::shell_quote("") == "''");
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(utils::to_lower("DEBUG") == "debug");
    CHECK(utils::to_lower("Info") == "info");
}
