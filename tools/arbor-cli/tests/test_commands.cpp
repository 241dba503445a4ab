#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "commands.hpp"

using namespace arbor::cli;
using Catch::Matchers::WithinAbs;

TEST_CASE("parse_int", "[cli]") {
    int value = -1;

    SECTION("Whole numbers") {
        REQUIRE(parse_int("3", value));
        REQUIRE(value == 3);
        REQUIRE(parse_int("-12", value));
        REQUIRE(value == -12);
    }

    SECTION("Trailing text and empty input are rejected") {
        REQUIRE_FALSE(parse_int("", value));
        REQUIRE_FALSE(parse_int("2x", value));
        REQUIRE_FALSE(parse_int("1.5", value));
        REQUIRE(value == -1);
    }

    SECTION("Values outside the int range are rejected") {
        REQUIRE_FALSE(parse_int("4294967296", value));
        REQUIRE_FALSE(parse_int("-4294967297", value));
        REQUIRE_FALSE(parse_int("99999999999999999999999", value));
        REQUIRE(value == -1);
    }

    SECTION("int limits are accepted") {
        REQUIRE(parse_int("2147483647", value));
        REQUIRE(value == 2147483647);
    }
}

TEST_CASE("parse_double", "[cli]") {
    double value = -1.0;

    REQUIRE(parse_double("0.25", value));
    REQUIRE_THAT(value, WithinAbs(0.25, 1e-12));

    REQUIRE_FALSE(parse_double("", value));
    REQUIRE_FALSE(parse_double("abc", value));
    REQUIRE_FALSE(parse_double("inf", value));
    REQUIRE_FALSE(parse_double("nan", value));
    REQUIRE_THAT(value, WithinAbs(0.25, 1e-12));
}

TEST_CASE("offline command rejects out of range input", "[cli]") {
    OfflineOptions options;
    options.species_id = "white-oak";
    options.seconds = 60.0;

    SECTION("Stage above old growth") {
        options.stage = 5;
        REQUIRE(cmd_offline(options) == Result::InvalidArgs);
    }

    SECTION("Progress of one") {
        options.progress = 1.0;
        REQUIRE(cmd_offline(options) == Result::InvalidArgs);
    }

    SECTION("Unknown species") {
        options.species_id = "no-such-tree";
        REQUIRE(cmd_offline(options) == Result::InvalidArgs);
    }

    SECTION("Valid input") {
        REQUIRE(cmd_offline(options) == Result::Success);
    }
}
