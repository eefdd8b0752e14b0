/**
 * @file test_util.cpp
 * @brief Unit tests for command-line value parsing and name helpers
 */

#include <catch2/catch_test_macros.hpp>

#include "util.hpp"

using namespace goesrx;

TEST_CASE("Spacecraft ids are bounded to one byte", "[util]") {
    uint8_t id = 7;
    REQUIRE(parse_scid("0", id));
    CHECK(id == 0);
    REQUIRE(parse_scid("19", id));
    CHECK(id == 19);
    REQUIRE(parse_scid("255", id));
    CHECK(id == 255);

    SECTION("out of range values do not wrap") {
        id = 7;
        CHECK_FALSE(parse_scid("256", id));
        CHECK_FALSE(parse_scid("275", id));
        CHECK_FALSE(parse_scid("1000", id));
        CHECK_FALSE(parse_scid("-1", id));
        CHECK(id == 7);
    }

    SECTION("not a number") {
        CHECK_FALSE(parse_scid("", id));
        CHECK_FALSE(parse_scid("0x13", id));
        CHECK_FALSE(parse_scid("12a", id));
        CHECK_FALSE(parse_scid(" 12", id));
    }
}

TEST_CASE("Host and port", "[util]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_host_port("127.0.0.1:5004", host, port));
    CHECK(host == "127.0.0.1");
    CHECK(port == 5004);
    CHECK_FALSE(parse_host_port("localhost", host, port));
    CHECK_FALSE(parse_host_port("localhost:70000", host, port));
    CHECK_FALSE(parse_host_port("localhost:abc", host, port));
}

TEST_CASE("Name components are sanitized", "[util]") {
    CHECK(sanitize_component("GOES-16 FD/ch13") == "GOES-16_FD_ch13");
    CHECK(sanitize_component("a.b_c-d") == "a.b_c-d");
    CHECK(trim("  x y \t") == "x y");
}
