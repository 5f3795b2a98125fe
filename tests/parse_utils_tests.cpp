#include "test_common.hpp"
#include <cstdint>
#include "parse_utils.hpp"

TEST_CASE("parse_bytes handles unit suffixes") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("10B", 0, SIZE_MAX, ok) == 10);
    REQUIRE(parse_bytes("1k", 0, SIZE_MAX, ok) == 1024);
    REQUIRE(parse_bytes("2KB", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(parse_bytes("1M", 0, SIZE_MAX, ok) == 1024 * 1024);
    REQUIRE(parse_bytes("1gb", 0, SIZE_MAX, ok) == 1024ull * 1024 * 1024);
    REQUIRE(ok);
}

TEST_CASE("parse_bytes rejects bad input") {
    bool ok = true;
    REQUIRE(parse_bytes("", 0, SIZE_MAX, ok) == 0);
    REQUIRE_FALSE(ok);
    parse_bytes("abc", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("-5", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("5x", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("0", 1, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("99999999999999999999999", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepts common spellings") {
    bool ok = false;
    REQUIRE(parse_bool("true", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("YES", ok));
    REQUIRE(parse_bool("", ok));
    REQUIRE_FALSE(parse_bool("off", ok));
    REQUIRE(ok);
    REQUIRE_FALSE(parse_bool("0", ok));
    REQUIRE_FALSE(parse_bool("maybe", ok));
    REQUIRE_FALSE(ok);
}
