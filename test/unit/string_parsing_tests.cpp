// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace courier::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
}

TEST_CASE("SafeParseSize - counts", "[util][string_parsing]") {
    REQUIRE(SafeParseSize("0", 256) == size_t{0});
    REQUIRE(SafeParseSize("8", 256) == size_t{8});
    REQUIRE(SafeParseSize("256", 256) == size_t{256});

    REQUIRE_FALSE(SafeParseSize("257", 256).has_value());
    REQUIRE_FALSE(SafeParseSize("-1", 256).has_value());
    REQUIRE_FALSE(SafeParseSize("+4", 256).has_value());
    REQUIRE_FALSE(SafeParseSize("4 ", 256).has_value());
    REQUIRE_FALSE(SafeParseSize("", 256).has_value());
}

TEST_CASE("IsValidLogLevel - spdlog level names", "[util][string_parsing]") {
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        REQUIRE(IsValidLogLevel(level));
    }
    REQUIRE_FALSE(IsValidLogLevel("warning"));
    REQUIRE_FALSE(IsValidLogLevel("INFO"));
    REQUIRE_FALSE(IsValidLogLevel(""));
}

TEST_CASE("SplitList - comma separated options", "[util][string_parsing]") {
    SECTION("Plain list") {
        auto items = SplitList("pipeline,publish");
        REQUIRE(items == std::vector<std::string>{"pipeline", "publish"});
    }

    SECTION("Empty items are dropped") {
        auto items = SplitList(",a,,b,");
        REQUIRE(items == std::vector<std::string>{"a", "b"});
    }

    SECTION("Single item and empty input") {
        REQUIRE(SplitList("all") == std::vector<std::string>{"all"});
        REQUIRE(SplitList("").empty());
    }

    SECTION("Custom separator") {
        REQUIRE(SplitList("a;b", ';') == std::vector<std::string>{"a", "b"});
    }
}
