#include <catch2/catch_test_macros.hpp>

#include "call_bridge/utils/text.hpp"

#include <string>

TEST_CASE("trim removes surrounding whitespace") {
    REQUIRE(call_bridge::utils::trim("  hello\t\n") == "hello");
    REQUIRE(call_bridge::utils::trim("   ").empty());
}

TEST_CASE("normalize_phone_number strips whitespace and keeps the plus sign") {
    const auto number = call_bridge::utils::normalize_phone_number(" +31 20 123 4567 ");
    REQUIRE(number.has_value());
    REQUIRE(*number == "+31201234567");
}

TEST_CASE("normalize_phone_number rejects malformed numbers") {
    REQUIRE_FALSE(call_bridge::utils::normalize_phone_number("").has_value());
    REQUIRE_FALSE(call_bridge::utils::normalize_phone_number("12345").has_value());
    REQUIRE_FALSE(call_bridge::utils::normalize_phone_number("1234567890123456").has_value());
    REQUIRE_FALSE(call_bridge::utils::normalize_phone_number("+31-20-1234567").has_value());
    REQUIRE_FALSE(call_bridge::utils::normalize_phone_number("31+201234567").has_value());
    REQUIRE_FALSE(call_bridge::utils::normalize_phone_number("+").has_value());
}

TEST_CASE("is_iso_date accepts only YYYY-MM-DD") {
    REQUIRE(call_bridge::utils::is_iso_date("2024-05-01"));
    REQUIRE_FALSE(call_bridge::utils::is_iso_date("2024-5-1"));
    REQUIRE_FALSE(call_bridge::utils::is_iso_date("2024-13-01"));
    REQUIRE_FALSE(call_bridge::utils::is_iso_date("01-05-2024"));
}
