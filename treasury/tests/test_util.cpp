#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"

TEST_CASE("Query parameter parsing", "[util]") {
    SECTION("Whole numbers in range") {
        REQUIRE(util::parse_positive_int("1", 3660) == 1);
        REQUIRE(util::parse_positive_int("30", 3660) == 30);
        REQUIRE(util::parse_positive_int("3660", 3660) == 3660);
    }
    
    SECTION("Out of range is refused, not thrown") {
        REQUIRE_FALSE(util::parse_positive_int("0", 3660));
        REQUIRE_FALSE(util::parse_positive_int("3661", 3660));
        REQUIRE_FALSE(util::parse_positive_int("99999999999999999999", 3660));
    }
    
    SECTION("Anything but digits is refused") {
        REQUIRE_FALSE(util::parse_positive_int("", 3660));
        REQUIRE_FALSE(util::parse_positive_int("-5", 3660));
        REQUIRE_FALSE(util::parse_positive_int("7d", 3660));
        REQUIRE_FALSE(util::parse_positive_int(" 7", 3660));
        REQUIRE_FALSE(util::parse_positive_int("1e3", 3660));
    }
}

TEST_CASE("Date helpers", "[util]") {
    SECTION("ISO date truncation") {
        REQUIRE(util::iso_date("2024-03-01") == "2024-03-01");
        REQUIRE(util::iso_date("2024-03-01T10:15:00Z") == "2024-03-01");
        REQUIRE_FALSE(util::iso_date("03/01/2024"));
        REQUIRE_FALSE(util::iso_date("2024-13-01"));
    }
    
    SECTION("Day arithmetic crosses month ends") {
        REQUIRE(util::add_days("2024-03-01", -1) == "2024-02-29");
        REQUIRE(util::add_days("2024-12-31", 1) == "2025-01-01");
    }
}
