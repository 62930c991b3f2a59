// SPDX-License-Identifier: MIT
/**
 * @file test_date_utils.cpp
 * @brief Unit tests for calendar arithmetic on YYYY-MM-DD strings
 */

#include <catch2/catch_test_macros.hpp>
#include "data/date_utils.hpp"
#include <stdexcept>

using namespace holding;

TEST_CASE("Date validation", "[Dates]") {
    REQUIRE(dates::is_valid_date("2021-01-04"));
    REQUIRE(dates::is_valid_date("2020-02-29"));
    REQUIRE_FALSE(dates::is_valid_date("2021-02-29"));
    REQUIRE_FALSE(dates::is_valid_date("2021-13-01"));
    REQUIRE_FALSE(dates::is_valid_date("2021-1-4"));
    REQUIRE_FALSE(dates::is_valid_date("20210104"));
    REQUIRE_FALSE(dates::is_valid_date(""));
}

TEST_CASE("Date arithmetic", "[Dates]") {
    SECTION("Adding days crosses month and year boundaries") {
        REQUIRE(dates::add_days("2021-01-31", 1) == "2021-02-01");
        REQUIRE(dates::add_days("2020-02-28", 1) == "2020-02-29");
        REQUIRE(dates::add_days("2021-12-31", 1) == "2022-01-01");
        REQUIRE(dates::add_days("2021-03-01", -1) == "2021-02-28");
    }

    SECTION("Days between is signed") {
        REQUIRE(dates::days_between("2021-01-01", "2021-01-05") == 4);
        REQUIRE(dates::days_between("2021-01-05", "2021-01-01") == -4);
        REQUIRE(dates::days_between("2020-01-01", "2021-01-01") == 366);
    }

    SECTION("Epoch round trip") {
        long long d = dates::days_since_epoch("2021-06-15");
        REQUIRE(dates::from_days_since_epoch(d) == "2021-06-15");
        REQUIRE(dates::days_since_epoch("1970-01-01") == 0);
    }

    SECTION("Components and weekday") {
        REQUIRE(dates::extract_year("2021-06-15") == 2021);
        REQUIRE(dates::extract_month("2021-06-15") == 6);
        REQUIRE(dates::extract_day("2021-06-15") == 15);
        REQUIRE(dates::day_of_week("2021-01-04") == 0); // Monday
        REQUIRE(dates::day_of_week("2021-01-10") == 6); // Sunday
    }

    SECTION("Malformed input throws") {
        REQUIRE_THROWS_AS(dates::days_since_epoch("2021-02-30"), std::invalid_argument);
        REQUIRE_THROWS_AS(dates::add_days("not-a-date", 1), std::invalid_argument);
    }
}

TEST_CASE("Yesterday is a valid date before today", "[Dates]") {
    std::string y = dates::yesterday();
    REQUIRE(dates::is_valid_date(y));
    REQUIRE(y > "2020-01-01");
}
