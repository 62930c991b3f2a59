// SPDX-License-Identifier: MIT
/**
 * @file test_returns.cpp
 * @brief Unit tests for bottleneck, turnover and XIRR
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "valuation/returns.hpp"
#include <cmath>
#include <stdexcept>

using namespace holding;
using namespace holding::valuation;
using Catch::Matchers::WithinAbs;

TEST_CASE("Bottleneck is the peak capital at risk", "[Returns]") {
    std::vector<ledger::LedgerEntry> entries = {
        {"2021-01-01", -100.0, 100.0},
        {"2021-01-02", -50.0, 50.0},
        {"2021-01-03", 30.0, -30.0}};
    REQUIRE(bottleneck(entries) == Catch::Approx(150.0));

    SECTION("Money returned before reinvesting lowers the peak") {
        std::vector<ledger::LedgerEntry> recycled = {
            {"2021-01-01", -100.0, 100.0},
            {"2021-01-02", 80.0, -80.0},
            {"2021-01-03", -60.0, 60.0}};
        REQUIRE(bottleneck(recycled) == Catch::Approx(100.0));
    }

    SECTION("Empty ledger") {
        REQUIRE(bottleneck({}) == 0.0);
    }
}

TEST_CASE("Turnover rate annualizes traded volume", "[Returns]") {
    std::vector<ledger::LedgerEntry> entries = {
        {"2021-01-01", -1000.0, 1000.0},
        {"2021-01-05", 1000.0, -1000.0}};

    REQUIRE(turnover_rate(entries, "2021-01-05") == Catch::Approx(2000.0 / 1000.0 / 2.0 * 365.0 / 4.0));

    SECTION("Degenerate windows are zero") {
        REQUIRE(turnover_rate({}, "2021-01-05") == 0.0);
        REQUIRE(turnover_rate(entries, "2021-01-01") == 0.0);
    }
}

TEST_CASE("Cash flows mirror ledger cash", "[Returns]") {
    std::vector<ledger::LedgerEntry> entries = {
        {"2021-01-01", -1000.0, 1000.0},
        {"2021-01-10", 0.0, 50.0}};
    auto flows = cashflows(entries);
    REQUIRE(flows.size() == 2);
    REQUIRE(flows[0].date == "2021-01-01");
    REQUIRE(flows[0].amount == -1000.0);
    REQUIRE(flows[1].amount == 0.0);
}

TEST_CASE("XIRR", "[Returns]") {
    SECTION("Single period over a leap year") {
        std::vector<CashFlow> flows = {{"2020-01-01", -1000.0}, {"2021-01-01", 1100.0}};
        double expected = std::pow(1.1, 365.0 / 366.0) - 1.0;
        REQUIRE_THAT(xirr(flows), WithinAbs(expected, 1e-6));
        REQUIRE_THAT(xnpv(flows, expected), WithinAbs(0.0, 1e-4));
    }

    SECTION("Order of flows does not matter") {
        std::vector<CashFlow> flows = {{"2022-01-01", 1210.0}, {"2021-01-01", -1000.0}};
        REQUIRE_THAT(xirr(flows), WithinAbs(std::pow(1.21, 365.0 / 365.0) - 1.0, 1e-6));
    }

    SECTION("Losses give a negative rate") {
        std::vector<CashFlow> flows = {{"2021-01-01", -1000.0}, {"2022-01-01", 800.0}};
        REQUIRE_THAT(xirr(flows), WithinAbs(-0.2, 1e-6));
    }

    SECTION("Several contributions") {
        std::vector<CashFlow> flows = {
            {"2021-01-01", -1000.0}, {"2021-07-01", -1000.0}, {"2022-01-01", 2150.0}};
        double r = xirr(flows, 0.05);
        REQUIRE(r > 0.0);
        REQUIRE_THAT(xnpv(flows, r), WithinAbs(0.0, 1e-4));
    }

    SECTION("Large short-horizon return solved from a poor guess") {
        std::vector<CashFlow> flows = {{"2021-01-01", -1000.0}, {"2021-01-31", 1100.0}};
        double r = xirr(flows, -0.5);
        REQUIRE_THAT(xnpv(flows, r), WithinAbs(0.0, 1e-3));
    }

    SECTION("Empty flows are zero, one-signed flows throw") {
        REQUIRE(xirr({}) == 0.0);
        REQUIRE_THROWS_AS(xirr({{"2021-01-01", -1000.0}, {"2021-06-01", -10.0}}), std::runtime_error);
    }
}
