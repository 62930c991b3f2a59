// SPDX-License-Identifier: MIT
/**
 * @file test_fund_instrument.cpp
 * @brief Unit tests for PriceTable, FundInstrument quotes and corporate actions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "test_helpers.hpp"
#include "ledger/ledger_errors.hpp"
#include <cmath>
#include <limits>

using namespace holding;
using namespace holding::instrument;
using holding::testing::flat_prices;
using holding::testing::make_fund;
using holding::testing::make_prices;

TEST_CASE("PriceTable construction and lookups", "[PriceTable]") {
    std::vector<std::string> dates = {"2021-01-04", "2021-01-05", "2021-01-08"};
    Eigen::VectorXd nav(3);
    nav << 1.00, 1.02, 1.05;
    PriceTable prices(dates, nav, {{"2021-01-05", 0.01}});

    REQUIRE(prices.num_dates() == 3);
    REQUIRE(prices.value_at("2021-01-06") == Catch::Approx(1.02));
    REQUIRE(prices.value_at("2021-01-30") == Catch::Approx(1.05));
    REQUIRE_THROWS_AS(prices.value_at("2021-01-01"), std::out_of_range);
    REQUIRE_FALSE(prices.exact_value("2021-01-06").has_value());
    REQUIRE(*prices.first_on_or_after("2021-01-06") == 2);
    REQUIRE(*prices.last_on_or_before("2021-01-06") == 1);
    REQUIRE(prices.action_at("2021-01-05").has_value());
    REQUIRE(prices.dates_between("2021-01-05", "2021-01-31").size() == 2);
    REQUIRE(prices.filter_by_date("2021-01-05", "2021-01-05").num_dates() == 1);

    SECTION("Invalid tables rejected") {
        Eigen::VectorXd bad(3);
        bad << 1.0, -1.0, 1.0;
        REQUIRE_THROWS_AS(PriceTable(dates, bad), std::invalid_argument);

        std::vector<std::string> unordered = {"2021-01-05", "2021-01-04", "2021-01-08"};
        REQUIRE_THROWS_AS(PriceTable(unordered, nav), std::invalid_argument);

        Eigen::VectorXd short_nav(2);
        short_nav << 1.0, 1.0;
        REQUIRE_THROWS_AS(PriceTable(dates, short_nav), std::invalid_argument);
    }
}

TEST_CASE("Corporate action decoding", "[CorporateAction]") {
    auto split = CorporateAction::decode("2021-01-05", -2.0);
    REQUIRE(split.type == CorporateActionType::SPLIT);
    REQUIRE(split.value == Catch::Approx(2.0));

    auto dividend = CorporateAction::decode("2021-01-05", 0.05, true);
    REQUIRE(dividend.type == CorporateActionType::DIVIDEND);
    REQUIRE(dividend.value == Catch::Approx(0.05));
    REQUIRE(dividend.reinvest);

    REQUIRE_THROWS_AS(CorporateAction::decode("2021-01-05", 0.0), ledger::UnrecognizedCorporateAction);
    REQUIRE_THROWS_AS(CorporateAction::decode("2021-01-05", std::numeric_limits<double>::quiet_NaN()),
                      ledger::UnrecognizedCorporateAction);
}

TEST_CASE("FundInstrument purchase quotes", "[FundInstrument]") {
    // weekdays only: 2021-01-02/03 are a weekend
    auto prices = make_prices("2021-01-01", 30, [](const std::string&) { return 2.0; }, {}, true);

    SECTION("Settles on the next priced day") {
        auto fund = make_fund(prices);
        auto q = fund->quote_buy(1000.0, "2021-01-02");
        REQUIRE(q.settle_date == "2021-01-04");
        REQUIRE(q.cash == Catch::Approx(-1000.0));
        REQUIRE(q.shares == Catch::Approx(500.0));
    }

    SECTION("Purchase fee reduces shares, not cash") {
        FeeScheduleConfig cfg;
        cfg.purchase_rate_percent = 1.5;
        auto fund = make_fund(prices, {}, false, FeeSchedule(cfg));
        auto q = fund->quote_buy(1000.0, "2021-01-04");
        REQUIRE(q.cash == Catch::Approx(-1000.0));
        REQUIRE(q.shares == Catch::Approx(492.61)); // 1000 / 1.015 / 2
    }

    SECTION("Non-positive amount and missing prices rejected") {
        auto fund = make_fund(prices);
        REQUIRE_THROWS_AS(fund->quote_buy(0.0, "2021-01-04"), std::invalid_argument);
        REQUIRE_THROWS_AS(fund->quote_buy(100.0, "2021-03-01"), std::out_of_range);
    }
}

TEST_CASE("FundInstrument redemption quotes", "[FundInstrument]") {
    FeeScheduleConfig cfg;
    cfg.redemption_tiers = {{7, 1.5}, {365, 0.5}, {-1, 0.0}};
    auto fund = make_fund(flat_prices("2021-01-01", 29), {}, false, FeeSchedule(cfg));

    auto lots = ledger::LotRegistry().buy(100.0, "2021-01-01").buy(100.0, "2021-01-08");

    SECTION("Fee depends on the age of each consumed lot") {
        auto q = fund->quote_redeem(150.0, "2021-01-10", lots);
        // 100 held 9 days at 0.5%, 50 held 2 days at 1.5%
        REQUIRE(q.settle_date == "2021-01-10");
        REQUIRE(q.cash == Catch::Approx(99.5 + 49.25));
        REQUIRE(q.shares == Catch::Approx(-150.0));
    }

    SECTION("After the last price settles on the last priced day") {
        auto q = fund->quote_redeem(200.0, "2021-03-01", lots);
        REQUIRE(q.settle_date == "2021-01-29");
        REQUIRE(q.shares == Catch::Approx(-200.0));
    }

    SECTION("Quoting more than held throws") {
        REQUIRE_THROWS_AS(fund->quote_redeem(250.0, "2021-01-10", lots), ledger::InsufficientShares);
    }
}

TEST_CASE("FundInstrument calendar", "[FundInstrument]") {
    auto prices = flat_prices("2021-01-01", 10, 1.0, {{"2021-01-05", -2.0}, {"2021-01-07", 0.1}});
    auto fund = make_fund(prices, {"2021-01-05"}, true);

    REQUIRE(fund->code() == "F001");
    REQUIRE(fund->is_lock_date("2021-01-05"));
    REQUIRE_FALSE(fund->is_lock_date("2021-01-06"));
    REQUIRE_FALSE(fund->corporate_action_at("2021-01-06").has_value());

    auto split = fund->corporate_action_at("2021-01-05");
    REQUIRE(split);
    REQUIRE(split->type == CorporateActionType::SPLIT);

    auto dividend = fund->corporate_action_at("2021-01-07");
    REQUIRE(dividend);
    REQUIRE(dividend->reinvest);

    REQUIRE(fund->priced_dates("2021-01-03", "2021-01-05").size() == 3);
    REQUIRE_THROWS_AS(make_fund(PriceTable()), std::invalid_argument);
}
