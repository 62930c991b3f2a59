// SPDX-License-Identifier: MIT
/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader, StatusTable and configuration loading
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/status_table.hpp"
#include "ledger/ledger_errors.hpp"
#include "ledger/replay_engine.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace holding;
using Catch::Matchers::WithinAbs;

namespace {

std::filesystem::path scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "holding_ledger_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // namespace

TEST_CASE("StatusTable construction", "[StatusTable]") {
    Eigen::MatrixXd values(3, 2);
    values << 1000.0, 0.0,
              0.0, 500.0,
              -0.005, 0.0;
    std::vector<std::string> dates = {"2021-01-04", "2021-01-05", "2021-01-06"};
    data::StatusTable status(values, dates, {"F001", "F002"});

    REQUIRE(status.num_dates() == 3);
    REQUIRE(status.num_codes() == 2);
    REQUIRE(status.has_code("F002"));

    SECTION("Column drops empty cells") {
        auto col = status.column("F001");
        REQUIRE(col.size() == 2);
        REQUIRE(col[0].date == "2021-01-04");
        REQUIRE_THAT(col[1].value, WithinAbs(-0.005, 1e-12));
        REQUIRE_THROWS_AS(status.column("F003"), std::out_of_range);
    }

    SECTION("Date filtering") {
        auto filtered = status.filter_by_date("2021-01-05", "2021-01-31");
        REQUIRE(filtered.num_dates() == 2);
        REQUIRE(filtered.column("F002").size() == 1);
    }

    SECTION("Invalid tables rejected") {
        REQUIRE_THROWS_AS(data::StatusTable(values, {"2021-01-04", "2021-01-05"}, {"F001", "F002"}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(data::StatusTable(values, dates, {"F001", "F001"}), std::invalid_argument);
        REQUIRE_THROWS_AS(data::StatusTable(values, {"2021-01-06", "2021-01-05", "2021-01-04"}, {"F001", "F002"}),
                          std::invalid_argument);
    }
}

TEST_CASE("Price CSV loading", "[DataLoader]") {
    auto dir = scratch_dir("prices");
    auto path = dir / "F001.csv";
    write_file(path,
               "date,netvalue,comment\n"
               "2021-01-04,1.0000,0\n"
               "2021-01-05,1.0100,\n"
               "not-a-date,9.9,0\n"
               "2021-01-06,1.0200,0.05\n"
               "2021-01-07,0.5100,-2\n"
               "2021-01-08,0.5200,special payout\n");

    auto prices = DataLoader::load_price_csv(path.string());
    REQUIRE(prices.num_dates() == 5);
    REQUIRE_THAT(prices.value_at("2021-01-05"), WithinAbs(1.01, 1e-12));

    REQUIRE_FALSE(prices.action_at("2021-01-04").has_value());
    REQUIRE_FALSE(prices.action_at("2021-01-05").has_value());
    REQUIRE_THAT(*prices.action_at("2021-01-06"), WithinAbs(0.05, 1e-12));
    REQUIRE_THAT(*prices.action_at("2021-01-07"), WithinAbs(-2.0, 1e-12));

    SECTION("Unparseable comment is kept and fails on replay") {
        auto raw = prices.action_at("2021-01-08");
        REQUIRE(raw.has_value());
        REQUIRE(std::isnan(*raw));

        instrument::FundInstrument fund("F001", "Fund", prices);
        REQUIRE_THROWS_AS(fund.corporate_action_at("2021-01-08"), ledger::UnrecognizedCorporateAction);
    }

    SECTION("Round trip through save") {
        auto out = dir / "saved.csv";
        DataLoader::save_price_csv(prices.filter_by_date("2021-01-04", "2021-01-07"), out.string());
        auto reloaded = DataLoader::load_price_csv(out.string());
        REQUIRE(reloaded.num_dates() == 4);
        REQUIRE_THAT(*reloaded.action_at("2021-01-07"), WithinAbs(-2.0, 1e-12));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_price_csv((dir / "missing.csv").string()), std::runtime_error);
    }
}

TEST_CASE("Status CSV loading", "[DataLoader]") {
    auto dir = scratch_dir("status");
    auto path = dir / "status.csv";
    write_file(path,
               "date,F001,F002\n"
               "2021-02-01,0,-0.005\n"
               "2021-01-04,1000,2000\n"
               "2021-01-05,,500\n");

    auto status = DataLoader::load_status_csv(path.string());
    REQUIRE(status.num_codes() == 2);
    REQUIRE(status.get_dates().front() == "2021-01-04");

    auto f001 = status.column("F001");
    REQUIRE(f001.size() == 1);
    REQUIRE_THAT(f001[0].value, WithinAbs(1000.0, 1e-12));
    REQUIRE(status.column("F002").size() == 3);

    SECTION("Selected codes only") {
        auto only = DataLoader::load_status_csv(path.string(), {"F002"});
        REQUIRE(only.num_codes() == 1);
        REQUIRE_THROWS_AS(DataLoader::load_status_csv(path.string(), {"F009"}), std::runtime_error);
    }

    SECTION("Duplicate dates rejected") {
        auto dup = dir / "dup.csv";
        write_file(dup, "date,F001\n2021-01-04,1000\n2021-01-04,-0.005\n");
        REQUIRE_THROWS_AS(DataLoader::load_status_csv(dup.string()), std::runtime_error);
    }
}

TEST_CASE("JSON configuration loading", "[DataLoader]") {
    auto dir = scratch_dir("config");
    auto config_path = dir / "ledger_config.json";
    write_file(config_path, R"({
        "instruments": [
            {
                "code": "F001",
                "name": "Bond Fund",
                "price_file": "F001.csv",
                "lock_dates": ["2021-01-05"],
                "dividend_reinvest": true,
                "fees": {"purchase_rate": 0.15, "redemption": [{"max_days": 7, "rate": 1.5}, {"rate": 0.0}]}
            },
            { "code": "F002", "price_file": "F002.csv" }
        ],
        "status": {"file": "status.csv"},
        "replay": {"end_date": "2021-12-31"},
        "report": {"as_of": "2021-06-30", "volume_frequency": "W"},
        "output": {"directory": "out", "export_lots": false}
    })");

    auto config = DataLoader::load_config(config_path.string());
    REQUIRE(config.instruments.size() == 2);
    REQUIRE(config.instruments[0].lock_dates.size() == 1);
    REQUIRE(config.instruments[0].dividend_reinvest);
    REQUIRE_THAT(config.instruments[0].fees.purchase_rate_percent, WithinAbs(0.15, 1e-12));
    REQUIRE(config.instruments[1].name == "F002");
    REQUIRE(config.instruments[1].fees.redemption_tiers.empty());
    REQUIRE(config.status.file == "status.csv");
    REQUIRE(config.replay.end_date == "2021-12-31");
    REQUIRE(config.report.as_of == "2021-06-30");
    REQUIRE(config.report.volume_frequency == "W");
    REQUIRE_THAT(config.report.xirr_guess, WithinAbs(0.1, 1e-12));
    REQUIRE(config.output.directory == "out");
    REQUIRE_FALSE(config.output.export_lots);
    REQUIRE(config.output.export_ledger);

    SECTION("Instrument built relative to a base directory") {
        write_file(dir / "F001.csv", "date,netvalue,comment\n2021-01-04,1.0,0\n2021-01-05,1.1,0\n");
        auto fund = DataLoader::build_instrument(config.instruments[0], dir.string());
        REQUIRE(fund->code() == "F001");
        REQUIRE(fund->name() == "Bond Fund");
        REQUIRE(fund->is_lock_date("2021-01-05"));
        REQUIRE(fund->dividend_reinvest());
        REQUIRE(fund->prices().num_dates() == 2);
    }

    SECTION("Invalid configurations") {
        auto bad = dir / "bad.json";
        write_file(bad, R"({"instruments": [{"name": "no code", "price_file": "x.csv"}]})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad.string()), std::invalid_argument);

        write_file(bad, R"({"instruments": [{"code": "A", "price_file": "a.csv"}, {"code": "A", "price_file": "b.csv"}]})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad.string()), std::invalid_argument);

        write_file(bad, "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad.string()), std::runtime_error);
    }
}
