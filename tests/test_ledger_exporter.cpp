// SPDX-License-Identifier: MIT
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "test_helpers.hpp"
#include "ledger/ledger_exporter.hpp"
#include <filesystem>
#include <fstream>

using namespace holding;
using namespace holding::ledger;
using holding::testing::flat_prices;
using holding::testing::make_fund;

namespace {
valuation::Holding sample_holding() {
    ReplayOptions opts;
    opts.end_date = "2021-01-31";
    auto fund = make_fund(flat_prices("2021-01-01", 31, 1.0, {{"2021-01-10", 0.05}}));
    return valuation::Holding::replay(fund, {{"2021-01-01", 1000.0}, {"2021-01-03", 500.0}, {"2021-01-05", -1000.0}},
                                      opts);
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream f(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line)) lines.push_back(line);
    return lines;
}
} // namespace

TEST_CASE("Ledger summary", "[LedgerExporter]") {
    auto h = sample_holding();
    auto s = summarize(h.history());
    REQUIRE(s.total_entries == 4);
    REQUIRE(s.cash_outflows == 2);
    REQUIRE(s.cash_inflows == 2); // redemption + cash dividend
    REQUIRE(s.share_only_entries == 0);
    REQUIRE(s.total_paid == Catch::Approx(1500.0));
    REQUIRE(s.total_received == Catch::Approx(1000.0 + 25.0));
    REQUIRE(s.final_shares == Catch::Approx(500.0));
    REQUIRE(s.open_lots == 1);
}

TEST_CASE("Ledger CSV export", "[LedgerExporter]") {
    auto h = sample_holding();
    auto dir = std::filesystem::temp_directory_path() / "holding_ledger_tests" / "export";
    std::filesystem::remove_all(dir);

    const std::string ledger_path = (dir / "F001_ledger.csv").string();
    REQUIRE_NOTHROW(LedgerExporter::export_ledger_csv(h.history(), ledger_path));
    REQUIRE(std::filesystem::exists(ledger_path));

    auto lines = read_lines(ledger_path);
    REQUIRE(lines.size() == 5);
    REQUIRE(lines[0] == "date,cash,shares,balance");
    REQUIRE(lines[1] == "2021-01-01,-1000.00,1000.00,1000.00");
    REQUIRE(lines[3] == "2021-01-05,1000.00,-1000.00,500.00");

    const std::string lots_path = (dir / "F001_lots.csv").string();
    REQUIRE_NOTHROW(LedgerExporter::export_lots_csv(h.history(), lots_path));
    auto lot_lines = read_lines(lots_path);
    REQUIRE(lot_lines[0] == "date,lot_index,acquired,shares");
    // snapshots hold 1, 2, 1, 1 lots
    REQUIRE(lot_lines.size() == 6);
    REQUIRE(lot_lines.back() == "2021-01-10,0,2021-01-03,500.00");
}

TEST_CASE("Report JSON export", "[LedgerExporter]") {
    auto h = sample_holding();
    auto report = h.daily_report("2021-01-10");

    auto j = LedgerExporter::report_to_json(report);
    REQUIRE(j["code"] == "F001");
    REQUIRE(j["shares"].get<double>() == Catch::Approx(500.0));
    REQUIRE(j["total_returned"].get<double>() == Catch::Approx(1025.0));

    auto path = std::filesystem::temp_directory_path() / "holding_ledger_tests" / "report" / "report.json";
    std::filesystem::remove_all(path.parent_path());
    LedgerExporter::export_report_json({report}, path.string());

    std::ifstream f(path);
    REQUIRE(f.is_open());
    nlohmann::json loaded;
    f >> loaded;
    REQUIRE(loaded.is_array());
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded[0]["date"] == "2021-01-10");
}
