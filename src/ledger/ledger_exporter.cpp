// SPDX-License-Identifier: MIT
#include "ledger/ledger_exporter.hpp"
#include "ledger/amounts.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace holding {
namespace ledger {

namespace {

std::ofstream open_for_writing(const std::string& filepath) {
    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }
    return file;
}

} // namespace

LedgerSummary summarize(const LedgerHistory& history) {
    LedgerSummary s;
    s.total_entries = static_cast<int>(history.size());
    for (const auto& e : history.entries) {
        if (e.cash < 0.0) {
            ++s.cash_outflows;
            s.total_paid -= e.cash;
        } else if (e.cash > 0.0) {
            ++s.cash_inflows;
            s.total_received += e.cash;
        } else {
            ++s.share_only_entries;
        }
    }
    s.total_paid = round_half_up(s.total_paid);
    s.total_received = round_half_up(s.total_received);
    s.final_shares = round_half_up(history.total_shares());
    if (!history.snapshots.empty()) {
        s.open_lots = static_cast<int>(history.snapshots.back().lots.size());
    }
    return s;
}

void LedgerExporter::export_ledger_csv(const LedgerHistory& history, const std::string& filepath) {
    std::ofstream file = open_for_writing(filepath);

    file << "date,cash,shares,balance\n";
    file << std::fixed << std::setprecision(2);

    double balance = 0.0;
    for (const auto& e : history.entries) {
        balance += e.shares;
        file << e.date << ","
             << e.cash << ","
             << e.shares << ","
             << round_half_up(balance) << "\n";
    }

    file.close();
}

void LedgerExporter::export_lots_csv(const LedgerHistory& history, const std::string& filepath) {
    std::ofstream file = open_for_writing(filepath);

    file << "date,lot_index,acquired,shares\n";
    file << std::fixed << std::setprecision(2);

    for (const auto& snap : history.snapshots) {
        const auto& lots = snap.lots.lots();
        for (size_t i = 0; i < lots.size(); ++i) {
            file << snap.date << ","
                 << i << ","
                 << lots[i].date << ","
                 << lots[i].shares << "\n";
        }
    }

    file.close();
}

nlohmann::json LedgerExporter::report_to_json(const valuation::DailyReport& r) {
    nlohmann::json j;
    j["date"] = r.date;
    j["code"] = r.code;
    j["name"] = r.name;
    j["unit_value"] = r.unit_value;
    j["unit_cost"] = r.unit_cost;
    j["shares"] = r.shares;
    j["market_value"] = r.market_value;
    j["total_contributed"] = r.total_contributed;
    j["bottleneck"] = r.bottleneck;
    j["net_cost"] = r.net_cost;
    j["total_returned"] = r.total_returned;
    j["turnover"] = r.turnover;
    j["realized_gain"] = r.realized_gain;
    j["return_rate"] = r.return_rate;
    return j;
}

void LedgerExporter::export_report_json(const std::vector<valuation::DailyReport>& reports,
                                        const std::string& filepath) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : reports) {
        out.push_back(report_to_json(r));
    }

    std::ofstream file = open_for_writing(filepath);
    file << out.dump(2) << "\n";
    file.close();
}

void LedgerExporter::print_summary(const std::string& code, const LedgerHistory& history) {
    auto s = summarize(history);
    std::cout << "\n=== Ledger Summary: " << code << " ===\n";
    std::cout << "Entries: " << s.total_entries << "\n";
    std::cout << "Outflows: " << s.cash_outflows << "  Inflows: " << s.cash_inflows
              << "  Share-only: " << s.share_only_entries << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Total paid: " << s.total_paid << "\n";
    std::cout << "Total received: " << s.total_received << "\n";
    std::cout << "Shares held: " << s.final_shares << " in " << s.open_lots << " lots\n";
    std::cout << std::defaultfloat;
    std::cout << "==========================\n";
}

void LedgerExporter::print_report(const valuation::DailyReport& r) {
    std::cout << "\n=== Holding Report: " << r.code << " " << r.name << " (" << r.date << ") ===\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Unit value:      " << r.unit_value << "\n";
    std::cout << "Unit cost:       " << r.unit_cost << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Shares:          " << r.shares << "\n";
    std::cout << "Market value:    " << r.market_value << "\n";
    std::cout << "Contributed:     " << r.total_contributed << "\n";
    std::cout << "Returned:        " << r.total_returned << "\n";
    std::cout << "Net cost:        " << r.net_cost << "\n";
    std::cout << "Bottleneck:      " << r.bottleneck << "\n";
    std::cout << "Realized gain:   " << r.realized_gain << "\n";
    std::cout << std::setprecision(4);
    std::cout << "Return rate (%): " << r.return_rate << "\n";
    std::cout << "Turnover:        " << r.turnover << "\n";
    std::cout << std::defaultfloat;
}

} // namespace ledger
} // namespace holding
