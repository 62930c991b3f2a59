// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ledger/ledger_history.hpp"
#include "valuation/holding.hpp"

namespace holding {
namespace ledger {

struct LedgerSummary {
    int total_entries = 0;
    int cash_outflows = 0;     // purchases
    int cash_inflows = 0;      // redemptions and cash dividends
    int share_only_entries = 0; // splits and reinvested dividends
    double total_paid = 0.0;
    double total_received = 0.0;
    double final_shares = 0.0;
    int open_lots = 0;
};

LedgerSummary summarize(const LedgerHistory& history);

// One CSV/JSON writer per artefact; output directories are created on demand.
class LedgerExporter {
public:
    // date,cash,shares,balance
    static void export_ledger_csv(const LedgerHistory& history, const std::string& filepath);

    // date,lot_index,acquired,shares  (one row per lot per snapshot)
    static void export_lots_csv(const LedgerHistory& history, const std::string& filepath);

    static nlohmann::json report_to_json(const valuation::DailyReport& report);

    // Array of reports plus per-holding ledger summaries.
    static void export_report_json(const std::vector<valuation::DailyReport>& reports,
                                   const std::string& filepath);

    static void print_summary(const std::string& code, const LedgerHistory& history);
    static void print_report(const valuation::DailyReport& report);
};

} // namespace ledger
} // namespace holding
