// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>
#include "ledger/ledger_history.hpp"

namespace holding {
namespace valuation {

enum class AggregationFrequency {
    DAILY,
    WEEKLY,
    MONTHLY
};

// One bar of buy or sell cash. Weekly bars are labelled with the Thursday
// of their Monday-based week, monthly bars with the 15th.
struct VolumeBar {
    std::string date;
    double cash = 0.0;
};

struct TradeVolume {
    AggregationFrequency frequency = AggregationFrequency::DAILY;
    std::vector<VolumeBar> buys;   // cash < 0
    std::vector<VolumeBar> sells;  // cash > 0

    double total_bought() const;
    double total_sold() const;
};

// Accepts "D"/"daily", "W"/"weekly", "M"/"monthly" (case-insensitive).
// Throws ledger::UnsupportedAggregationFrequency for anything else.
AggregationFrequency parse_frequency(const std::string& freq_str);

std::string to_string(AggregationFrequency freq);

// Bucket label for a date under the given frequency.
std::string bucket_label(const std::string& date, AggregationFrequency freq);

// Nets ledger cash per bucket; positive buckets are sells, negative buys,
// zero buckets are dropped.
TradeVolume aggregate_trade_volume(const std::vector<ledger::LedgerEntry>& entries,
                                   AggregationFrequency freq);

TradeVolume aggregate_trade_volume(const std::vector<ledger::LedgerEntry>& entries,
                                   const std::string& freq_str);

} // namespace valuation
} // namespace holding
