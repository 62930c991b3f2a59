// SPDX-License-Identifier: MIT
#include "valuation/trade_volume.hpp"
#include "data/date_utils.hpp"
#include "ledger/ledger_errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>

namespace holding {
namespace valuation {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

double TradeVolume::total_bought() const {
    double sum = 0.0;
    for (const auto& b : buys) sum += b.cash;
    return sum;
}

double TradeVolume::total_sold() const {
    double sum = 0.0;
    for (const auto& s : sells) sum += s.cash;
    return sum;
}

AggregationFrequency parse_frequency(const std::string& freq_str) {
    auto s = to_lower(freq_str);
    if (s == "d" || s == "daily") return AggregationFrequency::DAILY;
    if (s == "w" || s == "weekly") return AggregationFrequency::WEEKLY;
    if (s == "m" || s == "monthly") return AggregationFrequency::MONTHLY;
    throw ledger::UnsupportedAggregationFrequency(freq_str);
}

std::string to_string(AggregationFrequency freq) {
    switch (freq) {
        case AggregationFrequency::DAILY: return "daily";
        case AggregationFrequency::WEEKLY: return "weekly";
        case AggregationFrequency::MONTHLY: return "monthly";
    }
    return "unknown";
}

std::string bucket_label(const std::string& date, AggregationFrequency freq) {
    switch (freq) {
        case AggregationFrequency::DAILY:
            return date;
        case AggregationFrequency::WEEKLY: {
            int dow = dates::day_of_week(date);  // 0=Mon
            return dates::add_days(date, 3 - dow);
        }
        case AggregationFrequency::MONTHLY: {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-15",
                          dates::extract_year(date), dates::extract_month(date));
            return std::string(buffer);
        }
    }
    return date;
}

TradeVolume aggregate_trade_volume(const std::vector<ledger::LedgerEntry>& entries,
                                   AggregationFrequency freq) {
    std::map<std::string, double> buckets;
    for (const auto& e : entries) {
        buckets[bucket_label(e.date, freq)] += e.cash;
    }

    TradeVolume out;
    out.frequency = freq;
    for (const auto& kv : buckets) {
        if (kv.second > 0.0) out.sells.push_back(VolumeBar{kv.first, kv.second});
        else if (kv.second < 0.0) out.buys.push_back(VolumeBar{kv.first, kv.second});
    }
    return out;
}

TradeVolume aggregate_trade_volume(const std::vector<ledger::LedgerEntry>& entries,
                                   const std::string& freq_str) {
    // reject before touching the ledger
    AggregationFrequency freq = parse_frequency(freq_str);
    return aggregate_trade_volume(entries, freq);
}

} // namespace valuation
} // namespace holding
