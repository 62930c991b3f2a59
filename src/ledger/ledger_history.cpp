// SPDX-License-Identifier: MIT
#include "ledger/ledger_history.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace holding {
namespace ledger {

// Lot totals are rounded per lot on splits, so allow a few cents of drift.
static constexpr double kBalanceTolerance = 0.05;

void LedgerHistory::append(const LedgerEntry& entry, const LotRegistry& lots) {
    if (!entries.empty() && !(entries.back().date < entry.date)) {
        throw std::logic_error("ledger entry on " + entry.date +
                               " does not follow " + entries.back().date);
    }
    entries.push_back(entry);
    snapshots.push_back(LotRegistrySnapshot{entry.date, lots});
}

LedgerHistory LedgerHistory::truncated(const std::string& date) const {
    LedgerHistory out;
    for (size_t i = 0; i < entries.size() && entries[i].date <= date; ++i) {
        out.entries.push_back(entries[i]);
        out.snapshots.push_back(snapshots[i]);
    }
    return out;
}

LotRegistry LedgerHistory::registry_at(const std::string& date) const {
    auto it = std::upper_bound(snapshots.begin(), snapshots.end(), date,
                               [](const std::string& d, const LotRegistrySnapshot& s) { return d < s.date; });
    if (it == snapshots.begin()) return LotRegistry();
    return std::prev(it)->lots;
}

double LedgerHistory::total_shares() const {
    double total = 0.0;
    for (const auto& e : entries) total += e.shares;
    return total;
}

void LedgerHistory::validate() const {
    if (entries.size() != snapshots.size()) {
        std::ostringstream msg;
        msg << "entries (" << entries.size() << ") and snapshots (" << snapshots.size() << ") differ in length";
        throw std::logic_error(msg.str());
    }
    double running = 0.0;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].date != snapshots[i].date) {
            throw std::logic_error("entry " + entries[i].date + " paired with snapshot " + snapshots[i].date);
        }
        if (i > 0 && !(entries[i - 1].date < entries[i].date)) {
            throw std::logic_error("ledger dates not strictly increasing at " + entries[i].date);
        }
        running += entries[i].shares;
        double lots = snapshots[i].lots.total_shares();
        if (std::abs(lots - running) > kBalanceTolerance) {
            std::ostringstream msg;
            msg << "lot total " << lots << " != share balance " << running << " on " << entries[i].date;
            throw std::logic_error(msg.str());
        }
    }
}

} // namespace ledger
} // namespace holding
