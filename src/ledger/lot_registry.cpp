// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of LotRegistry
// ============================================================================

#include "ledger/lot_registry.hpp"
#include "ledger/amounts.hpp"
#include "ledger/ledger_errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace holding {
namespace ledger {

// Shares are quoted to the cent; a request within half a cent of the
// balance is treated as the whole balance.
static constexpr double kShareTolerance = 0.005;

LotRegistry::LotRegistry(std::vector<Lot> lots) : lots_(std::move(lots)) {
    for (const auto& lot : lots_) {
        if (lot.shares < 0.0) {
            throw std::invalid_argument("lot on " + lot.date + " has negative shares");
        }
    }
}

double LotRegistry::total_shares() const {
    double total = 0.0;
    for (const auto& lot : lots_) total += lot.shares;
    return total;
}

void LotRegistry::check_not_before_newest(const std::string& date, const char* op) const {
    if (!lots_.empty() && date < lots_.back().date) {
        std::ostringstream msg;
        msg << op << " on " << date << " precedes newest lot acquired " << lots_.back().date;
        throw std::invalid_argument(msg.str());
    }
}

// ============================================================================
// Operations
// ============================================================================

LotRegistry LotRegistry::buy(double shares, const std::string& date) const {
    if (shares < 0.0) throw std::invalid_argument("buy shares must be >= 0");
    check_not_before_newest(date, "buy");

    std::vector<Lot> next = lots_;
    next.push_back(Lot{date, shares});
    return LotRegistry(std::move(next));
}

SellResult LotRegistry::sell(double shares, const std::string& date) const {
    if (shares < 0.0) throw std::invalid_argument("sell shares must be >= 0");

    double amount = round_half_up(shares);
    double total = total_shares();
    if (amount > total + kShareTolerance) {
        std::ostringstream msg;
        msg << "requested " << amount << " shares on " << date << " but only " << total << " held";
        throw InsufficientShares(msg.str());
    }

    SellResult result;
    if (amount <= 0.0) {
        result.remaining = passthrough();
        return result;
    }
    check_not_before_newest(date, "sell");

    double left = std::min(amount, total);
    std::vector<Lot> kept;
    for (const auto& lot : lots_) {
        if (left <= kAmountTolerance) {
            kept.push_back(lot);
        } else if (lot.shares <= left + kAmountTolerance) {
            // whole lot consumed
            result.consumed.push_back(lot);
            left -= lot.shares;
        } else {
            result.consumed.push_back(Lot{lot.date, round_half_up(left)});
            kept.push_back(Lot{lot.date, round_half_up(lot.shares - left)});
            left = 0.0;
        }
    }

    result.remaining = LotRegistry(std::move(kept));
    return result;
}

LotRegistry LotRegistry::split(double ratio, const std::string& date) const {
    if (!(ratio > 0.0)) {
        std::ostringstream msg;
        msg << "split ratio must be > 0, got " << ratio;
        throw std::invalid_argument(msg.str());
    }
    check_not_before_newest(date, "split");

    std::vector<Lot> next;
    next.reserve(lots_.size());
    for (const auto& lot : lots_) {
        next.push_back(Lot{lot.date, round_half_up(lot.shares * ratio)});
    }
    return LotRegistry(std::move(next));
}

LotRegistry LotRegistry::passthrough() const {
    return LotRegistry(lots_);
}

bool LotRegistry::operator==(const LotRegistry& other) const {
    if (lots_.size() != other.lots_.size()) return false;
    for (size_t i = 0; i < lots_.size(); ++i) {
        if (lots_[i].date != other.lots_[i].date) return false;
        if (std::abs(lots_[i].shares - other.lots_[i].shares) > kAmountTolerance) return false;
    }
    return true;
}

} // namespace ledger
} // namespace holding
