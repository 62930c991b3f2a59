// SPDX-License-Identifier: MIT
#include "instrument/fee_schedule.hpp"
#include "ledger/amounts.hpp"

#include <sstream>

namespace holding {
namespace instrument {

FeeScheduleConfig FeeScheduleConfig::default_config() {
    FeeScheduleConfig cfg;
    cfg.purchase_rate_percent = 0.0;
    cfg.redemption_tiers.clear();
    return cfg;
}

FeeScheduleConfig FeeScheduleConfig::from_json(const nlohmann::json& j) {
    FeeScheduleConfig cfg = default_config();
    if (!j.is_object()) return cfg;

    cfg.purchase_rate_percent = j.value("purchase_rate", cfg.purchase_rate_percent);
    if (j.contains("redemption")) {
        for (const auto& tier : j.at("redemption")) {
            RedemptionTier t;
            if (tier.contains("max_days") && !tier.at("max_days").is_null()) {
                t.max_days = tier.at("max_days").get<int>();
            }
            t.rate_percent = tier.value("rate", 0.0);
            cfg.redemption_tiers.push_back(t);
        }
    }
    return cfg;
}

FeeSchedule::FeeSchedule(const FeeScheduleConfig& config)
    : config_(config) {
    validate_config();
}

FeeSchedule::FeeSchedule()
    : config_(FeeScheduleConfig::default_config()) {
}

void FeeSchedule::validate_config() const {
    if (config_.purchase_rate_percent < 0.0 || config_.purchase_rate_percent >= 100.0) {
        std::ostringstream ss; ss << config_.purchase_rate_percent;
        throw std::invalid_argument("Expected value in [0, 100) for parameter 'purchase_rate', got: " + ss.str());
    }
    int prev_max = 0;
    for (size_t i = 0; i < config_.redemption_tiers.size(); ++i) {
        const auto& t = config_.redemption_tiers[i];
        if (t.rate_percent < 0.0 || t.rate_percent >= 100.0) {
            std::ostringstream ss; ss << t.rate_percent;
            throw std::invalid_argument("Expected value in [0, 100) for redemption tier 'rate', got: " + ss.str());
        }
        if (t.max_days < 0 && i + 1 != config_.redemption_tiers.size()) {
            throw std::invalid_argument("Only the last redemption tier may be unbounded");
        }
        if (t.max_days >= 0 && t.max_days <= prev_max && i > 0) {
            throw std::invalid_argument("Redemption tiers must have increasing 'max_days'");
        }
        if (t.max_days >= 0) prev_max = t.max_days;
    }
}

double FeeSchedule::redemption_rate(int holding_days) const {
    for (const auto& t : config_.redemption_tiers) {
        if (t.max_days < 0 || holding_days < t.max_days) return t.rate_percent;
    }
    return 0.0;
}

double FeeSchedule::purchase_fee(double amount) const {
    return amount - amount / (1.0 + config_.purchase_rate_percent / 100.0);
}

double FeeSchedule::purchase_shares(double amount, double nav) const {
    if (!(nav > 0.0)) {
        std::ostringstream ss; ss << nav;
        throw std::invalid_argument("Expected positive value for parameter 'nav', got: " + ss.str());
    }
    return ledger::round_half_up((amount - purchase_fee(amount)) / nav);
}

double FeeSchedule::redemption_proceeds(double shares, double nav, int holding_days) const {
    double rate = redemption_rate(holding_days);
    return ledger::round_half_up(shares * nav * (1.0 - rate / 100.0));
}

} // namespace instrument
} // namespace holding
