// fee_schedule.hpp
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace holding {
namespace instrument {

// Redemption fee applied to shares held for fewer than max_days.
// max_days < 0 means the tier has no upper bound.
struct RedemptionTier {
    int max_days{-1};
    double rate_percent{0.0};
};

struct FeeScheduleConfig {
    double purchase_rate_percent{0.0};
    std::vector<RedemptionTier> redemption_tiers;

    static FeeScheduleConfig from_json(const nlohmann::json& j);
    static FeeScheduleConfig default_config();
};

class FeeSchedule {
public:
    explicit FeeSchedule(const FeeScheduleConfig& config);
    FeeSchedule();
    ~FeeSchedule() = default;

    double purchase_rate() const { return config_.purchase_rate_percent; }

    // Rate (percent) for shares held holding_days calendar days.
    double redemption_rate(int holding_days) const;

    // Shares bought with amount at net value nav, after the purchase fee.
    double purchase_shares(double amount, double nav) const;
    double purchase_fee(double amount) const;

    // Cash paid out for shares held holding_days, after the redemption fee.
    double redemption_proceeds(double shares, double nav, int holding_days) const;

    const FeeScheduleConfig& config() const { return config_; }

private:
    FeeScheduleConfig config_;
    void validate_config() const;
};

} // namespace instrument
} // namespace holding
