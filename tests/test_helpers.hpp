// SPDX-License-Identifier: MIT
// Shared fixtures: calendar-day price tables and fund instruments.
#pragma once

#include "data/date_utils.hpp"
#include "instrument/fund_instrument.hpp"
#include "instrument/price_table.hpp"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace holding {
namespace testing {

// One price per calendar day (weekdays only if weekdays_only) from start.
inline instrument::PriceTable make_prices(const std::string& start, int num_days,
                                          const std::function<double(const std::string&)>& nav,
                                          const std::map<std::string, double>& actions = {},
                                          bool weekdays_only = false) {
    std::vector<std::string> dates;
    std::vector<double> values;
    for (int d = 0; d < num_days; ++d) {
        std::string date = dates::add_days(start, d);
        if (weekdays_only && dates::day_of_week(date) >= 5) continue;
        dates.push_back(date);
        values.push_back(nav(date));
    }
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    for (size_t i = 0; i < values.size(); ++i) v(static_cast<Eigen::Index>(i)) = values[i];
    return instrument::PriceTable(dates, v, actions);
}

inline instrument::PriceTable flat_prices(const std::string& start, int num_days, double nav = 1.0,
                                          const std::map<std::string, double>& actions = {}) {
    return make_prices(start, num_days, [nav](const std::string&) { return nav; }, actions);
}

inline std::shared_ptr<instrument::FundInstrument>
make_fund(const instrument::PriceTable& prices,
          const std::set<std::string>& lock_dates = {},
          bool dividend_reinvest = false,
          const instrument::FeeSchedule& fees = instrument::FeeSchedule(),
          const std::string& code = "F001") {
    return std::make_shared<instrument::FundInstrument>(code, "Test Fund " + code, prices, fees,
                                                        lock_dates, dividend_reinvest);
}

} // namespace testing
} // namespace holding
