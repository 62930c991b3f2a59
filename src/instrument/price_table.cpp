// SPDX-License-Identifier: MIT
/**
 * @file price_table.cpp
 * @brief Implementation of PriceTable class
 */

#include "instrument/price_table.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace holding
{
    namespace instrument
    {

        // ============================================================================
        // Constructors
        // ============================================================================

        PriceTable::PriceTable(const std::vector<std::string> &dates,
                               const Eigen::VectorXd &net_values,
                               const std::map<std::string, double> &actions)
            : dates_(dates), net_values_(net_values), actions_(actions)
        {
            validate();
            build_index_map();
        }

        // ============================================================================
        // Lookups
        // ============================================================================

        double PriceTable::value_at(const std::string &date) const
        {
            auto idx = last_on_or_before(date);
            if (!idx)
            {
                throw std::out_of_range("no net value on or before " + date);
            }
            return net_values_(static_cast<Eigen::Index>(*idx));
        }

        std::optional<double> PriceTable::exact_value(const std::string &date) const
        {
            auto it = date_index_.find(date);
            if (it == date_index_.end())
                return std::nullopt;
            return net_values_(static_cast<Eigen::Index>(it->second));
        }

        std::optional<size_t> PriceTable::first_on_or_after(const std::string &date) const
        {
            auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
            if (it == dates_.end())
                return std::nullopt;
            return static_cast<size_t>(std::distance(dates_.begin(), it));
        }

        std::optional<size_t> PriceTable::last_on_or_before(const std::string &date) const
        {
            auto it = std::upper_bound(dates_.begin(), dates_.end(), date);
            if (it == dates_.begin())
                return std::nullopt;
            return static_cast<size_t>(std::distance(dates_.begin(), it) - 1);
        }

        std::optional<double> PriceTable::action_at(const std::string &date) const
        {
            auto it = actions_.find(date);
            if (it == actions_.end())
                return std::nullopt;
            return it->second;
        }

        std::vector<std::string> PriceTable::dates_between(const std::string &start,
                                                           const std::string &end) const
        {
            std::vector<std::string> out;
            auto lo = std::lower_bound(dates_.begin(), dates_.end(), start);
            auto hi = std::upper_bound(dates_.begin(), dates_.end(), end);
            if (lo < hi)
                out.assign(lo, hi);
            return out;
        }

        PriceTable PriceTable::filter_by_date(const std::string &start_date,
                                              const std::string &end_date) const
        {
            std::vector<std::string> kept_dates;
            std::vector<double> kept_values;
            std::map<std::string, double> kept_actions;

            for (size_t i = 0; i < dates_.size(); ++i)
            {
                if (dates_[i] < start_date || dates_[i] > end_date)
                    continue;
                kept_dates.push_back(dates_[i]);
                kept_values.push_back(net_values_(static_cast<Eigen::Index>(i)));
            }
            for (const auto &kv : actions_)
            {
                if (kv.first >= start_date && kv.first <= end_date)
                    kept_actions.insert(kv);
            }

            Eigen::VectorXd values = Eigen::Map<Eigen::VectorXd>(kept_values.data(),
                                                                 static_cast<Eigen::Index>(kept_values.size()));
            return PriceTable(kept_dates, values, kept_actions);
        }

        void PriceTable::print_summary() const
        {
            std::cout << "\n=== Price Table Summary ===\n";
            if (dates_.empty())
            {
                std::cout << "(empty)\n";
            }
            else
            {
                std::cout << "Rows: " << dates_.size() << "\n";
                std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
                std::cout << "Net value range: " << net_values_.minCoeff() << " - "
                          << net_values_.maxCoeff() << "\n";
                std::cout << "Corporate actions: " << actions_.size() << "\n";
            }
            std::cout << "===========================\n"
                      << std::endl;
        }

        // =========================
        // Private Helper Methods
        // =========================

        void PriceTable::validate() const
        {
            if (net_values_.size() != static_cast<Eigen::Index>(dates_.size()))
            {
                std::ostringstream msg;
                msg << "net values size (" << net_values_.size() << ") != dates size ("
                    << dates_.size() << ")";
                throw std::invalid_argument(msg.str());
            }
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                if (!dates::is_valid_date(dates_[i]))
                    throw std::invalid_argument("invalid price date: '" + dates_[i] + "'");
                if (i > 0 && !(dates_[i - 1] < dates_[i]))
                    throw std::invalid_argument("price dates must be strictly increasing at " + dates_[i]);
                double v = net_values_(static_cast<Eigen::Index>(i));
                if (!(v > 0.0) || !std::isfinite(v))
                {
                    std::ostringstream msg;
                    msg << "net value on " << dates_[i] << " is not positive: " << v;
                    throw std::invalid_argument(msg.str());
                }
            }
        }

        void PriceTable::build_index_map()
        {
            date_index_.clear();
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                date_index_[dates_[i]] = i;
            }
        }

    } // namespace instrument
} // namespace holding
