// SPDX-License-Identifier: MIT
/*
 * @file price_table.hpp
 * @brief Net asset value history of a single instrument.
 *
 * Stores one row per priced day: the net value (as an Eigen vector) and the
 * raw corporate-action column announced by the instrument for that day.
 */

#ifndef HOLDING_INSTRUMENT_PRICE_TABLE_HPP
#define HOLDING_INSTRUMENT_PRICE_TABLE_HPP

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace holding
{
    namespace instrument
    {

        /**
         * @class PriceTable
         * @brief Date-indexed net values plus the raw corporate-action calendar.
         *
         * @note Dates must be strictly increasing.
         * @note Corporate-action values are stored undecoded; an entry that
         *       could not be parsed is kept as NaN so it fails when replayed.
         */
        class PriceTable
        {
        public:
            PriceTable() = default;

            /**
             * @brief Constructor with data.
             * @param dates Priced dates (YYYY-MM-DD), strictly increasing.
             * @param net_values Net value per date, all positive.
             * @param actions Raw corporate-action value keyed by date.
             * @throws std::invalid_argument on size mismatch, unordered dates or
             *         non-positive values
             */
            PriceTable(const std::vector<std::string> &dates,
                       const Eigen::VectorXd &net_values,
                       const std::map<std::string, double> &actions = {});

            ~PriceTable() = default;

            const std::vector<std::string> &get_dates() const
            {
                return dates_;
            }

            const Eigen::VectorXd &get_net_values() const
            {
                return net_values_;
            }

            const std::map<std::string, double> &get_actions() const
            {
                return actions_;
            }

            size_t num_dates() const
            {
                return dates_.size();
            }

            bool empty() const
            {
                return dates_.empty();
            }

            /**
             * @brief Net value on the last priced day on or before date.
             * @throws std::out_of_range if date precedes the first row
             */
            double value_at(const std::string &date) const;

            /// Net value on an exact priced day, if the day is priced.
            std::optional<double> exact_value(const std::string &date) const;

            /// Row index of the first priced day on or after date.
            std::optional<size_t> first_on_or_after(const std::string &date) const;

            /// Row index of the last priced day on or before date.
            std::optional<size_t> last_on_or_before(const std::string &date) const;

            /// Raw corporate-action value on date, if announced.
            std::optional<double> action_at(const std::string &date) const;

            std::vector<std::string> dates_between(const std::string &start,
                                                   const std::string &end) const;

            /**
             * @brief Keep rows within [start_date, end_date].
             */
            PriceTable filter_by_date(const std::string &start_date,
                                      const std::string &end_date) const;

            void print_summary() const;

        private:
            std::vector<std::string> dates_;
            Eigen::VectorXd net_values_;
            std::map<std::string, double> actions_;
            std::map<std::string, size_t> date_index_;

            void validate() const;
            void build_index_map();
        };

    } // namespace instrument
} // namespace holding

#endif // HOLDING_INSTRUMENT_PRICE_TABLE_HPP
