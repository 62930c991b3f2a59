// SPDX-License-Identifier: MIT
/**
 * @file date_utils.hpp
 * @brief Calendar arithmetic on YYYY-MM-DD date strings.
 *
 * Dates are carried as ISO strings throughout the library, which keeps them
 * lexicographically ordered. These helpers convert to and from a day count
 * so the replay engine can walk the calendar one day at a time.
 */

#ifndef HOLDING_DATA_DATE_UTILS_HPP
#define HOLDING_DATA_DATE_UTILS_HPP

#include <string>

namespace holding
{
    namespace dates
    {
        /**
         * @brief Check for a well-formed YYYY-MM-DD calendar date.
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Days since 1970-01-01 for a YYYY-MM-DD string.
         * @throws std::invalid_argument if the string is not a valid date
         */
        long long days_since_epoch(const std::string &date);

        /**
         * @brief Inverse of days_since_epoch().
         */
        std::string from_days_since_epoch(long long days);

        std::string add_days(const std::string &date, int days_offset);

        /// Signed number of days from @p from to @p to.
        int days_between(const std::string &from, const std::string &to);

        int extract_year(const std::string &date);
        int extract_month(const std::string &date);
        int extract_day(const std::string &date);

        /// 0=Mon, 6=Sun
        int day_of_week(const std::string &date);

        /**
         * @brief Today's date minus one day, from the local clock.
         *
         * Default end of replay when no explicit end date is configured.
         */
        std::string yesterday();

    } // namespace dates
} // namespace holding

#endif // HOLDING_DATA_DATE_UTILS_HPP
