// SPDX-License-Identifier: MIT
/**
 * @file date_utils.cpp
 * @brief Implementation of date helpers
 */

#include "data/date_utils.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>

namespace holding
{
    namespace dates
    {

        namespace
        {
            bool is_leap(int y)
            {
                return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
            }

            int days_in_month(int y, int m)
            {
                static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && is_leap(y))
                    return 29;
                return table[m - 1];
            }

            // Howard Hinnant's days_from_civil
            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<long long>(doe) - 719468;
            }
        } // namespace

        bool is_valid_date(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            int m = std::stoi(date.substr(5, 2));
            int d = std::stoi(date.substr(8, 2));
            if (m < 1 || m > 12)
                return false;
            return d >= 1 && d <= days_in_month(std::stoi(date.substr(0, 4)), m);
        }

        long long days_since_epoch(const std::string &date)
        {
            if (!is_valid_date(date))
                throw std::invalid_argument("invalid date (expected YYYY-MM-DD): '" + date + "'");
            return days_from_civil(extract_year(date), extract_month(date), extract_day(date));
        }

        std::string from_days_since_epoch(long long days)
        {
            days += 719468;
            const long long era = (days >= 0 ? days : days - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(days - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;
            const long long y = static_cast<long long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);

            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", y, m, d);
            return std::string(buffer);
        }

        std::string add_days(const std::string &date, int days_offset)
        {
            return from_days_since_epoch(days_since_epoch(date) + days_offset);
        }

        int days_between(const std::string &from, const std::string &to)
        {
            return static_cast<int>(days_since_epoch(to) - days_since_epoch(from));
        }

        int extract_year(const std::string &date)
        {
            return std::stoi(date.substr(0, 4));
        }

        int extract_month(const std::string &date)
        {
            return std::stoi(date.substr(5, 2));
        }

        int extract_day(const std::string &date)
        {
            return std::stoi(date.substr(8, 2));
        }

        int day_of_week(const std::string &date)
        {
            // 1970-01-01 was a Thursday
            long long n = days_since_epoch(date);
            long long w = (n + 3) % 7;
            if (w < 0)
                w += 7;
            return static_cast<int>(w);
        }

        std::string yesterday()
        {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local = *std::localtime(&now);
            char buffer[11];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local);
            return add_days(std::string(buffer), -1);
        }

    } // namespace dates
} // namespace holding
