// SPDX-License-Identifier: MIT
#ifndef HOLDING_LEDGER_AMOUNTS_HPP
#define HOLDING_LEDGER_AMOUNTS_HPP

#include <algorithm>
#include <cmath>

namespace holding
{
    namespace ledger
    {

        /// Tolerance used when comparing 2-decimal share and cash amounts.
        constexpr double kAmountTolerance = 1e-6;

        /**
         * @brief Round half away from zero to a fixed number of decimals.
         *
         * Cash and share quantities are quoted to the cent, so the binary
         * representation of e.g. 2.675 must still round up to 2.68. A small
         * relative nudge absorbs that representation error.
         */
        inline double round_half_up(double value, int decimals = 2)
        {
            if (!std::isfinite(value))
                return value;
            double factor = std::pow(10.0, decimals);
            double scaled = std::abs(value) * factor;
            scaled = std::floor(scaled + 0.5 + 1e-9 * std::max(1.0, scaled));
            double result = scaled / factor;
            return value < 0.0 ? -result : result;
        }

    } // namespace ledger
} // namespace holding

#endif // HOLDING_LEDGER_AMOUNTS_HPP
