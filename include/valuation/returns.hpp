// SPDX-License-Identifier: MIT
/**
 * @file returns.hpp
 * @brief Ledger-derived capital and return measures.
 *
 * All functions scan a sequence of ledger entries (usually a history
 * truncated at a report date) and are pure.
 */

#ifndef HOLDING_VALUATION_RETURNS_HPP
#define HOLDING_VALUATION_RETURNS_HPP

#include "ledger/ledger_history.hpp"

#include <string>
#include <vector>

namespace holding
{
    namespace valuation
    {

        /**
         * @struct CashFlow
         * @brief Dated cash amount, signed from the holder's point of view.
         */
        struct CashFlow
        {
            std::string date;
            double amount = 0.0;
        };

        /**
         * @brief Largest amount of money simultaneously at risk.
         *
         * Maximum over all prefixes of the ledger of the cumulative capital
         * contributed net of capital already returned (-sum of cash), rounded
         * to the cent. Returns 0 for an empty ledger.
         */
        double bottleneck(const std::vector<ledger::LedgerEntry> &entries);

        /**
         * @brief Annualized turnover.
         *
         * sum(|cash|) / bottleneck / 2 * 365 / days, where days runs from the
         * first entry to end_date. Returns 0 for an empty ledger, a
         * non-positive elapsed window or a zero bottleneck.
         */
        double turnover_rate(const std::vector<ledger::LedgerEntry> &entries,
                             const std::string &end_date);

        /// One cash flow per ledger entry (zero-cash entries included).
        std::vector<CashFlow> cashflows(const std::vector<ledger::LedgerEntry> &entries);

        /**
         * @brief Annual rate r solving sum(cf_i * (1 + r)^(-d_i / 365)) = 0.
         *
         * d_i counts days from the earliest flow. Newton's method seeded at
         * guess; falls back to bisection when Newton leaves the domain or
         * stalls.
         *
         * @param flows Cash flows in any order.
         * @param guess Starting rate, e.g. 0.1 for 10%.
         * @return 0 if flows is empty.
         * @throws std::runtime_error if flows do not change sign or no root is
         *         bracketed
         */
        double xirr(const std::vector<CashFlow> &flows, double guess = 0.1);

        /**
         * @brief Net present value of flows at rate, discounted to the earliest flow.
         */
        double xnpv(const std::vector<CashFlow> &flows, double rate);

    } // namespace valuation
} // namespace holding

#endif // HOLDING_VALUATION_RETURNS_HPP
