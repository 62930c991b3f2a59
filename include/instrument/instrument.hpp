// SPDX-License-Identifier: MIT
/**
 * @file instrument.hpp
 * @brief Abstract interface for the priced instrument behind a holding
 *
 * The replay engine never prices anything itself. It asks the instrument
 * for net asset values, purchase and redemption quotes, the corporate
 * action calendar and lock dates. Implementations are immutable after
 * construction and safe for concurrent reads.
 */

#pragma once

#include "ledger/lot_registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace holding
{
    namespace instrument
    {

        /**
         * @struct Quote
         * @brief Result of pricing a purchase or redemption
         */
        struct Quote
        {
            std::string settle_date; ///< Priced day the trade settles on
            double cash = 0.0;       ///< Signed from the holder's view (buy < 0)
            double shares = 0.0;     ///< Signed share delta (redeem < 0)
        };

        enum class CorporateActionType
        {
            SPLIT,   ///< value is the multiplicative share ratio
            DIVIDEND ///< value is the cash paid per share
        };

        /**
         * @struct CorporateAction
         * @brief Instrument-announced event on a given date
         */
        struct CorporateAction
        {
            std::string date;
            CorporateActionType type = CorporateActionType::DIVIDEND;
            double value = 0.0;
            bool reinvest = false; ///< Dividend is paid in new shares

            /**
             * @brief Classify a raw calendar value.
             *
             * A negative value -r is a split with ratio r, a positive value a
             * per-share dividend.
             *
             * @throws ledger::UnrecognizedCorporateAction for zero or non-finite values
             */
            static CorporateAction decode(const std::string &date, double raw, bool reinvest = false);
        };

        /**
         * @class Instrument
         * @brief Price/quote provider and corporate-action calendar
         */
        class Instrument
        {
        public:
            virtual ~Instrument() = default;

            virtual const std::string &code() const = 0;
            virtual const std::string &name() const = 0;

            /**
             * @brief Net asset value in effect on a date (last priced day <= date).
             * @throws std::out_of_range if the date precedes all prices
             */
            virtual double price_at(const std::string &date) const = 0;

            /**
             * @brief Quote investing @p amount of money on @p date.
             * @return Quote with negative cash and positive shares
             */
            virtual Quote quote_buy(double amount, const std::string &date) const = 0;

            /**
             * @brief Quote redeeming @p shares on @p date.
             *
             * Fees may depend on the age of the lots consumed, so the current
             * registry is passed in.
             *
             * @return Quote with positive cash and negative shares
             */
            virtual Quote quote_redeem(double shares, const std::string &date,
                                       const ledger::LotRegistry &lots) const = 0;

            /**
             * @brief Corporate action announced for a date, if any.
             * @throws ledger::UnrecognizedCorporateAction if the calendar entry
             *         cannot be classified
             */
            virtual std::optional<CorporateAction> corporate_action_at(const std::string &date) const = 0;

            /// Ordinary buys and sells are not accepted on a lock date.
            virtual bool is_lock_date(const std::string &date) const = 0;

            /// Priced dates in [start, end], ascending.
            virtual std::vector<std::string> priced_dates(const std::string &start,
                                                          const std::string &end) const = 0;
        };

    } // namespace instrument
} // namespace holding
