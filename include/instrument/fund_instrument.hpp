// SPDX-License-Identifier: MIT
#ifndef HOLDING_INSTRUMENT_FUND_INSTRUMENT_HPP
#define HOLDING_INSTRUMENT_FUND_INSTRUMENT_HPP

#include "instrument/instrument.hpp"
#include "instrument/fee_schedule.hpp"
#include "instrument/price_table.hpp"

#include <set>
#include <string>

namespace holding
{
    namespace instrument
    {

        /**
         * @class FundInstrument
         * @brief Table-driven open-end fund
         *
         * Purchases and redemptions settle at the net value of the first
         * priced day on or after the requested date. The purchase fee is a
         * flat percentage; the redemption fee is chosen per consumed lot by
         * how long that lot was held.
         *
         * Usage Example:
         * @code
         * FundInstrument fund("000001", "Sample Fund", prices, FeeSchedule(cfg));
         * Quote q = fund.quote_buy(1000.0, "2020-01-02");
         * @endcode
         */
        class FundInstrument : public Instrument
        {
        public:
            FundInstrument(const std::string &code,
                           const std::string &name,
                           const PriceTable &prices,
                           const FeeSchedule &fees = FeeSchedule(),
                           const std::set<std::string> &lock_dates = {},
                           bool dividend_reinvest = false);

            const std::string &code() const override { return code_; }
            const std::string &name() const override { return name_; }

            double price_at(const std::string &date) const override;

            Quote quote_buy(double amount, const std::string &date) const override;

            /**
             * @throws std::out_of_range if no price exists for the settlement
             * @throws ledger::InsufficientShares if shares exceed the registry
             */
            Quote quote_redeem(double shares, const std::string &date,
                               const ledger::LotRegistry &lots) const override;

            std::optional<CorporateAction> corporate_action_at(const std::string &date) const override;

            bool is_lock_date(const std::string &date) const override;

            std::vector<std::string> priced_dates(const std::string &start,
                                                  const std::string &end) const override;

            const PriceTable &prices() const { return prices_; }
            const FeeSchedule &fees() const { return fees_; }
            bool dividend_reinvest() const { return dividend_reinvest_; }

        private:
            std::string code_;
            std::string name_;
            PriceTable prices_;
            FeeSchedule fees_;
            std::set<std::string> lock_dates_;
            bool dividend_reinvest_;
        };

    } // namespace instrument
} // namespace holding

#endif // HOLDING_INSTRUMENT_FUND_INSTRUMENT_HPP
