// SPDX-License-Identifier: MIT
/**
 * @file holding.hpp
 * @brief A replayed holding and its point-in-time reports.
 *
 * Pairs an instrument with the ledger history replayed for it and derives
 * valuation reports, unit cost, realized rate of return and the series
 * consumed by charting front-ends.
 */

#ifndef HOLDING_VALUATION_HOLDING_HPP
#define HOLDING_VALUATION_HOLDING_HPP

#include "instrument/instrument.hpp"
#include "ledger/instruction.hpp"
#include "ledger/ledger_history.hpp"
#include "ledger/replay_engine.hpp"
#include "valuation/returns.hpp"
#include "valuation/trade_volume.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace holding
{
    namespace valuation
    {

        /**
         * @struct DailyReport
         * @brief Full position report of a holding as of a date.
         */
        struct DailyReport
        {
            std::string date;
            std::string code;
            std::string name;
            double unit_value = 0.0;        ///< Net value in effect on date
            double unit_cost = 0.0;         ///< (contributed - returned) / shares, 4 decimals
            double shares = 0.0;            ///< Share balance
            double market_value = 0.0;      ///< shares * unit_value
            double total_contributed = 0.0; ///< Sum of purchases (sign flipped)
            double bottleneck = 0.0;        ///< Peak capital at risk
            double net_cost = 0.0;          ///< contributed - returned
            double total_returned = 0.0;    ///< Redemptions and cash dividends
            double turnover = 0.0;          ///< Annualized turnover rate
            double realized_gain = 0.0;     ///< market_value + returned - contributed
            double return_rate = 0.0;       ///< realized_gain / bottleneck in percent, 4 decimals
        };

        /**
         * @struct BriefReport
         * @brief Frequently used subset of DailyReport.
         */
        struct BriefReport
        {
            std::string date;
            double unit_value = 0.0;
            double shares = 0.0;
            double value = 0.0;
        };

        struct SeriesPoint
        {
            std::string date;
            double value = 0.0;
        };

        /**
         * @class Holding
         * @brief Replayed position in one instrument.
         *
         * Immutable after construction; all queries are const.
         */
        class Holding
        {
        public:
            Holding(std::shared_ptr<const instrument::Instrument> instrument,
                    ledger::LedgerHistory history);

            /**
             * @brief Replay instructions against an instrument.
             * @throws ledger::LedgerError on malformed instruction data
             */
            static Holding replay(std::shared_ptr<const instrument::Instrument> instrument,
                                  const std::vector<ledger::StatusInstruction> &status,
                                  const ledger::ReplayOptions &options = ledger::ReplayOptions());

            const instrument::Instrument &instrument() const { return *instrument_; }
            const ledger::LedgerHistory &history() const { return history_; }

            DailyReport daily_report(const std::string &date) const;

            /// Empty when nothing had been bought by date.
            std::optional<BriefReport> brief_report(const std::string &date) const;

            /// Net money put in divided by shares held, 0 when nothing is held.
            double unit_cost(const std::string &date) const;

            /**
             * @brief Cash received if every share held on date were redeemed then.
             *
             * Quoted through the instrument against the lot registry in effect
             * on date, so age-tiered redemption fees apply.
             */
            double liquidation_proceeds(const std::string &date) const;

            /// Realized IRR with all shares virtually redeemed on date.
            double xirr_rate(const std::string &date, double guess = 0.1) const;

            double bottleneck(const std::string &date) const;
            double turnover_rate(const std::string &date) const;

            /// Position value on every priced day from the first purchase to end.
            std::vector<SeriesPoint> value_series(const std::string &start, const std::string &end) const;

            /// Unit cost on every priced day from the first purchase to end.
            std::vector<SeriesPoint> cost_series(const std::string &start, const std::string &end) const;

            TradeVolume trade_volume(const std::string &freq) const;

        private:
            std::shared_ptr<const instrument::Instrument> instrument_;
            ledger::LedgerHistory history_;

            std::vector<std::string> series_dates(const std::string &start, const std::string &end) const;
        };

        /**
         * @brief IRR across several holdings.
         *
         * Truncates the aggregated cash-flow series at date and appends one
         * terminal flow: the summed liquidation proceeds of every holding.
         *
         * @return 0 if no flow is dated on or before date.
         */
        double internal_rate_of_return(const std::vector<CashFlow> &flows,
                                       const std::vector<const Holding *> &holdings,
                                       const std::string &date,
                                       double guess = 0.1);

        /// Concatenated ledger cash flows of several holdings, date-ordered.
        std::vector<CashFlow> merge_cashflows(const std::vector<const Holding *> &holdings);

    } // namespace valuation
} // namespace holding

#endif // HOLDING_VALUATION_HOLDING_HPP
