// SPDX-License-Identifier: MIT
/**
 * @file holding.cpp
 * @brief Implementation of Holding reports and multi-holding IRR
 */

#include "valuation/holding.hpp"
#include "ledger/amounts.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace holding
{
    namespace valuation
    {

        using ledger::round_half_up;

        namespace
        {
            struct CashTotals
            {
                double contributed = 0.0;
                double returned = 0.0;
            };

            CashTotals sum_cash(const std::vector<ledger::LedgerEntry> &entries)
            {
                CashTotals t;
                for (const auto &e : entries)
                {
                    if (e.cash < 0.0)
                        t.contributed -= e.cash;
                    else
                        t.returned += e.cash;
                }
                return t;
            }
        } // namespace

        // ===================================================================
        // Construction
        // ===================================================================

        Holding::Holding(std::shared_ptr<const instrument::Instrument> instrument,
                         ledger::LedgerHistory history)
            : instrument_(std::move(instrument)), history_(std::move(history))
        {
            if (!instrument_)
            {
                throw std::invalid_argument("Holding requires an instrument");
            }
            history_.validate();
        }

        Holding Holding::replay(std::shared_ptr<const instrument::Instrument> instrument,
                                const std::vector<ledger::StatusInstruction> &status,
                                const ledger::ReplayOptions &options)
        {
            if (!instrument)
            {
                throw std::invalid_argument("Holding::replay requires an instrument");
            }
            ledger::LedgerHistory history = ledger::ReplayEngine(options).run(*instrument, status);
            return Holding(std::move(instrument), std::move(history));
        }

        // ===================================================================
        // Reports
        // ===================================================================

        DailyReport Holding::daily_report(const std::string &date) const
        {
            DailyReport r;
            r.date = date;
            r.code = instrument_->code();
            r.name = instrument_->name();

            ledger::LedgerHistory partial = history_.truncated(date);
            if (partial.empty())
            {
                // nothing held yet, but the day's net value is still reported
                try
                {
                    r.unit_value = instrument_->price_at(date);
                }
                catch (const std::out_of_range &)
                {
                    r.unit_value = 0.0; // date precedes the price history
                }
                return r;
            }

            CashTotals totals = sum_cash(partial.entries);

            r.unit_value = instrument_->price_at(date);
            r.shares = round_half_up(partial.total_shares());
            r.market_value = round_half_up(r.shares * r.unit_value);
            r.total_contributed = round_half_up(totals.contributed);
            r.total_returned = round_half_up(totals.returned);
            r.net_cost = round_half_up(totals.contributed - totals.returned);
            r.unit_cost = r.shares > 0.0 ? round_half_up(r.net_cost / r.shares, 4) : 0.0;
            r.bottleneck = valuation::bottleneck(partial.entries);
            r.turnover = valuation::turnover_rate(partial.entries, date);
            r.realized_gain = round_half_up(r.market_value + totals.returned - totals.contributed);
            r.return_rate = r.bottleneck == 0.0
                                ? 0.0
                                : round_half_up(r.realized_gain / r.bottleneck * 100.0, 4);
            return r;
        }

        std::optional<BriefReport> Holding::brief_report(const std::string &date) const
        {
            ledger::LedgerHistory partial = history_.truncated(date);
            if (partial.empty())
                return std::nullopt;

            BriefReport b;
            b.date = date;
            b.unit_value = instrument_->price_at(date);
            b.shares = round_half_up(partial.total_shares());
            b.value = round_half_up(b.shares * b.unit_value);
            return b;
        }

        double Holding::unit_cost(const std::string &date) const
        {
            ledger::LedgerHistory partial = history_.truncated(date);
            double shares = partial.total_shares();
            if (shares <= ledger::kAmountTolerance)
                return 0.0;

            CashTotals totals = sum_cash(partial.entries);
            return (totals.contributed - totals.returned) / shares;
        }

        double Holding::liquidation_proceeds(const std::string &date) const
        {
            ledger::LotRegistry lots = history_.registry_at(date);
            double shares = lots.total_shares();
            if (shares <= ledger::kAmountTolerance)
                return 0.0;
            return instrument_->quote_redeem(shares, date, lots).cash;
        }

        double Holding::xirr_rate(const std::string &date, double guess) const
        {
            return internal_rate_of_return(cashflows(history_.entries), {this}, date, guess);
        }

        double Holding::bottleneck(const std::string &date) const
        {
            return valuation::bottleneck(history_.truncated(date).entries);
        }

        double Holding::turnover_rate(const std::string &date) const
        {
            return valuation::turnover_rate(history_.truncated(date).entries, date);
        }

        // ===================================================================
        // Series
        // ===================================================================

        std::vector<std::string> Holding::series_dates(const std::string &start, const std::string &end) const
        {
            if (history_.empty())
                return {};
            std::string from = std::max(start, history_.entries.front().date);
            if (from > end)
                return {};
            return instrument_->priced_dates(from, end);
        }

        std::vector<SeriesPoint> Holding::value_series(const std::string &start, const std::string &end) const
        {
            std::vector<SeriesPoint> out;
            for (const auto &d : series_dates(start, end))
            {
                double shares = history_.truncated(d).total_shares();
                out.push_back(SeriesPoint{d, round_half_up(shares * instrument_->price_at(d))});
            }
            return out;
        }

        std::vector<SeriesPoint> Holding::cost_series(const std::string &start, const std::string &end) const
        {
            std::vector<SeriesPoint> out;
            for (const auto &d : series_dates(start, end))
            {
                out.push_back(SeriesPoint{d, round_half_up(unit_cost(d), 4)});
            }
            return out;
        }

        TradeVolume Holding::trade_volume(const std::string &freq) const
        {
            return aggregate_trade_volume(history_.entries, freq);
        }

        // ===================================================================
        // Multi-holding
        // ===================================================================

        double internal_rate_of_return(const std::vector<CashFlow> &flows,
                                       const std::vector<const Holding *> &holdings,
                                       const std::string &date,
                                       double guess)
        {
            std::vector<CashFlow> partial;
            for (const auto &f : flows)
            {
                if (f.date <= date)
                    partial.push_back(f);
            }
            if (partial.empty())
                return 0.0;

            double terminal = 0.0;
            for (const Holding *h : holdings)
            {
                if (h != nullptr)
                    terminal += h->liquidation_proceeds(date);
            }
            partial.push_back(CashFlow{date, terminal});
            return xirr(partial, guess);
        }

        std::vector<CashFlow> merge_cashflows(const std::vector<const Holding *> &holdings)
        {
            std::vector<CashFlow> out;
            for (const Holding *h : holdings)
            {
                if (h == nullptr)
                    continue;
                auto flows = cashflows(h->history().entries);
                out.insert(out.end(), flows.begin(), flows.end());
            }
            std::stable_sort(out.begin(), out.end(),
                             [](const CashFlow &a, const CashFlow &b) { return a.date < b.date; });
            return out;
        }

    } // namespace valuation
} // namespace holding
