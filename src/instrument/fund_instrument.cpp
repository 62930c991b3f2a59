// SPDX-License-Identifier: MIT
/**
 * @file fund_instrument.cpp
 * @brief Implementation of FundInstrument and corporate-action decoding
 */

#include "instrument/fund_instrument.hpp"
#include "data/date_utils.hpp"
#include "ledger/amounts.hpp"
#include "ledger/ledger_errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace holding
{
    namespace instrument
    {

        // ============================================================================
        // CorporateAction
        // ============================================================================

        CorporateAction CorporateAction::decode(const std::string &date, double raw, bool reinvest)
        {
            if (!std::isfinite(raw) || raw == 0.0)
            {
                std::ostringstream msg;
                msg << "value '" << raw << "' on " << date << " is neither a split nor a dividend";
                throw ledger::UnrecognizedCorporateAction(msg.str());
            }

            CorporateAction action;
            action.date = date;
            if (raw < 0.0)
            {
                action.type = CorporateActionType::SPLIT;
                action.value = -raw;
            }
            else
            {
                action.type = CorporateActionType::DIVIDEND;
                action.value = raw;
                action.reinvest = reinvest;
            }
            return action;
        }

        // ============================================================================
        // FundInstrument
        // ============================================================================

        FundInstrument::FundInstrument(const std::string &code,
                                       const std::string &name,
                                       const PriceTable &prices,
                                       const FeeSchedule &fees,
                                       const std::set<std::string> &lock_dates,
                                       bool dividend_reinvest)
            : code_(code), name_(name), prices_(prices), fees_(fees),
              lock_dates_(lock_dates), dividend_reinvest_(dividend_reinvest)
        {
            if (prices_.empty())
            {
                throw std::invalid_argument("price table for " + code + " must not be empty");
            }
        }

        double FundInstrument::price_at(const std::string &date) const
        {
            return prices_.value_at(date);
        }

        Quote FundInstrument::quote_buy(double amount, const std::string &date) const
        {
            if (!(amount > 0.0))
            {
                std::ostringstream msg;
                msg << "purchase amount must be > 0, got " << amount;
                throw std::invalid_argument(msg.str());
            }

            auto idx = prices_.first_on_or_after(date);
            if (!idx)
            {
                throw std::out_of_range("no net value on or after " + date + " to settle purchase of " + code_);
            }

            Quote q;
            q.settle_date = prices_.get_dates()[*idx];
            double nav = prices_.get_net_values()(static_cast<Eigen::Index>(*idx));
            q.shares = fees_.purchase_shares(amount, nav);
            q.cash = -ledger::round_half_up(amount);
            return q;
        }

        Quote FundInstrument::quote_redeem(double shares, const std::string &date,
                                           const ledger::LotRegistry &lots) const
        {
            auto idx = prices_.first_on_or_after(date);
            if (!idx)
            {
                // virtual liquidation after the last published value
                idx = prices_.last_on_or_before(date);
            }
            if (!idx)
            {
                throw std::out_of_range("no net value around " + date + " to settle redemption of " + code_);
            }

            Quote q;
            q.settle_date = prices_.get_dates()[*idx];
            double nav = prices_.get_net_values()(static_cast<Eigen::Index>(*idx));

            auto sold = lots.sell(shares, q.settle_date);
            double proceeds = 0.0;
            double sold_shares = 0.0;
            for (const auto &lot : sold.consumed)
            {
                int held = dates::days_between(lot.date, q.settle_date);
                proceeds += fees_.redemption_proceeds(lot.shares, nav, held);
                sold_shares += lot.shares;
            }

            q.cash = ledger::round_half_up(proceeds);
            q.shares = -ledger::round_half_up(sold_shares);
            return q;
        }

        std::optional<CorporateAction> FundInstrument::corporate_action_at(const std::string &date) const
        {
            auto raw = prices_.action_at(date);
            if (!raw)
                return std::nullopt;
            return CorporateAction::decode(date, *raw, dividend_reinvest_);
        }

        bool FundInstrument::is_lock_date(const std::string &date) const
        {
            return lock_dates_.count(date) > 0;
        }

        std::vector<std::string> FundInstrument::priced_dates(const std::string &start,
                                                              const std::string &end) const
        {
            return prices_.dates_between(start, end);
        }

    } // namespace instrument
} // namespace holding
