// SPDX-License-Identifier: MIT

#include "ledger/replay_engine.hpp"
#include "data/date_utils.hpp"
#include "ledger/amounts.hpp"
#include "ledger/ledger_errors.hpp"

#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace holding
{
    namespace ledger
    {

        using instrument::CorporateActionType;
        using instrument::Quote;

        namespace
        {
            // Normal end of replay: no further actionable day up to the end date.
            struct EndOfInput
            {
            };
        } // namespace

        // ------------------------- ReplayOptions --------------------------------
        ReplayOptions ReplayOptions::from_json(const nlohmann::json &j)
        {
            ReplayOptions o;
            if (!j.is_object())
                return o;
            o.end_date = j.value("end_date", std::string());
            o.verbose = j.value("verbose", false);
            if (!o.end_date.empty() && !dates::is_valid_date(o.end_date))
                throw std::invalid_argument("replay end_date must be YYYY-MM-DD, got: " + o.end_date);
            return o;
        }

        // ------------------------- ReplayEngine ---------------------------------
        ReplayEngine::ReplayEngine(const ReplayOptions &options) : options_(options) {}

        LedgerHistory ReplayEngine::run(const instrument::Instrument &instrument,
                                        const std::vector<StatusInstruction> &status) const
        {
            ReplayState state = prepare(instrument, status);

            try
            {
                append_first_entry(state);
                while (true)
                {
                    append_next_entry(state);
                }
            }
            catch (const EndOfInput &)
            {
            }

            if (options_.verbose)
            {
                std::cout << "Replayed " << instrument.code() << ": " << state.history.size()
                          << " ledger entries, " << state.balance << " shares held\n";
            }
            return state.history;
        }

        ReplayEngine::ReplayState ReplayEngine::prepare(const instrument::Instrument &instrument,
                                                        const std::vector<StatusInstruction> &status) const
        {
            ReplayState state;
            state.instrument = &instrument;
            state.end_date = options_.end_date.empty() ? dates::yesterday() : options_.end_date;

            for (const auto &row : status)
            {
                if (!dates::is_valid_date(row.date))
                    throw std::invalid_argument("invalid instruction date: '" + row.date + "'");
                if (row.value == 0.0 || row.date > state.end_date)
                    continue;
                auto inserted = state.instructions.emplace(row.date, Instruction::decode(row));
                if (!inserted.second)
                {
                    // same-day buy and sell must be merged upstream
                    throw std::invalid_argument("more than one instruction on " + row.date +
                                                " for " + instrument.code());
                }
            }
            return state;
        }

        void ReplayEngine::append_first_entry(ReplayState &state) const
        {
            const auto &inst = *state.instrument;

            auto it = state.instructions.begin();
            while (it != state.instructions.end() && inst.is_lock_date(it->first))
                ++it;
            if (it == state.instructions.end())
                throw EndOfInput{};

            const Instruction &first = it->second;
            if (!first.is_purchase())
            {
                throw PrematureSell("first instruction for " + inst.code() + " on " + first.date +
                                    " is '" + to_string(first.kind) + "', not a purchase");
            }
            Quote q = inst.quote_buy(first.amount, first.date);
            for (const std::string &day : {first.date, q.settle_date})
            {
                if (inst.corporate_action_at(day))
                {
                    throw UnrecognizedCorporateAction("corporate action on " + day +
                                                      ", the first purchase date of " + inst.code() +
                                                      ", is not supported");
                }
            }
            check_settled_past(state, first.date, q.settle_date);

            LotRegistry lots = LotRegistry().buy(q.shares, q.settle_date);
            LedgerEntry entry{q.settle_date, q.cash, q.shares};

            state.history.append(entry, lots);
            state.balance = round_half_up(q.shares);
            log_entry(entry, "first purchase");
        }

        void ReplayEngine::append_next_entry(ReplayState &state) const
        {
            std::string date = dates::add_days(state.history.entries.back().date, 1);
            while (true)
            {
                if (date > state.end_date)
                    throw EndOfInput{};
                if (is_actionable(state, date))
                    break;
                date = dates::add_days(date, 1);
            }
            replay_day(state, date);
        }

        bool ReplayEngine::is_actionable(const ReplayState &state, const std::string &date) const
        {
            const auto &inst = *state.instrument;
            if (inst.corporate_action_at(date))
                return true;
            if (state.instructions.count(date) == 0)
                return false;
            // lock date without corporate action: not visited at all
            return !inst.is_lock_date(date);
        }

        void ReplayEngine::replay_day(ReplayState &state, const std::string &date) const
        {
            const auto &inst = *state.instrument;
            const double balance_before = state.balance;

            LotRegistry lots = state.history.snapshots.back().lots;
            LedgerEntry entry{date, 0.0, 0.0};
            bool reinvest_day = false;
            std::ostringstream what;

            // -- user instruction (ignored on lock dates)
            auto it = state.instructions.find(date);
            if (it != state.instructions.end() && !inst.is_lock_date(date))
            {
                const Instruction &ins = it->second;
                reinvest_day = ins.kind == InstructionKind::REINVEST_DIVIDEND;
                what << to_string(ins.kind);

                if (ins.is_purchase())
                {
                    Quote q = inst.quote_buy(ins.amount, date);
                    check_settled_past(state, date, q.settle_date);
                    lots = lots.buy(q.shares, q.settle_date);
                    entry.date = q.settle_date;
                    entry.cash += q.cash;
                    entry.shares += q.shares;
                }
                else if (ins.is_redemption())
                {
                    double shares = ins.kind == InstructionKind::REDEEM_RATIO
                                        ? balance_before * ins.amount
                                        : ins.amount;
                    Quote q = inst.quote_redeem(shares, date, lots);
                    check_settled_past(state, date, q.settle_date);
                    lots = lots.sell(-q.shares, q.settle_date).remaining;
                    entry.date = q.settle_date;
                    entry.cash += q.cash;
                    entry.shares += q.shares;
                }
            }

            // -- corporate action (applied on lock dates too); a trade settling
            // later takes the action of its settlement day
            std::string action_date = date;
            auto action = inst.corporate_action_at(date);
            if (!action && entry.date > date)
            {
                action_date = entry.date;
                action = inst.corporate_action_at(action_date);
            }
            if (action)
            {
                reinvest_day = reinvest_day || action->reinvest;
                if (what.tellp() > 0)
                    what << " + ";

                if (action->type == CorporateActionType::SPLIT)
                {
                    double added = 0.0;
                    for (const auto &lot : lots.lots())
                        added += round_half_up(lot.shares * (action->value - 1.0));
                    lots = lots.split(action->value, action_date);
                    entry.shares += added;
                    what << "split x" << action->value;
                }
                else if (!reinvest_day)
                {
                    entry.cash += round_half_up(balance_before * action->value);
                    lots = lots.passthrough();
                    what << "dividend " << action->value << "/share";
                }
                else
                {
                    double nav = inst.price_at(action_date);
                    double added = round_half_up(balance_before * (action->value / nav));
                    lots = lots.buy(added, action_date);
                    entry.shares += added;
                    what << "reinvested dividend " << action->value << "/share";
                }
            }

            state.history.append(entry, lots);
            state.balance = round_half_up(state.balance + entry.shares);
            log_entry(entry, what.str());
        }

        void ReplayEngine::check_settled_past(const ReplayState &state, const std::string &date,
                                              const std::string &settle_date) const
        {
            if (settle_date <= date)
                return;
            auto it = state.instructions.upper_bound(date);
            for (; it != state.instructions.end() && it->first <= settle_date; ++it)
            {
                if (state.instrument->is_lock_date(it->first))
                    continue;
                // both settle on the same day and must be merged upstream
                throw std::invalid_argument("instruction on " + it->first + " for " +
                                            state.instrument->code() + " falls before the " +
                                            settle_date + " settlement of the one on " + date +
                                            " and must be merged upstream");
            }
        }

        void ReplayEngine::log_entry(const LedgerEntry &entry, const std::string &what) const
        {
            if (!options_.verbose)
                return;
            std::ostringstream line;
            line << "  [replay] " << entry.date << "  " << std::setw(24) << std::left << what
                 << std::right << std::fixed << std::setprecision(2)
                 << " cash " << std::setw(12) << entry.cash
                 << " shares " << std::setw(12) << entry.shares << "\n";
            std::cout << line.str();
        }

    } // namespace ledger
} // namespace holding
