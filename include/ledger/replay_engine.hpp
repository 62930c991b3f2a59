// SPDX-License-Identifier: MIT
#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "instrument/instrument.hpp"
#include "ledger/instruction.hpp"
#include "ledger/ledger_history.hpp"

namespace holding
{
    namespace ledger
    {

        struct ReplayOptions
        {
            std::string end_date; ///< Last day scanned (inclusive); empty = yesterday
            bool verbose = false;

            static ReplayOptions from_json(const nlohmann::json &j);
        };

        /**
         * @class ReplayEngine
         * @brief Rebuilds a holding's ledger and lot history from its instructions.
         *
         * Walks the calendar one day at a time from the first purchase. A day
         * produces a ledger entry when it carries a corporate action, or a
         * non-zero instruction on a day that is not a lock date. Everything
         * is priced through the instrument.
         *
         * Fatal data problems surface as LedgerError subclasses
         * (InsufficientShares, PrematureSell, UnrecognizedCorporateAction);
         * running out of days or instructions is a normal return.
         *
         * Usage:
         * @code
         *   ReplayOptions opts;
         *   opts.end_date = "2021-12-31";
         *   LedgerHistory h = ReplayEngine(opts).run(fund, instructions);
         * @endcode
         */
        class ReplayEngine
        {
        public:
            explicit ReplayEngine(const ReplayOptions &options = ReplayOptions());
            ~ReplayEngine() = default;

            /**
             * @brief Replay one holding.
             * @param instrument Price/quote provider and corporate-action calendar.
             * @param status Raw instructions for this holding, any order, at most
             *        one per date.
             * @throws std::invalid_argument on duplicate or malformed dates, or
             *         when a later instruction falls before an earlier trade's
             *         settlement day
             */
            LedgerHistory run(const instrument::Instrument &instrument,
                              const std::vector<StatusInstruction> &status) const;

            const ReplayOptions &options() const { return options_; }

        private:
            ReplayOptions options_;

            struct ReplayState
            {
                const instrument::Instrument *instrument = nullptr;
                std::map<std::string, Instruction> instructions;
                std::string end_date;
                LedgerHistory history;
                double balance = 0.0;
            };

            ReplayState prepare(const instrument::Instrument &instrument,
                                const std::vector<StatusInstruction> &status) const;

            void append_first_entry(ReplayState &state) const;
            void append_next_entry(ReplayState &state) const;
            bool is_actionable(const ReplayState &state, const std::string &date) const;
            void replay_day(ReplayState &state, const std::string &date) const;
            // Throws if an instruction after date would be skipped by a trade
            // settling on settle_date.
            void check_settled_past(const ReplayState &state, const std::string &date,
                                    const std::string &settle_date) const;

            void log_entry(const LedgerEntry &entry, const std::string &what) const;
        };

    } // namespace ledger
} // namespace holding
