// SPDX-License-Identifier: MIT
#ifndef HOLDING_LEDGER_LEDGER_HISTORY_HPP
#define HOLDING_LEDGER_LEDGER_HISTORY_HPP

#include "ledger/lot_registry.hpp"

#include <string>
#include <vector>

namespace holding
{
    namespace ledger
    {

        /**
         * @struct LedgerEntry
         * @brief Cash and share movement of one holding on one date
         */
        struct LedgerEntry
        {
            std::string date;    ///< Settlement date (YYYY-MM-DD)
            double cash = 0.0;   ///< < 0 paid out, > 0 received
            double shares = 0.0; ///< Signed share delta
        };

        /**
         * @struct LotRegistrySnapshot
         * @brief Lot registry as it stood after the ledger entry of the same date
         */
        struct LotRegistrySnapshot
        {
            std::string date;
            LotRegistry lots;
        };

        /**
         * @struct LedgerHistory
         * @brief Replay output: parallel, date-aligned entries and snapshots
         */
        struct LedgerHistory
        {
            std::vector<LedgerEntry> entries;
            std::vector<LotRegistrySnapshot> snapshots;

            bool empty() const { return entries.empty(); }
            size_t size() const { return entries.size(); }

            void append(const LedgerEntry &entry, const LotRegistry &lots);

            /// Entries and snapshots dated on or before date.
            LedgerHistory truncated(const std::string &date) const;

            /// Registry in effect at date (empty before the first entry).
            LotRegistry registry_at(const std::string &date) const;

            /// Sum of share deltas of all entries.
            double total_shares() const;

            /**
             * @brief Check the structural invariants.
             *
             * Same length, same dates, strictly increasing dates, and every
             * snapshot's lot total equal to the running share balance.
             *
             * @throws std::logic_error describing the first violation
             */
            void validate() const;
        };

    } // namespace ledger
} // namespace holding

#endif // HOLDING_LEDGER_LEDGER_HISTORY_HPP
