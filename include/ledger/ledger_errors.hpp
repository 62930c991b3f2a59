// SPDX-License-Identifier: MIT
#pragma once

#include <stdexcept>
#include <string>

namespace holding
{
    namespace ledger
    {

        /**
         * @class LedgerError
         * @brief Base for fatal conditions that abort one holding's replay.
         *
         * These indicate malformed instruction or calendar data, not transient
         * failures, and are never retried.
         */
        class LedgerError : public std::runtime_error
        {
        public:
            explicit LedgerError(const std::string &msg) : std::runtime_error(msg) {}
        };

        /// A redemption asked for more shares than the lot registry holds.
        class InsufficientShares : public LedgerError
        {
        public:
            explicit InsufficientShares(const std::string &msg)
                : LedgerError("Insufficient shares: " + msg) {}
        };

        /// A redemption instruction precedes the first purchase.
        class PrematureSell : public LedgerError
        {
        public:
            explicit PrematureSell(const std::string &msg)
                : LedgerError("Premature sell: " + msg) {}
        };

        /// A corporate-action value is neither a split nor a dividend.
        class UnrecognizedCorporateAction : public LedgerError
        {
        public:
            explicit UnrecognizedCorporateAction(const std::string &msg)
                : LedgerError("Unrecognized corporate action: " + msg) {}
        };

        /// Reporting layer was asked for a grouping unit it does not implement.
        class UnsupportedAggregationFrequency : public std::invalid_argument
        {
        public:
            explicit UnsupportedAggregationFrequency(const std::string &freq)
                : std::invalid_argument("Unsupported aggregation frequency: " + freq) {}
        };

    } // namespace ledger
} // namespace holding
