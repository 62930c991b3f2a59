// SPDX-License-Identifier: MIT
#ifndef HOLDING_LEDGER_LOT_REGISTRY_HPP
#define HOLDING_LEDGER_LOT_REGISTRY_HPP

#include <string>
#include <vector>

namespace holding
{
    namespace ledger
    {

        /**
         * @struct Lot
         * @brief Shares acquired on a single date, tracked for FIFO consumption
         */
        struct Lot
        {
            std::string date;   ///< Acquisition date (YYYY-MM-DD)
            double shares = 0.0;///< Outstanding shares, never negative
        };

        struct SellResult;

        /**
         * @class LotRegistry
         * @brief Immutable, oldest-first collection of outstanding purchase lots
         *
         * Every operation is const and returns a new registry, so a registry
         * held by an earlier ledger snapshot is never affected by later trades.
         */
        class LotRegistry
        {
        public:
            LotRegistry() = default;
            explicit LotRegistry(std::vector<Lot> lots);

            // -- Queries
            const std::vector<Lot> &lots() const { return lots_; }
            size_t size() const { return lots_.size(); }
            bool empty() const { return lots_.empty(); }
            double total_shares() const;

            // -- Operations
            /**
             * @brief Append a new lot.
             * @throws std::invalid_argument if shares is negative or the date
             *         precedes the newest lot
             */
            LotRegistry buy(double shares, const std::string &date) const;

            /**
             * @brief Remove shares starting from the oldest lot.
             *
             * A lot is split when the requested amount falls in its middle.
             * Shares are rounded to the cent before consumption.
             *
             * @throws InsufficientShares if shares exceeds total_shares()
             * @throws std::invalid_argument if shares is negative or the date
             *         precedes the newest lot
             */
            SellResult sell(double shares, const std::string &date) const;

            /**
             * @brief Scale every lot by ratio, keeping acquisition dates.
             * @throws std::invalid_argument if ratio is not positive
             */
            LotRegistry split(double ratio, const std::string &date) const;

            /// Identity copy, for corporate actions that only move cash.
            LotRegistry passthrough() const;

            bool operator==(const LotRegistry &other) const;

        private:
            std::vector<Lot> lots_;

            void check_not_before_newest(const std::string &date, const char *op) const;
        };

        /**
         * @struct SellResult
         * @brief Outcome of a FIFO sell
         */
        struct SellResult
        {
            std::vector<Lot> consumed; ///< Lots (or lot fragments) removed, oldest first
            LotRegistry remaining;     ///< Registry after the sell
        };

    } // namespace ledger
} // namespace holding

#endif // HOLDING_LEDGER_LOT_REGISTRY_HPP
