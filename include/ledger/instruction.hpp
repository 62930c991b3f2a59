// SPDX-License-Identifier: MIT
#ifndef HOLDING_LEDGER_INSTRUCTION_HPP
#define HOLDING_LEDGER_INSTRUCTION_HPP

#include <string>
#include <vector>

namespace holding
{
    namespace ledger
    {

        /**
         * @struct StatusInstruction
         * @brief Raw user instruction for one holding on one date (0 = none)
         */
        struct StatusInstruction
        {
            std::string date;
            double value = 0.0;
        };

        /**
         * @enum InstructionKind
         * @brief Action encoded by the magnitude of a status value
         */
        enum class InstructionKind
        {
            NONE,             ///< value == 0
            BUY,              ///< value > 0, amount of money to invest
            REINVEST_DIVIDEND,///< tenths-fraction digit 5; same-day dividend is reinvested
            REDEEM_RATIO,     ///< -0.005 <= value < 0, fraction of current shares
            REDEEM_SHARES     ///< value < -0.005, number of shares
        };

        /**
         * @struct Instruction
         * @brief Decoded instruction handed to the replay state machine
         *
         * For BUY and REINVEST_DIVIDEND, amount is the money to invest (may be
         * 0 for a pure reinvestment marker). For REDEEM_SHARES it is the share
         * count, for REDEEM_RATIO the fraction of the balance in (0, 1].
         */
        struct Instruction
        {
            std::string date;
            InstructionKind kind = InstructionKind::NONE;
            double amount = 0.0;

            bool is_purchase() const
            {
                return (kind == InstructionKind::BUY || kind == InstructionKind::REINVEST_DIVIDEND) &&
                       amount > 0.0;
            }

            bool is_redemption() const
            {
                return kind == InstructionKind::REDEEM_RATIO || kind == InstructionKind::REDEEM_SHARES;
            }

            /**
             * @brief Decode a raw status value.
             *
             * The value -0.005 is the boundary between ratio and share-count
             * redemption and means "redeem 100%". A value whose tenths-fraction
             * digit is 5 (e.g. 1000.05 or 0.05) marks a reinvestment day and
             * invests the value truncated to tenths: 1000.05 invests 1000.0,
             * 0.15 invests 0.1 and a bare 0.05 invests nothing.
             */
            static Instruction decode(const StatusInstruction &raw);
        };

        /// Threshold separating ratio redemption from share-count redemption.
        constexpr double kFullRedemptionMarker = -0.005;

        std::string to_string(InstructionKind kind);

        /// Drop zero rows and decode the rest, keeping date order.
        std::vector<Instruction> decode_all(const std::vector<StatusInstruction> &rows);

    } // namespace ledger
} // namespace holding

#endif // HOLDING_LEDGER_INSTRUCTION_HPP
