// SPDX-License-Identifier: MIT
/**
 * @file instruction.cpp
 * @brief Decoding of raw status values into tagged instructions
 */

#include "ledger/instruction.hpp"

#include <algorithm>
#include <cmath>

namespace holding
{
    namespace ledger
    {

        namespace
        {
            bool has_reinvest_marker(double value)
            {
                double scaled = value * 10.0;
                double fraction = scaled - std::trunc(scaled);
                double digit = std::round(fraction * 10.0) / 10.0;
                return std::abs(digit - 0.5) < 1e-9;
            }
        } // namespace

        Instruction Instruction::decode(const StatusInstruction &raw)
        {
            Instruction out;
            out.date = raw.date;
            double v = raw.value;

            if (v == 0.0 || !std::isfinite(v))
            {
                out.kind = InstructionKind::NONE;
                return out;
            }

            if (has_reinvest_marker(v))
            {
                // strip the hundredths marker, keep the invested amount
                out.kind = InstructionKind::REINVEST_DIVIDEND;
                out.amount = std::trunc(v * 10.0 + 1e-9) / 10.0;
                return out;
            }

            if (v > 0.0)
            {
                out.kind = InstructionKind::BUY;
                out.amount = v;
            }
            else if (v < kFullRedemptionMarker - 1e-12)
            {
                out.kind = InstructionKind::REDEEM_SHARES;
                out.amount = -v;
            }
            else
            {
                out.kind = InstructionKind::REDEEM_RATIO;
                out.amount = std::min(1.0, v / kFullRedemptionMarker);
            }
            return out;
        }

        std::string to_string(InstructionKind kind)
        {
            switch (kind)
            {
            case InstructionKind::NONE:
                return "none";
            case InstructionKind::BUY:
                return "buy";
            case InstructionKind::REINVEST_DIVIDEND:
                return "reinvest";
            case InstructionKind::REDEEM_RATIO:
                return "redeem_ratio";
            case InstructionKind::REDEEM_SHARES:
                return "redeem_shares";
            }
            return "unknown";
        }

        std::vector<Instruction> decode_all(const std::vector<StatusInstruction> &rows)
        {
            std::vector<Instruction> out;
            out.reserve(rows.size());
            for (const auto &row : rows)
            {
                if (row.value == 0.0)
                    continue;
                out.push_back(Instruction::decode(row));
            }
            return out;
        }

    } // namespace ledger
} // namespace holding
