// SPDX-License-Identifier: MIT
/**
 * @file returns.cpp
 * @brief Implementation of bottleneck, turnover and XIRR.
 *
 * XIRR evaluates the discounted sum over Eigen arrays of amounts and year
 * fractions, so each Newton step is a pair of vectorized reductions.
 */

#include "valuation/returns.hpp"
#include "data/date_utils.hpp"
#include "ledger/amounts.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace holding
{
    namespace valuation
    {

        namespace
        {
            constexpr double kDaysPerYear = 365.0;
            constexpr int kMaxNewtonIterations = 100;
            constexpr int kMaxBisectionIterations = 200;
            constexpr double kRateTolerance = 1e-10;
            constexpr double kLowerRate = -0.999999;

            struct DiscountInputs
            {
                Eigen::ArrayXd amounts;
                Eigen::ArrayXd years; ///< Year fractions from the earliest flow
            };

            DiscountInputs build_inputs(const std::vector<CashFlow> &flows)
            {
                DiscountInputs in;
                const Eigen::Index n = static_cast<Eigen::Index>(flows.size());
                in.amounts.resize(n);
                in.years.resize(n);

                std::string start = flows.front().date;
                for (const auto &f : flows)
                    start = std::min(start, f.date);

                for (Eigen::Index i = 0; i < n; ++i)
                {
                    const auto &f = flows[static_cast<size_t>(i)];
                    in.amounts(i) = f.amount;
                    in.years(i) = dates::days_between(start, f.date) / kDaysPerYear;
                }
                return in;
            }

            double npv_at(const DiscountInputs &in, double rate)
            {
                double log_base = std::log1p(rate);
                return (in.amounts * (-in.years * log_base).exp()).sum();
            }

            double npv_derivative_at(const DiscountInputs &in, double rate)
            {
                double log_base = std::log1p(rate);
                return (-in.years * in.amounts * (-(in.years + 1.0) * log_base).exp()).sum();
            }

            double bisect(const DiscountInputs &in)
            {
                double lo = kLowerRate;
                double hi = 1.0;
                double f_lo = npv_at(in, lo);
                double f_hi = npv_at(in, hi);

                while (f_lo * f_hi > 0.0 && hi < 1e6)
                {
                    hi *= 10.0;
                    f_hi = npv_at(in, hi);
                }
                if (!(f_lo * f_hi <= 0.0) || !std::isfinite(f_lo) || !std::isfinite(f_hi))
                {
                    throw std::runtime_error("xirr: no rate in (-100%, 1e8%) sets the net present value to zero");
                }

                for (int iter = 0; iter < kMaxBisectionIterations; ++iter)
                {
                    double mid = 0.5 * (lo + hi);
                    double f_mid = npv_at(in, mid);
                    if (f_mid == 0.0 || (hi - lo) < kRateTolerance)
                        return mid;
                    if ((f_mid < 0.0) == (f_lo < 0.0))
                    {
                        lo = mid;
                        f_lo = f_mid;
                    }
                    else
                    {
                        hi = mid;
                    }
                }
                return 0.5 * (lo + hi);
            }
        } // namespace

        // ===================================================================
        // Capital measures
        // ===================================================================

        double bottleneck(const std::vector<ledger::LedgerEntry> &entries)
        {
            if (entries.empty())
                return 0.0;

            double invested = 0.0;
            double peak = -std::numeric_limits<double>::infinity();
            for (const auto &e : entries)
            {
                invested -= e.cash;
                peak = std::max(peak, invested);
            }
            return ledger::round_half_up(peak);
        }

        double turnover_rate(const std::vector<ledger::LedgerEntry> &entries,
                             const std::string &end_date)
        {
            if (entries.empty())
                return 0.0;

            int days = dates::days_between(entries.front().date, end_date);
            if (days <= 0)
                return 0.0;

            double peak = bottleneck(entries);
            if (peak == 0.0)
                return 0.0;

            double traded = 0.0;
            for (const auto &e : entries)
                traded += std::abs(e.cash);

            double turnover = traded / peak / 2.0;
            return turnover * kDaysPerYear / static_cast<double>(days);
        }

        std::vector<CashFlow> cashflows(const std::vector<ledger::LedgerEntry> &entries)
        {
            std::vector<CashFlow> out;
            out.reserve(entries.size());
            for (const auto &e : entries)
                out.push_back(CashFlow{e.date, e.cash});
            return out;
        }

        // ===================================================================
        // XIRR
        // ===================================================================

        double xnpv(const std::vector<CashFlow> &flows, double rate)
        {
            if (flows.empty())
                return 0.0;
            if (!(rate > -1.0))
                throw std::invalid_argument("xnpv: rate must be > -1");
            return npv_at(build_inputs(flows), rate);
        }

        double xirr(const std::vector<CashFlow> &flows, double guess)
        {
            if (flows.empty())
                return 0.0;

            DiscountInputs in = build_inputs(flows);
            if (!((in.amounts > 0.0).any() && (in.amounts < 0.0).any()))
            {
                throw std::runtime_error("xirr: cash flows must contain both inflows and outflows");
            }

            double scale = std::max(1.0, in.amounts.abs().maxCoeff());
            double rate = guess > kLowerRate ? guess : 0.1;

            for (int iter = 0; iter < kMaxNewtonIterations; ++iter)
            {
                double f = npv_at(in, rate);
                if (std::abs(f) < 1e-9 * scale)
                    return rate;

                double df = npv_derivative_at(in, rate);
                if (!std::isfinite(f) || !std::isfinite(df) || df == 0.0)
                    break;

                double step = f / df;
                double next = rate - step;
                if (!(next > -1.0) || !std::isfinite(next))
                    break;

                rate = next;
                if (std::abs(step) < kRateTolerance)
                    return rate;
            }

            return bisect(in);
        }

    } // namespace valuation
} // namespace holding
