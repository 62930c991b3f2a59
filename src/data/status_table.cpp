// SPDX-License-Identifier: MIT
/**
 * @file status_table.cpp
 * @brief Implementation of StatusTable
 */

#include "data/status_table.hpp"
#include "data/date_utils.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace holding
{
    namespace data
    {

        StatusTable::StatusTable(const Eigen::MatrixXd &values,
                                 const std::vector<std::string> &dates,
                                 const std::vector<std::string> &codes)
            : values_(values), dates_(dates), codes_(codes)
        {
            if (static_cast<size_t>(values_.rows()) != dates_.size())
            {
                throw std::invalid_argument("Status table rows must match number of dates");
            }
            if (static_cast<size_t>(values_.cols()) != codes_.size())
            {
                throw std::invalid_argument("Status table columns must match number of codes");
            }

            for (size_t i = 0; i < dates_.size(); ++i)
            {
                if (!dates::is_valid_date(dates_[i]))
                {
                    throw std::invalid_argument("Invalid status date: '" + dates_[i] + "'");
                }
                if (i > 0 && dates_[i] <= dates_[i - 1])
                {
                    throw std::invalid_argument("Status dates must be strictly increasing at " + dates_[i]);
                }
            }

            for (size_t j = 0; j < codes_.size(); ++j)
            {
                if (!code_index_.emplace(codes_[j], static_cast<Eigen::Index>(j)).second)
                {
                    throw std::invalid_argument("Duplicate status column: " + codes_[j]);
                }
            }

            if (!values_.allFinite())
            {
                throw std::invalid_argument("Status table contains non-finite values");
            }
        }

        bool StatusTable::has_code(const std::string &code) const
        {
            return code_index_.count(code) > 0;
        }

        std::vector<ledger::StatusInstruction> StatusTable::column(const std::string &code) const
        {
            auto it = code_index_.find(code);
            if (it == code_index_.end())
            {
                throw std::out_of_range("Code not found in status table: " + code);
            }

            std::vector<ledger::StatusInstruction> rows;
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                double v = values_(static_cast<Eigen::Index>(i), it->second);
                if (v != 0.0)
                {
                    rows.push_back(ledger::StatusInstruction{dates_[i], v});
                }
            }
            return rows;
        }

        StatusTable StatusTable::filter_by_date(const std::string &start, const std::string &end) const
        {
            std::vector<std::string> kept_dates;
            std::vector<Eigen::Index> kept_rows;
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                if (dates_[i] >= start && dates_[i] <= end)
                {
                    kept_dates.push_back(dates_[i]);
                    kept_rows.push_back(static_cast<Eigen::Index>(i));
                }
            }

            Eigen::MatrixXd filtered(static_cast<Eigen::Index>(kept_rows.size()), values_.cols());
            for (size_t r = 0; r < kept_rows.size(); ++r)
            {
                filtered.row(static_cast<Eigen::Index>(r)) = values_.row(kept_rows[r]);
            }
            return StatusTable(filtered, kept_dates, codes_);
        }

        void StatusTable::print_summary() const
        {
            std::cout << "\n=== Status Table Summary ===\n";
            std::cout << "Holdings: " << num_codes() << "\n";
            std::cout << "Instruction dates: " << num_dates() << "\n";
            if (!dates_.empty())
            {
                std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
            }
            for (size_t j = 0; j < codes_.size(); ++j)
            {
                Eigen::Index active = (values_.col(static_cast<Eigen::Index>(j)).array() != 0.0).count();
                std::cout << "  " << codes_[j] << ": " << active << " instructions\n";
            }
            std::cout << std::endl;
        }

    } // namespace data
} // namespace holding
