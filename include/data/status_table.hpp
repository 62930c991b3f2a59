// SPDX-License-Identifier: MIT
/*
 * @file status_table.hpp
 * @brief Trading instructions of several holdings, one column per code.
 *
 * Rows are instruction dates, columns are instrument codes. A cell is the
 * encoded instruction value for that holding on that date (0 = no action).
 */

#ifndef HOLDING_DATA_STATUS_TABLE_HPP
#define HOLDING_DATA_STATUS_TABLE_HPP

#include "ledger/instruction.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace holding
{
    namespace data
    {
        /**
         * @class StatusTable
         * @brief Container for the instruction matrix (dates x codes).
         *
         * @note Dates are strictly increasing.
         * @note Missing cells are stored as 0.
         */
        class StatusTable
        {
        public:
            StatusTable() = default;

            /**
             * @brief Constructor with data.
             * @param values Instruction matrix (dates x codes).
             * @param dates Row dates (YYYY-MM-DD).
             * @param codes Column instrument codes, unique.
             * @throws std::invalid_argument on dimension mismatch, malformed or
             *         unordered dates, duplicate codes or non-finite cells
             */
            StatusTable(const Eigen::MatrixXd &values,
                        const std::vector<std::string> &dates,
                        const std::vector<std::string> &codes);

            ~StatusTable() = default;

            const Eigen::MatrixXd &get_values() const
            {
                return values_;
            }

            const std::vector<std::string> &get_dates() const
            {
                return dates_;
            }

            const std::vector<std::string> &get_codes() const
            {
                return codes_;
            }

            size_t num_dates() const
            {
                return dates_.size();
            }

            size_t num_codes() const
            {
                return codes_.size();
            }

            bool has_code(const std::string &code) const;

            /**
             * @brief Instruction rows of one holding, zero cells dropped.
             * @throws std::out_of_range if the code is not a column
             */
            std::vector<ledger::StatusInstruction> column(const std::string &code) const;

            /// Rows dated in [start, end].
            StatusTable filter_by_date(const std::string &start, const std::string &end) const;

            void print_summary() const;

        private:
            Eigen::MatrixXd values_;
            std::vector<std::string> dates_;
            std::vector<std::string> codes_;
            std::map<std::string, Eigen::Index> code_index_;
        };

    } // namespace data
} // namespace holding

#endif // HOLDING_DATA_STATUS_TABLE_HPP
