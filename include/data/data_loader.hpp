// SPDX-License-Identifier: MIT
/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads net value histories and instruction tables from CSV files and the
 * ledger configuration from JSON files.
 */

#ifndef HOLDING_DATA_DATA_LOADER_HPP
#define HOLDING_DATA_DATA_LOADER_HPP

#include "data/status_table.hpp"
#include "instrument/fee_schedule.hpp"
#include "instrument/fund_instrument.hpp"
#include "instrument/price_table.hpp"
#include "ledger/replay_engine.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace holding
{

    /**
     * @struct InstrumentConfig
     * @brief One held instrument: identity, price file and trading rules
     */
    struct InstrumentConfig
    {
        std::string code;                           ///< Column name in the status table
        std::string name;                           ///< Display name
        std::string price_file;                     ///< CSV with date,netvalue,comment
        std::vector<std::string> lock_dates;        ///< Days closed to buys and sells
        bool dividend_reinvest = false;             ///< Pay every dividend in shares
        instrument::FeeScheduleConfig fees;         ///< Purchase and redemption fees

        static InstrumentConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct StatusConfig
     * @brief Where the instruction table lives
     */
    struct StatusConfig
    {
        std::string file; ///< CSV with date,<code1>,<code2>,...

        static StatusConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct ReportConfig
     * @brief Parameters of the reports printed after replay
     */
    struct ReportConfig
    {
        std::string as_of;                  ///< Report date; empty = replay end date
        double xirr_guess = 0.1;            ///< IRR solver seed
        std::string volume_frequency = "M"; ///< D, W or M

        static ReportConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct OutputConfig
     * @brief Export destinations
     */
    struct OutputConfig
    {
        std::string directory = "output";
        bool export_ledger = true;
        bool export_lots = true;
        bool export_report = true;

        static OutputConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct LedgerConfig
     * @brief Complete replay configuration
     */
    struct LedgerConfig
    {
        std::vector<InstrumentConfig> instruments;
        StatusConfig status;
        ledger::ReplayOptions replay;
        ReportConfig report;
        OutputConfig output;

        /**
         * @brief Load complete configuration from JSON file
         */
        static LedgerConfig load_from_file(const std::string &config_path);
    };

    /**
     * @class DataLoader
     * @brief Loads and parses ledger input files
     *
     * Supported CSV formats:
     * - Net values: date,netvalue,comment (comment holds the corporate action)
     * - Instructions: date,CODE1,CODE2,... (wide format, empty cell = 0)
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        // ========================================================================
        // CSV Loading Methods
        // ========================================================================

        /**
         * @brief Load a net value history.
         *
         * Expected format:
         * date,netvalue,comment
         * 2021-01-04,1.0000,0
         * 2021-03-01,1.0500,0.05
         *
         * A comment of 0 or an empty comment means no corporate action. A
         * comment that is not a number is kept as NaN so the replay rejects it
         * when it reaches that day.
         *
         * @throws std::runtime_error if the file cannot be read or has no rows
         */
        static instrument::PriceTable load_price_csv(const std::string &filepath);

        /**
         * @brief Load an instruction table.
         *
         * Expected format:
         * date,F001,F002
         * 2021-01-04,1000,0
         * 2021-02-01,0,-0.005
         *
         * @param codes Columns to keep (all if empty).
         * @throws std::runtime_error if the file cannot be read or a requested
         *         code is missing
         */
        static data::StatusTable load_status_csv(const std::string &filepath,
                                                 const std::vector<std::string> &codes = {});

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load JSON configuration file
         * @throws std::runtime_error if file cannot be loaded
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load complete ledger configuration
         * @throws std::runtime_error on I/O or parse errors
         * @throws std::invalid_argument on invalid values
         */
        static LedgerConfig load_config(const std::string &config_path);

        /**
         * @brief Build an instrument from its configuration.
         * @param base_dir Directory relative price file paths are resolved against.
         */
        static std::shared_ptr<instrument::FundInstrument> build_instrument(const InstrumentConfig &config,
                                                                            const std::string &base_dir = "");

        // ========================================================================
        // Export Methods
        // ========================================================================

        static void save_price_csv(const instrument::PriceTable &prices, const std::string &filepath);

        static void save_status_csv(const data::StatusTable &status, const std::string &filepath);

    private:
        static std::vector<std::string> parse_csv_line(const std::string &line);
        static std::string trim(const std::string &str);

        /**
         * @brief Convert string to double safely
         * @return Double value, or NaN if conversion fails
         */
        static double safe_stod(const std::string &str);

        static std::string resolve_path(const std::string &path, const std::string &base_dir);
    };

} // namespace holding

#endif // HOLDING_DATA_DATA_LOADER_HPP
