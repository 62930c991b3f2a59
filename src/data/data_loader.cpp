// SPDX-License-Identifier: MIT
/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <set>
#include <sstream>

namespace holding
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    InstrumentConfig InstrumentConfig::from_json(const nlohmann::json &j)
    {
        InstrumentConfig config;
        config.code = j.value("code", "");
        config.name = j.value("name", config.code);
        config.price_file = j.value("price_file", "");
        config.lock_dates = j.value("lock_dates", std::vector<std::string>{});
        config.dividend_reinvest = j.value("dividend_reinvest", false);

        if (j.contains("fees"))
        {
            config.fees = instrument::FeeScheduleConfig::from_json(j["fees"]);
        }
        else
        {
            config.fees = instrument::FeeScheduleConfig::default_config();
        }

        if (config.code.empty())
        {
            throw std::invalid_argument("instrument entry requires a 'code'");
        }
        if (config.price_file.empty())
        {
            throw std::invalid_argument("instrument " + config.code + " requires a 'price_file'");
        }
        for (const auto &d : config.lock_dates)
        {
            if (!dates::is_valid_date(d))
            {
                throw std::invalid_argument("instrument " + config.code + " has invalid lock date: " + d);
            }
        }
        return config;
    }

    StatusConfig StatusConfig::from_json(const nlohmann::json &j)
    {
        StatusConfig config;
        config.file = j.value("file", "data/status.csv");
        return config;
    }

    ReportConfig ReportConfig::from_json(const nlohmann::json &j)
    {
        ReportConfig config;
        config.as_of = j.value("as_of", "");
        config.xirr_guess = j.value("xirr_guess", 0.1);
        config.volume_frequency = j.value("volume_frequency", "M");

        if (!config.as_of.empty() && !dates::is_valid_date(config.as_of))
        {
            throw std::invalid_argument("report as_of must be YYYY-MM-DD, got: " + config.as_of);
        }
        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "output");
        config.export_ledger = j.value("export_ledger", true);
        config.export_lots = j.value("export_lots", true);
        config.export_report = j.value("export_report", true);
        return config;
    }

    LedgerConfig LedgerConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - Net Values
    // ===========================

    instrument::PriceTable DataLoader::load_price_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.size() < 2 || trim(header[0]) != "date")
        {
            throw std::runtime_error("Price CSV must start with 'date,netvalue': " + filepath);
        }

        std::vector<std::string> dates;
        std::vector<double> values;
        std::map<std::string, double> actions;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 2)
                continue;

            std::string date = trim(fields[0]);
            if (!dates::is_valid_date(date))
            {
                continue; // Skip invalid dates
            }

            double nav = safe_stod(fields[1]);
            if (!std::isfinite(nav))
            {
                throw std::runtime_error("Invalid net value on " + date + " in " + filepath);
            }
            dates.push_back(date);
            values.push_back(nav);

            if (fields.size() > 2)
            {
                std::string comment = trim(fields[2]);
                if (comment.empty())
                    continue;
                double raw = safe_stod(comment);
                if (raw != 0.0)
                {
                    actions[date] = raw; // NaN kept for unparseable comments
                }
            }
        }

        if (dates.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        Eigen::VectorXd nav(static_cast<Eigen::Index>(values.size()));
        for (size_t i = 0; i < values.size(); ++i)
        {
            nav(static_cast<Eigen::Index>(i)) = values[i];
        }

        return instrument::PriceTable(dates, nav, actions);
    }

    // ===========================
    // CSV Loading - Instructions
    // ===========================

    data::StatusTable DataLoader::load_status_csv(const std::string &filepath,
                                                  const std::vector<std::string> &codes)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> all_codes;
        for (size_t i = 1; i < header.size(); ++i)
        {
            all_codes.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_codes;
        if (codes.empty())
        {
            for (size_t i = 0; i < all_codes.size(); ++i)
            {
                column_indices.push_back(i);
                selected_codes.push_back(all_codes[i]);
            }
        }
        else
        {
            for (const auto &code : codes)
            {
                auto it = std::find(all_codes.begin(), all_codes.end(), code);
                if (it == all_codes.end())
                {
                    throw std::runtime_error("Code " + code + " not found in " + filepath);
                }
                column_indices.push_back(static_cast<size_t>(std::distance(all_codes.begin(), it)));
                selected_codes.push_back(code);
            }
        }

        // Rows keyed by date so the table comes out ordered
        std::map<std::string, std::vector<double>> rows;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!dates::is_valid_date(date))
            {
                continue;
            }

            std::vector<double> row;
            row.reserve(column_indices.size());
            for (size_t idx : column_indices)
            {
                double v = 0.0;
                if (idx + 1 < fields.size() && !trim(fields[idx + 1]).empty())
                {
                    v = safe_stod(fields[idx + 1]);
                    if (!std::isfinite(v))
                    {
                        throw std::runtime_error("Invalid instruction for " + all_codes[idx] + " on " + date);
                    }
                }
                row.push_back(v);
            }

            if (!rows.emplace(date, row).second)
            {
                throw std::runtime_error("Duplicate instruction date " + date + " in " + filepath);
            }
        }

        Eigen::MatrixXd values(static_cast<Eigen::Index>(rows.size()),
                               static_cast<Eigen::Index>(selected_codes.size()));
        std::vector<std::string> dates;
        Eigen::Index r = 0;
        for (const auto &kv : rows)
        {
            dates.push_back(kv.first);
            for (size_t c = 0; c < kv.second.size(); ++c)
            {
                values(r, static_cast<Eigen::Index>(c)) = kv.second[c];
            }
            ++r;
        }

        return data::StatusTable(values, dates, selected_codes);
    }

    // ===========================
    // Configuration Loading
    // ===========================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    LedgerConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        LedgerConfig config;

        if (j.contains("instruments"))
        {
            std::set<std::string> seen;
            for (const auto &item : j["instruments"])
            {
                InstrumentConfig ic = InstrumentConfig::from_json(item);
                if (!seen.insert(ic.code).second)
                {
                    throw std::invalid_argument("duplicate instrument code in config: " + ic.code);
                }
                config.instruments.push_back(ic);
            }
        }

        if (j.contains("status"))
        {
            config.status = StatusConfig::from_json(j["status"]);
        }

        if (j.contains("replay"))
        {
            config.replay = ledger::ReplayOptions::from_json(j["replay"]);
        }

        if (j.contains("report"))
        {
            config.report = ReportConfig::from_json(j["report"]);
        }

        if (j.contains("output"))
        {
            config.output = OutputConfig::from_json(j["output"]);
        }

        return config;
    }

    std::shared_ptr<instrument::FundInstrument> DataLoader::build_instrument(const InstrumentConfig &config,
                                                                             const std::string &base_dir)
    {
        instrument::PriceTable prices = load_price_csv(resolve_path(config.price_file, base_dir));
        std::set<std::string> locks(config.lock_dates.begin(), config.lock_dates.end());
        return std::make_shared<instrument::FundInstrument>(config.code,
                                                            config.name,
                                                            prices,
                                                            instrument::FeeSchedule(config.fees),
                                                            locks,
                                                            config.dividend_reinvest);
    }

    // ===========================
    // Export
    // ===========================

    void DataLoader::save_price_csv(const instrument::PriceTable &prices, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,netvalue,comment\n";
        file << std::fixed;
        const auto &dates = prices.get_dates();
        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i] << "," << std::setprecision(4) << prices.get_net_values()(static_cast<Eigen::Index>(i))
                 << ",";
            auto action = prices.action_at(dates[i]);
            if (action)
                file << std::setprecision(4) << *action;
            else
                file << 0;
            file << "\n";
        }
    }

    void DataLoader::save_status_csv(const data::StatusTable &status, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &code : status.get_codes())
        {
            file << "," << code;
        }
        file << "\n";

        file << std::fixed << std::setprecision(4);
        const auto &values = status.get_values();
        for (size_t i = 0; i < status.num_dates(); ++i)
        {
            file << status.get_dates()[i];
            for (Eigen::Index c = 0; c < values.cols(); ++c)
            {
                file << "," << values(static_cast<Eigen::Index>(i), c);
            }
            file << "\n";
        }
    }

    // ===========================
    // Helpers
    // ===========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        // Whole field must be numeric; "1.05abc" is not a value
        try
        {
            size_t used = 0;
            double v = std::stod(trimmed, &used);
            if (used != trimmed.size())
                return std::numeric_limits<double>::quiet_NaN();
            return v;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    std::string DataLoader::resolve_path(const std::string &path, const std::string &base_dir)
    {
        if (base_dir.empty() || path.empty() || path[0] == '/')
            return path;
        if (base_dir.back() == '/')
            return base_dir + path;
        return base_dir + "/" + path;
    }

} // namespace holding
