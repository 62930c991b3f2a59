// SPDX-License-Identifier: MIT
/**
 * @file generate_sample_data.cpp
 * @brief Generate sample net value histories, instructions and a config
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"
#include "data/status_table.hpp"
#include "instrument/price_table.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>

using namespace holding;

namespace {

// Weekday net values from a lognormal walk starting at 1.0.
instrument::PriceTable make_prices(const std::string& start, int num_days, double volatility,
                                   std::mt19937& rng, const std::map<std::string, double>& actions) {
    std::normal_distribution<double> shock(0.0002, volatility);
    std::vector<std::string> dates;
    std::vector<double> values;
    double nav = 1.0;
    for (int d = 0; d < num_days; ++d) {
        std::string date = dates::add_days(start, d);
        if (dates::day_of_week(date) >= 5) continue;
        nav *= std::exp(shock(rng));
        auto it = actions.find(date);
        if (it != actions.end() && it->second < 0.0) {
            nav /= -it->second;  // split divides the net value
        }
        dates.push_back(date);
        values.push_back(std::round(nav * 10000.0) / 10000.0);
    }

    Eigen::VectorXd nv(static_cast<Eigen::Index>(values.size()));
    for (size_t i = 0; i < values.size(); ++i) nv(static_cast<Eigen::Index>(i)) = values[i];
    return instrument::PriceTable(dates, nv, actions);
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Sample Ledger Data Generator ===\n" << std::endl;

    std::string output_dir = "data/sample";
    unsigned seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output DIR       Output directory (default: data/sample)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this message\n";
            return 0;
        }
    }

    try {
        std::filesystem::create_directories(output_dir);
        std::mt19937 rng(seed);

        // F001 pays a 0.02 dividend mid-year; F002 splits 1:2 in September.
        auto f001 = make_prices("2021-01-04", 365, 0.008, rng, {{"2021-06-15", 0.02}});
        auto f002 = make_prices("2021-01-04", 365, 0.012, rng, {{"2021-09-01", -2.0}});

        DataLoader::save_price_csv(f001, output_dir + "/F001.csv");
        DataLoader::save_price_csv(f002, output_dir + "/F002.csv");

        // Monthly purchases, a share redemption, a half redemption, a full exit
        // and one reinvest-dividend marker on the F001 dividend day.
        std::vector<std::string> dates = {
            "2021-01-04", "2021-02-01", "2021-03-01", "2021-04-01", "2021-05-03",
            "2021-06-15", "2021-07-01", "2021-08-02", "2021-10-01", "2021-11-01", "2021-12-01"};
        Eigen::MatrixXd values(static_cast<Eigen::Index>(dates.size()), 2);
        values << 1000.0,  2000.0,
                  1000.0,     0.0,
                  1000.0,  1000.0,
                     0.0,  -500.0,
                  1000.0,     0.0,
                     0.05,    0.0,
                  -0.0025,    0.0,
                  1000.0,  1000.0,
                     0.0,  -0.0025,
                  500.0,      0.0,
                     0.0,  -0.005;
        data::StatusTable status(values, dates, {"F001", "F002"});
        DataLoader::save_status_csv(status, output_dir + "/status.csv");

        nlohmann::json config;
        config["instruments"] = nlohmann::json::array({
            {{"code", "F001"}, {"name", "Sample Bond Fund"}, {"price_file", output_dir + "/F001.csv"},
             {"fees", {{"purchase_rate", 0.15},
                       {"redemption", nlohmann::json::array({{{"max_days", 7}, {"rate", 1.5}},
                                                             {{"max_days", 365}, {"rate", 0.5}},
                                                             {{"rate", 0.0}}})}}}},
            {{"code", "F002"}, {"name", "Sample Equity Fund"}, {"price_file", output_dir + "/F002.csv"},
             {"lock_dates", nlohmann::json::array({"2021-09-01"})}}});
        config["status"] = {{"file", output_dir + "/status.csv"}};
        config["replay"] = {{"end_date", "2021-12-31"}};
        config["report"] = {{"as_of", "2021-12-31"}, {"xirr_guess", 0.1}, {"volume_frequency", "M"}};
        config["output"] = {{"directory", "output"}};

        std::ofstream file(output_dir + "/ledger_config.json");
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + output_dir + "/ledger_config.json");
        }
        file << config.dump(2) << "\n";

        std::cout << "Price days: F001=" << f001.num_dates() << ", F002=" << f002.num_dates() << "\n";
        std::cout << "Instruction dates: " << status.num_dates() << "\n";
        std::cout << "Written to " << output_dir << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
