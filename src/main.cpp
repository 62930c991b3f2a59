// SPDX-License-Identifier: MIT
/**
 * @file main.cpp
 * @brief Main entry point for the holding ledger replayer
 *
 * Command-line application that loads configuration, replays every
 * configured holding from its instruction column, prints position reports
 * and exports ledgers, lot histories and reports.
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"
#include "data/status_table.hpp"
#include "ledger/ledger_errors.hpp"
#include "ledger/ledger_exporter.hpp"
#include "valuation/holding.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace holding;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Holding Ledger v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (overrides config)\n"
              << "  --as-of DATE          Report date YYYY-MM-DD (default: replay end date)\n"
              << "  --verbose             Trace every ledger entry\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/ledger_config.json --verbose\n"
              << "  " << program_name << " --config data/config/ledger_config.json --as-of 2021-06-30\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Holding Ledger v1.0.0                                   \n"
              << "       Trade Replay and Position Valuation                     \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir;
    std::string as_of;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--as-of" && i + 1 < argc)
            {
                args.as_of = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        if (args.verbose)
        {
            config.replay.verbose = true;
        }
        if (!args.output_dir.empty())
        {
            config.output.directory = args.output_dir;
        }

        if (config.replay.end_date.empty())
        {
            config.replay.end_date = dates::yesterday();
        }
        std::string as_of = !args.as_of.empty() ? args.as_of : config.report.as_of;
        if (as_of.empty())
        {
            as_of = config.replay.end_date;
        }
        if (!dates::is_valid_date(as_of))
        {
            throw std::invalid_argument("report date must be YYYY-MM-DD, got: " + as_of);
        }

        if (args.verbose)
        {
            std::cout << "  - Holdings: ";
            for (const auto &ic : config.instruments)
            {
                std::cout << ic.code << " ";
            }
            std::cout << "\n  - Replay through: " << config.replay.end_date << "\n";
            std::cout << "  - Report date: " << as_of << "\n";
        }

        // ====================================================================
        // 2. Load Instructions
        // ====================================================================
        std::cout << "[2/5] Loading instructions..." << std::endl;

        std::vector<std::string> codes;
        for (const auto &ic : config.instruments)
        {
            codes.push_back(ic.code);
        }
        auto status = DataLoader::load_status_csv(config.status.file, codes);

        std::cout << "  - Loaded " << status.num_dates() << " dates, "
                  << status.num_codes() << " holdings" << std::endl;
        if (args.verbose)
        {
            status.print_summary();
        }

        // ====================================================================
        // 3. Replay
        // ====================================================================
        std::cout << "[3/5] Replaying ledgers..." << std::endl;

        std::vector<std::unique_ptr<valuation::Holding>> holdings;
        int failures = 0;
        for (const auto &ic : config.instruments)
        {
            auto fund = DataLoader::build_instrument(ic);
            try
            {
                auto h = valuation::Holding::replay(fund, status.column(ic.code), config.replay);
                std::cout << "  - " << ic.code << ": " << h.history().size() << " ledger entries" << std::endl;
                holdings.push_back(std::make_unique<valuation::Holding>(std::move(h)));
            }
            catch (const ledger::LedgerError &e)
            {
                std::cerr << "  - " << ic.code << ": replay failed: " << e.what() << std::endl;
                ++failures;
            }
        }

        // ====================================================================
        // 4. Reports
        // ====================================================================
        std::cout << "[4/5] Building reports as of " << as_of << "..." << std::endl;

        std::vector<valuation::DailyReport> reports;
        std::vector<const valuation::Holding *> held;
        for (const auto &h : holdings)
        {
            held.push_back(h.get());
            auto report = h->daily_report(as_of);
            reports.push_back(report);
            ledger::LedgerExporter::print_summary(h->instrument().code(), h->history());
            ledger::LedgerExporter::print_report(report);

            auto volume = h->trade_volume(config.report.volume_frequency);
            std::cout << "Trade volume (" << valuation::to_string(volume.frequency) << "): "
                      << std::fixed << std::setprecision(2)
                      << -volume.total_bought() << " bought, "
                      << volume.total_sold() << " sold" << std::defaultfloat << "\n";
        }

        if (!held.empty())
        {
            auto flows = valuation::merge_cashflows(held);
            double irr = valuation::internal_rate_of_return(flows, held, as_of, config.report.xirr_guess);
            std::cout << "\nCombined IRR: " << std::fixed << std::setprecision(2)
                      << irr * 100.0 << "%" << std::defaultfloat << std::endl;
        }

        // ====================================================================
        // 5. Export
        // ====================================================================
        std::cout << "\n[5/5] Exporting results to " << config.output.directory << "..." << std::endl;

        for (const auto &h : holdings)
        {
            const std::string &code = h->instrument().code();
            if (config.output.export_ledger)
            {
                ledger::LedgerExporter::export_ledger_csv(h->history(),
                                                          config.output.directory + "/" + code + "_ledger.csv");
            }
            if (config.output.export_lots)
            {
                ledger::LedgerExporter::export_lots_csv(h->history(),
                                                        config.output.directory + "/" + code + "_lots.csv");
            }
        }
        if (config.output.export_report)
        {
            ledger::LedgerExporter::export_report_json(reports, config.output.directory + "/report.json");
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        if (failures == 0)
        {
            std::cout << "Replay completed successfully in " << duration << " ms\n";
        }
        else
        {
            std::cout << "Replay completed with " << failures << " failed holding(s) in "
                      << duration << " ms\n";
        }
        std::cout << "================================================================\n"
                  << std::endl;

        return failures == 0 ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
