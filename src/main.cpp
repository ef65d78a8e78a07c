/**
 * @file main.cpp
 * @brief Main entry point for the portfolio report generator
 *
 * Command-line application that loads configuration and prices, computes
 * portfolio risk/return metrics, simulates the rebalancing discipline and
 * writes the report files.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/price_provider.hpp"
#include "analytics/portfolio_metrics.hpp"
#include "backtest/allocation_validator.hpp"
#include "backtest/rebalancing_simulator.hpp"
#include "report/report_writer.hpp"
#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace cryptofolio;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Cryptofolio Report v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (overrides config)\n"
              << "  --frequency F         Rebalancing frequency: none, daily, weekly, monthly\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/portfolio_config.json --verbose\n"
              << "  " << program_name << " --config data/config/portfolio_config.json --frequency monthly\n"
              << std::endl;
}

void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Cryptofolio Report v1.0.0                               \n"
              << "       Portfolio Rebalancing & Risk Metrics                    \n"
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
    std::string frequency;
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
            else if (arg == "--frequency" && i + 1 < argc)
            {
                args.frequency = argv[++i];
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

std::string local_timestamp()
{
    std::time_t now = std::time(nullptr);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", std::localtime(&now));
    return std::string(buffer);
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        AnalysisConfig config = DataLoader::load_config(args.config_path);
        if (!args.frequency.empty())
        {
            config.rebalance.frequency = backtest::RebalanceConfig::parse_frequency(args.frequency);
        }
        if (!args.output_dir.empty())
        {
            config.output.directory = args.output_dir;
        }

        if (args.verbose)
        {
            std::cout << "  - Data file: " << config.data.data_file << "\n";
            std::cout << "  - Lookback: " << config.data.lookback_days << " days\n";
            std::cout << "  - Rebalancing: " << backtest::to_string(config.rebalance.frequency)
                      << " (" << backtest::to_string(config.rebalance.boundary_rule) << ")\n";
            std::cout << "  - Cache TTL: " << config.cache.ttl_seconds << " s\n";
        }

        // ====================================================================
        // 2. Load Price Data
        // ====================================================================
        std::cout << "[2/5] Loading price data..." << std::endl;

        auto source = std::make_shared<CsvPriceSource>(config.data.data_file);
        std::vector<std::string> assets = config.data.assets;
        if (assets.empty())
        {
            assets = source->available_assets();
        }

        PriceDataProvider provider(source, PriceCache(std::chrono::seconds(config.cache.ttl_seconds)));
        MarketData prices = provider.fetch_aligned_series(assets, config.data.lookback_days);

        std::cout << "  - Aligned " << prices.num_dates() << " dates, "
                  << prices.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            prices.print_summary();
        }

        Eigen::VectorXd weights;
        if (config.portfolio.weights.empty())
        {
            std::cerr << "Warning: no target weights configured, using equal allocation" << std::endl;
            weights = backtest::equal_weights(prices.num_assets());
        }
        else
        {
            weights = backtest::to_weight_vector(config.portfolio.weights);
        }

        // ====================================================================
        // 3. Risk / Return Metrics
        // ====================================================================
        std::cout << "[3/5] Computing portfolio metrics..." << std::endl;

        analytics::MetricsConfig metrics_config;
        metrics_config.periods_per_year = config.analytics.periods_per_year;
        analytics::MetricsResult metrics =
            analytics::compute_metrics(prices, weights, config.portfolio.risk_free_rate, metrics_config);

        if (args.verbose)
        {
            metrics.print_summary();
        }

        // ====================================================================
        // 4. Rebalancing Simulation
        // ====================================================================
        std::cout << "[4/5] Simulating " << backtest::to_string(config.rebalance.frequency)
                  << " rebalancing..." << std::endl;

        backtest::RebalancingSimulator simulator(backtest::SimulationParams::from_config(config));
        backtest::SimulationResult simulation = simulator.simulate(prices, weights);

        if (args.verbose)
        {
            simulation.print_summary();
        }

        // ====================================================================
        // 5. Reports
        // ====================================================================
        std::cout << "[5/5] Writing reports to " << config.output.directory << "..." << std::endl;

        std::filesystem::create_directories(config.output.directory);
        const std::filesystem::path out_dir(config.output.directory);

        const report::AnalysisReport analysis(local_timestamp(), prices, metrics, simulation);

        const std::string report_path = (out_dir / report::report_filename(prices)).string();
        report::write_text_report(analysis, report_path);
        report::write_summary_json(analysis, (out_dir / "metrics.json").string());
        simulation.export_to_csv((out_dir / "portfolio_value.csv").string());
        simulation.export_quantities_to_csv((out_dir / "quantities.csv").string());

        std::cout << "  - Report: " << report_path << "\n";

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Report completed successfully in " << duration << " ms\n";
        std::cout << std::fixed << std::setprecision(2)
                  << "Return " << metrics.annual_return_pct << "%, volatility "
                  << metrics.annual_volatility_pct << "%, Sharpe " << metrics.sharpe_ratio << "\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
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
