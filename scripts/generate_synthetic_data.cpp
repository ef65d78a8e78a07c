/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic crypto price data for the report generator
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "analytics/portfolio_metrics.hpp"
#include "backtest/allocation_validator.hpp"
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>

using namespace cryptofolio;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Price Generator ===\n" << std::endl;

    std::vector<std::string> assets = {
        "bitcoin",
        "ethereum",
        "solana"
    };

    // Crypto trades every calendar day
    size_t num_days = 730;
    std::string start_date = "2023-01-01";
    std::string output_file = "data/market/crypto_prices.csv";
    double volatility = 0.03;        // 3% daily volatility
    double drift = 0.0005;
    std::uint32_t seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--volatility" && i + 1 < argc) {
                volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                drift = std::stod(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/crypto_prices.csv)\n"
                          << "  --days N           Number of calendar days (default: 730)\n"
                          << "  --seed S           Random seed (default: 42)\n"
                          << "  --volatility VAL   Daily volatility (default: 0.03)\n"
                          << "  --drift VAL        Daily drift (default: 0.0005)\n"
                          << "  --help             Show this help\n";
                return 0;
            } else {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        std::cout << "Generating " << num_days << " days for " << assets.size()
                  << " assets from " << start_date << " (seed " << seed << ")..." << std::endl;

        auto data = DataLoader::generate_synthetic_data(
            assets, num_days, start_date, volatility, drift, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_csv_wide(data, output_file);

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << data.num_dates() << " ("
                  << data.get_dates().front() << " to "
                  << data.get_dates().back() << ")\n";
        std::cout << "Assets: " << data.num_assets() << "\n";

        if (data.num_dates() >= 2) {
            auto metrics = analytics::compute_metrics(data, backtest::equal_weights(data.num_assets()));

            std::cout << "\nAsset Statistics (Annualized):\n";
            std::cout << std::string(45, '-') << "\n";
            std::cout << std::setw(12) << "Asset"
                      << std::setw(15) << "Mean Return"
                      << std::setw(15) << "Volatility" << "\n";
            std::cout << std::string(45, '-') << "\n";

            for (size_t i = 0; i < data.num_assets(); ++i) {
                auto idx = static_cast<Eigen::Index>(i);
                std::cout << std::setw(12) << data.get_tickers()[i]
                          << std::setw(14) << std::fixed << std::setprecision(2)
                          << metrics.asset_annual_return_pct[idx] << "%"
                          << std::setw(14) << metrics.asset_annual_volatility_pct[idx] << "%\n";
            }
            std::cout << std::string(45, '-') << "\n";
        }

        std::cout << "\nData generation complete.\n" << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/cryptofolio_report --config data/config/portfolio_config.json --verbose\n";
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
