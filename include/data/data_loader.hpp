/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load price data from CSV files and
 * analysis configuration from JSON files.
 */

#ifndef CRYPTOFOLIO_DATA_DATA_LOADER_HPP
#define CRYPTOFOLIO_DATA_DATA_LOADER_HPP

#include "data/market_data.hpp"
#include "data/price_aligner.hpp"
#include "backtest/rebalance_scheduler.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>


namespace cryptofolio {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading
 */
struct DataConfig {
    std::string data_file;                     ///< Path to price CSV
    std::vector<std::string> assets;           ///< Asset ids to load (all if empty)
    int lookback_days = 365;                   ///< Trailing window in calendar days

    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct PortfolioSettings
 * @brief Target allocation and risk-free rate
 */
struct PortfolioSettings {
    std::vector<double> weights;               ///< Target weights (asset order of DataConfig)
    double risk_free_rate = 0.0;               ///< Annual risk-free rate

    static PortfolioSettings from_json(const nlohmann::json& j);
};

/**
 * @struct AnalyticsConfig
 * @brief Parameters of the statistics engine
 */
struct AnalyticsConfig {
    double periods_per_year = 365.0;           ///< Annualization factor (crypto trades 24/7)

    static AnalyticsConfig from_json(const nlohmann::json& j);
};

/**
 * @struct CacheConfig
 * @brief Price cache time-to-live
 */
struct CacheConfig {
    int ttl_seconds = 300;

    static CacheConfig from_json(const nlohmann::json& j);
};

/**
 * @struct OutputConfig
 * @brief Report output location
 */
struct OutputConfig {
    std::string directory = "reports";

    static OutputConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalysisConfig
 * @brief Complete configuration of one analysis run
 */
struct AnalysisConfig {
    DataConfig data;
    PortfolioSettings portfolio;
    backtest::RebalanceConfig rebalance;
    AnalyticsConfig analytics;
    CacheConfig cache;
    OutputConfig output;
};

/**
 * @class DataLoader
 * @brief Loads and parses price data
 *
 * Supports CSV files with standard formats:
 * - Format 1: date, asset1, asset2, ... (wide format)
 * - Format 2: date, asset, price (long format)
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load price data from CSV file (wide format)
     *
     * Expected format:
     * date,bitcoin,ethereum,solana
     * 2024-01-01,42000.0,2300.0,100.0
     *
     * Empty or unparsable cells become NaN.
     *
     * @param filepath Path to CSV file
     * @param assets Optional list of assets to load (loads all if empty)
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded or an asset is absent
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& assets = {});

    /**
     * @brief Load price data from CSV file (long format)
     *
     * Expected format:
     * date,asset,price
     * 2024-01-01,bitcoin,42000.0
     * 2024-01-01,ethereum,2300.0
     *
     * Dates missing for an asset are NaN in the resulting table.
     *
     * @param filepath Path to CSV file
     * @param assets Optional list of assets to load, also fixes column order
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& assets = {});

    /**
     * @brief Auto-detect CSV format and load
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& assets = {});

    /**
     * @brief Load a CSV file as one price series per asset
     *
     * Missing observations are skipped, so each series only holds the
     * dates that asset actually traded.
     */
    static std::vector<PriceSeries> load_series(const std::string& filepath,
                                                const std::vector<std::string>& assets = {});

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @throws std::runtime_error if file cannot be loaded or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete analysis configuration
     */
    static AnalysisConfig load_config(const std::string& config_path);

    /**
     * @brief Build configuration from an already parsed JSON document
     */
    static AnalysisConfig parse_config(const nlohmann::json& j);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic daily prices (geometric Brownian motion)
     * @param assets List of asset ids
     * @param num_days Number of calendar days
     * @param start_date Starting date
     * @param volatility Daily volatility (default 0.03)
     * @param drift Daily drift (default 0.0005)
     * @param seed Random seed, equal seeds give equal data
     * @return MarketData object with synthetic prices
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& assets,
        size_t num_days,
        const std::string& start_date = "2024-01-01",
        double volatility = 0.03,
        double drift = 0.0005,
        std::uint32_t seed = 42
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    static void save_csv_wide(const MarketData& data, const std::string& filepath);
    static void save_csv_long(const MarketData& data, const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double, NaN if conversion fails
     */
    static double safe_stod(const std::string& str);

    static bool is_long_header(const std::vector<std::string>& header);
};

} // namespace cryptofolio

#endif // CRYPTOFOLIO_DATA_DATA_LOADER_HPP
