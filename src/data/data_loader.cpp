/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <random>
#include <sstream>

namespace cryptofolio
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", "data/market/crypto_prices.csv");
        config.assets = j.value("assets", std::vector<std::string>{});
        config.lookback_days = j.value("lookback_days", 365);

        if (config.lookback_days <= 0)
        {
            throw std::invalid_argument("data.lookback_days must be positive, got: " +
                                        std::to_string(config.lookback_days));
        }
        return config;
    }

    PortfolioSettings PortfolioSettings::from_json(const nlohmann::json &j)
    {
        PortfolioSettings config;
        config.weights = j.value("weights", std::vector<double>{});
        config.risk_free_rate = j.value("risk_free_rate", 0.0);
        return config;
    }

    AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json &j)
    {
        AnalyticsConfig config;
        config.periods_per_year = j.value("periods_per_year", 365.0);
        if (config.periods_per_year <= 0.0)
        {
            throw std::invalid_argument("analytics.periods_per_year must be positive");
        }
        return config;
    }

    CacheConfig CacheConfig::from_json(const nlohmann::json &j)
    {
        CacheConfig config;
        config.ttl_seconds = j.value("ttl_seconds", 300);
        if (config.ttl_seconds < 0)
        {
            throw std::invalid_argument("cache.ttl_seconds must not be negative");
        }
        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "reports");
        return config;
    }

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                         const std::vector<std::string> &assets)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::vector<std::string> all_assets;
        std::vector<std::string> dates;
        std::vector<std::vector<double>> price_data;

        // Read header line
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        for (size_t i = 1; i < header.size(); ++i)
        {
            all_assets.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_assets;

        if (assets.empty())
        {
            for (size_t i = 0; i < all_assets.size(); ++i)
            {
                column_indices.push_back(i);
                selected_assets.push_back(all_assets[i]);
            }
        }
        else
        {
            for (const auto &asset : assets)
            {
                auto it = std::find(all_assets.begin(), all_assets.end(), asset);
                if (it == all_assets.end())
                {
                    throw std::runtime_error("Asset '" + asset + "' not found in " + filepath);
                }
                column_indices.push_back(static_cast<size_t>(std::distance(all_assets.begin(), it)));
                selected_assets.push_back(asset);
            }
        }

        // Read data rows
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!calendar::is_valid_timestamp(date))
            {
                continue; // Skip invalid dates
            }

            dates.push_back(date);

            std::vector<double> row_prices;
            row_prices.reserve(column_indices.size());

            for (size_t idx : column_indices)
            {
                if (idx + 1 < fields.size())
                {
                    row_prices.push_back(safe_stod(fields[idx + 1]));
                }
                else
                {
                    row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
                }
            }

            price_data.push_back(row_prices);
        }

        if (dates.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                               static_cast<Eigen::Index>(selected_assets.size()));
        for (size_t i = 0; i < dates.size(); ++i)
        {
            for (size_t j = 0; j < selected_assets.size(); ++j)
            {
                prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = price_data[i][j];
            }
        }

        return MarketData(prices, dates, selected_assets);
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    MarketData DataLoader::load_csv_long(const std::string &filepath,
                                         const std::vector<std::string> &assets)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::map<std::string, std::map<std::string, double>> data_map; // date -> asset -> price
        std::vector<std::string> seen_assets;

        // Skip header
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 3)
                continue;

            std::string date = trim(fields[0]);
            std::string asset = trim(fields[1]);
            double price = safe_stod(fields[2]);

            if (!calendar::is_valid_timestamp(date))
                continue;

            if (!assets.empty() &&
                std::find(assets.begin(), assets.end(), asset) == assets.end())
            {
                continue;
            }

            data_map[date][asset] = price;
            if (std::find(seen_assets.begin(), seen_assets.end(), asset) == seen_assets.end())
            {
                seen_assets.push_back(asset);
            }
        }

        if (data_map.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        // Requested order wins, otherwise first appearance in the file
        std::vector<std::string> columns = assets.empty() ? seen_assets : assets;
        for (const auto &asset : columns)
        {
            if (std::find(seen_assets.begin(), seen_assets.end(), asset) == seen_assets.end())
            {
                throw std::runtime_error("Asset '" + asset + "' not found in " + filepath);
            }
        }

        std::vector<std::string> dates;
        dates.reserve(data_map.size());
        for (const auto &entry : data_map)
        {
            dates.push_back(entry.first);
        }

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                               static_cast<Eigen::Index>(columns.size()));
        prices.setConstant(std::numeric_limits<double>::quiet_NaN());

        for (size_t i = 0; i < dates.size(); ++i)
        {
            const auto &row = data_map[dates[i]];
            for (size_t j = 0; j < columns.size(); ++j)
            {
                auto it = row.find(columns[j]);
                if (it != row.end())
                {
                    prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = it->second;
                }
            }
        }

        return MarketData(prices, dates, columns);
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    MarketData DataLoader::load_csv(const std::string &filepath,
                                    const std::vector<std::string> &assets)
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
        file.close();

        if (is_long_header(parse_csv_line(line)))
        {
            return load_csv_long(filepath, assets);
        }
        return load_csv_wide(filepath, assets);
    }

    std::vector<PriceSeries> DataLoader::load_series(const std::string &filepath,
                                                     const std::vector<std::string> &assets)
    {
        return PriceAligner::split(load_csv(filepath, assets));
    }

    // ================
    // JSON Loading
    // ================

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

        return j;
    }

    AnalysisConfig DataLoader::load_config(const std::string &config_path)
    {
        return parse_config(load_json(config_path));
    }

    AnalysisConfig DataLoader::parse_config(const nlohmann::json &j)
    {
        AnalysisConfig config;

        config.data = DataConfig::from_json(j.value("data", nlohmann::json::object()));
        config.portfolio = PortfolioSettings::from_json(j.value("portfolio", nlohmann::json::object()));

        if (j.contains("rebalance"))
        {
            config.rebalance = backtest::RebalanceConfig::from_json(j["rebalance"]);
        }

        config.analytics = AnalyticsConfig::from_json(j.value("analytics", nlohmann::json::object()));
        config.cache = CacheConfig::from_json(j.value("cache", nlohmann::json::object()));
        config.output = OutputConfig::from_json(j.value("output", nlohmann::json::object()));

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &assets,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::uint32_t seed)
    {
        if (num_days == 0)
        {
            throw std::invalid_argument("num_days must be positive");
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift - 0.5 * volatility * volatility, volatility);

        const auto rows = static_cast<Eigen::Index>(num_days);
        const auto cols = static_cast<Eigen::Index>(assets.size());
        Eigen::MatrixXd prices(rows, cols);
        std::vector<std::string> dates;
        dates.reserve(num_days);

        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(calendar::add_days(start_date, static_cast<long long>(i)));
        }

        // Geometric Brownian motion, log increments keep prices positive
        for (Eigen::Index j = 0; j < cols; ++j)
        {
            prices(0, j) = 100.0 * static_cast<double>(j + 1);

            for (Eigen::Index i = 1; i < rows; ++i)
            {
                prices(i, j) = prices(i - 1, j) * std::exp(dist(gen));
            }
        }

        return MarketData(prices, dates, assets);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv_wide(const MarketData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &asset : data.get_tickers())
        {
            file << "," << asset;
        }
        file << "\n";

        const auto &prices = data.get_prices();
        const auto &dates = data.get_dates();

        file << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (Eigen::Index j = 0; j < prices.cols(); ++j)
            {
                file << ",";
                double p = prices(static_cast<Eigen::Index>(i), j);
                if (!std::isnan(p))
                {
                    file << p;
                }
            }
            file << "\n";
        }
    }

    void DataLoader::save_csv_long(const MarketData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,asset,price\n";

        const auto &prices = data.get_prices();
        const auto &dates = data.get_dates();
        const auto &assets = data.get_tickers();

        file << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < dates.size(); ++i)
        {
            for (size_t j = 0; j < assets.size(); ++j)
            {
                double p = prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                if (std::isnan(p))
                    continue;
                file << dates[i] << "," << assets[j] << "," << p << "\n";
            }
        }
    }

    // =======================
    // Private Helper Methods
    // =======================

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
        if (trimmed.empty())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        errno = 0;
        char *end = nullptr;
        double value = std::strtod(trimmed.c_str(), &end);
        if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return value;
    }

    bool DataLoader::is_long_header(const std::vector<std::string> &header)
    {
        if (header.size() != 3)
            return false;

        std::string column = trim(header[1]);
        std::transform(column.begin(), column.end(), column.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return column == "asset" || column == "ticker" || column == "symbol" || column == "coin";
    }

} // namespace cryptofolio
