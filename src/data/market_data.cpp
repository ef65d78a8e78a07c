/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "data/market_data.hpp"
#include "core/errors.hpp"

#include <iostream>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace cryptofolio
{

    // ============================================================================
    // Constructors
    // ============================================================================

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {

        // Validate dimensions
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }

        for (size_t i = 1; i < dates_.size(); ++i)
        {
            if (!(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument("Dates must be strictly increasing: '" + dates_[i - 1] +
                                            "' followed by '" + dates_[i] + "'");
            }
        }

        std::set<std::string> unique_tickers(tickers_.begin(), tickers_.end());
        if (unique_tickers.size() != tickers_.size())
        {
            throw std::invalid_argument("Asset identifiers must be unique");
        }
    }

    // ===========================
    // Return Calculation Methods
    // ===========================

    Eigen::MatrixXd MarketData::calculate_returns(ReturnType type) const
    {
        if (prices_.rows() < 2)
        {
            throw InsufficientHistoryError(num_dates(), 2);
        }
        validate_prices();

        const Eigen::Index n_rows = prices_.rows() - 1;
        Eigen::MatrixXd ratios =
            (prices_.bottomRows(n_rows).array() / prices_.topRows(n_rows).array()).matrix();

        if (type == ReturnType::SIMPLE)
        {
            return (ratios.array() - 1.0).matrix();
        }
        return ratios.array().log().matrix();
    }

    // ===================
    // Validation Methods
    // ===================

    void MarketData::validate_prices() const
    {
        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p = prices_(i, j);
                if (!std::isfinite(p) || p <= 0.0)
                {
                    std::ostringstream msg;
                    msg << "price of " << tickers_[static_cast<size_t>(j)] << " on "
                        << dates_[static_cast<size_t>(i)] << " is not positive: " << p;
                    throw InvalidPriceError(msg.str());
                }
            }
        }
    }

    size_t MarketData::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    void MarketData::print_summary() const
    {
        std::cout << "\n=== Market Data Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "==========================\n"
                  << std::endl;
    }

} // namespace cryptofolio
