/*
 * @file market_data.hpp
 * @brief Aligned multi-asset price table.
 *
 * Stores prices for a fixed, caller-defined asset order on a common,
 * chronologically ordered date index, and derives per-asset returns from it.
 */

#ifndef CRYPTOFOLIO_DATA_MARKET_DATA_HPP
#define CRYPTOFOLIO_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace cryptofolio
{
    /**
     *  @enum ReturnType
     *  @brief Type of return calculation.
     */
    enum class ReturnType
    {
        SIMPLE, /**< Simple returns (P_t / P_{t-1} - 1) */
        LOG     /**< Logarithmic returns (log(P_t / P_{t-1})) */
    };

    /**
     * @class MarketData
     * @brief Price table indexed by timestamp (rows) and asset (columns).
     *
     * A table produced by the PriceAligner holds a positive price for every
     * asset at every timestamp. Tables read from a CSV file may carry NaN for
     * missing observations; validate_prices() rejects them.
     *
     * @note Dates must be strictly increasing.
     * @note Instances are immutable after construction; every transformation
     *       returns a new table.
     */
    class MarketData
    {
    public:
        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x assets).
         * @param dates Vector of timestamps, strictly increasing.
         * @param tickers Vector of asset identifiers, unique.
         * @throws std::invalid_argument if dimensions disagree, dates are not
         *         strictly increasing or tickers repeat
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~MarketData() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        /**
         * @brief Get the full price matrix (dates x assets).
         */
        const Eigen::MatrixXd &get_prices() const
        {
            return prices_;
        }

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        bool empty() const
        {
            return prices_.rows() == 0 || prices_.cols() == 0;
        }

        /** ===========================================
         *  Return Calculation
         *  ===========================================
         */

        /**
         * @brief Calculate per-asset returns between adjacent timestamps.
         * @param type Type of return calculation (LOG by default)
         * @return Matrix of returns (dates-1 x assets)
         * @throws InsufficientHistoryError if fewer than 2 timestamps
         * @throws InvalidPriceError if a price is non-positive or missing
         */
        Eigen::MatrixXd calculate_returns(ReturnType type = ReturnType::LOG) const;

        /** ===========================================
         *  Validation
         *  ===========================================
         */

        /**
         * @brief Require every price to be finite and strictly positive.
         * @throws InvalidPriceError naming the first offending asset and date
         */
        void validate_prices() const;

        /**
         * @brief Count missing values (NaN entries in the price matrix).
         */
        size_t count_missing() const;

        /**
         * @brief Print summary to stdout.
         */
        void print_summary() const;

    private:
        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
        std::vector<std::string> dates_;             ///< Timestamps
        std::vector<std::string> tickers_;           ///< Asset identifiers
    };

}
#endif // CRYPTOFOLIO_DATA_MARKET_DATA_HPP
