/**
 * @file portfolio_metrics.hpp
 * @brief Risk/return statistics of a fixed-weight portfolio.
 *
 * Derives annualized return, covariance-based annualized volatility, Sharpe
 * ratio, correlation matrix and maximum drawdown from an aligned price table
 * and a target weight vector. All statistics are computed on daily log
 * returns r_i(t) = ln(P_i(t) / P_i(t-1)).
 */

#ifndef CRYPTOFOLIO_ANALYTICS_PORTFOLIO_METRICS_HPP
#define CRYPTOFOLIO_ANALYTICS_PORTFOLIO_METRICS_HPP

#include "data/market_data.hpp"
#include "analytics/drawdown.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cryptofolio
{
    namespace analytics
    {

        /// Crypto markets trade every calendar day.
        constexpr double DEFAULT_PERIODS_PER_YEAR = 365.0;

        /**
         * @struct MetricsConfig
         * @brief Parameters of the statistics engine.
         */
        struct MetricsConfig
        {
            double periods_per_year = DEFAULT_PERIODS_PER_YEAR; ///< Annualization factor
        };

        /**
         * @struct MetricsResult
         * @brief Scalar metrics, correlation and drawdown of one evaluation.
         *
         * Returns and volatilities are in percent. The drawdown is a fraction
         * (<= 0) of the normalized cumulative value series.
         */
        struct MetricsResult
        {
            std::vector<std::string> tickers;
            std::vector<std::string> dates;

            double annual_return_pct = 0.0;     ///< Sum of w_i * annualized mean log return, in %
            double annual_volatility_pct = 0.0; ///< sqrt(w' Sigma w), in %
            double sharpe_ratio = 0.0;          ///< 0 when volatility is 0
            double max_drawdown = 0.0;          ///< Minimum of the underwater curve
            DrawdownInfo drawdown;
            double risk_free_rate = 0.0;        ///< Annual rate used for the Sharpe ratio
            double periods_per_year = DEFAULT_PERIODS_PER_YEAR;

            Eigen::VectorXd asset_annual_return_pct;
            Eigen::VectorXd asset_annual_volatility_pct;
            Eigen::MatrixXd covariance;         ///< Annualized covariance of log returns
            Eigen::MatrixXd correlation;        ///< Pearson correlation, diagonal exactly 1

            std::vector<double> portfolio_log_returns; ///< ln(sum_i w_i exp(r_i(t)))
            std::vector<double> cumulative_value;      ///< exp(cumsum), starts at 1.0
            std::vector<double> drawdown_series;       ///< Underwater curve of cumulative_value

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /**
         * @brief Compute portfolio metrics.
         * @param market_data Aligned price table (dates x assets)
         * @param weights Target weights, one per asset
         * @param risk_free_rate Annual risk-free rate as a fraction
         * @param config Annualization settings
         * @throws InvalidWeightsError if the weights fail validation
         * @throws DimensionMismatchError if weights and assets differ in count
         * @throws InsufficientHistoryError if fewer than 2 timestamps
         * @throws InvalidPriceError if a price is non-positive
         *
         * @note Pure function: identical inputs give bit-identical outputs.
         */
        MetricsResult compute_metrics(const MarketData &market_data,
                                      const Eigen::VectorXd &weights,
                                      double risk_free_rate = 0.0,
                                      const MetricsConfig &config = MetricsConfig());

        /**
         * @brief Log return of a portfolio held at constant weights.
         *
         * The share 1 - sum(w) is held as cash with zero return.
         * @param log_returns Per-asset log returns (periods x assets)
         * @return ln(1 + sum_i w_i (exp(r_i(t)) - 1)) for every period
         */
        std::vector<double> portfolio_log_returns(const Eigen::MatrixXd &log_returns,
                                                  const Eigen::VectorXd &weights);

    } // namespace analytics
} // namespace cryptofolio

#endif // CRYPTOFOLIO_ANALYTICS_PORTFOLIO_METRICS_HPP
