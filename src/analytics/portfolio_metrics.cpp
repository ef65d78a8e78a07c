/**
 * @file portfolio_metrics.cpp
 * @brief Implementation of the portfolio statistics engine
 */

#include "analytics/portfolio_metrics.hpp"
#include "backtest/allocation_validator.hpp"
#include "risk/sample_covariance.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

namespace cryptofolio
{
    namespace analytics
    {

        namespace
        {
            nlohmann::json matrix_to_json(const Eigen::MatrixXd &m)
            {
                nlohmann::json rows = nlohmann::json::array();
                for (Eigen::Index i = 0; i < m.rows(); ++i)
                {
                    nlohmann::json row = nlohmann::json::array();
                    for (Eigen::Index j = 0; j < m.cols(); ++j)
                    {
                        row.push_back(m(i, j));
                    }
                    rows.push_back(row);
                }
                return rows;
            }
        } // anonymous namespace

        // ===================================================================
        // Computation
        // ===================================================================

        std::vector<double> portfolio_log_returns(const Eigen::MatrixXd &log_returns,
                                                  const Eigen::VectorXd &weights)
        {
            if (log_returns.cols() != weights.size())
            {
                throw DimensionMismatchError(static_cast<size_t>(weights.size()),
                                             static_cast<size_t>(log_returns.cols()));
            }

            // expm1(r_i) is the simple return P_i(t) / P_i(t-1) - 1. The
            // unallocated share 1 - sum(w) is cash and earns nothing, so the
            // portfolio gross return is 1 + sum(w_i * expm1(r_i)).
            Eigen::VectorXd simple = log_returns.unaryExpr([](double r) { return std::expm1(r); }) * weights;

            std::vector<double> result(static_cast<size_t>(simple.size()));
            for (Eigen::Index t = 0; t < simple.size(); ++t)
            {
                result[static_cast<size_t>(t)] = std::log1p(simple[t]);
            }
            return result;
        }

        MetricsResult compute_metrics(const MarketData &market_data,
                                      const Eigen::VectorXd &weights,
                                      double risk_free_rate,
                                      const MetricsConfig &config)
        {
            if (!(config.periods_per_year > 0.0))
            {
                throw std::invalid_argument("periods_per_year must be positive, got: " +
                                            std::to_string(config.periods_per_year));
            }

            backtest::validate_weights(weights);

            const size_t n_assets = market_data.num_assets();
            if (static_cast<size_t>(weights.size()) != n_assets)
            {
                throw DimensionMismatchError(static_cast<size_t>(weights.size()), n_assets);
            }
            if (market_data.num_dates() < 2)
            {
                throw InsufficientHistoryError(market_data.num_dates(), 2);
            }

            const double periods = config.periods_per_year;
            const Eigen::MatrixXd log_returns = market_data.calculate_returns(ReturnType::LOG);

            MetricsResult result;
            result.tickers = market_data.get_tickers();
            result.dates = market_data.get_dates();
            result.risk_free_rate = risk_free_rate;
            result.periods_per_year = periods;

            // Annualized per-asset statistics
            Eigen::VectorXd mean_returns = log_returns.colwise().mean().transpose() * periods;

            risk::SampleCovariance estimator(true);
            result.covariance = estimator.estimate_covariance(log_returns) * periods;
            result.correlation = risk::RiskModel::covariance_to_correlation(result.covariance);

            result.asset_annual_return_pct = mean_returns * 100.0;
            result.asset_annual_volatility_pct =
                result.covariance.diagonal().array().max(0.0).sqrt().matrix() * 100.0;

            // Portfolio statistics
            const double annual_return = weights.dot(mean_returns);
            const double variance = weights.dot(result.covariance * weights);
            const double volatility = variance > 0.0 ? std::sqrt(variance) : 0.0;

            result.annual_return_pct = annual_return * 100.0;
            result.annual_volatility_pct = volatility * 100.0;
            result.sharpe_ratio = volatility == 0.0 ? 0.0 : (annual_return - risk_free_rate) / volatility;

            // Drawdown on the normalized cumulative value series
            result.portfolio_log_returns = portfolio_log_returns(log_returns, weights);
            result.cumulative_value.reserve(result.portfolio_log_returns.size() + 1);
            result.cumulative_value.push_back(1.0);
            double running = 0.0;
            for (double r : result.portfolio_log_returns)
            {
                running += r;
                result.cumulative_value.push_back(std::exp(running));
            }

            result.drawdown_series = underwater_curve(result.cumulative_value);
            result.drawdown = drawdown_info(result.cumulative_value);
            result.max_drawdown = result.drawdown.depth;

            return result;
        }

        // ===================================================================
        // Export
        // ===================================================================

        nlohmann::json MetricsResult::to_json() const
        {
            nlohmann::json j;
            j["assets"] = tickers;
            if (!dates.empty())
            {
                j["start_date"] = dates.front();
                j["end_date"] = dates.back();
            }
            j["num_periods"] = dates.size();
            j["periods_per_year"] = periods_per_year;
            j["risk_free_rate"] = risk_free_rate;

            j["annual_return_pct"] = annual_return_pct;
            j["annual_volatility_pct"] = annual_volatility_pct;
            j["sharpe_ratio"] = sharpe_ratio;
            j["max_drawdown"] = max_drawdown;
            j["max_drawdown_detail"] = {
                {"peak_index", drawdown.peak_index},
                {"trough_index", drawdown.trough_index},
                {"recovery_index", drawdown.recovery_index}};

            nlohmann::json per_asset = nlohmann::json::object();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                per_asset[tickers[i]] = {
                    {"annual_return_pct", asset_annual_return_pct[idx]},
                    {"annual_volatility_pct", asset_annual_volatility_pct[idx]}};
            }
            j["per_asset"] = per_asset;
            j["covariance"] = matrix_to_json(covariance);
            j["correlation"] = matrix_to_json(correlation);

            return j;
        }

        void MetricsResult::print_summary() const
        {
            std::cout << "\n=== Portfolio Metrics ===\n";
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Annualized return:     " << annual_return_pct << "%\n";
            std::cout << "Annualized volatility: " << annual_volatility_pct << "%\n";
            std::cout << "Sharpe ratio:          " << sharpe_ratio << "\n";
            std::cout << "Max drawdown:          " << max_drawdown * 100.0 << "%\n";

            std::cout << "\nCorrelation:\n";
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                std::cout << std::setw(12) << tickers[i];
                for (size_t j = 0; j < tickers.size(); ++j)
                {
                    std::cout << std::setw(8)
                              << correlation(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                }
                std::cout << "\n";
            }
            std::cout << "=========================\n"
                      << std::endl;
        }

    } // namespace analytics
} // namespace cryptofolio
