// SPDX-License-Identifier: MIT

#include "backtest/rebalancing_simulator.hpp"
#include "backtest/allocation_validator.hpp"
#include "analytics/drawdown.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace cryptofolio
{
    namespace backtest
    {

        // ------------------------- SimulationParams -----------------------------
        SimulationParams SimulationParams::from_config(const AnalysisConfig &config)
        {
            SimulationParams p;
            p.rebalance = config.rebalance;
            return p;
        }

        // ------------------------- SimulationResult helpers ---------------------
        Eigen::VectorXd SimulationResult::quantities_at(size_t t) const
        {
            if (t >= size())
                throw std::out_of_range("timestamp index " + std::to_string(t) + " out of range");
            return quantities.row(static_cast<Eigen::Index>(t)).transpose();
        }

        Eigen::VectorXd SimulationResult::weights_at(size_t t) const
        {
            if (t >= size())
                throw std::out_of_range("timestamp index " + std::to_string(t) + " out of range");
            Eigen::VectorXd w = holding_values.row(static_cast<Eigen::Index>(t)).transpose();
            if (value_series[t] > 0.0)
                w /= value_series[t];
            return w;
        }

        double SimulationResult::final_value() const
        {
            if (value_series.empty())
                return 0.0;
            return value_series.back();
        }

        double SimulationResult::total_return() const
        {
            if (value_series.empty())
                return 0.0;
            double init = value_series.front();
            if (init == 0.0)
                return 0.0;
            return value_series.back() / init - 1.0;
        }

        double SimulationResult::max_drawdown() const
        {
            if (value_series.empty())
                return 0.0;
            return analytics::max_drawdown(value_series);
        }

        Eigen::VectorXd SimulationResult::quantity_drift() const
        {
            if (quantities.rows() == 0)
                return Eigen::VectorXd();
            Eigen::VectorXd first = quantities.row(0).transpose();
            Eigen::VectorXd last = quantities.row(quantities.rows() - 1).transpose();
            Eigen::VectorXd drift = Eigen::VectorXd::Zero(first.size());
            for (Eigen::Index i = 0; i < first.size(); ++i)
            {
                // A zero-weight asset is never bought, so it has no drift
                if (first[i] > 0.0)
                    drift[i] = (last[i] - first[i]) / first[i];
            }
            return drift;
        }

        void SimulationResult::print_summary() const
        {
            std::cout << "Rebalancing: " << to_string(rebalance.frequency)
                      << " (" << to_string(rebalance.boundary_rule) << ")\n";
            std::cout << "Periods: " << size() << " Rebalances: " << rebalance_count
                      << " Turnover: " << turnover << "\n";
            std::cout << "Final value: " << final_value() << " Total return: " << total_return()
                      << " Max drawdown: " << max_drawdown() << "\n";
        }

        void SimulationResult::export_to_csv(const std::string &filepath) const
        {
            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);
            out << std::setprecision(10);
            out << "date,value,cumulative_return,rebalanced\n";
            for (size_t i = 0; i < value_series.size() && i < dates.size(); ++i)
            {
                double cum = value_series[i] / value_series.front() - 1.0;
                out << dates[i] << "," << value_series[i] << "," << cum << ","
                    << (rebalanced[i] ? 1 : 0) << "\n";
            }
        }

        void SimulationResult::export_quantities_to_csv(const std::string &filepath) const
        {
            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);
            out << std::setprecision(10);
            out << "date";
            for (const auto &ticker : tickers)
                out << "," << ticker;
            out << "\n";
            for (Eigen::Index i = 0; i < quantities.rows(); ++i)
            {
                out << dates[static_cast<size_t>(i)];
                for (Eigen::Index j = 0; j < quantities.cols(); ++j)
                    out << "," << quantities(i, j);
                out << "\n";
            }
        }

        // ------------------------- RebalancingSimulator -------------------------
        RebalancingSimulator::RebalancingSimulator(const SimulationParams &params) : params_(params)
        {
            if (!(params_.rebalance.initial_capital > 0.0))
                throw std::invalid_argument("initial_capital must be > 0");
        }

        SimulationResult RebalancingSimulator::simulate(const MarketData &market_data,
                                                        const Eigen::VectorXd &weights) const
        {
            validate_weights(weights);

            const size_t N = market_data.num_dates();
            const size_t M = market_data.num_assets();
            if (static_cast<size_t>(weights.size()) != M)
                throw DimensionMismatchError(static_cast<size_t>(weights.size()), M);
            if (N == 0)
                throw InsufficientHistoryError(0, 1);
            market_data.validate_prices();

            const std::vector<std::string> &dates = market_data.get_dates();
            const Eigen::MatrixXd &prices_matrix = market_data.get_prices();

            SimulationResult result;
            result.dates = dates;
            result.tickers = market_data.get_tickers();
            result.rebalance = params_.rebalance;
            result.value_series.resize(N);
            result.quantities.resize(static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(M));
            result.holding_values.resize(static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(M));
            result.cash_series.resize(N);
            result.rebalanced.assign(N, false);

            RebalanceScheduler scheduler(params_.rebalance);
            const std::vector<bool> boundaries = scheduler.boundary_mask(dates);

            Holdings holdings(result.tickers);
            Eigen::VectorXd prices = prices_matrix.row(0).transpose();

            holdings.allocate(params_.rebalance.initial_capital, weights, prices);
            result.value_series[0] = params_.rebalance.initial_capital;
            result.rebalanced[0] = true;
            result.cash_series[0] = holdings.cash();
            result.quantities.row(0) = holdings.quantities().transpose();
            result.holding_values.row(0) = (holdings.quantities().array() * prices.array()).matrix().transpose();

            for (size_t t = 1; t < N; ++t)
            {
                const auto row = static_cast<Eigen::Index>(t);
                prices = prices_matrix.row(row).transpose();

                // A reset trades at the closing prices and leaves the value unchanged
                result.value_series[t] = holdings.value(prices);
                if (boundaries[t])
                {
                    result.turnover += holdings.rebalance(weights, prices);
                    result.rebalanced[t] = true;
                    ++result.rebalance_count;
                }

                result.cash_series[t] = holdings.cash();
                result.quantities.row(row) = holdings.quantities().transpose();
                result.holding_values.row(row) =
                    (holdings.quantities().array() * prices.array()).matrix().transpose();
            }

            return result;
        }

        SimulationResult simulate(const MarketData &market_data,
                                  const Eigen::VectorXd &weights,
                                  RebalanceFrequency frequency)
        {
            SimulationParams params;
            params.rebalance.frequency = frequency;
            return RebalancingSimulator(params).simulate(market_data, weights);
        }

    } // namespace backtest
} // namespace cryptofolio
