// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>
#include <Eigen/Dense>
#include "data/market_data.hpp"
#include "data/data_loader.hpp"
#include "backtest/holdings.hpp"
#include "backtest/rebalance_scheduler.hpp"

namespace cryptofolio
{
    namespace backtest
    {

        /**
         * @struct SimulationResult
         * @brief Time-indexed output of one rebalancing simulation.
         *
         * Every series shares the date index of the input price table. Row t of
         * `quantities` holds the units held after any reset at t, and
         * `value_series[t]` is their value at the prices of t plus the cash
         * residual. A reset does not change the value.
         */
        struct SimulationResult
        {
            std::vector<std::string> dates;
            std::vector<std::string> tickers;
            RebalanceConfig rebalance;

            std::vector<double> value_series;   ///< Portfolio value per timestamp
            Eigen::MatrixXd quantities;         ///< Units held (dates x assets)
            Eigen::MatrixXd holding_values;     ///< q_i * p_i (dates x assets)
            std::vector<double> cash_series;    ///< Uninvested residual value * (1 - sum(w))
            std::vector<bool> rebalanced;       ///< Holdings reset at t (t0 is the initial allocation)
            size_t rebalance_count = 0;         ///< Resets after the initial allocation
            double turnover = 0.0;              ///< Sum over resets of traded value / portfolio value

            size_t size() const { return value_series.size(); }

            // -------------------------------------------------------------------
            // Inline metrics
            // -------------------------------------------------------------------

            Eigen::VectorXd quantities_at(size_t t) const;

            /**
             * @brief Implied weights q_i p_i / value at timestamp t.
             */
            Eigen::VectorXd weights_at(size_t t) const;

            double final_value() const;
            double total_return() const;

            /**
             * @brief Worst peak-to-trough decline of the value series (<= 0).
             */
            double max_drawdown() const;

            /**
             * @brief Relative change of each asset's quantity since t0.
             */
            Eigen::VectorXd quantity_drift() const;

            // -------------------------------------------------------------------
            // Export
            // -------------------------------------------------------------------

            void print_summary() const;

            /**
             * @brief Write date, value, cumulative return and rebalance flag.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_to_csv(const std::string &filepath) const;

            /**
             * @brief Write the quantity series, one column per asset.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_quantities_to_csv(const std::string &filepath) const;
        };

        struct SimulationParams
        {
            RebalanceConfig rebalance;

            static SimulationParams from_config(const AnalysisConfig &config);
        };

        /**
         * @class RebalancingSimulator
         * @brief Tracks unit holdings through an aligned price table, resetting
         *        them to target weights at every scheduled boundary.
         *
         * Between boundaries quantities are carried unchanged and the value
         * drifts with prices. At a boundary the value is first computed with the
         * carried quantities, then q_i = value * w_i / p_i.
         */
        class RebalancingSimulator
        {
        public:
            explicit RebalancingSimulator(const SimulationParams &params);
            ~RebalancingSimulator() = default;

            /**
             * @brief Run the simulation.
             * @throws InvalidWeightsError if the weights fail validation
             * @throws DimensionMismatchError if weights and assets differ in count
             * @throws InsufficientHistoryError if the table has no timestamps
             * @throws InvalidPriceError if any price is non-positive
             */
            SimulationResult simulate(const MarketData &market_data,
                                      const Eigen::VectorXd &weights) const;

            const SimulationParams &params() const { return params_; }

        private:
            SimulationParams params_;
        };

        /**
         * @brief Simulate with default capital and the calendar boundary rule.
         */
        SimulationResult simulate(const MarketData &market_data,
                                  const Eigen::VectorXd &weights,
                                  RebalanceFrequency frequency);

    } // namespace backtest
} // namespace cryptofolio
