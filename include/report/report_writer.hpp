/**
 * @file report_writer.hpp
 * @brief Text and JSON output of a full portfolio analysis run.
 */

#ifndef CRYPTOFOLIO_REPORT_REPORT_WRITER_HPP
#define CRYPTOFOLIO_REPORT_REPORT_WRITER_HPP

#include "data/market_data.hpp"
#include "analytics/portfolio_metrics.hpp"
#include "backtest/rebalancing_simulator.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace cryptofolio
{
    namespace report
    {

        /**
         * @struct AnalysisReport
         * @brief Everything one report is rendered from.
         *
         * Binds the results of a run without copying them; the referenced
         * objects must outlive the report.
         */
        struct AnalysisReport
        {
            AnalysisReport(std::string generated_at,
                           const MarketData &prices,
                           const analytics::MetricsResult &metrics,
                           const backtest::SimulationResult &simulation)
                : generated_at(std::move(generated_at)), prices(prices), metrics(metrics), simulation(simulation)
            {
            }

            std::string generated_at;                 ///< Timestamp printed in the header
            const MarketData &prices;                 ///< Aligned prices the run used
            const analytics::MetricsResult &metrics;
            const backtest::SimulationResult &simulation;
        };

        /**
         * @brief File name of the text report, "portfolio_report_<last date>.txt".
         */
        std::string report_filename(const MarketData &prices);

        /**
         * @brief Render the human-readable report.
         *
         * Sections: per-asset snapshot, portfolio metrics, quantity
         * adjustments since inception and the correlation matrix.
         */
        std::string format_text_report(const AnalysisReport &report);

        /**
         * @brief Metrics plus a simulation summary as one JSON document.
         */
        nlohmann::json build_summary_json(const AnalysisReport &report);

        /**
         * @throws std::runtime_error if the file cannot be opened
         */
        void write_text_report(const AnalysisReport &report, const std::string &path);

        /**
         * @throws std::runtime_error if the file cannot be opened
         */
        void write_summary_json(const AnalysisReport &report, const std::string &path);

    } // namespace report
} // namespace cryptofolio

#endif // CRYPTOFOLIO_REPORT_REPORT_WRITER_HPP
