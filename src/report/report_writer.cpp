/**
 * @file report_writer.cpp
 * @brief Implementation of the report writer
 */

#include "report/report_writer.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cryptofolio
{
    namespace report
    {

        namespace
        {
            const char *const RULE = "====================================================\n";
            const char *const THIN_RULE = "----------------------------------------------------\n";

            std::string upper(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::toupper(c)); });
                return s;
            }

            std::string signed_pct(double fraction)
            {
                std::ostringstream out;
                out << std::showpos << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
                return out.str();
            }
        } // anonymous namespace

        std::string report_filename(const MarketData &prices)
        {
            if (prices.num_dates() == 0)
            {
                throw std::invalid_argument("Cannot name a report for an empty price table");
            }
            // Only the date part, timestamps may carry a time of day
            return "portfolio_report_" + prices.get_dates().back().substr(0, 10) + ".txt";
        }

        std::string format_text_report(const AnalysisReport &report)
        {
            const MarketData &prices = report.prices;
            const analytics::MetricsResult &metrics = report.metrics;
            const backtest::SimulationResult &sim = report.simulation;
            const std::vector<std::string> &assets = prices.get_tickers();
            const Eigen::MatrixXd &p = prices.get_prices();
            const Eigen::Index last = p.rows() - 1;

            std::ostringstream out;
            out << std::fixed << std::setprecision(2);

            out << RULE;
            out << "PORTFOLIO REPORT - " << report.generated_at << "\n";
            out << "Period: " << prices.get_dates().front() << " to " << prices.get_dates().back()
                << " (" << prices.num_dates() << " observations)\n";
            out << RULE << "\n";

            // --- Section 1: assets
            out << "SECTION 1: INDIVIDUAL ASSETS\n";
            out << THIN_RULE;
            for (size_t i = 0; i < assets.size(); ++i)
            {
                const auto j = static_cast<Eigen::Index>(i);
                out << "Asset: " << upper(assets[i]) << "\n";
                out << " * Price: $" << p(last, j);
                if (last > 0)
                {
                    out << " (" << signed_pct(p(last, j) / p(last - 1, j) - 1.0) << ")";
                }
                out << "\n";
                out << " * Annualized return: " << metrics.asset_annual_return_pct[j] << "%\n";
                out << " * Annualized volatility: " << metrics.asset_annual_volatility_pct[j] << "%\n\n";
            }

            // --- Section 2: portfolio
            out << "SECTION 2: PORTFOLIO PERFORMANCE\n";
            out << THIN_RULE;
            out << "Strategy: " << backtest::to_string(sim.rebalance.frequency) << " rebalancing ("
                << backtest::to_string(sim.rebalance.boundary_rule) << " boundaries)\n";
            out << " * Annualized return: " << metrics.annual_return_pct << "%\n";
            out << " * Portfolio volatility: " << metrics.annual_volatility_pct << "%\n";
            out << " * Sharpe ratio: " << metrics.sharpe_ratio << "\n";
            out << " * Max drawdown: " << metrics.max_drawdown * 100.0 << "%\n";
            out << std::setprecision(4);
            out << " * Simulated value: " << sim.final_value() << " (initial "
                << sim.rebalance.initial_capital << ", " << signed_pct(sim.total_return()) << ")\n";
            out << " * Rebalances: " << sim.rebalance_count << ", turnover " << sim.turnover << "\n\n";

            // --- Section 3: quantities
            out << "SECTION 3: QUANTITY ADJUSTMENTS\n";
            out << THIN_RULE;
            Eigen::VectorXd current = sim.quantities_at(sim.size() - 1);
            Eigen::VectorXd drift = sim.quantity_drift();
            for (size_t i = 0; i < assets.size(); ++i)
            {
                const auto j = static_cast<Eigen::Index>(i);
                out << " * " << upper(assets[i]) << ": " << std::setprecision(6) << current[j]
                    << " units (" << signed_pct(drift[j]) << " total drift)\n";
            }
            out << "\n";

            // --- Section 4: correlation
            out << "SECTION 4: CORRELATION MATRIX\n";
            out << THIN_RULE;
            out << std::setprecision(3);
            out << std::setw(12) << "";
            for (const auto &a : assets)
            {
                out << std::setw(12) << a.substr(0, 11);
            }
            out << "\n";
            for (size_t i = 0; i < assets.size(); ++i)
            {
                out << std::setw(12) << assets[i].substr(0, 11);
                for (size_t k = 0; k < assets.size(); ++k)
                {
                    out << std::setw(12)
                        << metrics.correlation(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k));
                }
                out << "\n";
            }

            out << "\n[End of Portfolio Report]\n";
            return out.str();
        }

        nlohmann::json build_summary_json(const AnalysisReport &report)
        {
            const backtest::SimulationResult &sim = report.simulation;

            nlohmann::json j;
            j["generated_at"] = report.generated_at;
            j["metrics"] = report.metrics.to_json();

            nlohmann::json quantities = nlohmann::json::object();
            Eigen::VectorXd current = sim.quantities_at(sim.size() - 1);
            Eigen::VectorXd drift = sim.quantity_drift();
            for (size_t i = 0; i < sim.tickers.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                quantities[sim.tickers[i]] = {{"units", current[idx]}, {"drift", drift[idx]}};
            }

            j["simulation"] = {
                {"frequency", backtest::to_string(sim.rebalance.frequency)},
                {"boundary_rule", backtest::to_string(sim.rebalance.boundary_rule)},
                {"initial_capital", sim.rebalance.initial_capital},
                {"final_value", sim.final_value()},
                {"total_return", sim.total_return()},
                {"max_drawdown", sim.max_drawdown()},
                {"rebalance_count", sim.rebalance_count},
                {"turnover", sim.turnover},
                {"quantities", quantities}};

            return j;
        }

        void write_text_report(const AnalysisReport &report, const std::string &path)
        {
            std::string text = format_text_report(report);
            std::ofstream ofs(path);
            if (!ofs.is_open())
            {
                throw std::runtime_error("write_text_report: cannot open " + path);
            }
            ofs << text;
        }

        void write_summary_json(const AnalysisReport &report, const std::string &path)
        {
            nlohmann::json j = build_summary_json(report);
            std::ofstream ofs(path);
            if (!ofs.is_open())
            {
                throw std::runtime_error("write_summary_json: cannot open " + path);
            }
            ofs << j.dump(2) << "\n";
        }

    } // namespace report
} // namespace cryptofolio
