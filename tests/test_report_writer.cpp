/**
 * @file test_report_writer.cpp
 * @brief Unit tests for text and JSON report output
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "report/report_writer.hpp"
#include "data/data_loader.hpp"
#include "backtest/allocation_validator.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace cryptofolio;
using Catch::Matchers::ContainsSubstring;

namespace {

struct ReportFixture {
    MarketData prices;
    analytics::MetricsResult metrics;
    backtest::SimulationResult simulation;

    ReportFixture()
        : prices(DataLoader::generate_synthetic_data({"bitcoin", "ethereum"}, 45, "2024-03-01")) {
        Eigen::VectorXd w = backtest::equal_weights(2);
        metrics = analytics::compute_metrics(prices, w);
        simulation = backtest::simulate(prices, w, backtest::RebalanceFrequency::MONTHLY);
    }

    report::AnalysisReport report() const {
        return report::AnalysisReport("2024-04-14 09:30", prices, metrics, simulation);
    }
};

} // namespace

TEST_CASE_METHOD(ReportFixture, "Text report layout", "[ReportWriter]") {
    std::string text = report::format_text_report(report());

    REQUIRE_THAT(text, ContainsSubstring("PORTFOLIO REPORT - 2024-04-14 09:30"));
    REQUIRE_THAT(text, ContainsSubstring("SECTION 1: INDIVIDUAL ASSETS"));
    REQUIRE_THAT(text, ContainsSubstring("Asset: BITCOIN"));
    REQUIRE_THAT(text, ContainsSubstring("SECTION 2: PORTFOLIO PERFORMANCE"));
    REQUIRE_THAT(text, ContainsSubstring("Strategy: monthly rebalancing (calendar boundaries)"));
    REQUIRE_THAT(text, ContainsSubstring("Rebalances: 1"));
    REQUIRE_THAT(text, ContainsSubstring("SECTION 3: QUANTITY ADJUSTMENTS"));
    REQUIRE_THAT(text, ContainsSubstring("SECTION 4: CORRELATION MATRIX"));
    REQUIRE_THAT(text, ContainsSubstring("[End of Portfolio Report]"));

    REQUIRE(report::report_filename(prices) == "portfolio_report_2024-04-14.txt");
}

TEST_CASE_METHOD(ReportFixture, "Summary JSON", "[ReportWriter]") {
    auto j = report::build_summary_json(report());

    REQUIRE(j["generated_at"] == "2024-04-14 09:30");
    REQUIRE(j["metrics"]["assets"].size() == 2);
    REQUIRE(j["simulation"]["frequency"] == "monthly");
    REQUIRE(j["simulation"]["rebalance_count"] == 1);
    REQUIRE(j["simulation"]["quantities"].contains("ethereum"));
    REQUIRE(j["simulation"]["initial_capital"] == 1.0);
}

TEST_CASE_METHOD(ReportFixture, "Writing report files", "[ReportWriter]") {
    const auto dir = std::filesystem::temp_directory_path();
    const auto text_path = (dir / "cryptofolio_report.txt").string();
    const auto json_path = (dir / "cryptofolio_metrics.json").string();

    report::write_text_report(report(), text_path);
    report::write_summary_json(report(), json_path);

    std::ifstream text_in(text_path);
    std::stringstream buffer;
    buffer << text_in.rdbuf();
    REQUIRE(buffer.str() == report::format_text_report(report()));

    std::ifstream json_in(json_path);
    auto j = nlohmann::json::parse(json_in);
    REQUIRE(j["simulation"]["rebalance_count"] == 1);

    std::filesystem::remove(text_path);
    std::filesystem::remove(json_path);

    REQUIRE_THROWS_AS(report::write_text_report(report(), (dir / "missing_dir" / "r.txt").string()),
                      std::runtime_error);
}

TEST_CASE_METHOD(ReportFixture, "Report binds the run results", "[ReportWriter]") {
    auto r = report();
    REQUIRE(&r.prices == &prices);
    REQUIRE(&r.metrics == &metrics);
    REQUIRE(&r.simulation == &simulation);
    REQUIRE(r.generated_at == "2024-04-14 09:30");
}
