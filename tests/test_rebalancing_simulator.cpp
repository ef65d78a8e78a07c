#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "backtest/rebalancing_simulator.hpp"
#include "data/calendar.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace cryptofolio;
using namespace cryptofolio::backtest;
using Catch::Matchers::WithinAbs;

namespace {

// Asset a doubles on day 1 and stays, asset b is flat
MarketData two_asset_jump(int days, const std::string& start = "2024-01-01") {
    Eigen::MatrixXd prices(days, 2);
    std::vector<std::string> dates;
    for (int i = 0; i < days; ++i) {
        prices(i, 0) = i == 0 ? 100.0 : 200.0;
        prices(i, 1) = 50.0;
        dates.push_back(calendar::add_days(start, i));
    }
    return MarketData(prices, dates, {"a", "b"});
}

Eigen::VectorXd half_half() {
    Eigen::VectorXd w(2);
    w << 0.5, 0.5;
    return w;
}

} // namespace

TEST_CASE("Initial allocation", "[RebalancingSimulator]") {
    SimulationParams params;
    params.rebalance.initial_capital = 1000.0;
    RebalancingSimulator sim(params);

    auto md = two_asset_jump(3);
    auto res = sim.simulate(md, half_half());

    REQUIRE(res.size() == 3);
    REQUIRE(res.value_series[0] == 1000.0);
    REQUIRE(res.rebalanced[0]);
    REQUIRE_THAT(res.quantities(0, 0), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(res.quantities(0, 1), WithinAbs(10.0, 1e-12));
    REQUIRE(res.dates == md.get_dates());
    REQUIRE(res.tickers == md.get_tickers());
}

TEST_CASE("Buy and hold keeps quantities", "[RebalancingSimulator]") {
    auto res = simulate(two_asset_jump(10), half_half(), RebalanceFrequency::NONE);

    REQUIRE(res.rebalance_count == 0);
    REQUIRE(res.turnover == 0.0);
    for (size_t t = 1; t < res.size(); ++t) {
        REQUIRE_FALSE(res.rebalanced[t]);
        REQUIRE(res.quantities_at(t).isApprox(res.quantities_at(0)));
    }
    REQUIRE_THAT(res.final_value(), WithinAbs(1.5, 1e-12));
    REQUIRE_THAT(res.total_return(), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(res.quantity_drift()[0], WithinAbs(0.0, 1e-12));
}

TEST_CASE("Daily rebalancing resets the mix every day", "[RebalancingSimulator]") {
    auto res = simulate(two_asset_jump(4), half_half(), RebalanceFrequency::DAILY);

    REQUIRE(res.rebalance_count == 3);
    // Day 1: value 1.5, holdings 1.0 / 0.5 traded to 0.75 / 0.75
    REQUIRE_THAT(res.value_series[1], WithinAbs(1.5, 1e-12));
    REQUIRE_THAT(res.quantities(1, 0), WithinAbs(0.75 / 200.0, 1e-12));
    REQUIRE_THAT(res.quantities(1, 1), WithinAbs(0.75 / 50.0, 1e-12));
    REQUIRE_THAT(res.weights_at(1)[0], WithinAbs(0.5, 1e-12));
    // Only the first rebalance trades
    REQUIRE_THAT(res.turnover, WithinAbs(0.5 / 1.5, 1e-12));
    REQUIRE_THAT(res.final_value(), WithinAbs(1.5, 1e-12));
}

TEST_CASE("Weekly rebalancing happens only at week starts", "[RebalancingSimulator]") {
    // 2024-01-03 is a Wednesday, the next Monday is index 5
    auto res = simulate(two_asset_jump(10, "2024-01-03"), half_half(), RebalanceFrequency::WEEKLY);

    REQUIRE(res.rebalance_count == 1);
    REQUIRE(res.rebalanced[5]);
    REQUIRE(res.quantities_at(4).isApprox(res.quantities_at(0)));
    REQUIRE_THAT(res.weights_at(5)[0], WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(res.weights_at(4)[0], WithinAbs(1.0 / 1.5, 1e-12));
}

TEST_CASE("Weights within tolerance but not summing to one", "[RebalancingSimulator]") {
    Eigen::VectorXd below(2);
    below << 0.49995, 0.5;
    Eigen::VectorXd above(2);
    above << 0.50005, 0.5;

    SECTION("Constant prices keep the initial value") {
        Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(40, 2, 100.0);
        std::vector<std::string> dates;
        for (int i = 0; i < 40; ++i) {
            dates.push_back(calendar::add_days("2024-01-01", i));
        }
        MarketData md(prices, dates, {"a", "b"});

        for (const Eigen::VectorXd& w : {below, above}) {
            for (auto freq : {RebalanceFrequency::NONE, RebalanceFrequency::DAILY,
                              RebalanceFrequency::WEEKLY, RebalanceFrequency::MONTHLY}) {
                auto res = simulate(md, w, freq);
                REQUIRE(res.value_series[0] == 1.0);
                for (size_t t = 0; t < res.size(); ++t) {
                    REQUIRE_THAT(res.value_series[t], WithinAbs(1.0, 1e-12));
                    REQUIRE_THAT(res.cash_series[t], WithinAbs(1.0 - w.sum(), 1e-12));
                }
                REQUIRE_THAT(res.max_drawdown(), WithinAbs(0.0, 1e-12));
                REQUIRE_THAT(res.turnover, WithinAbs(0.0, 1e-12));
            }
        }
    }

    SECTION("Resets restore the target weights") {
        for (const Eigen::VectorXd& w : {below, above}) {
            auto res = simulate(two_asset_jump(10, "2024-01-03"), w, RebalanceFrequency::DAILY);
            // Cash does not take part in the jump of asset a
            REQUIRE_THAT(res.value_series[1], WithinAbs(1.0 + w[0], 1e-12));
            for (size_t t = 0; t < res.size(); ++t) {
                REQUIRE(res.rebalanced[t]);
                Eigen::VectorXd wt = res.weights_at(t);
                REQUIRE_THAT(wt[0], WithinAbs(w[0], 1e-6));
                REQUIRE_THAT(wt[1], WithinAbs(w[1], 1e-6));
            }
        }
    }

    SECTION("Weekly value is unchanged by the reset") {
        auto res = simulate(two_asset_jump(10, "2024-01-03"), below, RebalanceFrequency::WEEKLY);
        // Buy and hold until the Monday at index 5
        const double held = 0.49995 * 2.0 + 0.5 + 0.00005;
        REQUIRE_THAT(res.value_series[4], WithinAbs(held, 1e-12));
        REQUIRE(res.rebalanced[5]);
        REQUIRE_THAT(res.value_series[5], WithinAbs(held, 1e-12));
        REQUIRE_THAT(res.weights_at(5)[0], WithinAbs(0.49995, 1e-6));
        REQUIRE_THAT(res.final_value(), WithinAbs(held, 1e-12));
    }
}

TEST_CASE("Simulator input validation", "[RebalancingSimulator]") {
    auto md = two_asset_jump(5);

    SECTION("Weights") {
        Eigen::VectorXd w(2);
        w << 0.5, 0.6;
        REQUIRE_THROWS_AS(simulate(md, w, RebalanceFrequency::DAILY), InvalidWeightsError);
    }

    SECTION("Dimension mismatch") {
        Eigen::VectorXd w(3);
        w << 0.2, 0.3, 0.5;
        REQUIRE_THROWS_AS(simulate(md, w, RebalanceFrequency::DAILY), DimensionMismatchError);
    }

    SECTION("Empty table") {
        MarketData empty(Eigen::MatrixXd(0, 2), {}, {"a", "b"});
        REQUIRE_THROWS_AS(simulate(empty, half_half(), RebalanceFrequency::DAILY), InsufficientHistoryError);
    }

    SECTION("Bad price") {
        Eigen::MatrixXd prices(2, 2);
        prices << 1.0, 1.0,
                  -1.0, 1.0;
        MarketData bad(prices, {"2024-01-01", "2024-01-02"}, {"a", "b"});
        REQUIRE_THROWS_AS(simulate(bad, half_half(), RebalanceFrequency::DAILY), InvalidPriceError);
    }

    SECTION("Capital must be positive") {
        SimulationParams params;
        params.rebalance.initial_capital = 0.0;
        REQUIRE_THROWS_AS(RebalancingSimulator(params), std::invalid_argument);
    }

    SECTION("Single timestamp") {
        auto one = two_asset_jump(1);
        auto res = simulate(one, half_half(), RebalanceFrequency::DAILY);
        REQUIRE(res.size() == 1);
        REQUIRE(res.final_value() == 1.0);
    }
}

TEST_CASE("Simulation export", "[RebalancingSimulator]") {
    auto res = simulate(two_asset_jump(3), half_half(), RebalanceFrequency::DAILY);
    const auto dir = std::filesystem::temp_directory_path();
    const auto values = (dir / "cryptofolio_values.csv").string();
    const auto quantities = (dir / "cryptofolio_quantities.csv").string();

    res.export_to_csv(values);
    res.export_quantities_to_csv(quantities);

    std::ifstream in(values);
    std::string header, first;
    std::getline(in, header);
    std::getline(in, first);
    REQUIRE(header == "date,value,cumulative_return,rebalanced");
    REQUIRE(first == "2024-01-01,1,0,1");

    std::ifstream qin(quantities);
    std::getline(qin, header);
    REQUIRE(header == "date,a,b");

    std::filesystem::remove(values);
    std::filesystem::remove(quantities);
}
