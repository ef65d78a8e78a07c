/**
 * @file test_market_data.cpp
 * @brief Unit tests for the MarketData price table
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/market_data.hpp"
#include "core/errors.hpp"
#include <Eigen/Dense>

#include <cmath>
#include <limits>

using namespace cryptofolio;
using Catch::Matchers::WithinAbs;

namespace {

MarketData make_prices() {
    Eigen::MatrixXd prices(4, 2);
    prices << 100.0, 200.0,
              110.0, 210.0,
              105.0, 220.0,
              115.0, 215.0;
    std::vector<std::string> dates = {"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04"};
    std::vector<std::string> tickers = {"bitcoin", "ethereum"};
    return MarketData(prices, dates, tickers);
}

} // namespace

TEST_CASE("MarketData construction", "[MarketData]") {
    SECTION("Constructor with data") {
        auto data = make_prices();
        REQUIRE(data.num_dates() == 4);
        REQUIRE(data.num_assets() == 2);
        REQUIRE(data.get_tickers()[1] == "ethereum");
        REQUIRE_FALSE(data.empty());
    }

    SECTION("Dimension checks") {
        Eigen::MatrixXd prices(2, 2);
        prices << 1.0, 2.0, 3.0, 4.0;
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-01"}, {"a", "b"}), std::invalid_argument);
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-01", "2024-01-02"}, {"a"}), std::invalid_argument);
    }

    SECTION("Dates must be strictly increasing") {
        Eigen::MatrixXd prices(2, 1);
        prices << 1.0, 2.0;
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-02", "2024-01-01"}, {"a"}), std::invalid_argument);
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-01", "2024-01-01"}, {"a"}), std::invalid_argument);
    }

    SECTION("Asset ids must be unique") {
        Eigen::MatrixXd prices(1, 2);
        prices << 1.0, 2.0;
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-01"}, {"a", "a"}), std::invalid_argument);
    }
}

TEST_CASE("Return calculations", "[MarketData]") {
    auto data = make_prices();

    SECTION("Log returns are the default") {
        auto returns = data.calculate_returns();
        REQUIRE(returns.rows() == 3);
        REQUIRE(returns.cols() == 2);
        REQUIRE_THAT(returns(0, 0), WithinAbs(std::log(110.0 / 100.0), 1e-12));
        REQUIRE_THAT(returns(2, 1), WithinAbs(std::log(215.0 / 220.0), 1e-12));
    }

    SECTION("Simple returns") {
        auto returns = data.calculate_returns(ReturnType::SIMPLE);
        REQUIRE_THAT(returns(0, 0), WithinAbs(0.10, 1e-12));
    }

    SECTION("A single row has no returns") {
        Eigen::MatrixXd prices(1, 1);
        prices << 100.0;
        MarketData one(prices, {"2024-01-01"}, {"bitcoin"});
        REQUIRE_THROWS_AS(one.calculate_returns(), InsufficientHistoryError);
    }

    SECTION("Non-positive prices are rejected") {
        Eigen::MatrixXd prices(2, 1);
        prices << 100.0, 0.0;
        MarketData bad(prices, {"2024-01-01", "2024-01-02"}, {"bitcoin"});
        REQUIRE_THROWS_AS(bad.calculate_returns(), InvalidPriceError);
        REQUIRE_THROWS_AS(bad.validate_prices(), InvalidPriceError);
    }
}

TEST_CASE("Missing values", "[MarketData]") {
    Eigen::MatrixXd prices(3, 2);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    prices << 1.0, 2.0,
              nan, 2.0,
              1.5, 2.5;
    MarketData gappy(prices, {"2024-01-01", "2024-01-02", "2024-01-03"}, {"a", "b"});
    REQUIRE(gappy.count_missing() == 1);
    REQUIRE(make_prices().count_missing() == 0);
    REQUIRE_THROWS_AS(gappy.validate_prices(), InvalidPriceError);
}
