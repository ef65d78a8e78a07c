/**
 * @file test_price_aligner.cpp
 * @brief Unit tests for PriceSeries and timestamp alignment
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/price_aligner.hpp"
#include "core/errors.hpp"

#include <limits>

using namespace cryptofolio;
using Catch::Matchers::WithinAbs;

namespace {

PriceSeries make_series(const std::string& id,
                        const std::vector<std::string>& ts,
                        const std::vector<double>& px) {
    PriceSeries s;
    s.asset_id = id;
    s.timestamps = ts;
    s.prices = px;
    return s;
}

} // namespace

TEST_CASE("PriceSeries validation", "[PriceAligner]") {
    SECTION("Valid series") {
        auto s = make_series("bitcoin", {"2024-01-01", "2024-01-02"}, {40000.0, 41000.0});
        REQUIRE_NOTHROW(s.validate());
        REQUIRE(s.size() == 2);
    }

    SECTION("Empty series") {
        PriceSeries s;
        s.asset_id = "bitcoin";
        REQUIRE(s.empty());
        REQUIRE_THROWS_AS(s.validate(), InsufficientDataError);
    }

    SECTION("Unsorted timestamps") {
        auto s = make_series("bitcoin", {"2024-01-02", "2024-01-01"}, {1.0, 2.0});
        REQUIRE_THROWS_AS(s.validate(), std::invalid_argument);
    }

    SECTION("Non-positive price") {
        auto s = make_series("bitcoin", {"2024-01-01", "2024-01-02"}, {1.0, -2.0});
        REQUIRE_THROWS_AS(s.validate(), InvalidPriceError);
    }

    SECTION("Trailing window") {
        auto s = make_series("bitcoin",
                             {"2024-01-01", "2024-01-05", "2024-01-09", "2024-01-10"},
                             {1.0, 2.0, 3.0, 4.0});
        auto w = s.trailing_window(5);
        REQUIRE(w.size() == 3);
        REQUIRE(w.timestamps.front() == "2024-01-05");
        REQUIRE(w.asset_id == "bitcoin");
        REQUIRE_THROWS_AS(s.trailing_window(-1), std::invalid_argument);
    }
}

TEST_CASE("Alignment keeps only shared timestamps", "[PriceAligner]") {
    auto btc = make_series("bitcoin",
                           {"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04"},
                           {100.0, 101.0, 102.0, 103.0});
    auto eth = make_series("ethereum",
                           {"2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"},
                           {10.0, 11.0, 12.0, 13.0});
    auto sol = make_series("solana",
                           {"2024-01-02", "2024-01-04", "2024-01-05"},
                           {1.0, 2.0, 3.0});

    SECTION("Two assets") {
        auto md = PriceAligner::align({btc, eth});
        REQUIRE(md.num_dates() == 3);
        REQUIRE(md.get_dates().front() == "2024-01-02");
        REQUIRE(md.get_dates().back() == "2024-01-04");
        REQUIRE_THAT(md.get_prices()(0, 0), WithinAbs(101.0, 1e-12));
        REQUIRE_THAT(md.get_prices()(0, 1), WithinAbs(10.0, 1e-12));
    }

    SECTION("Asset order follows the input") {
        auto md = PriceAligner::align({sol, btc, eth});
        REQUIRE(md.get_tickers() == std::vector<std::string>{"solana", "bitcoin", "ethereum"});
        REQUIRE(md.get_dates() == std::vector<std::string>{"2024-01-02", "2024-01-04"});
        REQUIRE_THAT(md.get_prices()(1, 0), WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(md.get_prices()(1, 1), WithinAbs(103.0, 1e-12));
        REQUIRE_THAT(md.get_prices()(1, 2), WithinAbs(12.0, 1e-12));
    }

    SECTION("Minimum overlap") {
        REQUIRE_THROWS_AS(PriceAligner::align({sol, btc, eth}, 3), InsufficientHistoryError);
        REQUIRE_NOTHROW(PriceAligner::align({sol, btc, eth}, 2));
    }
}

TEST_CASE("Alignment failures", "[PriceAligner]") {
    auto a = make_series("a", {"2024-01-01", "2024-01-02"}, {1.0, 2.0});
    auto b = make_series("b", {"2024-02-01", "2024-02-02"}, {1.0, 2.0});

    REQUIRE_THROWS_AS(PriceAligner::align(std::vector<PriceSeries>{}), InsufficientDataError);
    REQUIRE_THROWS_AS(PriceAligner::align({a, b}), InsufficientDataError);
    REQUIRE_THROWS_AS(PriceAligner::align({a, a}), std::invalid_argument);

    try {
        PriceAligner::align({a, b});
        FAIL("expected InsufficientDataError");
    } catch (const PortfolioError& e) {
        REQUIRE(e.code() == ErrorCode::INSUFFICIENT_DATA);
    }
}

TEST_CASE("Split and realign a padded table", "[PriceAligner]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Eigen::MatrixXd prices(3, 2);
    prices << 1.0, nan,
              2.0, 20.0,
              3.0, 30.0;
    MarketData padded(prices, {"2024-01-01", "2024-01-02", "2024-01-03"}, {"a", "b"});

    auto parts = PriceAligner::split(padded);
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0].size() == 3);
    REQUIRE(parts[1].size() == 2);

    auto aligned = PriceAligner::align(padded);
    REQUIRE(aligned.num_dates() == 2);
    REQUIRE(aligned.count_missing() == 0);
    REQUIRE(aligned.get_dates().front() == "2024-01-02");
}
