#include <catch2/catch_test_macros.hpp>
#include "backtest/rebalance_scheduler.hpp"
#include "data/calendar.hpp"
#include <nlohmann/json.hpp>

using namespace cryptofolio;
using namespace cryptofolio::backtest;

namespace {

std::vector<std::string> consecutive_days(const std::string& start, int n) {
    std::vector<std::string> dates;
    for (int i = 0; i < n; ++i) {
        dates.push_back(calendar::add_days(start, i));
    }
    return dates;
}

RebalanceScheduler make_scheduler(RebalanceFrequency f, BoundaryRule rule = BoundaryRule::CALENDAR) {
    RebalanceConfig cfg;
    cfg.frequency = f;
    cfg.boundary_rule = rule;
    return RebalanceScheduler(cfg);
}

} // namespace

TEST_CASE("RebalanceScheduler calendar boundaries", "[RebalanceScheduler]") {
    SECTION("Daily fires on every new calendar day") {
        auto s = make_scheduler(RebalanceFrequency::DAILY);
        REQUIRE(s.is_boundary("2024-01-01", "2024-01-01", "2024-01-02"));
        REQUIRE(s.is_boundary("2024-01-01", "2024-01-02", "2024-01-05"));
        REQUIRE_FALSE(s.is_boundary("2024-01-01", "2024-01-02 08:00", "2024-01-02 16:00"));
    }

    SECTION("Weekly fires when the ISO week changes") {
        auto s = make_scheduler(RebalanceFrequency::WEEKLY);
        // 2024-01-07 is a Sunday
        REQUIRE(s.is_boundary("2024-01-01", "2024-01-07", "2024-01-08"));
        REQUIRE_FALSE(s.is_boundary("2024-01-01", "2024-01-08", "2024-01-10"));
        // Gap over a whole week
        REQUIRE(s.is_boundary("2024-01-01", "2024-01-03", "2024-01-17"));
    }

    SECTION("Weekly across a year end") {
        auto s = make_scheduler(RebalanceFrequency::WEEKLY);
        REQUIRE(s.is_boundary("2024-12-01", "2024-12-29", "2024-12-30"));
        REQUIRE_FALSE(s.is_boundary("2024-12-01", "2024-12-31", "2025-01-01"));
    }

    SECTION("Monthly fires when the calendar month changes") {
        auto s = make_scheduler(RebalanceFrequency::MONTHLY);
        REQUIRE(s.is_boundary("2024-01-01", "2024-01-31", "2024-02-01"));
        REQUIRE_FALSE(s.is_boundary("2024-01-01", "2024-02-01", "2024-02-29"));
        REQUIRE(s.is_boundary("2024-01-01", "2024-12-31", "2025-01-01"));
    }

    SECTION("None never fires") {
        auto s = make_scheduler(RebalanceFrequency::NONE);
        REQUIRE_FALSE(s.is_boundary("2024-01-01", "2024-01-31", "2024-02-01"));
        REQUIRE(s.stride_days() == 0);
    }
}

TEST_CASE("RebalanceScheduler boundary mask", "[RebalanceScheduler]") {
    // 2024-01-01 is a Monday
    auto dates = consecutive_days("2024-01-01", 30);

    SECTION("Weekly calendar") {
        auto mask = make_scheduler(RebalanceFrequency::WEEKLY).boundary_mask(dates);
        REQUIRE(mask.size() == 30);
        REQUIRE_FALSE(mask[0]);
        for (size_t t = 1; t < mask.size(); ++t) {
            REQUIRE(mask[t] == (t % 7 == 0));
        }
    }

    SECTION("Daily") {
        auto mask = make_scheduler(RebalanceFrequency::DAILY).boundary_mask(dates);
        REQUIRE_FALSE(mask[0]);
        for (size_t t = 1; t < mask.size(); ++t) {
            REQUIRE(mask[t]);
        }
    }

    SECTION("Weekly fixed stride starting mid-week") {
        auto mid = consecutive_days("2024-01-03", 15);
        auto s = make_scheduler(RebalanceFrequency::WEEKLY, BoundaryRule::FIXED_STRIDE);
        REQUIRE(s.stride_days() == 7);
        auto mask = s.boundary_mask(mid);
        REQUIRE(mask[7]);
        REQUIRE(mask[14]);
        // Calendar rule would fire on Monday 2024-01-08 (index 5)
        REQUIRE_FALSE(mask[5]);
    }

    SECTION("Monthly fixed stride") {
        auto long_dates = consecutive_days("2024-01-15", 65);
        auto mask = make_scheduler(RebalanceFrequency::MONTHLY, BoundaryRule::FIXED_STRIDE)
                        .boundary_mask(long_dates);
        size_t fired = 0;
        for (bool b : mask) fired += b ? 1 : 0;
        REQUIRE(fired == 2);
        REQUIRE(mask[30]);
        REQUIRE(mask[60]);
    }

    SECTION("Empty and single-date inputs") {
        auto s = make_scheduler(RebalanceFrequency::DAILY);
        REQUIRE(s.boundary_mask({}).empty());
        auto one = s.boundary_mask({"2024-01-01"});
        REQUIRE(one.size() == 1);
        REQUIRE_FALSE(one[0]);
    }
}

TEST_CASE("RebalanceConfig parsing", "[RebalanceScheduler][Config]") {
    REQUIRE(RebalanceConfig::parse_frequency("Weekly") == RebalanceFrequency::WEEKLY);
    REQUIRE(RebalanceConfig::parse_frequency("ME") == RebalanceFrequency::MONTHLY);
    REQUIRE(RebalanceConfig::parse_frequency("d") == RebalanceFrequency::DAILY);
    REQUIRE(RebalanceConfig::parse_frequency("buy_and_hold") == RebalanceFrequency::NONE);
    REQUIRE_THROWS_AS(RebalanceConfig::parse_frequency("quarterly"), std::invalid_argument);

    REQUIRE(RebalanceConfig::parse_boundary_rule("stride") == BoundaryRule::FIXED_STRIDE);
    REQUIRE_THROWS_AS(RebalanceConfig::parse_boundary_rule("anchored"), std::invalid_argument);

    auto cfg = RebalanceConfig::from_json(nlohmann::json{{"frequency", "daily"}, {"initial_capital", 250.0}});
    REQUIRE(cfg.frequency == RebalanceFrequency::DAILY);
    REQUIRE(cfg.boundary_rule == BoundaryRule::CALENDAR);
    REQUIRE(cfg.initial_capital == 250.0);
    REQUIRE_THROWS_AS(RebalanceConfig::from_json(nlohmann::json{{"initial_capital", 0.0}}),
                      std::invalid_argument);

    REQUIRE(RebalanceConfig::from_string("monthly").frequency == RebalanceFrequency::MONTHLY);
    REQUIRE(to_string(RebalanceFrequency::WEEKLY) == "weekly");
    REQUIRE(to_string(BoundaryRule::FIXED_STRIDE) == "fixed_stride");
}
