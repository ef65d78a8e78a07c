/**
 * @file test_price_cache.cpp
 * @brief Unit tests for the TTL price cache
 */

#include <catch2/catch_test_macros.hpp>
#include "data/price_cache.hpp"

#include <chrono>
#include <memory>

using namespace cryptofolio;

namespace {

// Manually advanced clock shared with the cache under test
struct FakeClock {
    std::shared_ptr<PriceCache::TimePoint> now =
        std::make_shared<PriceCache::TimePoint>(std::chrono::steady_clock::time_point{});

    PriceCache::ClockFn fn() const {
        auto t = now;
        return [t]() { return *t; };
    }

    void advance(std::chrono::seconds s) { *now += s; }
};

PriceSeries sample_series() {
    PriceSeries s;
    s.asset_id = "bitcoin";
    s.timestamps = {"2024-01-01", "2024-01-02"};
    s.prices = {42000.0, 43000.0};
    return s;
}

} // namespace

TEST_CASE("PriceCache hit and miss", "[PriceCache]") {
    FakeClock clock;
    PriceCache cache(std::chrono::seconds(300), clock.fn());
    const auto key = PriceCache::make_key("bitcoin", 365);

    REQUIRE(key == "bitcoin|365");
    REQUIRE_FALSE(cache.get(key).has_value());
    REQUIRE(cache.misses() == 1);

    cache.put(key, sample_series());
    auto hit = cache.get(key);
    REQUIRE(hit.has_value());
    REQUIRE(hit->prices.size() == 2);
    REQUIRE(cache.hits() == 1);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("PriceCache expiry", "[PriceCache]") {
    FakeClock clock;
    PriceCache cache(std::chrono::seconds(300), clock.fn());
    const auto key = PriceCache::make_key("bitcoin", 30);
    cache.put(key, sample_series());

    SECTION("Fresh just before the TTL") {
        clock.advance(std::chrono::seconds(299));
        REQUIRE(cache.get(key).has_value());
    }

    SECTION("Expired at the TTL") {
        clock.advance(std::chrono::seconds(300));
        REQUIRE_FALSE(cache.get(key).has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Purge removes only stale entries") {
        clock.advance(std::chrono::seconds(200));
        cache.put(PriceCache::make_key("ethereum", 30), sample_series());
        clock.advance(std::chrono::seconds(150));
        REQUIRE(cache.purge_expired() == 1);
        REQUIRE(cache.size() == 1);
    }
}

TEST_CASE("PriceCache management", "[PriceCache]") {
    FakeClock clock;

    SECTION("Zero TTL disables caching") {
        PriceCache cache(std::chrono::seconds(0), clock.fn());
        cache.put("k", sample_series());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Negative TTL is rejected") {
        REQUIRE_THROWS_AS(PriceCache(std::chrono::seconds(-1)), std::invalid_argument);
    }

    SECTION("Invalidate and clear") {
        PriceCache cache(std::chrono::seconds(60), clock.fn());
        cache.put("a", sample_series());
        cache.put("b", sample_series());
        REQUIRE(cache.invalidate("a"));
        REQUIRE_FALSE(cache.invalidate("a"));
        REQUIRE(cache.get("b").has_value());

        cache.clear();
        REQUIRE(cache.size() == 0);
        REQUIRE(cache.hits() == 0);
        REQUIRE(cache.misses() == 0);
    }

    SECTION("Default TTL is five minutes") {
        PriceCache cache;
        REQUIRE(cache.ttl() == std::chrono::seconds(300));
    }
}
