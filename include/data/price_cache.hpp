/**
 * @file price_cache.hpp
 * @brief Time-to-live cache of per-asset price histories.
 */

#ifndef CRYPTOFOLIO_DATA_PRICE_CACHE_HPP
#define CRYPTOFOLIO_DATA_PRICE_CACHE_HPP

#include "data/price_aligner.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace cryptofolio
{

    /**
     * @class PriceCache
     * @brief Key to PriceSeries store whose entries expire after a fixed TTL.
     *
     * The clock is injectable so expiry can be driven by tests. An entry
     * stored at time t is served for lookups strictly before t + ttl.
     *
     * @note Not thread-safe. Use one cache per thread.
     */
    class PriceCache
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;
        using ClockFn = std::function<TimePoint()>;

        /**
         * @param ttl Lifetime of an entry; zero disables caching
         * @param clock Time source, steady_clock::now by default
         */
        explicit PriceCache(std::chrono::seconds ttl = std::chrono::seconds(300),
                            ClockFn clock = ClockFn());

        /**
         * @brief Look up a live entry.
         * @return The cached series, or nullopt if absent or expired
         */
        std::optional<PriceSeries> get(const std::string &key);

        void put(const std::string &key, const PriceSeries &series);

        /**
         * @brief Remove one entry.
         * @return true if the key was present
         */
        bool invalidate(const std::string &key);

        void clear();

        /**
         * @brief Drop every expired entry.
         * @return Number of entries removed
         */
        size_t purge_expired();

        size_t size() const { return entries_.size(); }
        size_t hits() const { return hits_; }
        size_t misses() const { return misses_; }
        std::chrono::seconds ttl() const { return ttl_; }

        /**
         * @brief Cache key of one asset history request, "asset|lookback".
         */
        static std::string make_key(const std::string &asset_id, int lookback_days);

    private:
        struct Entry
        {
            PriceSeries series;
            TimePoint expires_at;
        };

        TimePoint now() const;

        std::chrono::seconds ttl_;
        ClockFn clock_;
        std::map<std::string, Entry> entries_;
        size_t hits_ = 0;
        size_t misses_ = 0;
    };

} // namespace cryptofolio

#endif // CRYPTOFOLIO_DATA_PRICE_CACHE_HPP
