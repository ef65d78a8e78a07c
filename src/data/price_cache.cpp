/**
 * @file price_cache.cpp
 * @brief Implementation of PriceCache
 */

#include "data/price_cache.hpp"

#include <stdexcept>
#include <utility>

namespace cryptofolio
{

    PriceCache::PriceCache(std::chrono::seconds ttl, ClockFn clock)
        : ttl_(ttl), clock_(std::move(clock))
    {
        if (ttl_.count() < 0)
        {
            throw std::invalid_argument("Cache TTL must not be negative");
        }
    }

    std::optional<PriceSeries> PriceCache::get(const std::string &key)
    {
        auto it = entries_.find(key);
        if (it == entries_.end())
        {
            ++misses_;
            return std::nullopt;
        }

        if (now() >= it->second.expires_at)
        {
            entries_.erase(it);
            ++misses_;
            return std::nullopt;
        }

        ++hits_;
        return it->second.series;
    }

    void PriceCache::put(const std::string &key, const PriceSeries &series)
    {
        if (ttl_.count() == 0)
        {
            return;
        }
        entries_[key] = Entry{series, now() + ttl_};
    }

    bool PriceCache::invalidate(const std::string &key)
    {
        return entries_.erase(key) > 0;
    }

    void PriceCache::clear()
    {
        entries_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    size_t PriceCache::purge_expired()
    {
        const TimePoint t = now();
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (t >= it->second.expires_at)
            {
                it = entries_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::string PriceCache::make_key(const std::string &asset_id, int lookback_days)
    {
        return asset_id + "|" + std::to_string(lookback_days);
    }

    PriceCache::TimePoint PriceCache::now() const
    {
        if (clock_)
        {
            return clock_();
        }
        return std::chrono::steady_clock::now();
    }

} // namespace cryptofolio
