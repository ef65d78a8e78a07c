/**
 * @file price_provider.cpp
 * @brief Implementation of CsvPriceSource and PriceDataProvider
 */

#include "data/price_provider.hpp"
#include "data/data_loader.hpp"
#include "core/errors.hpp"

#include <stdexcept>
#include <utility>

namespace cryptofolio
{

    // ============================================================================
    // CsvPriceSource
    // ============================================================================

    CsvPriceSource::CsvPriceSource(const std::string &filepath)
        : filepath_(filepath)
    {
        for (auto &series : DataLoader::load_series(filepath_))
        {
            std::string id = series.asset_id;
            series_.emplace(std::move(id), std::move(series));
        }
    }

    PriceSeries CsvPriceSource::fetch_history(const std::string &asset_id, int lookback_days)
    {
        auto it = series_.find(asset_id);
        if (it == series_.end() || it->second.empty())
        {
            throw InsufficientDataError("no price history for '" + asset_id + "' in " + filepath_);
        }
        return it->second.trailing_window(lookback_days);
    }

    std::vector<std::string> CsvPriceSource::available_assets() const
    {
        std::vector<std::string> ids;
        ids.reserve(series_.size());
        for (const auto &entry : series_)
        {
            ids.push_back(entry.first);
        }
        return ids;
    }

    // ============================================================================
    // PriceDataProvider
    // ============================================================================

    PriceDataProvider::PriceDataProvider(std::shared_ptr<PriceSource> source, PriceCache cache)
        : source_(std::move(source)), cache_(std::move(cache))
    {
        if (!source_)
        {
            throw std::invalid_argument("PriceDataProvider requires a price source");
        }
    }

    MarketData PriceDataProvider::fetch_aligned_series(const std::vector<std::string> &asset_ids,
                                                       int lookback_days,
                                                       size_t min_timestamps)
    {
        if (asset_ids.empty())
        {
            throw InsufficientDataError("no assets requested");
        }
        if (lookback_days <= 0)
        {
            throw std::invalid_argument("Lookback window must be positive, got: " +
                                        std::to_string(lookback_days));
        }

        // Drop expired entries, including keys this call does not request
        cache_.purge_expired();

        std::vector<PriceSeries> histories;
        histories.reserve(asset_ids.size());
        for (const auto &id : asset_ids)
        {
            histories.push_back(fetch_one(id, lookback_days));
        }

        return PriceAligner::align(histories, min_timestamps);
    }

    PriceSeries PriceDataProvider::fetch_one(const std::string &asset_id, int lookback_days)
    {
        const std::string key = PriceCache::make_key(asset_id, lookback_days);
        if (auto cached = cache_.get(key))
        {
            return *cached;
        }

        PriceSeries series;
        try
        {
            series = source_->fetch_history(asset_id, lookback_days);
        }
        catch (const std::runtime_error &e)
        {
            throw InsufficientDataError("fetching '" + asset_id + "' from " + source_->name() +
                                        " failed: " + e.what());
        }

        if (series.empty())
        {
            throw InsufficientDataError("source " + source_->name() + " returned no history for '" +
                                        asset_id + "'");
        }

        cache_.put(key, series);
        return series;
    }

} // namespace cryptofolio
