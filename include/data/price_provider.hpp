/**
 * @file price_provider.hpp
 * @brief Upstream price sources and the cached aligned-series provider.
 */

#ifndef CRYPTOFOLIO_DATA_PRICE_PROVIDER_HPP
#define CRYPTOFOLIO_DATA_PRICE_PROVIDER_HPP

#include "data/market_data.hpp"
#include "data/price_aligner.hpp"
#include "data/price_cache.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cryptofolio
{

    /**
     * @class PriceSource
     * @brief Interface of an upstream historical price feed.
     */
    class PriceSource
    {
    public:
        virtual ~PriceSource() = default;

        /**
         * @brief Fetch the trailing price history of one asset.
         * @param asset_id Asset identifier
         * @param lookback_days Calendar days ending at the newest observation
         * @throws InsufficientDataError if the asset is unknown or has no data
         */
        virtual PriceSeries fetch_history(const std::string &asset_id, int lookback_days) = 0;

        virtual std::string name() const = 0;
    };

    /**
     * @class CsvPriceSource
     * @brief PriceSource backed by a CSV file (wide or long layout).
     *
     * The file is read once at construction.
     */
    class CsvPriceSource : public PriceSource
    {
    public:
        /**
         * @throws std::runtime_error if the file cannot be read
         */
        explicit CsvPriceSource(const std::string &filepath);

        PriceSeries fetch_history(const std::string &asset_id, int lookback_days) override;
        std::string name() const override { return "csv:" + filepath_; }

        std::vector<std::string> available_assets() const;

    private:
        std::string filepath_;
        std::map<std::string, PriceSeries> series_;
    };

    /**
     * @class PriceDataProvider
     * @brief Fetches, caches and aligns price histories for a set of assets.
     *
     * Repeated requests within the cache TTL are served without touching the
     * upstream source. Failures of the source surface as InsufficientDataError.
     */
    class PriceDataProvider
    {
    public:
        PriceDataProvider(std::shared_ptr<PriceSource> source, PriceCache cache);

        /**
         * @brief Aligned price table of the trailing lookback window.
         * @param asset_ids Assets in output column order
         * @param lookback_days Trailing window in calendar days (> 0)
         * @param min_timestamps Minimum common timestamps required
         * @throws InsufficientDataError if a history is missing or the
         *         histories share no timestamp
         * @throws InsufficientHistoryError if fewer than min_timestamps remain
         */
        MarketData fetch_aligned_series(const std::vector<std::string> &asset_ids,
                                        int lookback_days,
                                        size_t min_timestamps = 2);

        const PriceCache &cache() const { return cache_; }
        PriceCache &cache() { return cache_; }

    private:
        PriceSeries fetch_one(const std::string &asset_id, int lookback_days);

        std::shared_ptr<PriceSource> source_;
        PriceCache cache_;
    };

} // namespace cryptofolio

#endif // CRYPTOFOLIO_DATA_PRICE_PROVIDER_HPP
