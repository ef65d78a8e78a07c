/**
 * @file price_aligner.hpp
 * @brief Intersect per-asset price series onto a common date index.
 */

#ifndef CRYPTOFOLIO_DATA_PRICE_ALIGNER_HPP
#define CRYPTOFOLIO_DATA_PRICE_ALIGNER_HPP

#include "data/market_data.hpp"

#include <string>
#include <vector>

namespace cryptofolio
{

    /**
     * @struct PriceSeries
     * @brief Ordered (timestamp, price) observations of one asset.
     */
    struct PriceSeries
    {
        std::string asset_id;                ///< Asset identifier
        std::vector<std::string> timestamps; ///< Strictly increasing timestamps
        std::vector<double> prices;          ///< Positive prices, same length as timestamps

        size_t size() const { return timestamps.size(); }
        bool empty() const { return timestamps.empty(); }

        /**
         * @brief Check ordering and price positivity.
         * @throws InsufficientDataError if the series has no observations
         * @throws InvalidPriceError on a non-positive or non-finite price
         * @throws std::invalid_argument on length mismatch or unordered timestamps
         */
        void validate() const;

        /**
         * @brief Keep the trailing window of calendar days ending at the last timestamp.
         */
        PriceSeries trailing_window(int lookback_days) const;
    };

    /**
     * @class PriceAligner
     * @brief Builds an aligned price table from independent per-asset series.
     *
     * Only timestamps present in every series survive. Gaps are never filled,
     * so no price history is fabricated for a missing-data period.
     *
     * Usage:
     * @code
     *   MarketData table = PriceAligner::align({btc, eth, sol});
     * @endcode
     */
    class PriceAligner
    {
    public:
        /**
         * @brief Align series on the intersection of their timestamps.
         * @param series One series per asset; output column order follows input order
         * @param min_timestamps Minimum number of common timestamps required
         * @return Table with at least min_timestamps rows
         * @throws InsufficientDataError if no series is given, a series is empty
         *         or the intersection is empty
         * @throws InsufficientHistoryError if the intersection is non-empty but
         *         shorter than min_timestamps
         * @throws InvalidPriceError on a non-positive price
         * @throws std::invalid_argument on duplicate asset ids or unordered timestamps
         */
        static MarketData align(const std::vector<PriceSeries> &series,
                                size_t min_timestamps = 1);

        /**
         * @brief Align a NaN-padded table by dropping incomplete rows.
         * @throws Same failures as the series overload
         */
        static MarketData align(const MarketData &padded,
                                size_t min_timestamps = 1);

        /**
         * @brief Split a table into one series per asset, skipping NaN entries.
         */
        static std::vector<PriceSeries> split(const MarketData &data);
    };

} // namespace cryptofolio

#endif // CRYPTOFOLIO_DATA_PRICE_ALIGNER_HPP
