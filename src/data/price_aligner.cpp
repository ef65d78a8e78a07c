/**
 * @file price_aligner.cpp
 * @brief Implementation of PriceSeries and PriceAligner
 */

#include "data/price_aligner.hpp"
#include "data/calendar.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>

namespace cryptofolio
{

    // ============================================================================
    // PriceSeries
    // ============================================================================

    void PriceSeries::validate() const
    {
        if (timestamps.empty())
        {
            throw InsufficientDataError("price series for '" + asset_id + "' is empty");
        }
        if (timestamps.size() != prices.size())
        {
            throw std::invalid_argument("price series for '" + asset_id +
                                        "' has mismatched timestamp and price counts");
        }

        for (size_t i = 0; i < timestamps.size(); ++i)
        {
            if (i > 0 && !(timestamps[i - 1] < timestamps[i]))
            {
                throw std::invalid_argument("timestamps of '" + asset_id +
                                            "' are not strictly increasing at '" + timestamps[i] + "'");
            }
            if (!std::isfinite(prices[i]) || prices[i] <= 0.0)
            {
                std::ostringstream msg;
                msg << "price of " << asset_id << " on " << timestamps[i]
                    << " is not positive: " << prices[i];
                throw InvalidPriceError(msg.str());
            }
        }
    }

    PriceSeries PriceSeries::trailing_window(int lookback_days) const
    {
        if (lookback_days <= 0)
        {
            throw std::invalid_argument("Lookback window must be positive, got: " +
                                        std::to_string(lookback_days));
        }
        if (timestamps.empty())
        {
            return *this;
        }

        long long cutoff = calendar::days_since_epoch(timestamps.back()) - lookback_days;
        size_t start = 0;
        while (start < timestamps.size() && calendar::days_since_epoch(timestamps[start]) < cutoff)
        {
            ++start;
        }

        PriceSeries window;
        window.asset_id = asset_id;
        window.timestamps.assign(timestamps.begin() + static_cast<std::ptrdiff_t>(start), timestamps.end());
        window.prices.assign(prices.begin() + static_cast<std::ptrdiff_t>(start), prices.end());
        return window;
    }

    // ============================================================================
    // PriceAligner
    // ============================================================================

    MarketData PriceAligner::align(const std::vector<PriceSeries> &series, size_t min_timestamps)
    {
        if (series.empty())
        {
            throw InsufficientDataError("no price series supplied");
        }

        std::set<std::string> asset_ids;
        for (const auto &s : series)
        {
            s.validate();
            if (!asset_ids.insert(s.asset_id).second)
            {
                throw std::invalid_argument("duplicate asset id: " + s.asset_id);
            }
        }

        // Intersect sorted timestamp vectors
        std::vector<std::string> common = series.front().timestamps;
        for (size_t k = 1; k < series.size() && !common.empty(); ++k)
        {
            std::vector<std::string> next;
            std::set_intersection(common.begin(), common.end(),
                                  series[k].timestamps.begin(), series[k].timestamps.end(),
                                  std::back_inserter(next));
            common.swap(next);
        }

        if (common.empty())
        {
            throw InsufficientDataError("price series share no common timestamp");
        }
        if (common.size() < min_timestamps)
        {
            throw InsufficientHistoryError(common.size(), min_timestamps);
        }

        const auto n_dates = static_cast<Eigen::Index>(common.size());
        const auto n_assets = static_cast<Eigen::Index>(series.size());
        Eigen::MatrixXd prices(n_dates, n_assets);
        std::vector<std::string> tickers;
        tickers.reserve(series.size());

        for (Eigen::Index j = 0; j < n_assets; ++j)
        {
            const PriceSeries &s = series[static_cast<size_t>(j)];
            tickers.push_back(s.asset_id);

            // Both sequences are sorted, walk them together
            size_t cursor = 0;
            for (Eigen::Index i = 0; i < n_dates; ++i)
            {
                const std::string &ts = common[static_cast<size_t>(i)];
                while (s.timestamps[cursor] != ts)
                {
                    ++cursor;
                }
                prices(i, j) = s.prices[cursor];
            }
        }

        return MarketData(prices, common, tickers);
    }

    MarketData PriceAligner::align(const MarketData &padded, size_t min_timestamps)
    {
        if (padded.num_assets() == 0 || padded.num_dates() == 0)
        {
            throw InsufficientDataError("price table is empty");
        }
        return align(split(padded), min_timestamps);
    }

    std::vector<PriceSeries> PriceAligner::split(const MarketData &data)
    {
        std::vector<PriceSeries> series;
        series.reserve(data.num_assets());

        const Eigen::MatrixXd &prices = data.get_prices();
        for (size_t j = 0; j < data.num_assets(); ++j)
        {
            PriceSeries s;
            s.asset_id = data.get_tickers()[j];
            for (size_t i = 0; i < data.num_dates(); ++i)
            {
                double p = prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                if (!std::isnan(p))
                {
                    s.timestamps.push_back(data.get_dates()[i]);
                    s.prices.push_back(p);
                }
            }
            series.push_back(std::move(s));
        }

        return series;
    }

} // namespace cryptofolio
