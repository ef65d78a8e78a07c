/**
 * @file drawdown.cpp
 * @brief Implementation of drawdown utilities
 */

#include "analytics/drawdown.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace cryptofolio
{
    namespace analytics
    {

        namespace
        {
            void check_series(const std::vector<double> &values)
            {
                if (values.empty())
                {
                    throw std::invalid_argument("Drawdown requires a non-empty value series");
                }
                for (size_t i = 0; i < values.size(); ++i)
                {
                    if (!std::isfinite(values[i]) || values[i] <= 0.0)
                    {
                        throw std::invalid_argument("Value series must be positive, got " +
                                                    std::to_string(values[i]) + " at index " +
                                                    std::to_string(i));
                    }
                }
            }
        } // anonymous namespace

        std::vector<double> underwater_curve(const std::vector<double> &values)
        {
            check_series(values);

            std::vector<double> curve(values.size());
            double peak = values[0];
            for (size_t i = 0; i < values.size(); ++i)
            {
                if (values[i] > peak)
                {
                    peak = values[i];
                }
                curve[i] = (values[i] - peak) / peak;
            }
            return curve;
        }

        double max_drawdown(const std::vector<double> &values)
        {
            return drawdown_info(values).depth;
        }

        DrawdownInfo drawdown_info(const std::vector<double> &values)
        {
            check_series(values);

            const int n = static_cast<int>(values.size());
            DrawdownInfo info;

            double peak = values[0];
            int peak_idx = 0;

            for (int i = 0; i < n; ++i)
            {
                if (values[i] > peak)
                {
                    peak = values[i];
                    peak_idx = i;
                }
                double dd = (values[i] - peak) / peak;
                if (dd < info.depth)
                {
                    info.depth = dd;
                    info.peak_index = peak_idx;
                    info.trough_index = i;
                }
            }

            if (info.depth < 0.0)
            {
                const double peak_value = values[info.peak_index];
                for (int i = info.trough_index + 1; i < n; ++i)
                {
                    if (values[i] >= peak_value)
                    {
                        info.recovery_index = i;
                        break;
                    }
                }
            }

            return info;
        }

    } // namespace analytics
} // namespace cryptofolio
