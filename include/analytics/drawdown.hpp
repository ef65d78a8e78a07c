/**
 * @file drawdown.hpp
 * @brief Drawdown of a value series against its running maximum.
 *
 * drawdown(t) = (value(t) - max_{s<=t} value(s)) / max_{s<=t} value(s)
 *
 * Drawdowns are reported as non-positive fractions (-0.25 = 25% below peak).
 */

#ifndef CRYPTOFOLIO_ANALYTICS_DRAWDOWN_HPP
#define CRYPTOFOLIO_ANALYTICS_DRAWDOWN_HPP

#include <vector>

namespace cryptofolio
{
    namespace analytics
    {

        /**
         * @struct DrawdownInfo
         * @brief Summary of the maximum drawdown event.
         *
         * If the series never regains the peak after the trough, or never
         * falls below a prior peak, recovery_index is -1.
         */
        struct DrawdownInfo
        {
            double depth = 0.0;      ///< Maximum drawdown as a non-positive fraction
            int peak_index = 0;      ///< Index of the peak before the drawdown
            int trough_index = 0;    ///< Index of the trough
            int recovery_index = -1; ///< Index of recovery (-1 if unrecovered)

            int duration() const { return trough_index - peak_index; }
        };

        /**
         * @brief Drawdown at every point of the series.
         * @throws std::invalid_argument if the series is empty or holds a
         *         non-positive value
         */
        std::vector<double> underwater_curve(const std::vector<double> &values);

        /**
         * @brief Minimum of the underwater curve (0 for a non-decreasing series).
         */
        double max_drawdown(const std::vector<double> &values);

        DrawdownInfo drawdown_info(const std::vector<double> &values);

    } // namespace analytics
} // namespace cryptofolio

#endif // CRYPTOFOLIO_ANALYTICS_DRAWDOWN_HPP
