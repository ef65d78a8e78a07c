/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Implements the standard sample covariance matrix estimation with
 * optional bias correction (Bessel's correction).
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 */

#pragma once

#include "risk_model.hpp"

namespace cryptofolio
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Properties:
         * - Unbiased estimator (with bias_correction = true)
         * - Positive semi-definite
         * - A single observation yields the zero matrix, Bessel's correction
         *   is not applied in that case
         *
         * Usage Example:
         * @code
         * SampleCovariance estimator(true);
         * Eigen::MatrixXd cov = estimator.estimate_covariance(returns) * 365.0;
         * @endcode
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @brief Construct sample covariance estimator
             * @param bias_correction Apply Bessel's correction (divide by n-1 vs n)
             *
             * Default is true to match pandas/NumPy default behavior
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets)
             * @return Covariance matrix (N x N)
             * @throws std::invalid_argument if returns is empty
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_; ///< Whether to apply Bessel's correction
        };

    } // namespace risk
} // namespace cryptofolio
