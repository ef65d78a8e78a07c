/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * Provides a common interface for the covariance estimators used by the
 * statistics engine. All risk models must implement estimate_covariance.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <memory>

namespace cryptofolio
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for risk model estimation
         *
         * Usage Example:
         * @code
         * auto risk_model = std::make_unique<SampleCovariance>(true);
         * Eigen::MatrixXd cov = risk_model->estimate_covariance(returns);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Symmetric covariance matrix (n_assets x n_assets)
             * @throws std::invalid_argument if returns matrix is empty or not finite
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Estimate correlation matrix from return data
             *
             * Default implementation: Convert covariance to correlation
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const Eigen::MatrixXd &returns) const;

            virtual std::string get_name() const = 0;

            /**
             * @brief Convert covariance matrix to correlation matrix
             *
             * The diagonal is exactly 1.0. A pair involving an asset with zero
             * variance has correlation 0.
             *
             * @throws std::invalid_argument if the matrix is not square or a
             *         variance is negative
             */
            static Eigen::MatrixXd covariance_to_correlation(
                const Eigen::MatrixXd &covariance);

        protected:
            /**
             * @brief Validate input returns matrix
             * @throws std::invalid_argument if validation fails
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace cryptofolio
