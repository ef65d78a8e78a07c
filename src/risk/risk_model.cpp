/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include <cmath>
#include <stdexcept>

namespace cryptofolio
{
    namespace risk
    {
        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns)
            const
        {
            Eigen::MatrixXd covariance = estimate_covariance(returns);
            return covariance_to_correlation(covariance);
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix cannot be empty.");
            }

            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = covariance.rows();

            if (n == 0 || covariance.cols() != n)
            {
                throw std::invalid_argument("Covariance matrix must be square and non-empty");
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (covariance(i, i) < 0.0)
                {
                    throw std::invalid_argument("Covariance matrix has negative diagonal element at index " +
                                                std::to_string(i) + ": " + std::to_string(covariance(i, i)));
                }
            }

            Eigen::VectorXd std_devs = covariance.diagonal().array().sqrt();

            // corr(i,j) = cov(i,j) / (std(i) * std(j))
            Eigen::MatrixXd correlation = Eigen::MatrixXd::Zero(n, n);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                correlation(i, i) = 1.0;
                for (Eigen::Index j = i + 1; j < n; ++j)
                {
                    double denom = std_devs(i) * std_devs(j);
                    double rho = 0.0;
                    if (denom > 0.0)
                    {
                        rho = covariance(i, j) / denom;
                        // Clamp to [-1, 1] to handle numerical errors
                        if (rho > 1.0)
                            rho = 1.0;
                        else if (rho < -1.0)
                            rho = -1.0;
                    }
                    correlation(i, j) = rho;
                    correlation(j, i) = rho;
                }
            }

            return correlation;
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace cryptofolio
