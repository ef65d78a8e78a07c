// SPDX-License-Identifier: MIT
#ifndef CRYPTOFOLIO_BACKTEST_ALLOCATION_VALIDATOR_HPP
#define CRYPTOFOLIO_BACKTEST_ALLOCATION_VALIDATOR_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>

namespace cryptofolio {
namespace backtest {

/// Allowed distance of the weight sum from 1.0 (0.01 percentage points).
constexpr double WEIGHT_SUM_TOLERANCE = 1e-4;

/**
 * @struct WeightCheck
 * @brief Outcome of a target-weight validation
 */
struct WeightCheck {
    bool valid = false;
    double sum = 0.0;        ///< Actual sum of the weights
    std::string message;     ///< Reason for rejection, empty when valid
};

/**
 * @brief Check that every weight is finite and in [0, 1] and that the weights
 *        sum to 1.0 within WEIGHT_SUM_TOLERANCE.
 *
 * Never normalizes. An empty vector is invalid.
 */
WeightCheck check_weights(const Eigen::VectorXd& weights);

/**
 * @brief Throwing form of check_weights.
 * @throws InvalidWeightsError carrying the actual sum
 */
void validate_weights(const Eigen::VectorXd& weights);

/**
 * @brief Equal allocation 1/n for n assets.
 * @throws std::invalid_argument if n == 0
 */
Eigen::VectorXd equal_weights(size_t n);

Eigen::VectorXd to_weight_vector(const std::vector<double>& weights);

} // namespace backtest
} // namespace cryptofolio

#endif // CRYPTOFOLIO_BACKTEST_ALLOCATION_VALIDATOR_HPP
