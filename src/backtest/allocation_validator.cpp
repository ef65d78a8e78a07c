// SPDX-License-Identifier: MIT
#include "backtest/allocation_validator.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cryptofolio {
namespace backtest {

WeightCheck check_weights(const Eigen::VectorXd& weights) {
    WeightCheck result;
    if (weights.size() == 0) {
        result.message = "weight vector is empty";
        return result;
    }

    double sum = 0.0;
    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        sum += weights[i];
    }
    result.sum = sum;

    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        const double w = weights[i];
        if (!std::isfinite(w) || w < 0.0 || w > 1.0) {
            std::ostringstream msg;
            msg << "weight " << i << " out of [0, 1]: " << w;
            result.message = msg.str();
            return result;
        }
    }

    if (std::abs(sum - 1.0) > WEIGHT_SUM_TOLERANCE) {
        std::ostringstream msg;
        msg << "weights sum to " << sum << ", expected 1.0 +/- " << WEIGHT_SUM_TOLERANCE;
        result.message = msg.str();
        return result;
    }

    result.valid = true;
    return result;
}

void validate_weights(const Eigen::VectorXd& weights) {
    WeightCheck check = check_weights(weights);
    if (!check.valid) {
        throw InvalidWeightsError(check.message, check.sum);
    }
}

Eigen::VectorXd equal_weights(size_t n) {
    if (n == 0) {
        throw std::invalid_argument("equal_weights requires at least one asset");
    }
    return Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n), 1.0 / static_cast<double>(n));
}

Eigen::VectorXd to_weight_vector(const std::vector<double>& weights) {
    Eigen::VectorXd w(static_cast<Eigen::Index>(weights.size()));
    for (size_t i = 0; i < weights.size(); ++i) {
        w[static_cast<Eigen::Index>(i)] = weights[i];
    }
    return w;
}

} // namespace backtest
} // namespace cryptofolio
