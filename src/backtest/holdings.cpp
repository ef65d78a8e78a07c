// ============================================================================
// Implementation of Holdings
// ============================================================================

#include "backtest/holdings.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cryptofolio {
namespace backtest {

// ============================================================================
// Holdings - helpers
// ============================================================================

void Holdings::validate_prices(const Eigen::VectorXd& prices) const {
    if (static_cast<size_t>(prices.size()) != tickers_.size()) {
        std::ostringstream msg;
        msg << "prices size (" << prices.size() << ") != num assets (" << tickers_.size() << ")";
        throw DimensionMismatchError(msg.str());
    }
    for (Eigen::Index i = 0; i < prices.size(); ++i) {
        if (!std::isfinite(prices[i]) || !(prices[i] > 0.0)) {
            std::ostringstream msg;
            msg << "price of " << tickers_[static_cast<size_t>(i)] << " is not positive: " << prices[i];
            throw InvalidPriceError(msg.str());
        }
    }
}

void Holdings::check_weights_size(const Eigen::VectorXd& weights) const {
    if (static_cast<size_t>(weights.size()) != tickers_.size()) {
        throw DimensionMismatchError(static_cast<size_t>(weights.size()), tickers_.size());
    }
}

// ============================================================================
// Holdings - lifecycle
// ============================================================================

Holdings::Holdings(const std::vector<std::string>& tickers)
    : tickers_(tickers) {
    if (tickers_.empty()) {
        throw std::invalid_argument("tickers must not be empty");
    }
    const auto n = static_cast<Eigen::Index>(tickers_.size());
    quantities_ = Eigen::VectorXd::Zero(n);
    previous_ = Eigen::VectorXd::Zero(n);
}

void Holdings::allocate(double capital, const Eigen::VectorXd& weights, const Eigen::VectorXd& prices) {
    if (!std::isfinite(capital) || !(capital > 0.0)) {
        throw std::invalid_argument("capital must be > 0");
    }
    check_weights_size(weights);
    validate_prices(prices);

    quantities_.array() = capital * weights.array() / prices.array();
    cash_ = capital * (1.0 - weights.sum());
    allocated_ = true;
}

double Holdings::rebalance(const Eigen::VectorXd& target_weights, const Eigen::VectorXd& prices) {
    if (!allocated_) {
        throw std::logic_error("rebalance called before allocate");
    }
    check_weights_size(target_weights);
    validate_prices(prices);

    const double v = value(prices);
    previous_ = quantities_;
    quantities_.array() = v * target_weights.array() / prices.array();
    cash_ = v * (1.0 - target_weights.sum());

    if (!(v > 0.0)) return 0.0;
    return ((quantities_ - previous_).array().abs() * prices.array()).sum() / v;
}

// ============================================================================
// Holdings - queries
// ============================================================================

double Holdings::value(const Eigen::VectorXd& prices) const {
    if (prices.size() != quantities_.size()) {
        std::ostringstream msg;
        msg << "prices size (" << prices.size() << ") != num assets (" << tickers_.size() << ")";
        throw DimensionMismatchError(msg.str());
    }
    return quantities_.dot(prices) + cash_;
}

Eigen::VectorXd Holdings::weights(const Eigen::VectorXd& prices) const {
    const double v = value(prices);
    Eigen::VectorXd w(quantities_.size());
    if (!(v > 0.0)) {
        w.setZero();
        return w;
    }
    w.array() = quantities_.array() * prices.array() / v;
    return w;
}

} // namespace backtest
} // namespace cryptofolio
