// SPDX-License-Identifier: MIT
#ifndef CRYPTOFOLIO_BACKTEST_HOLDINGS_HPP
#define CRYPTOFOLIO_BACKTEST_HOLDINGS_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>

namespace cryptofolio {
namespace backtest {

/**
 * @class Holdings
 * @brief Per-asset unit quantities plus an uninvested cash residual
 *
 * Quantities are stored in one fixed-size vector that is updated in place.
 * Weights accepted within tolerance may not sum to exactly one; the share
 * 1 - sum(w) is held as cash (slightly negative when sum(w) > 1), so the
 * portfolio value is sum(q_i * p_i) + cash.
 */
class Holdings {
public:
    explicit Holdings(const std::vector<std::string>& tickers);

    ~Holdings() = default;

    // -- Transitions

    /**
     * @brief Invest `capital` at target weights: q_i = capital * w_i / p_i.
     *
     * cash = capital * (1 - sum(w)).
     */
    void allocate(double capital, const Eigen::VectorXd& weights, const Eigen::VectorXd& prices);

    /**
     * @brief Reset quantities to target weights at current prices.
     *
     * Value is unchanged by the reset; cash becomes value * (1 - sum(w)).
     * @return Turnover of the reset: sum |dq_i * p_i| / value
     */
    double rebalance(const Eigen::VectorXd& target_weights, const Eigen::VectorXd& prices);

    // -- Queries
    double value(const Eigen::VectorXd& prices) const;
    Eigen::VectorXd weights(const Eigen::VectorXd& prices) const;
    const Eigen::VectorXd& quantities() const { return quantities_; }
    double cash() const { return cash_; }
    size_t num_assets() const { return tickers_.size(); }
    const std::vector<std::string>& tickers() const { return tickers_; }
    bool is_allocated() const { return allocated_; }

    /**
     * @brief Require one finite positive price per asset.
     * @throws DimensionMismatchError on a size mismatch
     * @throws InvalidPriceError on a non-positive price
     */
    void validate_prices(const Eigen::VectorXd& prices) const;

private:
    std::vector<std::string> tickers_;
    Eigen::VectorXd quantities_;
    Eigen::VectorXd previous_;   // scratch for turnover
    double cash_ = 0.0;
    bool allocated_ = false;

    void check_weights_size(const Eigen::VectorXd& weights) const;
};

} // namespace backtest
} // namespace cryptofolio

#endif // CRYPTOFOLIO_BACKTEST_HOLDINGS_HPP
