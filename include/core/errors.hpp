/**
 * @file errors.hpp
 * @brief Typed failures raised by the portfolio engine.
 *
 * Every input problem detected by the aligner, the validator, the statistics
 * engine or the simulator is reported as a PortfolioError subclass so callers
 * can branch on the failure kind (catch by type or inspect code()).
 */

#ifndef CRYPTOFOLIO_CORE_ERRORS_HPP
#define CRYPTOFOLIO_CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cryptofolio
{

    /**
     * @enum ErrorCode
     * @brief Failure taxonomy of the engine.
     */
    enum class ErrorCode
    {
        INSUFFICIENT_DATA,    /**< No data, or no date overlap across assets */
        INSUFFICIENT_HISTORY, /**< Too few aligned timestamps for the operation */
        INVALID_WEIGHTS,      /**< Weights outside [0,1] or not summing to 1 */
        DIMENSION_MISMATCH,   /**< Weight count differs from asset count */
        INVALID_PRICE         /**< Non-positive or non-finite price */
    };

    /**
     * @brief Stable identifier for an error code ("InsufficientData", ...).
     */
    const char *to_string(ErrorCode code);

    /**
     * @class PortfolioError
     * @brief Base class of all engine failures.
     */
    class PortfolioError : public std::invalid_argument
    {
    public:
        PortfolioError(ErrorCode code, const std::string &message);

        ErrorCode code() const { return code_; }

    private:
        ErrorCode code_;
    };

    class InsufficientDataError : public PortfolioError
    {
    public:
        explicit InsufficientDataError(const std::string &message)
            : PortfolioError(ErrorCode::INSUFFICIENT_DATA, message) {}
    };

    class InsufficientHistoryError : public PortfolioError
    {
    public:
        InsufficientHistoryError(size_t available, size_t required);

        size_t available() const { return available_; }
        size_t required() const { return required_; }

    private:
        size_t available_;
        size_t required_;
    };

    /**
     * @class InvalidWeightsError
     * @brief Weight vector rejected by the allocation validator.
     *
     * Carries the actual weight sum so the caller can offer a correction.
     */
    class InvalidWeightsError : public PortfolioError
    {
    public:
        InvalidWeightsError(const std::string &message, double weight_sum);

        double weight_sum() const { return weight_sum_; }

    private:
        double weight_sum_;
    };

    class DimensionMismatchError : public PortfolioError
    {
    public:
        DimensionMismatchError(size_t num_weights, size_t num_assets);

        explicit DimensionMismatchError(const std::string &message)
            : PortfolioError(ErrorCode::DIMENSION_MISMATCH, message) {}
    };

    class InvalidPriceError : public PortfolioError
    {
    public:
        explicit InvalidPriceError(const std::string &message)
            : PortfolioError(ErrorCode::INVALID_PRICE, message) {}
    };

} // namespace cryptofolio

#endif // CRYPTOFOLIO_CORE_ERRORS_HPP
