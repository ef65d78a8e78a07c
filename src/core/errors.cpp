/**
 * @file errors.cpp
 * @brief Message formatting for engine failures
 */

#include "core/errors.hpp"

#include <sstream>

namespace cryptofolio
{

    namespace
    {
        std::string mismatch_message(size_t num_weights, size_t num_assets)
        {
            std::ostringstream msg;
            msg << "weights size (" << num_weights << ") != num assets (" << num_assets << ")";
            return msg.str();
        }
    } // anonymous namespace

    const char *to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::INSUFFICIENT_DATA:
            return "InsufficientData";
        case ErrorCode::INSUFFICIENT_HISTORY:
            return "InsufficientHistory";
        case ErrorCode::INVALID_WEIGHTS:
            return "InvalidWeights";
        case ErrorCode::DIMENSION_MISMATCH:
            return "DimensionMismatch";
        case ErrorCode::INVALID_PRICE:
            return "InvalidPrice";
        }
        return "Unknown";
    }

    PortfolioError::PortfolioError(ErrorCode code, const std::string &message)
        : std::invalid_argument(std::string(to_string(code)) + ": " + message), code_(code)
    {
    }

    InsufficientHistoryError::InsufficientHistoryError(size_t available, size_t required)
        : PortfolioError(ErrorCode::INSUFFICIENT_HISTORY,
                         "need at least " + std::to_string(required) +
                             " aligned timestamps, got " + std::to_string(available)),
          available_(available), required_(required)
    {
    }

    InvalidWeightsError::InvalidWeightsError(const std::string &message, double weight_sum)
        : PortfolioError(ErrorCode::INVALID_WEIGHTS, message), weight_sum_(weight_sum)
    {
    }

    DimensionMismatchError::DimensionMismatchError(size_t num_weights, size_t num_assets)
        : PortfolioError(ErrorCode::DIMENSION_MISMATCH, mismatch_message(num_weights, num_assets))
    {
    }

} // namespace cryptofolio
