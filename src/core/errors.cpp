/// @file src/core/errors.cpp
/// @brief Error kind names and user-facing message templates.

#include "mktpsych/errors.hpp"

#include <fmt/format.h>

namespace mktpsych {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DataUnavailable:        return "data_unavailable";
        case ErrorKind::InsufficientData:       return "insufficient_data";
        case ErrorKind::DegenerateDistribution: return "degenerate_distribution";
        case ErrorKind::Timeout:                return "timeout";
        case ErrorKind::Internal:               return "internal";
    }
    return "internal";
}

std::string_view user_message(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DataUnavailable:
            return "Market data for this instrument is currently unavailable. "
                   "Please try again later.";
        case ErrorKind::InsufficientData:
            return "Not enough price history for this period. "
                   "Try a longer period.";
        case ErrorKind::DegenerateDistribution:
            return "Flat market, analysis not meaningful.";
        case ErrorKind::Timeout:
            return "The analysis is still running. Please try again shortly.";
        case ErrorKind::Internal:
            return "The analysis could not be completed due to an internal error.";
    }
    return "The analysis could not be completed due to an internal error.";
}

AnalysisError::AnalysisError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail)
    , kind_(kind)
{}

InsufficientDataError::InsufficientDataError(std::size_t available,
                                             std::size_t required)
    : AnalysisError(ErrorKind::InsufficientData,
                    fmt::format("{} usable returns, at least {} required",
                                available, required))
    , available_(available)
    , required_(required)
{}

}  // namespace mktpsych
