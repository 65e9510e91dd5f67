#pragma once

/// @file include/mktpsych/errors.hpp
/// @brief Error taxonomy for the analysis pipeline.
///
/// # Policy
/// Pipeline stages either return a typed value or throw one of the
/// `AnalysisError` subclasses below. The orchestrator wraps anything else in
/// `InternalAnalysisError` and never retries. Each kind has a fixed
/// user-facing message (`user_message`); `what()` carries the detail for logs.
///
/// Lookup-style helpers (CSV parsing, cache `get`, config parsing) do not
/// throw; they return `std::optional`.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mktpsych {

/// Stable, documented outward error kinds.
enum class ErrorKind {
    DataUnavailable,         ///< Upstream fetch failed or returned unusable data
    InsufficientData,        ///< Too few observations for the period
    DegenerateDistribution,  ///< Zero-variance sample; KDE cannot be fit
    Timeout,                 ///< Caller stopped waiting on an in-flight analysis
    Internal,                ///< Anything else
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Fixed explanatory text shown to users for each kind.
[[nodiscard]] std::string_view user_message(ErrorKind kind) noexcept;

/// Base of all pipeline errors.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& detail);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// Upstream data could not be obtained or violates the PriceSeries contract.
class DataUnavailableError : public AnalysisError {
public:
    explicit DataUnavailableError(const std::string& cause)
        : AnalysisError(ErrorKind::DataUnavailable, cause) {}
};

/// Fewer usable observations than the configured minimum.
class InsufficientDataError : public AnalysisError {
public:
    InsufficientDataError(std::size_t available, std::size_t required);

    [[nodiscard]] std::size_t available() const noexcept { return available_; }
    [[nodiscard]] std::size_t required() const noexcept { return required_; }

private:
    std::size_t available_;
    std::size_t required_;
};

/// The return sample is flat (zero variance) or the estimator cannot be fit.
class DegenerateDistributionError : public AnalysisError {
public:
    explicit DegenerateDistributionError(const std::string& detail)
        : AnalysisError(ErrorKind::DegenerateDistribution, detail) {}
};

/// A waiter on the analysis cache exceeded its wait timeout.
class AnalysisTimeoutError : public AnalysisError {
public:
    explicit AnalysisTimeoutError(const std::string& detail)
        : AnalysisError(ErrorKind::Timeout, detail) {}
};

/// Opaque wrapper for unexpected failures inside a pipeline stage.
class InternalAnalysisError : public AnalysisError {
public:
    explicit InternalAnalysisError(const std::string& detail)
        : AnalysisError(ErrorKind::Internal, detail) {}
};

} // namespace mktpsych
