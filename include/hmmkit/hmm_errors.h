#pragma once

#include <string>
#include <stdexcept>

namespace hmmkit {

/**
 * @brief Error codes for every failure the HMM core can surface
 *
 * Codes are grouped the same way errors propagate: configuration and
 * not-initialized errors fail fast before any state is touched, degenerate
 * sequences abort an in-progress fit, anomalies are only reported.
 */
enum class HmmErrorCode {
    SUCCESS = 0,
    CONFIGURATION_ERROR = 1,    // Inconsistent dimensions, non-stochastic matrices, bad covariance
    NOT_INITIALIZED = 2,        // Required parameter absent before score/decode/sample
    DEGENERATE_SEQUENCE = 3,    // Sequence has zero probability under every path
    CONVERGENCE_ANOMALY = 4,    // Log-likelihood decreased between EM iterations
    INVALID_ARGUMENT = 5,       // Malformed call argument (lengths, sample count, ...)
    IO_ERROR = 6                // Configuration file could not be read or written
};

/**
 * @brief Error severity used when an error is logged
 */
enum class ErrorSeverity {
    WARNING,    // Reported, operation continues
    ERROR,      // Operation rejected or aborted
    FATAL       // Caller cannot recover this instance
};

std::string error_code_to_string(HmmErrorCode code);
ErrorSeverity default_severity(HmmErrorCode code);

/**
 * @brief Base exception for the HMM core
 */
class HmmException : public std::runtime_error {
public:
    HmmException(HmmErrorCode code, const std::string& message);

    HmmErrorCode get_error_code() const { return code_; }
    ErrorSeverity get_severity() const { return default_severity(code_); }

private:
    HmmErrorCode code_;
};

/**
 * @brief Invalid model or data configuration
 */
class ConfigurationError : public HmmException {
public:
    explicit ConfigurationError(const std::string& message)
        : HmmException(HmmErrorCode::CONFIGURATION_ERROR, message) {}
};

/**
 * @brief A parameter needed by the requested operation has not been set
 */
class NotInitializedError : public HmmException {
public:
    explicit NotInitializedError(const std::string& message)
        : HmmException(HmmErrorCode::NOT_INITIALIZED, message) {}
};

/**
 * @brief Sequence whose total log-likelihood is -infinity
 *
 * Carries the index of the offending sequence within the observation set.
 */
class DegenerateSequenceError : public HmmException {
public:
    DegenerateSequenceError(size_t sequence_index, const std::string& message);

    size_t sequence_index() const { return sequence_index_; }

private:
    size_t sequence_index_;
};

} // namespace hmmkit
