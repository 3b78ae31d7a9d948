#include "hmmkit/hmm_errors.h"

namespace hmmkit {

std::string error_code_to_string(HmmErrorCode code) {
    switch (code) {
        case HmmErrorCode::SUCCESS: return "SUCCESS";
        case HmmErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case HmmErrorCode::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case HmmErrorCode::DEGENERATE_SEQUENCE: return "DEGENERATE_SEQUENCE";
        case HmmErrorCode::CONVERGENCE_ANOMALY: return "CONVERGENCE_ANOMALY";
        case HmmErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case HmmErrorCode::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

ErrorSeverity default_severity(HmmErrorCode code) {
    switch (code) {
        case HmmErrorCode::SUCCESS:
        case HmmErrorCode::CONVERGENCE_ANOMALY:
            return ErrorSeverity::WARNING;
        case HmmErrorCode::DEGENERATE_SEQUENCE:
            return ErrorSeverity::FATAL;
        default:
            return ErrorSeverity::ERROR;
    }
}

HmmException::HmmException(HmmErrorCode code, const std::string& message)
    : std::runtime_error("[" + error_code_to_string(code) + "] " + message)
    , code_(code) {
}

DegenerateSequenceError::DegenerateSequenceError(size_t sequence_index, const std::string& message)
    : HmmException(HmmErrorCode::DEGENERATE_SEQUENCE,
                   message + " (sequence " + std::to_string(sequence_index) + ")")
    , sequence_index_(sequence_index) {
}

} // namespace hmmkit
