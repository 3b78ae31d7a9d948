#include "hmmkit/convergence_monitor.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/logger.h"
#include <cmath>
#include <limits>

namespace hmmkit {
namespace hmm {

ConvergenceMonitor::ConvergenceMonitor(double tolerance, int max_iterations, double decrease_tolerance)
    : tolerance_(tolerance)
    , max_iterations_(max_iterations)
    , decrease_tolerance_(decrease_tolerance)
    , iteration_(0)
    , converged_(false)
    , tolerance_reached_(false) {
    if (!(tolerance >= 0.0)) {
        throw ConfigurationError("Convergence tolerance must be non-negative");
    }
    if (max_iterations <= 0) {
        throw ConfigurationError("Iteration cap must be positive");
    }
    if (!(decrease_tolerance >= 0.0)) {
        throw ConfigurationError("Decrease tolerance must be non-negative");
    }
}

void ConvergenceMonitor::report(double log_likelihood) {
    history_.push_back(log_likelihood);
    ++iteration_;

    tolerance_reached_ = false;
    if (history_.size() > 1) {
        const double previous = history_[history_.size() - 2];
        if (log_likelihood < previous - decrease_tolerance_) {
            anomalies_.push_back({iteration_, previous, log_likelihood});
            HMMKIT_LOG_WARN_F("Log-likelihood decreased at iteration %d: %.6f -> %.6f (delta %.3e)",
                              iteration_, previous, log_likelihood, log_likelihood - previous);
        }
        tolerance_reached_ = std::abs(log_likelihood - previous) < tolerance_;
    }

    converged_ = tolerance_reached_ || iteration_ >= max_iterations_;
}

void ConvergenceMonitor::reset() {
    history_.clear();
    anomalies_.clear();
    iteration_ = 0;
    converged_ = false;
    tolerance_reached_ = false;
}

double ConvergenceMonitor::last_log_likelihood() const {
    return history_.empty() ? -std::numeric_limits<double>::infinity() : history_.back();
}

} // namespace hmm
} // namespace hmmkit
