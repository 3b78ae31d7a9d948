#pragma once

#include <vector>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Log-likelihood decrease observed between two EM iterations
     */
    struct ConvergenceAnomaly {
        int iteration;              // 1-based iteration that decreased
        double previous;
        double current;

        double delta() const { return current - previous; }
    };

    /**
     * @brief Tracks EM progress and decides termination
     *
     * Converged once the absolute change between two consecutive totals
     * drops below tolerance, or once the iteration cap is reached.
     */
    class ConvergenceMonitor {
    public:
        ConvergenceMonitor(double tolerance, int max_iterations, double decrease_tolerance = 1e-6);

        // Record the total log-likelihood of one iteration
        void report(double log_likelihood);

        void reset();

        const std::vector<double>& history() const { return history_; }
        int iterations() const { return iteration_; }
        bool converged() const { return converged_; }

        // True when convergence came from the tolerance criterion rather than the cap
        bool tolerance_reached() const { return tolerance_reached_; }

        const std::vector<ConvergenceAnomaly>& anomalies() const { return anomalies_; }
        bool has_anomalies() const { return !anomalies_.empty(); }

        double tolerance() const { return tolerance_; }
        int max_iterations() const { return max_iterations_; }
        double decrease_tolerance() const { return decrease_tolerance_; }

        // Most recent total, -infinity before the first report
        double last_log_likelihood() const;

    private:
        double tolerance_;
        int max_iterations_;
        double decrease_tolerance_;

        std::vector<double> history_;
        std::vector<ConvergenceAnomaly> anomalies_;
        int iteration_;
        bool converged_;
        bool tolerance_reached_;
    };

} // namespace hmm
} // namespace hmmkit
