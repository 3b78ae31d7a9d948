#pragma once

#include <cstddef>
#include <limits>
#include <Eigen/Core>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Forward-Backward lattices and posteriors of one sequence
     */
    struct ForwardBackwardResult {
        Eigen::MatrixXd log_alpha;      // Forward log-probabilities [T x N]
        Eigen::MatrixXd log_beta;       // Backward log-probabilities [T x N]
        Eigen::MatrixXd gamma;          // State posteriors [T x N], rows sum to 1
        Eigen::MatrixXd xi_sum;         // Expected transition counts summed over t [N x N]
        double log_likelihood;          // log P(sequence)

        ForwardBackwardResult() : log_likelihood(-std::numeric_limits<double>::infinity()) {}
    };

    /**
     * @brief Log-space Forward-Backward over one sequence
     *
     * @param startprob Initial state distribution (N)
     * @param transmat Row-stochastic transition matrix (N x N)
     * @param framelogprob Emission log-likelihoods (T x N)
     * @param sequence_index Reported in the error when the sequence is degenerate
     * @throws DegenerateSequenceError if every path has zero probability
     * @throws ConfigurationError on inconsistent shapes or an empty sequence
     */
    ForwardBackwardResult forward_backward(const Eigen::VectorXd& startprob,
                                           const Eigen::MatrixXd& transmat,
                                           const Eigen::MatrixXd& framelogprob,
                                           size_t sequence_index = 0);

    // Forward pass only; returns -infinity for a zero-probability sequence
    double forward_log_likelihood(const Eigen::VectorXd& startprob,
                                  const Eigen::MatrixXd& transmat,
                                  const Eigen::MatrixXd& framelogprob);

    // Forward log-lattice given log start and transition probabilities
    Eigen::MatrixXd compute_log_alpha(const Eigen::VectorXd& log_startprob,
                                      const Eigen::MatrixXd& log_transmat,
                                      const Eigen::MatrixXd& framelogprob);

    // Backward log-lattice; the last row is zero
    Eigen::MatrixXd compute_log_beta(const Eigen::MatrixXd& log_transmat,
                                     const Eigen::MatrixXd& framelogprob);

    // Throws ConfigurationError unless the three arguments agree on N and T > 0
    void check_lattice_inputs(const Eigen::VectorXd& startprob,
                              const Eigen::MatrixXd& transmat,
                              const Eigen::MatrixXd& framelogprob);

} // namespace hmm
} // namespace hmmkit
