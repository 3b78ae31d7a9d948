#pragma once

#include <cstddef>
#include <limits>
#include <vector>
#include <Eigen/Core>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Most likely state path of one sequence
     */
    struct ViterbiResult {
        std::vector<int> state_sequence;    // Best path, one state per frame
        double log_prob;                    // Joint log-probability of path and observations

        ViterbiResult() : log_prob(-std::numeric_limits<double>::infinity()) {}
    };

    /**
     * @brief Viterbi decoding over log-probabilities with back-pointers
     *
     * Ties are broken towards the lowest state index, both in the
     * recursion and when picking the final state.
     *
     * @throws DegenerateSequenceError if no path has non-zero probability
     * @throws ConfigurationError on inconsistent shapes or an empty sequence
     */
    ViterbiResult viterbi_decode(const Eigen::VectorXd& startprob,
                                 const Eigen::MatrixXd& transmat,
                                 const Eigen::MatrixXd& framelogprob,
                                 size_t sequence_index = 0);

    /**
     * @brief Posterior (MAP) decoding result of one sequence
     */
    struct MapDecodeResult {
        std::vector<int> state_sequence;    // argmax of gamma per frame
        double mean_max_posterior;          // Mean over frames of the winning posterior
    };

    /**
     * @brief Independent per-frame argmax of state posteriors
     *
     * The resulting path is not constrained by the transition matrix and
     * may contain transitions of probability zero.
     */
    MapDecodeResult map_decode(const Eigen::MatrixXd& gamma);

    /**
     * @brief Joint log-probability of a given state path
     *
     * log startprob[s0] + sum log transmat[s(t-1), s(t)] + sum framelogprob(t, s(t))
     */
    double path_log_probability(const Eigen::VectorXd& startprob,
                                const Eigen::MatrixXd& transmat,
                                const Eigen::MatrixXd& framelogprob,
                                const std::vector<int>& state_sequence);

} // namespace hmm
} // namespace hmmkit
