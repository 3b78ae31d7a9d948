#include "hmmkit/viterbi_decoder.h"
#include "hmmkit/forward_backward.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include <cmath>

namespace hmmkit {
namespace hmm {

ViterbiResult viterbi_decode(const Eigen::VectorXd& startprob,
                             const Eigen::MatrixXd& transmat,
                             const Eigen::MatrixXd& framelogprob,
                             size_t sequence_index) {
    check_lattice_inputs(startprob, transmat, framelogprob);

    const Eigen::Index T = framelogprob.rows();
    const Eigen::Index N = framelogprob.cols();
    const Eigen::MatrixXd log_transmat = math::log_matrix(transmat);

    Eigen::MatrixXd delta(T, N);
    Eigen::MatrixXi back_pointers = Eigen::MatrixXi::Zero(T, N);
    delta.row(0) = math::log_vector(startprob).transpose() + framelogprob.row(0);

    for (Eigen::Index t = 1; t < T; ++t) {
        for (Eigen::Index j = 0; j < N; ++j) {
            double best_score = delta(t - 1, 0) + log_transmat(0, j);
            int best_state = 0;
            for (Eigen::Index i = 1; i < N; ++i) {
                const double score = delta(t - 1, i) + log_transmat(i, j);
                if (score > best_score) {
                    best_score = score;
                    best_state = static_cast<int>(i);
                }
            }
            delta(t, j) = best_score + framelogprob(t, j);
            back_pointers(t, j) = best_state;
        }
    }

    ViterbiResult result;
    int final_state = 0;
    result.log_prob = delta(T - 1, 0);
    for (Eigen::Index i = 1; i < N; ++i) {
        if (delta(T - 1, i) > result.log_prob) {
            result.log_prob = delta(T - 1, i);
            final_state = static_cast<int>(i);
        }
    }

    if (!std::isfinite(result.log_prob)) {
        throw DegenerateSequenceError(sequence_index, "No state path has non-zero probability");
    }

    result.state_sequence.resize(T);
    result.state_sequence[T - 1] = final_state;
    for (Eigen::Index t = T - 1; t > 0; --t) {
        result.state_sequence[t - 1] = back_pointers(t, result.state_sequence[t]);
    }

    return result;
}

MapDecodeResult map_decode(const Eigen::MatrixXd& gamma) {
    if (gamma.rows() == 0 || gamma.cols() == 0) {
        throw ConfigurationError("Cannot decode an empty posterior matrix");
    }

    MapDecodeResult result;
    result.state_sequence.resize(gamma.rows());
    double total = 0.0;
    for (Eigen::Index t = 0; t < gamma.rows(); ++t) {
        Eigen::Index best = 0;
        total += gamma.row(t).maxCoeff(&best);
        result.state_sequence[t] = static_cast<int>(best);
    }
    result.mean_max_posterior = total / static_cast<double>(gamma.rows());
    return result;
}

double path_log_probability(const Eigen::VectorXd& startprob,
                            const Eigen::MatrixXd& transmat,
                            const Eigen::MatrixXd& framelogprob,
                            const std::vector<int>& state_sequence) {
    check_lattice_inputs(startprob, transmat, framelogprob);
    if (state_sequence.size() != static_cast<size_t>(framelogprob.rows())) {
        throw ConfigurationError("State path length does not match the sequence length");
    }
    for (int state : state_sequence) {
        if (state < 0 || state >= startprob.size()) {
            throw ConfigurationError("State path contains an out-of-range state");
        }
    }

    double log_prob = std::log(startprob[state_sequence[0]]) + framelogprob(0, state_sequence[0]);
    for (size_t t = 1; t < state_sequence.size(); ++t) {
        log_prob += std::log(transmat(state_sequence[t - 1], state_sequence[t])) +
                    framelogprob(t, state_sequence[t]);
    }
    return log_prob;
}

} // namespace hmm
} // namespace hmmkit
