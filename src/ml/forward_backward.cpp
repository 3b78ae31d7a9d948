#include "hmmkit/forward_backward.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include <cmath>

namespace hmmkit {
namespace hmm {

void check_lattice_inputs(const Eigen::VectorXd& startprob,
                          const Eigen::MatrixXd& transmat,
                          const Eigen::MatrixXd& framelogprob) {
    const Eigen::Index N = startprob.size();
    if (N == 0) {
        throw ConfigurationError("startprob is empty");
    }
    if (transmat.rows() != N || transmat.cols() != N) {
        throw ConfigurationError("transmat must be " + std::to_string(N) + " x " + std::to_string(N));
    }
    if (framelogprob.cols() != N) {
        throw ConfigurationError("framelogprob has " + std::to_string(framelogprob.cols()) +
                                 " columns, expected " + std::to_string(N));
    }
    if (framelogprob.rows() == 0) {
        throw ConfigurationError("Cannot run inference on an empty sequence");
    }
    if (framelogprob.hasNaN()) {
        throw ConfigurationError("framelogprob contains NaN");
    }
}

Eigen::MatrixXd compute_log_alpha(const Eigen::VectorXd& log_startprob,
                                  const Eigen::MatrixXd& log_transmat,
                                  const Eigen::MatrixXd& framelogprob) {
    const Eigen::Index T = framelogprob.rows();
    const Eigen::Index N = framelogprob.cols();

    Eigen::MatrixXd log_alpha(T, N);
    log_alpha.row(0) = log_startprob.transpose() + framelogprob.row(0);

    Eigen::VectorXd work(N);
    for (Eigen::Index t = 1; t < T; ++t) {
        for (Eigen::Index j = 0; j < N; ++j) {
            work = log_alpha.row(t - 1).transpose() + log_transmat.col(j);
            log_alpha(t, j) = math::log_sum_exp(work) + framelogprob(t, j);
        }
    }
    return log_alpha;
}

Eigen::MatrixXd compute_log_beta(const Eigen::MatrixXd& log_transmat,
                                 const Eigen::MatrixXd& framelogprob) {
    const Eigen::Index T = framelogprob.rows();
    const Eigen::Index N = framelogprob.cols();

    Eigen::MatrixXd log_beta(T, N);
    log_beta.row(T - 1).setZero();

    Eigen::VectorXd work(N);
    for (Eigen::Index t = T - 2; t >= 0; --t) {
        const Eigen::VectorXd next = (framelogprob.row(t + 1) + log_beta.row(t + 1)).transpose();
        for (Eigen::Index i = 0; i < N; ++i) {
            work = log_transmat.row(i).transpose() + next;
            log_beta(t, i) = math::log_sum_exp(work);
        }
    }
    return log_beta;
}

ForwardBackwardResult forward_backward(const Eigen::VectorXd& startprob,
                                       const Eigen::MatrixXd& transmat,
                                       const Eigen::MatrixXd& framelogprob,
                                       size_t sequence_index) {
    check_lattice_inputs(startprob, transmat, framelogprob);

    const Eigen::Index T = framelogprob.rows();
    const Eigen::Index N = framelogprob.cols();
    const Eigen::VectorXd log_startprob = math::log_vector(startprob);
    const Eigen::MatrixXd log_transmat = math::log_matrix(transmat);

    ForwardBackwardResult result;
    result.log_alpha = compute_log_alpha(log_startprob, log_transmat, framelogprob);

    Eigen::VectorXd last = result.log_alpha.row(T - 1).transpose();
    result.log_likelihood = math::log_sum_exp(last);
    if (!std::isfinite(result.log_likelihood)) {
        throw DegenerateSequenceError(sequence_index,
            "Sequence has zero probability under the current parameters (log-likelihood " +
            std::to_string(result.log_likelihood) + ")");
    }

    result.log_beta = compute_log_beta(log_transmat, framelogprob);

    result.gamma.resize(T, N);
    Eigen::VectorXd log_gamma(N);
    for (Eigen::Index t = 0; t < T; ++t) {
        log_gamma = (result.log_alpha.row(t) + result.log_beta.row(t)).transpose();
        result.gamma.row(t) = math::log_normalize(log_gamma).transpose();
    }

    result.xi_sum = Eigen::MatrixXd::Zero(N, N);
    for (Eigen::Index t = 0; t + 1 < T; ++t) {
        const Eigen::RowVectorXd next = framelogprob.row(t + 1) + result.log_beta.row(t + 1);
        for (Eigen::Index i = 0; i < N; ++i) {
            const double from = result.log_alpha(t, i) - result.log_likelihood;
            if (from == -std::numeric_limits<double>::infinity()) {
                continue;
            }
            result.xi_sum.row(i) += ((log_transmat.row(i) + next).array() + from).exp().matrix();
        }
    }

    return result;
}

double forward_log_likelihood(const Eigen::VectorXd& startprob,
                              const Eigen::MatrixXd& transmat,
                              const Eigen::MatrixXd& framelogprob) {
    check_lattice_inputs(startprob, transmat, framelogprob);

    const Eigen::MatrixXd log_alpha = compute_log_alpha(math::log_vector(startprob),
                                                        math::log_matrix(transmat), framelogprob);
    Eigen::VectorXd last = log_alpha.row(log_alpha.rows() - 1).transpose();
    return math::log_sum_exp(last);
}

} // namespace hmm
} // namespace hmmkit
