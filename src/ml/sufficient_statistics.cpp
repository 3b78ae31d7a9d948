#include "hmmkit/sufficient_statistics.h"
#include "hmmkit/hmm_errors.h"

namespace hmmkit {
namespace hmm {

SufficientStatisticsAccumulator::SufficientStatisticsAccumulator(int n_components,
                                                                 std::unique_ptr<EmissionStatistics> emission_stats)
    : start_(Eigen::VectorXd::Zero(n_components))
    , trans_(Eigen::MatrixXd::Zero(n_components, n_components))
    , emission_(std::move(emission_stats))
    , n_sequences_(0)
    , n_frames_(0)
    , log_likelihood_(0.0) {
    if (n_components <= 0) {
        throw ConfigurationError("Accumulator needs a positive number of states");
    }
    if (!emission_) {
        throw ConfigurationError("Accumulator needs emission statistics");
    }
}

SufficientStatisticsAccumulator::SufficientStatisticsAccumulator(const SufficientStatisticsAccumulator& other)
    : start_(other.start_)
    , trans_(other.trans_)
    , emission_(other.emission_ ? other.emission_->clone() : nullptr)
    , n_sequences_(other.n_sequences_)
    , n_frames_(other.n_frames_)
    , log_likelihood_(other.log_likelihood_) {
}

SufficientStatisticsAccumulator& SufficientStatisticsAccumulator::operator=(const SufficientStatisticsAccumulator& other) {
    if (this != &other) {
        SufficientStatisticsAccumulator copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void SufficientStatisticsAccumulator::accumulate_sequence(const EmissionModel& emission,
                                                          const Eigen::MatrixXd& observations,
                                                          const Eigen::MatrixXd& framelogprob,
                                                          const ForwardBackwardResult& fb_result) {
    EmissionStatistics& emission_stats = emission_statistics();
    const Eigen::Index N = start_.size();
    if (fb_result.gamma.cols() != N || fb_result.xi_sum.rows() != N || fb_result.xi_sum.cols() != N) {
        throw ConfigurationError("Forward-backward result does not match the accumulator state count");
    }
    if (fb_result.gamma.rows() != observations.rows() || fb_result.gamma.rows() == 0) {
        throw ConfigurationError("Forward-backward result does not match the sequence length");
    }

    // Emission first: it may throw, and the totals below must then stay untouched
    emission.accumulate_statistics(emission_stats, observations, framelogprob, fb_result.gamma);

    start_ += fb_result.gamma.row(0).transpose();
    trans_ += fb_result.xi_sum;
    n_sequences_ += 1;
    n_frames_ += static_cast<size_t>(observations.rows());
    log_likelihood_ += fb_result.log_likelihood;
}

void SufficientStatisticsAccumulator::merge(const SufficientStatisticsAccumulator& other) {
    EmissionStatistics& emission_stats = emission_statistics();
    const EmissionStatistics& other_emission = other.emission();
    if (other.start_.size() != start_.size()) {
        throw ConfigurationError("Cannot merge accumulators with different state counts");
    }
    emission_stats.merge(other_emission);

    start_ += other.start_;
    trans_ += other.trans_;
    n_sequences_ += other.n_sequences_;
    n_frames_ += other.n_frames_;
    log_likelihood_ += other.log_likelihood_;
}

void SufficientStatisticsAccumulator::reset() {
    emission_statistics().reset();
    start_.setZero();
    trans_.setZero();
    n_sequences_ = 0;
    n_frames_ = 0;
    log_likelihood_ = 0.0;
}

const EmissionStatistics& SufficientStatisticsAccumulator::emission() const {
    if (!emission_) {
        throw NotInitializedError("Accumulator has no emission statistics (moved from)");
    }
    return *emission_;
}

EmissionStatistics& SufficientStatisticsAccumulator::emission_statistics() {
    if (!emission_) {
        throw NotInitializedError("Accumulator has no emission statistics (moved from)");
    }
    return *emission_;
}

} // namespace hmm
} // namespace hmmkit
