#pragma once

#include <memory>
#include <Eigen/Core>
#include "emission_model.h"
#include "forward_backward.h"

namespace hmmkit {
namespace hmm {

    /**
     * @brief Running E-step totals consumed by one M-step
     *
     * Holds start-state counts, expected transition counts and the emission
     * family's own statistics. Contributions from independent sequences (or
     * worker threads) are combined with merge().
     */
    class SufficientStatisticsAccumulator {
    public:
        SufficientStatisticsAccumulator(int n_components, std::unique_ptr<EmissionStatistics> emission_stats);

        SufficientStatisticsAccumulator(const SufficientStatisticsAccumulator& other);
        SufficientStatisticsAccumulator& operator=(const SufficientStatisticsAccumulator& other);
        SufficientStatisticsAccumulator(SufficientStatisticsAccumulator&&) = default;
        SufficientStatisticsAccumulator& operator=(SufficientStatisticsAccumulator&&) = default;

        /**
         * @brief Add one sequence's posteriors
         * @param observations Rows of this sequence only
         * @param framelogprob Emission log-likelihoods used for fb_result
         */
        void accumulate_sequence(const EmissionModel& emission,
                                 const Eigen::MatrixXd& observations,
                                 const Eigen::MatrixXd& framelogprob,
                                 const ForwardBackwardResult& fb_result);

        // Throws ConfigurationError when the state counts or emission families differ
        void merge(const SufficientStatisticsAccumulator& other);

        void reset();

        int n_components() const { return static_cast<int>(start_.size()); }
        const Eigen::VectorXd& start() const { return start_; }
        const Eigen::MatrixXd& trans() const { return trans_; }
        // Throws NotInitializedError on a moved-from accumulator
        const EmissionStatistics& emission() const;
        size_t n_sequences() const { return n_sequences_; }
        size_t n_frames() const { return n_frames_; }
        double log_likelihood() const { return log_likelihood_; }

    private:
        EmissionStatistics& emission_statistics();

        Eigen::VectorXd start_;                         // Sum of gamma[0] over sequences
        Eigen::MatrixXd trans_;                         // Sum of xi aggregates
        std::unique_ptr<EmissionStatistics> emission_;
        size_t n_sequences_;
        size_t n_frames_;
        double log_likelihood_;
    };

} // namespace hmm
} // namespace hmmkit
