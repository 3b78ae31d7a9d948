#pragma once

#include <memory>
#include <random>
#include <string>
#include <Eigen/Core>
#include "hmm_types.h"

namespace hmmkit {
namespace hmm {

    /**
     * @brief Family-specific emission sufficient statistics
     *
     * Each emission family defines its own totals. Merging must be
     * associative and commutative so per-sequence or per-thread
     * contributions can be reduced in any order before the M-step.
     */
    class EmissionStatistics {
    public:
        virtual ~EmissionStatistics() = default;

        virtual void reset() = 0;

        // Throws ConfigurationError if other belongs to a different family or shape
        virtual void merge(const EmissionStatistics& other) = 0;

        virtual std::unique_ptr<EmissionStatistics> clone() const = 0;
    };

    /**
     * @brief State-conditional observation distribution of an HMM
     *
     * One implementation per distribution family. Virtual dispatch happens
     * once per sequence; the per-observation loops live inside each family.
     */
    class EmissionModel {
    public:
        virtual ~EmissionModel() = default;

        virtual std::string family_name() const = 0;
        virtual int n_components() const = 0;
        virtual int n_features() const = 0;

        // Parameters this family can initialize and estimate
        virtual ParamSet supported_params() const = 0;

        // True once every parameter needed by log_likelihoods() is set
        virtual bool is_initialized() const = 0;

        /**
         * @brief Check parameter shapes and values
         * @throws ConfigurationError on inconsistent or invalid parameters
         */
        virtual void validate() const = 0;

        /**
         * @brief Check observations are usable by this family
         * @throws ConfigurationError on dimension or domain mismatch
         */
        virtual void check_observations(const Eigen::MatrixXd& observations) const = 0;

        /**
         * @brief Per-observation, per-state log-likelihoods
         * @param observations T x D block of one or more sequences
         * @return T x N matrix, entry (t, i) = log P(x_t | state i)
         */
        virtual Eigen::MatrixXd log_likelihoods(const Eigen::MatrixXd& observations) const = 0;

        // One draw from the emission distribution of the given state
        virtual Eigen::VectorXd generate_sample(int state, std::mt19937& rng) const = 0;

        /**
         * @brief Data-driven defaults for the listed parameters
         *
         * Parameters already set are kept; only missing parameters in
         * init_params are assigned.
         */
        virtual void init_from_data(const Eigen::MatrixXd& observations, const ParamSet& init_params,
                                    std::mt19937& rng) = 0;

        virtual std::unique_ptr<EmissionStatistics> create_statistics() const = 0;

        /**
         * @brief Add one sequence's contribution to the emission statistics
         * @param framelogprob T x N output of log_likelihoods() for the sequence
         * @param posteriors T x N state occupation posteriors (gamma)
         */
        virtual void accumulate_statistics(EmissionStatistics& stats,
                                           const Eigen::MatrixXd& observations,
                                           const Eigen::MatrixXd& framelogprob,
                                           const Eigen::MatrixXd& posteriors) const = 0;

        /**
         * @brief Re-estimate the listed parameters from accumulated statistics
         *
         * Either every listed parameter is updated or, when an exception is
         * thrown, none is.
         */
        virtual void do_mstep(const EmissionStatistics& stats, const ParamSet& params) = 0;

        virtual std::unique_ptr<EmissionModel> clone() const = 0;
    };

} // namespace hmm
} // namespace hmmkit
