#pragma once

#include <Eigen/Core>
#include "emission_model.h"

namespace hmmkit {
namespace hmm {

    /**
     * @brief Posterior-weighted symbol counts (N x M)
     */
    class CategoricalStatistics : public EmissionStatistics {
    public:
        CategoricalStatistics(int n_components, int n_symbols);

        void reset() override;
        void merge(const EmissionStatistics& other) override;
        std::unique_ptr<EmissionStatistics> clone() const override;

        Eigen::MatrixXd obs;
    };

    /**
     * @brief Categorical distribution over M symbols per state
     *
     * Observations are a single column of integer symbols in [0, M).
     * n_features() reports the alphabet size M.
     */
    class CategoricalEmission : public EmissionModel {
    public:
        CategoricalEmission(int n_components, int n_symbols, double emissionprob_prior = 1.0);

        std::string family_name() const override { return "categorical"; }
        int n_components() const override { return n_components_; }
        int n_features() const override { return n_symbols_; }
        ParamSet supported_params() const override { return {Param::EMISSIONPROB}; }
        bool is_initialized() const override { return emissionprob_.size() > 0; }
        void validate() const override;
        void check_observations(const Eigen::MatrixXd& observations) const override;

        Eigen::MatrixXd log_likelihoods(const Eigen::MatrixXd& observations) const override;
        Eigen::VectorXd generate_sample(int state, std::mt19937& rng) const override;
        void init_from_data(const Eigen::MatrixXd& observations, const ParamSet& init_params,
                            std::mt19937& rng) override;

        std::unique_ptr<EmissionStatistics> create_statistics() const override;
        void accumulate_statistics(EmissionStatistics& stats,
                                   const Eigen::MatrixXd& observations,
                                   const Eigen::MatrixXd& framelogprob,
                                   const Eigen::MatrixXd& posteriors) const override;
        void do_mstep(const EmissionStatistics& stats, const ParamSet& params) override;

        std::unique_ptr<EmissionModel> clone() const override;

        int n_symbols() const { return n_symbols_; }
        double emissionprob_prior() const { return emissionprob_prior_; }
        const Eigen::MatrixXd& emissionprob() const { return emissionprob_; }

        // N x M, every row a probability distribution
        void set_emissionprob(const Eigen::MatrixXd& emissionprob);

    private:
        int n_components_;
        int n_symbols_;
        double emissionprob_prior_;

        Eigen::MatrixXd emissionprob_;

        void check_emissionprob(const Eigen::MatrixXd& emissionprob) const;
    };

} // namespace hmm
} // namespace hmmkit
