#pragma once

#include <vector>
#include <Eigen/Core>
#include "emission_model.h"
#include "gaussian_mixture.h"

namespace hmmkit {
namespace hmm {

    struct GmmEmissionConfig {
        int n_mix;              // Mixture components per state
        double min_covar;       // Eigenvalue floor of component covariances
        int inner_iterations;   // Weighted EM passes per M-step

        GmmEmissionConfig()
            : n_mix(2)
            , min_covar(1e-3)
            , inner_iterations(1) {}
    };

    /**
     * @brief Statistics for the mixture M-step
     *
     * component_stats[i][m] holds the moments of mixture component m of state i,
     * weighted by state posterior times component responsibility. They are
     * enough for the single-pass update. Inner EM passes re-evaluate the
     * responsibilities, so with keep_observations the raw frames are also
     * stored and state_weights[i][k] is the posterior of state i for
     * observations[k].
     */
    class GmmStatistics : public EmissionStatistics {
    public:
        GmmStatistics(int n_components, int n_mix, int n_features, bool keep_observations);

        void reset() override;
        void merge(const EmissionStatistics& other) override;
        std::unique_ptr<EmissionStatistics> clone() const override;

        bool keeps_observations() const { return keep_observations_; }

        std::vector<std::vector<SufficientStatistics>> component_stats;
        std::vector<Eigen::VectorXd> observations;
        std::vector<std::vector<double>> state_weights;

    private:
        bool keep_observations_;
    };

    /**
     * @brief Gaussian mixture per state
     *
     * Each state owns a GaussianMixture of n_mix full-covariance components.
     * With inner_iterations == 1 the M-step is the standard Baum-Welch
     * update for GMM-HMMs.
     */
    class GmmEmission : public EmissionModel {
    public:
        GmmEmission(int n_components, int n_features, const GmmEmissionConfig& config = GmmEmissionConfig());

        std::string family_name() const override { return "gmm"; }
        int n_components() const override { return n_components_; }
        int n_features() const override { return n_features_; }
        ParamSet supported_params() const override { return {Param::WEIGHTS, Param::MEANS, Param::COVARS}; }
        bool is_initialized() const override { return !mixtures_.empty(); }
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

        const GmmEmissionConfig& config() const { return config_; }
        int n_mix() const { return config_.n_mix; }
        const std::vector<GaussianMixture>& mixtures() const { return mixtures_; }
        const GaussianMixture& mixture(int state) const;

        // One mixture per state, each with n_mix components of dimension n_features
        void set_mixtures(const std::vector<GaussianMixture>& mixtures);

    private:
        int n_components_;
        int n_features_;
        GmmEmissionConfig config_;

        std::vector<GaussianMixture> mixtures_;

        void check_mixtures(const std::vector<GaussianMixture>& mixtures) const;
    };

} // namespace hmm
} // namespace hmmkit
