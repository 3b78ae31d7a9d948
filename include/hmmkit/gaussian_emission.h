#pragma once

#include <string>
#include <vector>
#include <Eigen/Core>
#include <Eigen/Dense>
#include "emission_model.h"

namespace hmmkit {
namespace hmm {

    /**
     * @brief Covariance structure of a Gaussian emission
     */
    enum class CovarianceType {
        SPHERICAL,  // One variance per state
        DIAG,       // Diagonal covariance per state
        FULL,       // Full covariance per state
        TIED        // One full covariance shared by all states
    };

    std::string covariance_type_to_string(CovarianceType type);
    // Throws ConfigurationError on an unknown name
    CovarianceType covariance_type_from_string(const std::string& name);

    /**
     * @brief Hyper-parameters of the Gaussian emission M-step
     *
     * Defaults give maximum likelihood means and slightly smoothed covariances.
     * With covars_prior > 0 the covariance update is a MAP estimate, so the data
     * log-likelihood reported per iteration may dip slightly and be recorded as
     * a convergence anomaly. Set covars_prior to 0 (with means_weight 0 and
     * covars_weight 1) for pure maximum likelihood EM, which never decreases it.
     */
    struct GaussianEmissionConfig {
        CovarianceType covariance_type;
        double min_covar;           // Variance floor
        double means_prior;         // Prior mean (applied to every coordinate)
        double means_weight;        // Pseudo-count of the prior mean
        double covars_prior;        // Prior covariance scale
        double covars_weight;       // Pseudo-count of the prior covariance

        GaussianEmissionConfig()
            : covariance_type(CovarianceType::DIAG)
            , min_covar(1e-3)
            , means_prior(0.0)
            , means_weight(0.0)
            , covars_prior(1e-2)
            , covars_weight(1.0) {}
    };

    /**
     * @brief Gaussian statistics: posterior mass, first and second moments per state
     */
    class GaussianStatistics : public EmissionStatistics {
    public:
        GaussianStatistics(int n_components, int n_features, bool full_moments);

        void reset() override;
        void merge(const EmissionStatistics& other) override;
        std::unique_ptr<EmissionStatistics> clone() const override;

        Eigen::VectorXd post;                   // N
        Eigen::MatrixXd obs;                    // N x D
        Eigen::MatrixXd obs_sq;                 // N x D, diagonal second moments
        std::vector<Eigen::MatrixXd> obs_outer; // N x (D x D), only for full/tied
    };

    /**
     * @brief Single Gaussian per state with configurable covariance structure
     */
    class GaussianEmission : public EmissionModel {
    public:
        GaussianEmission(int n_components, int n_features,
                         const GaussianEmissionConfig& config = GaussianEmissionConfig());

        std::string family_name() const override { return "gaussian"; }
        int n_components() const override { return n_components_; }
        int n_features() const override { return n_features_; }
        ParamSet supported_params() const override { return {Param::MEANS, Param::COVARS}; }
        bool is_initialized() const override;
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

        // Parameter access
        const GaussianEmissionConfig& config() const { return config_; }
        CovarianceType covariance_type() const { return config_.covariance_type; }
        const Eigen::MatrixXd& means() const { return means_; }

        /**
         * @brief Covariances in the storage shape of the covariance type
         *
         * spherical: N x 1, diag: N x D, tied: D x D, full: N*D x D
         * (state i occupies rows [i*D, (i+1)*D)).
         */
        const Eigen::MatrixXd& covars() const { return covars_; }

        // D x D covariance of one state regardless of storage shape
        Eigen::MatrixXd full_covariance(int state) const;

        void set_means(const Eigen::MatrixXd& means);
        void set_covars(const Eigen::MatrixXd& covars);

    private:
        int n_components_;
        int n_features_;
        GaussianEmissionConfig config_;

        Eigen::MatrixXd means_;
        Eigen::MatrixXd covars_;

        Eigen::Index expected_covars_rows() const;
        Eigen::Index expected_covars_cols() const;
        void check_covars(const Eigen::MatrixXd& covars) const;

        // Lower Cholesky factor of a state covariance, floored once with min_covar if needed
        Eigen::MatrixXd cholesky_factor(const Eigen::MatrixXd& covariance, int state) const;

        Eigen::MatrixXd expand_covariance(const Eigen::MatrixXd& full, int state_count) const;
    };

} // namespace hmm
} // namespace hmmkit
