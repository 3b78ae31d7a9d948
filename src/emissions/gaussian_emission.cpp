#include "hmmkit/gaussian_emission.h"
#include "hmmkit/gaussian_mixture.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include "hmmkit/logger.h"
#include <cmath>
#include <algorithm>

namespace hmmkit {
namespace hmm {

namespace {
    const double LOG_2PI = std::log(2.0 * M_PI);
    const double SYMMETRY_TOLERANCE = 1e-8;
}

std::string covariance_type_to_string(CovarianceType type) {
    switch (type) {
        case CovarianceType::SPHERICAL: return "spherical";
        case CovarianceType::DIAG: return "diag";
        case CovarianceType::FULL: return "full";
        case CovarianceType::TIED: return "tied";
    }
    return "unknown";
}

CovarianceType covariance_type_from_string(const std::string& name) {
    if (name == "spherical") return CovarianceType::SPHERICAL;
    if (name == "diag") return CovarianceType::DIAG;
    if (name == "full") return CovarianceType::FULL;
    if (name == "tied") return CovarianceType::TIED;
    throw ConfigurationError("Unknown covariance type: '" + name + "'");
}

// GaussianStatistics implementation
GaussianStatistics::GaussianStatistics(int n_components, int n_features, bool full_moments)
    : post(Eigen::VectorXd::Zero(n_components))
    , obs(Eigen::MatrixXd::Zero(n_components, n_features))
    , obs_sq(Eigen::MatrixXd::Zero(n_components, n_features)) {
    if (full_moments) {
        obs_outer.assign(n_components, Eigen::MatrixXd::Zero(n_features, n_features));
    }
}

void GaussianStatistics::reset() {
    post.setZero();
    obs.setZero();
    obs_sq.setZero();
    for (auto& outer : obs_outer) {
        outer.setZero();
    }
}

void GaussianStatistics::merge(const EmissionStatistics& other) {
    const auto* rhs = dynamic_cast<const GaussianStatistics*>(&other);
    if (rhs == nullptr || rhs->post.size() != post.size() || rhs->obs.cols() != obs.cols() ||
        rhs->obs_outer.size() != obs_outer.size()) {
        throw ConfigurationError("Cannot merge incompatible Gaussian statistics");
    }
    post += rhs->post;
    obs += rhs->obs;
    obs_sq += rhs->obs_sq;
    for (size_t i = 0; i < obs_outer.size(); ++i) {
        obs_outer[i] += rhs->obs_outer[i];
    }
}

std::unique_ptr<EmissionStatistics> GaussianStatistics::clone() const {
    return std::make_unique<GaussianStatistics>(*this);
}

// GaussianEmission implementation
GaussianEmission::GaussianEmission(int n_components, int n_features, const GaussianEmissionConfig& config)
    : n_components_(n_components), n_features_(n_features), config_(config) {
    if (n_components <= 0 || n_features <= 0) {
        throw ConfigurationError("Gaussian emission needs positive state and feature counts");
    }
    if (!(config.min_covar > 0.0)) {
        throw ConfigurationError("min_covar must be positive");
    }
}

bool GaussianEmission::is_initialized() const {
    return means_.size() > 0 && covars_.size() > 0;
}

Eigen::Index GaussianEmission::expected_covars_rows() const {
    switch (config_.covariance_type) {
        case CovarianceType::SPHERICAL:
        case CovarianceType::DIAG:
            return n_components_;
        case CovarianceType::TIED:
            return n_features_;
        case CovarianceType::FULL:
            return static_cast<Eigen::Index>(n_components_) * n_features_;
    }
    return 0;
}

Eigen::Index GaussianEmission::expected_covars_cols() const {
    return config_.covariance_type == CovarianceType::SPHERICAL ? 1 : n_features_;
}

void GaussianEmission::set_means(const Eigen::MatrixXd& means) {
    if (means.rows() != n_components_ || means.cols() != n_features_) {
        throw ConfigurationError("means must be " + std::to_string(n_components_) + " x " +
                                 std::to_string(n_features_));
    }
    if (!means.allFinite()) {
        throw ConfigurationError("means contain non-finite values");
    }
    means_ = means;
}

void GaussianEmission::set_covars(const Eigen::MatrixXd& covars) {
    check_covars(covars);
    covars_ = covars;
}

void GaussianEmission::check_covars(const Eigen::MatrixXd& covars) const {
    if (covars.rows() != expected_covars_rows() || covars.cols() != expected_covars_cols()) {
        throw ConfigurationError("covars for '" + covariance_type_to_string(config_.covariance_type) +
                                 "' must be " + std::to_string(expected_covars_rows()) + " x " +
                                 std::to_string(expected_covars_cols()));
    }
    if (!covars.allFinite()) {
        throw ConfigurationError("covars contain non-finite values");
    }

    switch (config_.covariance_type) {
        case CovarianceType::SPHERICAL:
        case CovarianceType::DIAG:
            if (covars.minCoeff() <= 0.0) {
                throw ConfigurationError("'" + covariance_type_to_string(config_.covariance_type) +
                                         "' covars must be positive");
            }
            break;
        case CovarianceType::TIED:
        case CovarianceType::FULL: {
            const int blocks = config_.covariance_type == CovarianceType::TIED ? 1 : n_components_;
            for (int i = 0; i < blocks; ++i) {
                Eigen::MatrixXd block = covars.block(static_cast<Eigen::Index>(i) * n_features_, 0,
                                                     n_features_, n_features_);
                if ((block - block.transpose()).cwiseAbs().maxCoeff() > SYMMETRY_TOLERANCE) {
                    throw ConfigurationError("component " + std::to_string(i) + " of covars is not symmetric");
                }
                cholesky_factor(block, i);
            }
            break;
        }
    }
}

void GaussianEmission::validate() const {
    if (!is_initialized()) {
        throw NotInitializedError("Gaussian emission parameters (means, covars) are not set");
    }
    if (means_.rows() != n_components_ || means_.cols() != n_features_) {
        throw ConfigurationError("means shape does not match the model");
    }
    check_covars(covars_);
}

void GaussianEmission::check_observations(const Eigen::MatrixXd& observations) const {
    if (observations.cols() != n_features_) {
        throw ConfigurationError("Expected " + std::to_string(n_features_) + " features, got " +
                                 std::to_string(observations.cols()));
    }
    if (!observations.allFinite()) {
        throw ConfigurationError("Observations contain non-finite values");
    }
}

Eigen::MatrixXd GaussianEmission::full_covariance(int state) const {
    if (state < 0 || state >= n_components_) {
        throw std::out_of_range("State index out of range");
    }
    if (covars_.size() == 0) {
        throw NotInitializedError("covars are not set");
    }
    switch (config_.covariance_type) {
        case CovarianceType::SPHERICAL:
            return covars_(state, 0) * Eigen::MatrixXd::Identity(n_features_, n_features_);
        case CovarianceType::DIAG:
            return Eigen::MatrixXd(covars_.row(state).transpose().asDiagonal());
        case CovarianceType::TIED:
            return covars_;
        case CovarianceType::FULL:
            return covars_.block(static_cast<Eigen::Index>(state) * n_features_, 0, n_features_, n_features_);
    }
    return Eigen::MatrixXd();
}

Eigen::MatrixXd GaussianEmission::cholesky_factor(const Eigen::MatrixXd& covariance, int state) const {
    Eigen::LLT<Eigen::MatrixXd> llt(covariance);
    if (llt.info() == Eigen::Success) {
        return Eigen::MatrixXd(llt.matrixL());
    }

    llt.compute(covariance + config_.min_covar * Eigen::MatrixXd::Identity(n_features_, n_features_));
    if (llt.info() != Eigen::Success) {
        throw ConfigurationError("Covariance of state " + std::to_string(state) +
                                 " is not positive-definite after flooring with min_covar");
    }
    return Eigen::MatrixXd(llt.matrixL());
}

Eigen::MatrixXd GaussianEmission::log_likelihoods(const Eigen::MatrixXd& observations) const {
    if (!is_initialized()) {
        throw NotInitializedError("Gaussian emission parameters (means, covars) are not set");
    }
    check_observations(observations);

    const Eigen::Index T = observations.rows();
    Eigen::MatrixXd framelogprob(T, n_components_);

    if (config_.covariance_type == CovarianceType::SPHERICAL ||
        config_.covariance_type == CovarianceType::DIAG) {
        for (int i = 0; i < n_components_; ++i) {
            Eigen::ArrayXd variances;
            if (config_.covariance_type == CovarianceType::SPHERICAL) {
                variances = Eigen::ArrayXd::Constant(n_features_, covars_(i, 0));
            } else {
                variances = covars_.row(i).transpose().array();
            }
            const double log_norm = n_features_ * LOG_2PI + variances.log().sum();
            Eigen::ArrayXXd centered = (observations.rowwise() - means_.row(i)).array();
            Eigen::ArrayXd mahalanobis = (centered.square().rowwise() / variances.transpose()).rowwise().sum();
            framelogprob.col(i) = (-0.5 * (log_norm + mahalanobis)).matrix();
        }
        return framelogprob;
    }

    Eigen::MatrixXd tied_factor;
    if (config_.covariance_type == CovarianceType::TIED) {
        tied_factor = cholesky_factor(covars_, 0);
    }

    for (int i = 0; i < n_components_; ++i) {
        Eigen::MatrixXd factor = config_.covariance_type == CovarianceType::TIED
            ? tied_factor : cholesky_factor(full_covariance(i), i);
        const double log_det = 2.0 * factor.diagonal().array().log().sum();

        Eigen::MatrixXd centered = (observations.rowwise() - means_.row(i)).transpose();
        Eigen::MatrixXd whitened = factor.triangularView<Eigen::Lower>().solve(centered);
        framelogprob.col(i) = (-0.5 * (n_features_ * LOG_2PI + log_det +
                                       whitened.colwise().squaredNorm().array())).matrix().transpose();
    }
    return framelogprob;
}

Eigen::VectorXd GaussianEmission::generate_sample(int state, std::mt19937& rng) const {
    if (!is_initialized()) {
        throw NotInitializedError("Gaussian emission parameters (means, covars) are not set");
    }
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::VectorXd z(n_features_);
    for (int d = 0; d < n_features_; ++d) {
        z[d] = normal(rng);
    }
    Eigen::MatrixXd factor = cholesky_factor(full_covariance(state), state);
    return means_.row(state).transpose() + factor * z;
}

Eigen::MatrixXd GaussianEmission::expand_covariance(const Eigen::MatrixXd& full, int state_count) const {
    switch (config_.covariance_type) {
        case CovarianceType::SPHERICAL:
            return Eigen::MatrixXd::Constant(state_count, 1, full.diagonal().mean());
        case CovarianceType::DIAG:
            return full.diagonal().transpose().replicate(state_count, 1);
        case CovarianceType::TIED:
            return full;
        case CovarianceType::FULL:
            return full.replicate(state_count, 1);
    }
    return Eigen::MatrixXd();
}

void GaussianEmission::init_from_data(const Eigen::MatrixXd& observations, const ParamSet& init_params,
                                      std::mt19937& rng) {
    check_observations(observations);
    if (observations.rows() == 0) {
        throw ConfigurationError("Cannot initialize Gaussian emission from empty data");
    }

    if (init_params.contains(Param::MEANS)) {
        if (means_.size() > 0) {
            HMMKIT_LOG_INFO("Gaussian means supplied by caller, skipping initialization");
        } else {
            std::vector<Eigen::VectorXd> data;
            data.reserve(observations.rows());
            for (Eigen::Index t = 0; t < observations.rows(); ++t) {
                data.push_back(observations.row(t).transpose());
            }
            GaussianMixture clusters;
            clusters.initialize_kmeans(data, n_components_, rng, config_.min_covar);

            Eigen::MatrixXd means(n_components_, n_features_);
            for (int i = 0; i < n_components_; ++i) {
                means.row(i) = clusters.component(i).mean().transpose();
            }
            set_means(means);
        }
    }

    if (init_params.contains(Param::COVARS)) {
        if (covars_.size() > 0) {
            HMMKIT_LOG_INFO("Gaussian covars supplied by caller, skipping initialization");
        } else {
            Eigen::MatrixXd cv = math::empirical_covariance(observations) +
                                 config_.min_covar * Eigen::MatrixXd::Identity(n_features_, n_features_);
            set_covars(expand_covariance(cv, n_components_));
        }
    }
}

std::unique_ptr<EmissionStatistics> GaussianEmission::create_statistics() const {
    const bool full_moments = config_.covariance_type == CovarianceType::FULL ||
                              config_.covariance_type == CovarianceType::TIED;
    return std::make_unique<GaussianStatistics>(n_components_, n_features_, full_moments);
}

void GaussianEmission::accumulate_statistics(EmissionStatistics& stats,
                                             const Eigen::MatrixXd& observations,
                                             const Eigen::MatrixXd& /*framelogprob*/,
                                             const Eigen::MatrixXd& posteriors) const {
    auto* gaussian_stats = dynamic_cast<GaussianStatistics*>(&stats);
    if (gaussian_stats == nullptr) {
        throw ConfigurationError("Gaussian emission received foreign statistics");
    }
    if (posteriors.rows() != observations.rows() || posteriors.cols() != n_components_) {
        throw ConfigurationError("Posterior matrix does not match observations");
    }

    gaussian_stats->post += posteriors.colwise().sum().transpose();
    gaussian_stats->obs.noalias() += posteriors.transpose() * observations;
    gaussian_stats->obs_sq.noalias() += posteriors.transpose() * observations.array().square().matrix();

    for (size_t i = 0; i < gaussian_stats->obs_outer.size(); ++i) {
        Eigen::MatrixXd weighted = observations.array().colwise() * posteriors.col(i).array();
        gaussian_stats->obs_outer[i].noalias() += weighted.transpose() * observations;
    }
}

void GaussianEmission::do_mstep(const EmissionStatistics& stats, const ParamSet& params) {
    const auto* gaussian_stats = dynamic_cast<const GaussianStatistics*>(&stats);
    if (gaussian_stats == nullptr) {
        throw ConfigurationError("Gaussian emission received foreign statistics");
    }
    const auto& post = gaussian_stats->post;
    const auto& obs = gaussian_stats->obs;

    const double mw = config_.means_weight;
    const Eigen::MatrixXd means_prior = Eigen::MatrixXd::Constant(n_components_, n_features_, config_.means_prior);

    Eigen::MatrixXd new_means = means_;
    if (params.contains(Param::MEANS)) {
        for (int i = 0; i < n_components_; ++i) {
            const double denom = mw + post[i];
            if (denom > 0.0) {
                new_means.row(i) = (mw * means_prior.row(i) + obs.row(i)) / denom;
            }
        }
    }

    Eigen::MatrixXd new_covars = covars_;
    if (params.contains(Param::COVARS)) {
        const double cp = config_.covars_prior;
        const double cw = config_.covars_weight;
        const Eigen::MatrixXd meandiff = new_means - means_prior;

        if (config_.covariance_type == CovarianceType::SPHERICAL ||
            config_.covariance_type == CovarianceType::DIAG) {
            Eigen::MatrixXd diag_covars(n_components_, n_features_);
            for (int i = 0; i < n_components_; ++i) {
                if (config_.covariance_type == CovarianceType::DIAG) {
                    diag_covars.row(i) = covars_.row(i);
                } else {
                    diag_covars.row(i).setConstant(covars_(i, 0));
                }
                if (post[i] <= 0.0) {
                    continue;
                }
                Eigen::ArrayXd m = new_means.row(i).transpose().array();
                Eigen::ArrayXd c_n = mw * meandiff.row(i).transpose().array().square()
                                     + gaussian_stats->obs_sq.row(i).transpose().array()
                                     - 2.0 * m * obs.row(i).transpose().array()
                                     + m.square() * post[i];
                const double c_d = std::max(std::max(cw - 1.0, 0.0) + post[i], 1e-5);
                diag_covars.row(i) = ((cp + c_n) / c_d).matrix().transpose();
            }
            diag_covars = diag_covars.cwiseMax(config_.min_covar);

            if (config_.covariance_type == CovarianceType::SPHERICAL) {
                new_covars = diag_covars.rowwise().mean();
            } else {
                new_covars = diag_covars;
            }
        } else {
            const Eigen::MatrixXd prior = cp * Eigen::MatrixXd::Identity(n_features_, n_features_);
            const double cv_weight = std::max(cw - n_features_, 0.0);

            std::vector<Eigen::MatrixXd> c_n(n_components_);
            for (int i = 0; i < n_components_; ++i) {
                Eigen::VectorXd m = new_means.row(i).transpose();
                Eigen::VectorXd o = obs.row(i).transpose();
                Eigen::VectorXd md = meandiff.row(i).transpose();
                Eigen::MatrixXd obs_mean = o * m.transpose();
                c_n[i] = mw * md * md.transpose() + gaussian_stats->obs_outer[i]
                         - obs_mean - obs_mean.transpose() + m * m.transpose() * post[i];
            }

            if (config_.covariance_type == CovarianceType::TIED) {
                Eigen::MatrixXd total = Eigen::MatrixXd::Zero(n_features_, n_features_);
                for (const auto& c : c_n) total += c;
                const double denom = cv_weight + post.sum();
                if (denom > 0.0) {
                    Eigen::MatrixXd cov = (prior + total) / denom;
                    new_covars = 0.5 * (cov + cov.transpose());
                }
            } else {
                for (int i = 0; i < n_components_; ++i) {
                    const double denom = cv_weight + post[i];
                    if (denom <= 0.0 || post[i] <= 0.0) {
                        continue;
                    }
                    Eigen::MatrixXd cov = (prior + c_n[i]) / denom;
                    new_covars.block(static_cast<Eigen::Index>(i) * n_features_, 0, n_features_, n_features_) =
                        0.5 * (cov + cov.transpose());
                }
            }

            // Floor blocks whose factorization fails; check_covars below rejects what flooring cannot fix
            const int blocks = config_.covariance_type == CovarianceType::TIED ? 1 : n_components_;
            for (int i = 0; i < blocks; ++i) {
                auto block = new_covars.block(static_cast<Eigen::Index>(i) * n_features_, 0, n_features_, n_features_);
                Eigen::LLT<Eigen::MatrixXd> llt(block);
                if (llt.info() != Eigen::Success) {
                    HMMKIT_LOG_WARN_F("Covariance of state %d lost positive-definiteness, flooring with min_covar", i);
                    block += config_.min_covar * Eigen::MatrixXd::Identity(n_features_, n_features_);
                }
            }
        }
        check_covars(new_covars);
    }

    means_ = new_means;
    covars_ = new_covars;
}

std::unique_ptr<EmissionModel> GaussianEmission::clone() const {
    return std::make_unique<GaussianEmission>(*this);
}

} // namespace hmm
} // namespace hmmkit
