#include "hmmkit/gmm_emission.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/logger.h"
#include <limits>

namespace hmmkit {
namespace hmm {

// GmmStatistics implementation
GmmStatistics::GmmStatistics(int n_components, int n_mix, int n_features, bool keep_observations)
    : component_stats(n_components, std::vector<SufficientStatistics>(n_mix, SufficientStatistics(n_features)))
    , state_weights(keep_observations ? n_components : 0)
    , keep_observations_(keep_observations) {
}

void GmmStatistics::reset() {
    for (auto& state : component_stats) {
        for (auto& stat : state) {
            stat.clear();
        }
    }
    observations.clear();
    for (auto& weights : state_weights) {
        weights.clear();
    }
}

void GmmStatistics::merge(const EmissionStatistics& other) {
    const auto* rhs = dynamic_cast<const GmmStatistics*>(&other);
    if (rhs == nullptr || rhs->component_stats.size() != component_stats.size() ||
        rhs->keep_observations_ != keep_observations_) {
        throw ConfigurationError("Cannot merge incompatible GMM statistics");
    }
    for (size_t i = 0; i < component_stats.size(); ++i) {
        if (rhs->component_stats[i].size() != component_stats[i].size()) {
            throw ConfigurationError("Cannot merge incompatible GMM statistics");
        }
    }

    for (size_t i = 0; i < component_stats.size(); ++i) {
        for (size_t m = 0; m < component_stats[i].size(); ++m) {
            component_stats[i][m].merge(rhs->component_stats[i][m]);
        }
    }
    if (keep_observations_) {
        observations.insert(observations.end(), rhs->observations.begin(), rhs->observations.end());
        for (size_t i = 0; i < state_weights.size(); ++i) {
            state_weights[i].insert(state_weights[i].end(),
                                    rhs->state_weights[i].begin(), rhs->state_weights[i].end());
        }
    }
}

std::unique_ptr<EmissionStatistics> GmmStatistics::clone() const {
    return std::make_unique<GmmStatistics>(*this);
}

// GmmEmission implementation
GmmEmission::GmmEmission(int n_components, int n_features, const GmmEmissionConfig& config)
    : n_components_(n_components), n_features_(n_features), config_(config) {
    if (n_components <= 0 || n_features <= 0) {
        throw ConfigurationError("GMM emission needs positive state and feature counts");
    }
    if (config.n_mix <= 0) {
        throw ConfigurationError("n_mix must be positive");
    }
    if (config.inner_iterations <= 0) {
        throw ConfigurationError("inner_iterations must be positive");
    }
    if (!(config.min_covar > 0.0)) {
        throw ConfigurationError("min_covar must be positive");
    }
}

const GaussianMixture& GmmEmission::mixture(int state) const {
    if (state < 0 || static_cast<size_t>(state) >= mixtures_.size()) {
        throw std::out_of_range("State index out of range");
    }
    return mixtures_[state];
}

void GmmEmission::check_mixtures(const std::vector<GaussianMixture>& mixtures) const {
    if (mixtures.size() != static_cast<size_t>(n_components_)) {
        throw ConfigurationError("Expected " + std::to_string(n_components_) + " mixtures, got " +
                                 std::to_string(mixtures.size()));
    }
    for (size_t i = 0; i < mixtures.size(); ++i) {
        const auto& mix = mixtures[i];
        if (mix.num_components() != static_cast<size_t>(config_.n_mix) || mix.dimension() != n_features_) {
            throw ConfigurationError("Mixture of state " + std::to_string(i) + " must have " +
                                     std::to_string(config_.n_mix) + " components of dimension " +
                                     std::to_string(n_features_));
        }
        if (!mix.is_valid()) {
            throw ConfigurationError("Mixture of state " + std::to_string(i) +
                                     " has invalid weights or covariances");
        }
    }
}

void GmmEmission::set_mixtures(const std::vector<GaussianMixture>& mixtures) {
    check_mixtures(mixtures);
    mixtures_ = mixtures;
}

void GmmEmission::validate() const {
    if (!is_initialized()) {
        throw NotInitializedError("GMM emission mixtures are not set");
    }
    check_mixtures(mixtures_);
}

void GmmEmission::check_observations(const Eigen::MatrixXd& observations) const {
    if (observations.cols() != n_features_) {
        throw ConfigurationError("Expected " + std::to_string(n_features_) + " features, got " +
                                 std::to_string(observations.cols()));
    }
    if (!observations.allFinite()) {
        throw ConfigurationError("Observations contain non-finite values");
    }
}

Eigen::MatrixXd GmmEmission::log_likelihoods(const Eigen::MatrixXd& observations) const {
    if (!is_initialized()) {
        throw NotInitializedError("GMM emission mixtures are not set");
    }
    check_observations(observations);

    Eigen::MatrixXd framelogprob(observations.rows(), n_components_);
    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        Eigen::VectorXd x = observations.row(t).transpose();
        for (int i = 0; i < n_components_; ++i) {
            framelogprob(t, i) = mixtures_[i].log_likelihood(x);
        }
    }
    return framelogprob;
}

Eigen::VectorXd GmmEmission::generate_sample(int state, std::mt19937& rng) const {
    return mixture(state).sample(rng);
}

void GmmEmission::init_from_data(const Eigen::MatrixXd& observations, const ParamSet& init_params,
                                 std::mt19937& rng) {
    const ParamSet mixture_params = init_params.intersect(supported_params());
    if (mixture_params.empty()) {
        return;
    }
    if (is_initialized()) {
        HMMKIT_LOG_INFO("GMM mixtures supplied by caller, skipping initialization");
        return;
    }
    check_observations(observations);
    if (observations.rows() == 0) {
        throw ConfigurationError("Cannot initialize GMM emission from empty data");
    }

    std::vector<Eigen::VectorXd> data;
    data.reserve(observations.rows());
    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        data.push_back(observations.row(t).transpose());
    }

    // Coarse partition into one cluster per state, then a mixture per cluster
    GaussianMixture partition;
    partition.initialize_kmeans(data, n_components_, rng, config_.min_covar);

    std::vector<std::vector<Eigen::VectorXd>> clusters(n_components_);
    for (const auto& x : data) {
        int best = 0;
        double best_distance = std::numeric_limits<double>::infinity();
        for (int i = 0; i < n_components_; ++i) {
            const double distance = (x - partition.component(i).mean()).squaredNorm();
            if (distance < best_distance) {
                best_distance = distance;
                best = i;
            }
        }
        clusters[best].push_back(x);
    }

    std::vector<GaussianMixture> mixtures(n_components_);
    for (int i = 0; i < n_components_; ++i) {
        const auto& source = clusters[i].size() >= static_cast<size_t>(config_.n_mix) ? clusters[i] : data;
        mixtures[i].initialize_kmeans(source, config_.n_mix, rng, config_.min_covar);
    }

    set_mixtures(mixtures);
    HMMKIT_LOG_DEBUG_F("Initialized %d state mixtures with %d components each", n_components_, config_.n_mix);
}

std::unique_ptr<EmissionStatistics> GmmEmission::create_statistics() const {
    return std::make_unique<GmmStatistics>(n_components_, config_.n_mix, n_features_,
                                           config_.inner_iterations > 1);
}

void GmmEmission::accumulate_statistics(EmissionStatistics& stats,
                                        const Eigen::MatrixXd& observations,
                                        const Eigen::MatrixXd& /*framelogprob*/,
                                        const Eigen::MatrixXd& posteriors) const {
    auto* gmm_stats = dynamic_cast<GmmStatistics*>(&stats);
    if (gmm_stats == nullptr || gmm_stats->component_stats.size() != static_cast<size_t>(n_components_)) {
        throw ConfigurationError("GMM emission received foreign statistics");
    }
    if (!is_initialized()) {
        throw NotInitializedError("GMM emission mixtures are not set");
    }
    if (posteriors.rows() != observations.rows() || posteriors.cols() != n_components_) {
        throw ConfigurationError("Posterior matrix does not match observations");
    }

    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        const Eigen::VectorXd x = observations.row(t).transpose();
        for (int i = 0; i < n_components_; ++i) {
            const double state_weight = posteriors(t, i);
            if (state_weight <= 0.0) continue;

            const std::vector<double> resp = mixtures_[i].responsibilities(x);
            auto& state_stats = gmm_stats->component_stats[i];
            for (size_t m = 0; m < state_stats.size(); ++m) {
                state_stats[m].accumulate(x, state_weight * resp[m]);
            }
        }

        if (gmm_stats->keeps_observations()) {
            gmm_stats->observations.push_back(x);
            for (int i = 0; i < n_components_; ++i) {
                gmm_stats->state_weights[i].push_back(posteriors(t, i));
            }
        }
    }
}

void GmmEmission::do_mstep(const EmissionStatistics& stats, const ParamSet& params) {
    const auto* gmm_stats = dynamic_cast<const GmmStatistics*>(&stats);
    if (gmm_stats == nullptr || gmm_stats->component_stats.size() != static_cast<size_t>(n_components_)) {
        throw ConfigurationError("GMM emission received foreign statistics");
    }

    GaussianMixture::UpdateMask mask;
    mask.weights = params.contains(Param::WEIGHTS);
    mask.means = params.contains(Param::MEANS);
    mask.covariances = params.contains(Param::COVARS);
    if (!mask.weights && !mask.means && !mask.covariances) {
        return;
    }

    std::vector<GaussianMixture> updated = mixtures_;
    for (int i = 0; i < n_components_; ++i) {
        // First pass from the E-step moments, further passes re-run EM on the kept frames
        updated[i].update_parameters(gmm_stats->component_stats[i], mask, config_.min_covar);
        if (gmm_stats->keeps_observations() && config_.inner_iterations > 1) {
            updated[i].train_weighted_em(gmm_stats->observations, gmm_stats->state_weights[i], mask,
                                         config_.min_covar, config_.inner_iterations - 1);
        }
    }
    check_mixtures(updated);
    mixtures_ = std::move(updated);
}

std::unique_ptr<EmissionModel> GmmEmission::clone() const {
    return std::make_unique<GmmEmission>(*this);
}

} // namespace hmm
} // namespace hmmkit
