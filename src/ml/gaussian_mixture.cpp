#include "hmmkit/gaussian_mixture.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include <algorithm>
#include <numeric>
#include <cmath>
#include <limits>

namespace hmmkit {
namespace hmm {

namespace {
    const double LOG_2PI = std::log(2.0 * M_PI);

    void clamp_eigenvalues(Eigen::MatrixXd& matrix, double min_eigenvalue) {
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix);
        if (solver.info() == Eigen::Success) {
            Eigen::VectorXd eigenvalues = solver.eigenvalues().cwiseMax(min_eigenvalue);
            matrix = solver.eigenvectors() * eigenvalues.asDiagonal() * solver.eigenvectors().transpose();
        } else {
            matrix += min_eigenvalue * Eigen::MatrixXd::Identity(matrix.rows(), matrix.cols());
        }
    }
}

// SufficientStatistics implementation
void SufficientStatistics::update_parameters(Eigen::VectorXd& mean, Eigen::MatrixXd& covariance,
                                             double min_variance) const {
    if (gamma > 0.0) {
        mean = gamma_x / gamma;
        covariance = (gamma_xx / gamma) - mean * mean.transpose();
        covariance = 0.5 * (covariance + covariance.transpose());
        clamp_eigenvalues(covariance, min_variance);
    }
}

// GaussianComponent implementation
GaussianComponent::GaussianComponent()
    : mean_(Eigen::VectorXd::Zero(1))
    , covariance_(Eigen::MatrixXd::Identity(1, 1))
    , log_determinant_(0.0) {
    update_cache();
}

GaussianComponent::GaussianComponent(int dimension)
    : mean_(Eigen::VectorXd::Zero(dimension))
    , covariance_(Eigen::MatrixXd::Identity(dimension, dimension))
    , log_determinant_(0.0) {
    update_cache();
}

GaussianComponent::GaussianComponent(const Eigen::VectorXd& mean, const Eigen::MatrixXd& covariance)
    : mean_(mean), covariance_(covariance), log_determinant_(0.0) {
    if (mean.size() != covariance.rows() || covariance.rows() != covariance.cols()) {
        throw ConfigurationError("Dimension mismatch between mean and covariance");
    }
    update_cache();
}

void GaussianComponent::set_mean(const Eigen::VectorXd& mean) {
    if (mean.size() != dimension()) {
        throw ConfigurationError("Mean dimension mismatch");
    }
    mean_ = mean;
}

void GaussianComponent::set_covariance(const Eigen::MatrixXd& covariance) {
    if (covariance.rows() != dimension() || covariance.cols() != dimension()) {
        throw ConfigurationError("Covariance dimension mismatch");
    }
    Eigen::MatrixXd previous = covariance_;
    covariance_ = covariance;
    try {
        update_cache();
    } catch (const ConfigurationError&) {
        covariance_ = previous;
        update_cache();
        throw;
    }
}

void GaussianComponent::set_parameters(const Eigen::VectorXd& mean, const Eigen::MatrixXd& covariance) {
    if (mean.size() != covariance.rows() || covariance.rows() != covariance.cols()) {
        throw ConfigurationError("Dimension mismatch between mean and covariance");
    }
    Eigen::VectorXd previous_mean = mean_;
    mean_ = mean;
    try {
        set_covariance(covariance);
    } catch (const ConfigurationError&) {
        mean_ = previous_mean;
        throw;
    }
}

double GaussianComponent::log_pdf(const Eigen::VectorXd& observation) const {
    if (observation.size() != dimension()) {
        throw ConfigurationError("Observation dimension mismatch");
    }
    Eigen::VectorXd diff = observation - mean_;
    Eigen::VectorXd whitened = cholesky_.matrixL().solve(diff);
    return -0.5 * (dimension() * LOG_2PI + log_determinant_ + whitened.squaredNorm());
}

Eigen::VectorXd GaussianComponent::sample(std::mt19937& rng) const {
    std::normal_distribution<double> normal(0.0, 1.0);

    Eigen::VectorXd z(dimension());
    for (int i = 0; i < dimension(); ++i) {
        z[i] = normal(rng);
    }
    return mean_ + cholesky_.matrixL() * z;
}

bool GaussianComponent::is_valid() const {
    if (!mean_.allFinite() || !covariance_.allFinite()) {
        return false;
    }
    Eigen::LLT<Eigen::MatrixXd> llt(covariance_);
    return llt.info() == Eigen::Success;
}

void GaussianComponent::update_cache() {
    cholesky_.compute(covariance_);
    if (cholesky_.info() != Eigen::Success) {
        throw ConfigurationError("Covariance matrix is not positive-definite");
    }
    log_determinant_ = 2.0 * cholesky_.matrixLLT().diagonal().array().log().sum();
}

// GaussianMixture implementation
GaussianMixture::GaussianMixture() : dimension_(0) {
}

GaussianMixture::GaussianMixture(int num_components, int dimension) : dimension_(dimension) {
    if (num_components <= 0) {
        throw ConfigurationError("Mixture needs at least one component");
    }
    components_.reserve(num_components);
    weights_.assign(num_components, 1.0 / num_components);
    for (int i = 0; i < num_components; ++i) {
        components_.emplace_back(dimension);
    }
}

GaussianMixture::GaussianMixture(const std::vector<GaussianComponent>& components)
    : components_(components) {
    if (components.empty()) {
        dimension_ = 0;
        return;
    }
    dimension_ = components[0].dimension();
    validate_dimension_consistency();
    weights_.assign(components.size(), 1.0 / components.size());
}

const GaussianComponent& GaussianMixture::component(size_t index) const {
    if (index >= components_.size()) {
        throw std::out_of_range("Component index out of range");
    }
    return components_[index];
}

GaussianComponent& GaussianMixture::component(size_t index) {
    if (index >= components_.size()) {
        throw std::out_of_range("Component index out of range");
    }
    return components_[index];
}

double GaussianMixture::weight(size_t index) const {
    if (index >= weights_.size()) {
        throw std::out_of_range("Weight index out of range");
    }
    return weights_[index];
}

void GaussianMixture::set_weights(const std::vector<double>& weights) {
    if (weights.size() != components_.size()) {
        throw ConfigurationError("Weight vector size mismatch");
    }
    for (double w : weights) {
        if (w < 0.0 || !std::isfinite(w)) {
            throw ConfigurationError("All weights must be finite and non-negative");
        }
    }
    weights_ = weights;
    normalize_weights();
}

void GaussianMixture::normalize_weights() {
    if (weights_.empty()) return;

    double sum = std::accumulate(weights_.begin(), weights_.end(), 0.0);
    if (sum > 0.0) {
        for (double& w : weights_) {
            w /= sum;
        }
    } else {
        std::fill(weights_.begin(), weights_.end(), 1.0 / weights_.size());
    }
}

double GaussianMixture::log_likelihood(const Eigen::VectorXd& observation) const {
    if (components_.empty()) {
        return -std::numeric_limits<double>::infinity();
    }

    std::vector<double> log_weighted;
    log_weighted.reserve(components_.size());
    for (size_t i = 0; i < components_.size(); ++i) {
        log_weighted.push_back(std::log(weights_[i]) + components_[i].log_pdf(observation));
    }
    return math::log_sum_exp(log_weighted);
}

std::vector<double> GaussianMixture::responsibilities(const Eigen::VectorXd& observation) const {
    Eigen::VectorXd log_weighted(components_.size());
    for (size_t i = 0; i < components_.size(); ++i) {
        log_weighted[i] = std::log(weights_[i]) + components_[i].log_pdf(observation);
    }
    Eigen::VectorXd normalized = math::log_normalize(log_weighted);
    return std::vector<double>(normalized.data(), normalized.data() + normalized.size());
}

Eigen::VectorXd GaussianMixture::sample(std::mt19937& rng) const {
    if (components_.empty()) {
        return Eigen::VectorXd();
    }
    std::discrete_distribution<size_t> dist(weights_.begin(), weights_.end());
    return components_[dist(rng)].sample(rng);
}

void GaussianMixture::initialize_kmeans(const std::vector<Eigen::VectorXd>& data, int num_components,
                                        std::mt19937& rng, double min_variance, int max_iterations) {
    if (data.empty()) {
        throw ConfigurationError("Cannot initialize mixture from empty data");
    }
    if (num_components <= 0) {
        throw ConfigurationError("Mixture needs at least one component");
    }

    const int dimension = static_cast<int>(data[0].size());
    const Eigen::MatrixXd regularizer = min_variance * Eigen::MatrixXd::Identity(dimension, dimension);

    Eigen::MatrixXd stacked(data.size(), dimension);
    for (size_t i = 0; i < data.size(); ++i) {
        stacked.row(i) = data[i].transpose();
    }
    const Eigen::MatrixXd global_covariance = math::empirical_covariance(stacked) + regularizer;

    std::vector<size_t> assignments = kmeans_clustering(data, num_components, rng, max_iterations);

    std::vector<GaussianComponent> components;
    std::vector<double> weights;
    components.reserve(num_components);
    weights.reserve(num_components);
    std::uniform_int_distribution<size_t> pick(0, data.size() - 1);

    for (int k = 0; k < num_components; ++k) {
        Eigen::VectorXd mean = Eigen::VectorXd::Zero(dimension);
        size_t count = 0;
        for (size_t i = 0; i < data.size(); ++i) {
            if (assignments[i] == static_cast<size_t>(k)) {
                mean += data[i];
                ++count;
            }
        }

        if (count < 2) {
            // Too few points for a covariance estimate
            components.emplace_back(count == 1 ? mean : data[pick(rng)], global_covariance);
            weights.push_back(std::max<double>(count, 1.0) / data.size());
            continue;
        }

        mean /= static_cast<double>(count);
        Eigen::MatrixXd covariance = Eigen::MatrixXd::Zero(dimension, dimension);
        for (size_t i = 0; i < data.size(); ++i) {
            if (assignments[i] == static_cast<size_t>(k)) {
                Eigen::VectorXd diff = data[i] - mean;
                covariance.noalias() += diff * diff.transpose();
            }
        }
        covariance /= static_cast<double>(count);
        covariance += regularizer;

        components.emplace_back(mean, covariance);
        weights.push_back(static_cast<double>(count) / data.size());
    }

    components_ = std::move(components);
    weights_ = std::move(weights);
    dimension_ = dimension;
    normalize_weights();
}

std::vector<SufficientStatistics> GaussianMixture::accumulate_weighted_statistics(
    const std::vector<Eigen::VectorXd>& observations,
    const std::vector<double>& observation_weights) const {

    std::vector<SufficientStatistics> statistics(components_.size(), SufficientStatistics(dimension_));

    for (size_t obs_idx = 0; obs_idx < observations.size(); ++obs_idx) {
        const double obs_weight = observation_weights[obs_idx];
        if (obs_weight <= 0.0) continue;

        const auto& obs = observations[obs_idx];
        auto resp = responsibilities(obs);
        for (size_t i = 0; i < components_.size(); ++i) {
            statistics[i].accumulate(obs, resp[i] * obs_weight);
        }
    }

    return statistics;
}

void GaussianMixture::update_parameters(const std::vector<SufficientStatistics>& statistics,
                                        const UpdateMask& mask, double min_variance) {
    if (statistics.size() != components_.size()) {
        throw ConfigurationError("Statistics do not match the number of mixture components");
    }

    double total_gamma = 0.0;
    for (const auto& stat : statistics) {
        total_gamma += stat.gamma;
    }
    if (total_gamma <= 0.0) {
        return;
    }

    // Build the new mixture on the side so a failure leaves this one intact
    std::vector<GaussianComponent> new_components = components_;
    std::vector<double> new_weights = weights_;

    for (size_t i = 0; i < components_.size(); ++i) {
        const auto& stat = statistics[i];

        if (mask.weights) {
            new_weights[i] = std::max(stat.gamma / total_gamma, MIN_WEIGHT);
        }

        if (stat.gamma > MIN_WEIGHT && (mask.means || mask.covariances)) {
            Eigen::VectorXd new_mean = components_[i].mean();
            Eigen::MatrixXd new_covariance = components_[i].covariance();
            stat.update_parameters(new_mean, new_covariance, min_variance);

            if (!mask.means) {
                // Covariance about the fixed mean m: E[xx'] - m xbar' - xbar m' + m m'
                const Eigen::VectorXd& m = components_[i].mean();
                const Eigen::VectorXd x_bar = stat.gamma_x / stat.gamma;
                new_covariance = stat.gamma_xx / stat.gamma - m * x_bar.transpose()
                                 - x_bar * m.transpose() + m * m.transpose();
                new_covariance = 0.5 * (new_covariance + new_covariance.transpose());
                clamp_eigenvalues(new_covariance, min_variance);
                new_mean = m;
            }
            if (!mask.covariances) {
                new_covariance = components_[i].covariance();
            }
            new_components[i].set_parameters(new_mean, new_covariance);
        }
    }

    components_ = std::move(new_components);
    weights_ = std::move(new_weights);
    normalize_weights();
}

double GaussianMixture::train_weighted_em(const std::vector<Eigen::VectorXd>& observations,
                                          const std::vector<double>& observation_weights,
                                          const UpdateMask& mask,
                                          double min_variance,
                                          int max_iterations,
                                          double tolerance) {
    if (observations.size() != observation_weights.size()) {
        throw ConfigurationError("Observation and weight counts differ");
    }
    if (observations.empty() || components_.empty()) {
        return -std::numeric_limits<double>::infinity();
    }

    double prev_log_likelihood = weighted_log_likelihood(observations, observation_weights);
    double log_likelihood = prev_log_likelihood;

    for (int iter = 0; iter < max_iterations; ++iter) {
        auto statistics = accumulate_weighted_statistics(observations, observation_weights);
        update_parameters(statistics, mask, min_variance);
        log_likelihood = weighted_log_likelihood(observations, observation_weights);

        if (std::abs(log_likelihood - prev_log_likelihood) < tolerance) {
            break;
        }
        prev_log_likelihood = log_likelihood;
    }

    return log_likelihood;
}

double GaussianMixture::weighted_log_likelihood(const std::vector<Eigen::VectorXd>& observations,
                                                const std::vector<double>& observation_weights) const {
    double total = 0.0;
    double total_weight = 0.0;

    for (size_t i = 0; i < observations.size(); ++i) {
        if (observation_weights[i] > 0.0) {
            total += observation_weights[i] * log_likelihood(observations[i]);
            total_weight += observation_weights[i];
        }
    }

    return total_weight > 0.0 ? total / total_weight : -std::numeric_limits<double>::infinity();
}

bool GaussianMixture::is_valid() const {
    if (components_.empty() || components_.size() != weights_.size()) {
        return false;
    }
    for (const auto& component : components_) {
        if (!component.is_valid()) {
            return false;
        }
    }
    double weight_sum = std::accumulate(weights_.begin(), weights_.end(), 0.0);
    return std::abs(weight_sum - 1.0) < 1e-6;
}

std::vector<size_t> GaussianMixture::kmeans_clustering(const std::vector<Eigen::VectorXd>& data, int num_clusters,
                                                       std::mt19937& rng, int max_iterations) const {
    const int dimension = static_cast<int>(data[0].size());
    std::vector<Eigen::VectorXd> centroids(num_clusters);
    std::vector<size_t> assignments(data.size(), static_cast<size_t>(num_clusters));

    // Seed centroids from distinct data points where possible
    std::vector<size_t> order(data.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);
    for (int k = 0; k < num_clusters; ++k) {
        centroids[k] = data[order[k % order.size()]];
    }

    for (int iter = 0; iter < max_iterations; ++iter) {
        bool changed = false;

        for (size_t i = 0; i < data.size(); ++i) {
            double min_distance = std::numeric_limits<double>::infinity();
            size_t best_cluster = 0;

            for (int k = 0; k < num_clusters; ++k) {
                double distance = (data[i] - centroids[k]).squaredNorm();
                if (distance < min_distance) {
                    min_distance = distance;
                    best_cluster = k;
                }
            }

            if (assignments[i] != best_cluster) {
                assignments[i] = best_cluster;
                changed = true;
            }
        }

        if (!changed) {
            break;
        }

        std::vector<int> cluster_counts(num_clusters, 0);
        std::vector<Eigen::VectorXd> new_centroids(num_clusters, Eigen::VectorXd::Zero(dimension));
        for (size_t i = 0; i < data.size(); ++i) {
            new_centroids[assignments[i]] += data[i];
            cluster_counts[assignments[i]]++;
        }
        for (int k = 0; k < num_clusters; ++k) {
            if (cluster_counts[k] > 0) {
                centroids[k] = new_centroids[k] / cluster_counts[k];
            }
        }
    }

    return assignments;
}

void GaussianMixture::validate_dimension_consistency() const {
    for (const auto& component : components_) {
        if (component.dimension() != dimension_) {
            throw ConfigurationError("Inconsistent component dimensions");
        }
    }
}

} // namespace hmm
} // namespace hmmkit
