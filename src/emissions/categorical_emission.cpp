#include "hmmkit/categorical_emission.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include "hmmkit/logger.h"
#include <cmath>

namespace hmmkit {
namespace hmm {

namespace {
    const double INIT_JITTER = 0.1;
}

// CategoricalStatistics implementation
CategoricalStatistics::CategoricalStatistics(int n_components, int n_symbols)
    : obs(Eigen::MatrixXd::Zero(n_components, n_symbols)) {
}

void CategoricalStatistics::reset() {
    obs.setZero();
}

void CategoricalStatistics::merge(const EmissionStatistics& other) {
    const auto* rhs = dynamic_cast<const CategoricalStatistics*>(&other);
    if (rhs == nullptr || rhs->obs.rows() != obs.rows() || rhs->obs.cols() != obs.cols()) {
        throw ConfigurationError("Cannot merge incompatible categorical statistics");
    }
    obs += rhs->obs;
}

std::unique_ptr<EmissionStatistics> CategoricalStatistics::clone() const {
    return std::make_unique<CategoricalStatistics>(*this);
}

// CategoricalEmission implementation
CategoricalEmission::CategoricalEmission(int n_components, int n_symbols, double emissionprob_prior)
    : n_components_(n_components), n_symbols_(n_symbols), emissionprob_prior_(emissionprob_prior) {
    if (n_components <= 0 || n_symbols <= 0) {
        throw ConfigurationError("Categorical emission needs positive state and symbol counts");
    }
    if (!std::isfinite(emissionprob_prior)) {
        throw ConfigurationError("emissionprob_prior must be finite");
    }
}

void CategoricalEmission::check_emissionprob(const Eigen::MatrixXd& emissionprob) const {
    if (emissionprob.rows() != n_components_ || emissionprob.cols() != n_symbols_) {
        throw ConfigurationError("emissionprob must be " + std::to_string(n_components_) + " x " +
                                 std::to_string(n_symbols_));
    }
    for (int i = 0; i < n_components_; ++i) {
        if (!math::is_stochastic(emissionprob.row(i).transpose())) {
            throw ConfigurationError("Row " + std::to_string(i) + " of emissionprob is not a distribution");
        }
    }
}

void CategoricalEmission::set_emissionprob(const Eigen::MatrixXd& emissionprob) {
    check_emissionprob(emissionprob);
    emissionprob_ = emissionprob;
}

void CategoricalEmission::validate() const {
    if (!is_initialized()) {
        throw NotInitializedError("Categorical emissionprob is not set");
    }
    check_emissionprob(emissionprob_);
}

void CategoricalEmission::check_observations(const Eigen::MatrixXd& observations) const {
    if (observations.cols() != 1) {
        throw ConfigurationError("Categorical observations must be a single column of symbols");
    }
    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        const double value = observations(t, 0);
        if (!std::isfinite(value) || value != std::floor(value) || value < 0.0 || value >= n_symbols_) {
            throw ConfigurationError("Observation " + std::to_string(t) + " is not a symbol in [0, " +
                                     std::to_string(n_symbols_) + ")");
        }
    }
}

Eigen::MatrixXd CategoricalEmission::log_likelihoods(const Eigen::MatrixXd& observations) const {
    if (!is_initialized()) {
        throw NotInitializedError("Categorical emissionprob is not set");
    }
    check_observations(observations);

    const Eigen::MatrixXd log_emission = math::log_matrix(emissionprob_);
    Eigen::MatrixXd framelogprob(observations.rows(), n_components_);
    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        const int symbol = static_cast<int>(observations(t, 0));
        framelogprob.row(t) = log_emission.col(symbol).transpose();
    }
    return framelogprob;
}

Eigen::VectorXd CategoricalEmission::generate_sample(int state, std::mt19937& rng) const {
    if (!is_initialized()) {
        throw NotInitializedError("Categorical emissionprob is not set");
    }
    if (state < 0 || state >= n_components_) {
        throw std::out_of_range("State index out of range");
    }
    const Eigen::VectorXd row = emissionprob_.row(state).transpose();
    std::discrete_distribution<int> dist(row.data(), row.data() + row.size());
    return Eigen::VectorXd::Constant(1, static_cast<double>(dist(rng)));
}

void CategoricalEmission::init_from_data(const Eigen::MatrixXd& observations, const ParamSet& init_params,
                                         std::mt19937& rng) {
    if (!init_params.contains(Param::EMISSIONPROB)) {
        return;
    }
    if (is_initialized()) {
        HMMKIT_LOG_INFO("Categorical emissionprob supplied by caller, skipping initialization");
        return;
    }
    check_observations(observations);
    if (observations.rows() == 0) {
        throw ConfigurationError("Cannot initialize categorical emission from empty data");
    }

    Eigen::VectorXd frequencies = Eigen::VectorXd::Zero(n_symbols_);
    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        frequencies[static_cast<int>(observations(t, 0))] += 1.0;
    }
    frequencies /= static_cast<double>(observations.rows());

    // Per-state jitter so states do not start identical
    std::uniform_real_distribution<double> jitter(0.0, INIT_JITTER / n_symbols_);
    Eigen::MatrixXd emissionprob(n_components_, n_symbols_);
    for (int i = 0; i < n_components_; ++i) {
        for (int m = 0; m < n_symbols_; ++m) {
            emissionprob(i, m) = frequencies[m] + jitter(rng);
        }
    }
    math::normalize_rows(emissionprob);
    set_emissionprob(emissionprob);
}

std::unique_ptr<EmissionStatistics> CategoricalEmission::create_statistics() const {
    return std::make_unique<CategoricalStatistics>(n_components_, n_symbols_);
}

void CategoricalEmission::accumulate_statistics(EmissionStatistics& stats,
                                                const Eigen::MatrixXd& observations,
                                                const Eigen::MatrixXd& /*framelogprob*/,
                                                const Eigen::MatrixXd& posteriors) const {
    auto* categorical_stats = dynamic_cast<CategoricalStatistics*>(&stats);
    if (categorical_stats == nullptr) {
        throw ConfigurationError("Categorical emission received foreign statistics");
    }
    if (posteriors.rows() != observations.rows() || posteriors.cols() != n_components_) {
        throw ConfigurationError("Posterior matrix does not match observations");
    }
    for (Eigen::Index t = 0; t < observations.rows(); ++t) {
        const int symbol = static_cast<int>(observations(t, 0));
        categorical_stats->obs.col(symbol) += posteriors.row(t).transpose();
    }
}

void CategoricalEmission::do_mstep(const EmissionStatistics& stats, const ParamSet& params) {
    const auto* categorical_stats = dynamic_cast<const CategoricalStatistics*>(&stats);
    if (categorical_stats == nullptr) {
        throw ConfigurationError("Categorical emission received foreign statistics");
    }
    if (!params.contains(Param::EMISSIONPROB)) {
        return;
    }

    Eigen::MatrixXd updated = (categorical_stats->obs.array() + (emissionprob_prior_ - 1.0)).cwiseMax(0.0).matrix();
    for (int i = 0; i < n_components_; ++i) {
        if (updated.row(i).sum() <= 0.0) {
            HMMKIT_LOG_WARN_F("State %d has no emission mass, keeping previous emissionprob row", i);
            updated.row(i) = emissionprob_.row(i);
        }
    }
    math::normalize_rows(updated);
    check_emissionprob(updated);
    emissionprob_ = updated;
}

std::unique_ptr<EmissionModel> CategoricalEmission::clone() const {
    return std::make_unique<CategoricalEmission>(*this);
}

} // namespace hmm
} // namespace hmmkit
