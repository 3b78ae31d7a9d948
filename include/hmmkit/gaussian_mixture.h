#pragma once

#include <vector>
#include <random>
#include <Eigen/Core>
#include <Eigen/Dense>
#include <Eigen/Cholesky>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Sufficient statistics for one Gaussian component
     *
     * Accumulates responsibility-weighted zeroth, first and second moments
     * needed for the maximum likelihood update of a mixture component.
     */
    struct SufficientStatistics {
        double gamma;               // Responsibility sum
        Eigen::VectorXd gamma_x;    // Weighted observation sum
        Eigen::MatrixXd gamma_xx;   // Weighted outer-product sum

        SufficientStatistics() : gamma(0.0) {}

        explicit SufficientStatistics(int dimension)
            : gamma(0.0)
            , gamma_x(Eigen::VectorXd::Zero(dimension))
            , gamma_xx(Eigen::MatrixXd::Zero(dimension, dimension)) {}

        void clear() {
            gamma = 0.0;
            gamma_x.setZero();
            gamma_xx.setZero();
        }

        void accumulate(const Eigen::VectorXd& observation, double responsibility) {
            gamma += responsibility;
            gamma_x += responsibility * observation;
            gamma_xx.noalias() += responsibility * observation * observation.transpose();
        }

        void merge(const SufficientStatistics& other) {
            gamma += other.gamma;
            gamma_x += other.gamma_x;
            gamma_xx += other.gamma_xx;
        }

        // Maximum likelihood mean/covariance; leaves arguments untouched when gamma is zero
        void update_parameters(Eigen::VectorXd& mean, Eigen::MatrixXd& covariance, double min_variance) const;
    };

    /**
     * @brief Full-covariance Gaussian with cached Cholesky factor
     */
    class GaussianComponent {
    public:
        GaussianComponent();
        explicit GaussianComponent(int dimension);
        GaussianComponent(const Eigen::VectorXd& mean, const Eigen::MatrixXd& covariance);

        const Eigen::VectorXd& mean() const { return mean_; }
        const Eigen::MatrixXd& covariance() const { return covariance_; }
        int dimension() const { return static_cast<int>(mean_.size()); }

        void set_mean(const Eigen::VectorXd& mean);
        void set_covariance(const Eigen::MatrixXd& covariance);
        void set_parameters(const Eigen::VectorXd& mean, const Eigen::MatrixXd& covariance);

        double log_pdf(const Eigen::VectorXd& observation) const;

        Eigen::VectorXd sample(std::mt19937& rng) const;

        bool is_valid() const;

    private:
        Eigen::VectorXd mean_;
        Eigen::MatrixXd covariance_;

        Eigen::LLT<Eigen::MatrixXd> cholesky_;
        double log_determinant_;

        // Throws ConfigurationError when the covariance cannot be factorized
        void update_cache();
    };

    /**
     * @brief Gaussian mixture used as the per-state emission density of a GMM-HMM
     */
    class GaussianMixture {
    public:
        GaussianMixture();
        GaussianMixture(int num_components, int dimension);
        explicit GaussianMixture(const std::vector<GaussianComponent>& components);

        size_t num_components() const { return components_.size(); }
        int dimension() const { return dimension_; }
        const GaussianComponent& component(size_t index) const;
        GaussianComponent& component(size_t index);

        const std::vector<double>& weights() const { return weights_; }
        double weight(size_t index) const;
        void set_weights(const std::vector<double>& weights);
        void normalize_weights();

        double log_likelihood(const Eigen::VectorXd& observation) const;
        std::vector<double> responsibilities(const Eigen::VectorXd& observation) const;

        Eigen::VectorXd sample(std::mt19937& rng) const;

        /**
         * @brief k-means initialization of means, covariances and weights
         *
         * Empty clusters fall back to the global data covariance around a
         * randomly chosen data point.
         */
        void initialize_kmeans(const std::vector<Eigen::VectorXd>& data, int num_components,
                               std::mt19937& rng, double min_variance, int max_iterations = 100);

        /**
         * @brief Which mixture parameters a weighted EM step may change
         */
        struct UpdateMask {
            bool weights = true;
            bool means = true;
            bool covariances = true;
        };

        // Responsibility statistics of weighted observations under the current parameters
        std::vector<SufficientStatistics> accumulate_weighted_statistics(
            const std::vector<Eigen::VectorXd>& observations,
            const std::vector<double>& observation_weights) const;

        void update_parameters(const std::vector<SufficientStatistics>& statistics,
                               const UpdateMask& mask, double min_variance);

        /**
         * @brief Weighted EM on a fixed set of (observation, weight) pairs
         * @return weighted mean log-likelihood after the last iteration
         */
        double train_weighted_em(const std::vector<Eigen::VectorXd>& observations,
                                 const std::vector<double>& observation_weights,
                                 const UpdateMask& mask,
                                 double min_variance,
                                 int max_iterations = 1,
                                 double tolerance = 1e-6);

        double weighted_log_likelihood(const std::vector<Eigen::VectorXd>& observations,
                                       const std::vector<double>& observation_weights) const;

        bool is_valid() const;

    private:
        std::vector<GaussianComponent> components_;
        std::vector<double> weights_;
        int dimension_;

        std::vector<size_t> kmeans_clustering(const std::vector<Eigen::VectorXd>& data, int num_clusters,
                                              std::mt19937& rng, int max_iterations) const;
        void validate_dimension_consistency() const;

        static constexpr double MIN_WEIGHT = 1e-10;
    };

} // namespace hmm
} // namespace hmmkit
