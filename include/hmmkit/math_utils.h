#pragma once

#include <vector>
#include <Eigen/Core>

namespace hmmkit {
namespace math {

    /**
     * @brief Numerically stable log(sum(exp(x)))
     *
     * Returns -infinity when every element is -infinity (or the input is empty)
     * instead of the NaN a naive max-shift would produce.
     */
    double log_sum_exp(const Eigen::Ref<const Eigen::VectorXd>& log_values);
    double log_sum_exp(const std::vector<double>& log_values);

    // Element-wise log; zero entries map to -infinity
    Eigen::MatrixXd log_matrix(const Eigen::MatrixXd& probabilities);
    Eigen::VectorXd log_vector(const Eigen::VectorXd& probabilities);

    // exp(x - log_sum_exp(x)); all -infinity input yields a zero vector
    Eigen::VectorXd log_normalize(const Eigen::Ref<const Eigen::VectorXd>& log_values);

    /**
     * @brief Check that a vector is a probability distribution
     *
     * Entries non-negative and summing to 1 within tolerance.
     */
    bool is_stochastic(const Eigen::Ref<const Eigen::VectorXd>& values, double tolerance = 1e-6);

    /**
     * @brief Normalize each row to sum to 1; rows summing to zero are left untouched
     * @return number of rows that could not be normalized
     */
    int normalize_rows(Eigen::MatrixXd& matrix);

    // Sample covariance of the rows (divides by n, not n-1)
    Eigen::MatrixXd empirical_covariance(const Eigen::MatrixXd& data);

} // namespace math
} // namespace hmmkit
