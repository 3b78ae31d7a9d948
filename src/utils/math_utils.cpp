#include "hmmkit/math_utils.h"
#include <cmath>
#include <limits>
#include <algorithm>

namespace hmmkit {
namespace math {

double log_sum_exp(const Eigen::Ref<const Eigen::VectorXd>& log_values) {
    if (log_values.size() == 0) {
        return -std::numeric_limits<double>::infinity();
    }

    const double max_log = log_values.maxCoeff();
    if (std::isinf(max_log)) {
        // All -inf gives -inf; any +inf gives +inf
        return max_log;
    }

    double sum = 0.0;
    for (Eigen::Index i = 0; i < log_values.size(); ++i) {
        sum += std::exp(log_values[i] - max_log);
    }
    return max_log + std::log(sum);
}

double log_sum_exp(const std::vector<double>& log_values) {
    if (log_values.empty()) {
        return -std::numeric_limits<double>::infinity();
    }
    Eigen::Map<const Eigen::VectorXd> mapped(log_values.data(), static_cast<Eigen::Index>(log_values.size()));
    return log_sum_exp(mapped);
}

Eigen::MatrixXd log_matrix(const Eigen::MatrixXd& probabilities) {
    return probabilities.array().log().matrix();
}

Eigen::VectorXd log_vector(const Eigen::VectorXd& probabilities) {
    return probabilities.array().log().matrix();
}

Eigen::VectorXd log_normalize(const Eigen::Ref<const Eigen::VectorXd>& log_values) {
    const double log_total = log_sum_exp(log_values);
    if (std::isinf(log_total)) {
        return Eigen::VectorXd::Zero(log_values.size());
    }
    return (log_values.array() - log_total).exp().matrix();
}

bool is_stochastic(const Eigen::Ref<const Eigen::VectorXd>& values, double tolerance) {
    if (values.size() == 0 || !values.allFinite()) {
        return false;
    }
    if (values.minCoeff() < 0.0) {
        return false;
    }
    return std::abs(values.sum() - 1.0) <= tolerance;
}

int normalize_rows(Eigen::MatrixXd& matrix) {
    int degenerate_rows = 0;
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        const double row_sum = matrix.row(i).sum();
        if (row_sum > 0.0) {
            matrix.row(i) /= row_sum;
        } else {
            ++degenerate_rows;
        }
    }
    return degenerate_rows;
}

Eigen::MatrixXd empirical_covariance(const Eigen::MatrixXd& data) {
    const Eigen::Index n = data.rows();
    if (n == 0) {
        return Eigen::MatrixXd::Zero(data.cols(), data.cols());
    }
    Eigen::RowVectorXd mean = data.colwise().mean();
    Eigen::MatrixXd centered = data.rowwise() - mean;
    return (centered.transpose() * centered) / static_cast<double>(n);
}

} // namespace math
} // namespace hmmkit
