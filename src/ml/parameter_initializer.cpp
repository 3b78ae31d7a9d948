#include "hmmkit/parameter_initializer.h"
#include "hmmkit/logger.h"

namespace hmmkit {
namespace hmm {

ParameterInitializer::ParameterInitializer(unsigned int random_seed) : rng_(random_seed) {
}

Eigen::VectorXd ParameterInitializer::uniform_startprob(int n_components) {
    return Eigen::VectorXd::Constant(n_components, 1.0 / n_components);
}

Eigen::MatrixXd ParameterInitializer::uniform_transmat(int n_components) {
    return Eigen::MatrixXd::Constant(n_components, n_components, 1.0 / n_components);
}

void ParameterInitializer::initialize(Eigen::VectorXd& startprob,
                                      Eigen::MatrixXd& transmat,
                                      EmissionModel& emission,
                                      const Eigen::MatrixXd& observations,
                                      const ParamSet& init_params) {
    const int n_components = emission.n_components();

    if (init_params.contains(Param::STARTPROB)) {
        if (startprob.size() > 0) {
            HMMKIT_LOG_INFO("startprob supplied by caller, skipping initialization");
        } else {
            startprob = uniform_startprob(n_components);
        }
    }

    if (init_params.contains(Param::TRANSMAT)) {
        if (transmat.size() > 0) {
            HMMKIT_LOG_INFO("transmat supplied by caller, skipping initialization");
        } else {
            transmat = uniform_transmat(n_components);
        }
    }

    emission.init_from_data(observations, init_params, rng_);
}

} // namespace hmm
} // namespace hmmkit
