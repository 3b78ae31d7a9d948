#pragma once

#include <random>
#include <Eigen/Core>
#include "emission_model.h"
#include "hmm_types.h"

namespace hmmkit {
namespace hmm {

    /**
     * @brief Default starting values for parameters the caller did not supply
     *
     * Start and transition probabilities default to uniform; emission
     * parameters are delegated to EmissionModel::init_from_data. All draws
     * come from one generator seeded at construction.
     */
    class ParameterInitializer {
    public:
        explicit ParameterInitializer(unsigned int random_seed);

        /**
         * @brief Fill every missing parameter listed in init_params
         *
         * Non-empty startprob/transmat and already-set emission parameters
         * are kept as given.
         */
        void initialize(Eigen::VectorXd& startprob,
                        Eigen::MatrixXd& transmat,
                        EmissionModel& emission,
                        const Eigen::MatrixXd& observations,
                        const ParamSet& init_params);

        static Eigen::VectorXd uniform_startprob(int n_components);
        static Eigen::MatrixXd uniform_transmat(int n_components);

        std::mt19937& rng() { return rng_; }

    private:
        std::mt19937 rng_;
    };

} // namespace hmm
} // namespace hmmkit
