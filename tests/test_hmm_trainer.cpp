#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <random>
#include <utility>
#include <vector>
#include <Eigen/Core>
#include "hmmkit/hmm_trainer.h"
#include "hmmkit/hmm_model.h"
#include "hmmkit/gaussian_emission.h"
#include "hmmkit/categorical_emission.h"
#include "hmmkit/gmm_emission.h"
#include "hmmkit/hmm_errors.h"

using namespace hmmkit;
using namespace hmmkit::hmm;

class HmmTrainerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Two well separated 1-D regimes with sticky transitions
        GaussianEmission emission(2, 1);
        Eigen::MatrixXd means(2, 1);
        means << -2.0, 3.0;
        emission.set_means(means);
        emission.set_covars(Eigen::MatrixXd::Constant(2, 1, 0.5));

        HiddenMarkovModel generator(std::make_unique<GaussianEmission>(emission));
        Eigen::VectorXd startprob(2);
        startprob << 0.6, 0.4;
        Eigen::MatrixXd transmat(2, 2);
        transmat << 0.85, 0.15,
                    0.2, 0.8;
        generator.set_startprob(startprob);
        generator.set_transmat(transmat);

        std::mt19937 rng(2024);
        const int n_sequences = 8;
        const int length = 40;
        observations_.resize(n_sequences * length, 1);
        for (int s = 0; s < n_sequences; ++s) {
            SampleResult sample = generator.sample(length, rng);
            observations_.middleRows(s * length, length) = sample.observations;
            lengths_.push_back(length);
        }
    }

    static HmmParameters fresh_gaussian_model() {
        GaussianEmissionConfig config;
        config.covars_prior = 0.0;
        return HmmParameters(std::make_unique<GaussianEmission>(2, 1, config));
    }

    static HmmParameters fresh_gaussian_model(CovarianceType covariance_type) {
        GaussianEmissionConfig config;
        config.covariance_type = covariance_type;
        config.covars_prior = 0.0;
        return HmmParameters(std::make_unique<GaussianEmission>(2, 1, config));
    }

    static TrainingStats fit_fixed_iterations(HmmParameters& model, const Eigen::MatrixXd& X,
                                              const std::vector<int>& lengths, int iterations) {
        TrainingConfig config;
        config.max_iterations = iterations;
        config.tolerance = 0.0;
        config.random_seed = 7;
        HmmTrainer trainer(config);
        return trainer.fit(model, X, lengths);
    }

    static void expect_non_decreasing(const TrainingStats& stats) {
        const auto& history = stats.monitor.history();
        ASSERT_FALSE(history.empty());
        for (size_t i = 1; i < history.size(); ++i) {
            EXPECT_GE(history[i], history[i - 1] - 1e-6) << "iteration " << i + 1;
        }
        EXPECT_FALSE(stats.monitor.has_anomalies());
    }

    Eigen::MatrixXd observations_;
    std::vector<int> lengths_;
};

TEST_F(HmmTrainerTest, LogLikelihoodIsNonDecreasing) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 25;
    config.tolerance = 0.0;

    HmmTrainer trainer(config);
    TrainingStats stats = trainer.fit(model, observations_, lengths_);

    const auto& history = stats.monitor.history();
    ASSERT_EQ(history.size(), 25u);
    for (size_t i = 1; i < history.size(); ++i) {
        EXPECT_GE(history[i], history[i - 1] - 1e-6) << "iteration " << i + 1;
    }
    EXPECT_FALSE(stats.monitor.has_anomalies());
    EXPECT_EQ(stats.final_state, TrainerState::ITERATION_LIMIT_REACHED);
    EXPECT_EQ(trainer.state(), TrainerState::ITERATION_LIMIT_REACHED);
    EXPECT_NO_THROW(model.validate());
}

TEST_F(HmmTrainerTest, ConvergesByTolerance) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 200;
    config.tolerance = 1e-3;

    TrainingStats stats = HmmTrainer(config).fit(model, observations_, lengths_);
    EXPECT_EQ(stats.final_state, TrainerState::CONVERGED);
    EXPECT_TRUE(stats.monitor.tolerance_reached());
    EXPECT_LT(stats.iterations(), 200);
    EXPECT_FALSE(stats.convergence_reason.empty());
}

TEST_F(HmmTrainerTest, RecoversGeneratingMeans) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 100;
    config.tolerance = 1e-4;
    HmmTrainer(config).fit(model, observations_, lengths_);

    const auto& emission = dynamic_cast<const GaussianEmission&>(*model.emission);
    double low = std::min(emission.means()(0, 0), emission.means()(1, 0));
    double high = std::max(emission.means()(0, 0), emission.means()(1, 0));
    EXPECT_NEAR(low, -2.0, 0.3);
    EXPECT_NEAR(high, 3.0, 0.3);
}

TEST_F(HmmTrainerTest, StatsDescribeTheRun) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 4;
    config.tolerance = 0.0;

    TrainingStats stats = HmmTrainer(config).fit(model, observations_, lengths_);
    EXPECT_EQ(stats.iterations(), 4);
    EXPECT_EQ(stats.e_step_timings.size(), 4u);
    EXPECT_EQ(stats.m_step_timings.size(), 4u);
    EXPECT_EQ(stats.n_sequences, lengths_.size());
    EXPECT_EQ(stats.n_frames, static_cast<size_t>(observations_.rows()));
    EXPECT_DOUBLE_EQ(stats.final_log_likelihood(), stats.monitor.history().back());
}

TEST_F(HmmTrainerTest, OnlyListedParametersAreEstimated) {
    HmmParameters model = fresh_gaussian_model();
    Eigen::VectorXd startprob(2);
    startprob << 0.5, 0.5;
    Eigen::MatrixXd transmat(2, 2);
    transmat << 0.6, 0.4,
                0.3, 0.7;
    model.startprob = startprob;
    model.transmat = transmat;

    TrainingConfig config;
    config.max_iterations = 3;
    config.params = ParamSet{Param::MEANS, Param::COVARS};

    HmmTrainer(config).fit(model, observations_, lengths_);
    EXPECT_TRUE(model.startprob.isApprox(startprob));
    EXPECT_TRUE(model.transmat.isApprox(transmat));
}

TEST_F(HmmTrainerTest, CallbackCancelsTraining) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 50;
    config.tolerance = 0.0;

    std::vector<int> seen;
    config.iteration_callback = [&seen](int iteration, double /*log_likelihood*/) {
        seen.push_back(iteration);
        return iteration < 2;
    };

    TrainingStats stats = HmmTrainer(config).fit(model, observations_, lengths_);
    EXPECT_EQ(stats.final_state, TrainerState::CANCELLED);
    EXPECT_EQ(stats.iterations(), 2);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST_F(HmmTrainerTest, ParallelAndSequentialEStepAgree) {
    TrainingConfig config;
    config.max_iterations = 5;
    config.tolerance = 0.0;

    HmmParameters sequential_model = fresh_gaussian_model();
    HmmTrainer(config).fit(sequential_model, observations_, lengths_);

    config.enable_parallel_estep = true;
    config.num_threads = 4;
    HmmParameters parallel_model = fresh_gaussian_model();
    TrainingStats stats = HmmTrainer(config).fit(parallel_model, observations_, lengths_);
    EXPECT_GE(stats.threads_used, 1);

    const auto& a = dynamic_cast<const GaussianEmission&>(*sequential_model.emission);
    const auto& b = dynamic_cast<const GaussianEmission&>(*parallel_model.emission);
    EXPECT_TRUE(sequential_model.startprob.isApprox(parallel_model.startprob, 1e-9));
    EXPECT_TRUE(sequential_model.transmat.isApprox(parallel_model.transmat, 1e-9));
    EXPECT_TRUE(a.means().isApprox(b.means(), 1e-9));
    EXPECT_TRUE(a.covars().isApprox(b.covars(), 1e-9));
}

TEST_F(HmmTrainerTest, ExpectationStepSumsSequences) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 1;
    HmmTrainer trainer(config);
    trainer.fit(model, observations_, lengths_);

    SufficientStatisticsAccumulator accumulator(2, model.emission->create_statistics());
    const auto spans = split_sequences(observations_, lengths_);
    trainer.expectation_step(model, observations_, spans, accumulator);

    EXPECT_EQ(accumulator.n_sequences(), lengths_.size());
    EXPECT_NEAR(accumulator.start().sum(), static_cast<double>(lengths_.size()), 1e-9);
    EXPECT_NEAR(accumulator.trans().sum(), static_cast<double>(observations_.rows() - lengths_.size()), 1e-8);
}

TEST_F(HmmTrainerTest, DegenerateSequenceAbortsWithIndex) {
    HmmParameters model(std::make_unique<CategoricalEmission>(2, 2));
    Eigen::VectorXd startprob(2);
    startprob << 1.0, 0.0;
    Eigen::MatrixXd transmat = Eigen::MatrixXd::Identity(2, 2);
    Eigen::MatrixXd emissionprob(2, 2);
    emissionprob << 1.0, 0.0,
                    0.0, 1.0;
    model.startprob = startprob;
    model.transmat = transmat;
    dynamic_cast<CategoricalEmission&>(*model.emission).set_emissionprob(emissionprob);

    // Second sequence emits symbol 1, impossible from state 0 without transitions
    Eigen::MatrixXd symbols(4, 1);
    symbols << 0, 0, 0, 1;

    TrainingConfig config;
    config.init_params = ParamSet::none();
    HmmTrainer trainer(config);
    try {
        trainer.fit(model, symbols, {2, 2});
        FAIL() << "Expected DegenerateSequenceError";
    } catch (const DegenerateSequenceError& e) {
        EXPECT_EQ(e.sequence_index(), 1u);
    }

    EXPECT_TRUE(model.startprob.isApprox(startprob));
    EXPECT_TRUE(model.transmat.isApprox(transmat));
    EXPECT_TRUE(dynamic_cast<const CategoricalEmission&>(*model.emission).emissionprob().isApprox(emissionprob));
}

TEST_F(HmmTrainerTest, ParallelEStepReportsLowestFailingSequence) {
    HmmParameters model(std::make_unique<CategoricalEmission>(2, 2));
    Eigen::VectorXd startprob(2);
    startprob << 1.0, 0.0;
    model.startprob = startprob;
    model.transmat = Eigen::MatrixXd::Identity(2, 2);
    Eigen::MatrixXd emissionprob = Eigen::MatrixXd::Identity(2, 2);
    dynamic_cast<CategoricalEmission&>(*model.emission).set_emissionprob(emissionprob);

    // Sequences 2 and 5 are impossible
    Eigen::MatrixXd symbols = Eigen::MatrixXd::Zero(12, 1);
    symbols(4, 0) = 1;
    symbols(10, 0) = 1;

    TrainingConfig config;
    config.init_params = ParamSet::none();
    config.enable_parallel_estep = true;
    config.num_threads = 3;
    try {
        HmmTrainer(config).fit(model, symbols, {2, 2, 2, 2, 2, 2});
        FAIL() << "Expected DegenerateSequenceError";
    } catch (const DegenerateSequenceError& e) {
        EXPECT_EQ(e.sequence_index(), 2u);
    }
}

TEST_F(HmmTrainerTest, InvalidConfigurationLeavesModelUntouched) {
    HmmParameters model = fresh_gaussian_model();

    TrainingConfig config;
    config.max_iterations = 0;
    EXPECT_THROW(HmmTrainer(config).fit(model, observations_, lengths_), ConfigurationError);

    config = TrainingConfig();
    config.tolerance = -1.0;
    EXPECT_THROW(HmmTrainer(config).fit(model, observations_, lengths_), ConfigurationError);

    config = TrainingConfig();
    EXPECT_THROW(HmmTrainer(config).fit(model, observations_, {5, 5}), ConfigurationError);
    EXPECT_THROW(HmmTrainer(config).fit(model, Eigen::MatrixXd::Zero(10, 3)), ConfigurationError);

    // Non-stochastic startprob is rejected after initialization, on a copy
    Eigen::VectorXd bad_startprob(2);
    bad_startprob << 0.9, 0.9;
    model.startprob = bad_startprob;
    EXPECT_THROW(HmmTrainer(config).fit(model, observations_, lengths_), ConfigurationError);

    EXPECT_TRUE(model.startprob.isApprox(bad_startprob));
    EXPECT_EQ(model.transmat.size(), 0);
    EXPECT_FALSE(model.emission->is_initialized());
}

TEST_F(HmmTrainerTest, MissingParametersWithoutInitialization) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.init_params = ParamSet{Param::STARTPROB, Param::TRANSMAT};

    EXPECT_THROW(HmmTrainer(config).fit(model, observations_, lengths_), NotInitializedError);
    EXPECT_EQ(model.startprob.size(), 0);
}

TEST_F(HmmTrainerTest, TransmatPriorSmoothsCounts) {
    HmmParameters model = fresh_gaussian_model();
    TrainingConfig config;
    config.max_iterations = 1;
    config.params = ParamSet{Param::TRANSMAT};
    config.transmat_prior = 1e6;

    HmmTrainer(config).fit(model, observations_, lengths_);
    // An overwhelming prior pulls every row towards uniform
    EXPECT_TRUE(model.transmat.isApprox(Eigen::MatrixXd::Constant(2, 2, 0.5), 1e-3));
}

TEST_F(HmmTrainerTest, TrainerStateNames) {
    EXPECT_EQ(trainer_state_to_string(TrainerState::CONVERGED), "CONVERGED");
    EXPECT_EQ(trainer_state_to_string(TrainerState::CANCELLED), "CANCELLED");

    HmmTrainer trainer;
    EXPECT_EQ(trainer.state(), TrainerState::INITIALIZING);
    EXPECT_EQ(trainer.get_config().max_iterations, 10);
    EXPECT_DOUBLE_EQ(trainer.get_config().tolerance, 1e-2);
}

TEST_F(HmmTrainerTest, EveryCovarianceTypeIsNonDecreasing) {
    const CovarianceType types[] = {CovarianceType::SPHERICAL, CovarianceType::DIAG,
                                    CovarianceType::FULL, CovarianceType::TIED};
    for (CovarianceType type : types) {
        SCOPED_TRACE(static_cast<int>(type));
        HmmParameters model = fresh_gaussian_model(type);
        TrainingStats stats = fit_fixed_iterations(model, observations_, lengths_, 20);
        EXPECT_EQ(stats.monitor.history().size(), 20u);
        expect_non_decreasing(stats);
        EXPECT_NO_THROW(model.validate());
    }
}

TEST_F(HmmTrainerTest, GmmLogLikelihoodIsNonDecreasing) {
    GmmEmissionConfig gmm_config;
    gmm_config.n_mix = 2;
    HmmParameters model(std::make_unique<GmmEmission>(2, 1, gmm_config));

    TrainingStats stats = fit_fixed_iterations(model, observations_, lengths_, 20);
    EXPECT_EQ(stats.monitor.history().size(), 20u);
    expect_non_decreasing(stats);
    EXPECT_NO_THROW(model.validate());
}

TEST_F(HmmTrainerTest, CategoricalLogLikelihoodIsNonDecreasing) {
    auto generating_emission = std::make_unique<CategoricalEmission>(2, 3);
    Eigen::MatrixXd emissionprob(2, 3);
    emissionprob << 0.7, 0.2, 0.1,
                    0.1, 0.3, 0.6;
    generating_emission->set_emissionprob(emissionprob);

    HiddenMarkovModel generator(std::move(generating_emission));
    Eigen::VectorXd startprob(2);
    startprob << 0.5, 0.5;
    Eigen::MatrixXd transmat(2, 2);
    transmat << 0.9, 0.1,
                0.15, 0.85;
    generator.set_startprob(startprob);
    generator.set_transmat(transmat);

    std::mt19937 rng(99);
    const int n_sequences = 6;
    const int length = 50;
    Eigen::MatrixXd symbols(n_sequences * length, 1);
    std::vector<int> lengths;
    for (int s = 0; s < n_sequences; ++s) {
        symbols.middleRows(s * length, length) = generator.sample(length, rng).observations;
        lengths.push_back(length);
    }

    HmmParameters model(std::make_unique<CategoricalEmission>(2, 3));
    TrainingStats stats = fit_fixed_iterations(model, symbols, lengths, 30);
    EXPECT_EQ(stats.monitor.history().size(), 30u);
    expect_non_decreasing(stats);
    EXPECT_NO_THROW(model.validate());
}

TEST_F(HmmTrainerTest, DefaultCovariancePriorStillConverges) {
    // Default config runs MAP updates; the fit must still finish and validate
    HmmParameters model(std::make_unique<GaussianEmission>(2, 1));
    TrainingConfig config;
    config.max_iterations = 200;
    config.tolerance = 1e-3;
    HmmTrainer trainer(config);
    TrainingStats stats = trainer.fit(model, observations_, lengths_);
    EXPECT_EQ(stats.final_state, TrainerState::CONVERGED);
    EXPECT_NO_THROW(model.validate());
}
