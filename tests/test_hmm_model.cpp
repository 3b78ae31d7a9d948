#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <vector>
#include <Eigen/Core>
#include "hmmkit/hmm_model.h"
#include "hmmkit/gaussian_emission.h"
#include "hmmkit/categorical_emission.h"
#include "hmmkit/hmm_errors.h"

using namespace hmmkit;
using namespace hmmkit::hmm;

namespace {

HiddenMarkovModel make_gaussian_model(double low_mean, double high_mean) {
    GaussianEmission emission(2, 1);
    Eigen::MatrixXd means(2, 1);
    means << low_mean, high_mean;
    emission.set_means(means);
    emission.set_covars(Eigen::MatrixXd::Constant(2, 1, 0.4));

    HiddenMarkovModel model(std::make_unique<GaussianEmission>(emission));
    Eigen::VectorXd startprob(2);
    startprob << 0.5, 0.5;
    Eigen::MatrixXd transmat(2, 2);
    transmat << 0.9, 0.1,
                0.15, 0.85;
    model.set_startprob(startprob);
    model.set_transmat(transmat);
    return model;
}

HiddenMarkovModel make_categorical_model() {
    CategoricalEmission emission(2, 3);
    Eigen::MatrixXd emissionprob(2, 3);
    emissionprob << 0.7, 0.3, 0.0,
                    0.0, 0.2, 0.8;
    emission.set_emissionprob(emissionprob);

    HiddenMarkovModel model(std::make_unique<CategoricalEmission>(emission));
    Eigen::VectorXd startprob(2);
    startprob << 1.0, 0.0;
    model.set_startprob(startprob);
    model.set_transmat(Eigen::MatrixXd::Identity(2, 2));
    return model;
}

} // namespace

class HiddenMarkovModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        truth_ = std::make_unique<HiddenMarkovModel>(make_gaussian_model(0.0, 4.0));
        std::mt19937 rng(7);
        const int n_sequences = 4;
        const int length = 100;
        observations_.resize(n_sequences * length, 1);
        for (int s = 0; s < n_sequences; ++s) {
            SampleResult sample = truth_->sample(length, rng);
            observations_.middleRows(s * length, length) = sample.observations;
            states_.insert(states_.end(), sample.states.begin(), sample.states.end());
            lengths_.push_back(length);
        }
    }

    std::unique_ptr<HiddenMarkovModel> truth_;
    Eigen::MatrixXd observations_;
    std::vector<int> states_;
    std::vector<int> lengths_;
};

TEST_F(HiddenMarkovModelTest, UnfittedModelRefusesInference) {
    HiddenMarkovModel model(std::make_unique<GaussianEmission>(2, 1));
    EXPECT_THROW(model.score(observations_), NotInitializedError);
    EXPECT_THROW(model.decode(observations_), NotInitializedError);
    EXPECT_THROW(model.predict_proba(observations_), NotInitializedError);
    EXPECT_THROW(model.sample(10, 1u), NotInitializedError);
}

TEST_F(HiddenMarkovModelTest, RejectsMissingEmission) {
    EXPECT_THROW(HiddenMarkovModel{std::unique_ptr<EmissionModel>()}, ConfigurationError);
}

TEST_F(HiddenMarkovModelTest, SetterValidation) {
    HiddenMarkovModel model(std::make_unique<GaussianEmission>(2, 1));

    Eigen::VectorXd wrong_size = Eigen::VectorXd::Constant(3, 1.0 / 3.0);
    EXPECT_THROW(model.set_startprob(wrong_size), ConfigurationError);

    Eigen::VectorXd not_normalized(2);
    not_normalized << 0.5, 0.6;
    EXPECT_THROW(model.set_startprob(not_normalized), ConfigurationError);

    Eigen::MatrixXd negative(2, 2);
    negative << 1.2, -0.2,
                0.5, 0.5;
    EXPECT_THROW(model.set_transmat(negative), ConfigurationError);
    EXPECT_THROW(model.set_transmat(Eigen::MatrixXd::Constant(2, 3, 1.0 / 3.0)), ConfigurationError);

    EXPECT_EQ(model.startprob().size(), 0);
    EXPECT_EQ(model.transmat().size(), 0);
}

TEST_F(HiddenMarkovModelTest, SampleShapesAndReproducibility) {
    SampleResult a = truth_->sample(50, 123u);
    SampleResult b = truth_->sample(50, 123u);

    EXPECT_EQ(a.observations.rows(), 50);
    EXPECT_EQ(a.observations.cols(), 1);
    ASSERT_EQ(a.states.size(), 50u);
    for (int s : a.states) {
        EXPECT_TRUE(s == 0 || s == 1);
    }
    EXPECT_EQ(a.states, b.states);
    EXPECT_TRUE(a.observations.isApprox(b.observations));

    SampleResult single = truth_->sample(1, 5u);
    EXPECT_EQ(single.observations.rows(), 1);
    EXPECT_EQ(single.states.size(), 1u);
}

TEST_F(HiddenMarkovModelTest, NonPositiveSampleCountIsInvalid) {
    try {
        truth_->sample(0, 1u);
        FAIL() << "Expected HmmException";
    } catch (const HmmException& e) {
        EXPECT_EQ(e.get_error_code(), HmmErrorCode::INVALID_ARGUMENT);
    }
    EXPECT_THROW(truth_->sample(-3, 1u), HmmException);
}

TEST_F(HiddenMarkovModelTest, FitImprovesOverPoorBaseline) {
    HiddenMarkovModel baseline = make_gaussian_model(10.0, 20.0);
    const double baseline_score = baseline.score(observations_, lengths_);

    HiddenMarkovModel model(std::make_unique<GaussianEmission>(2, 1));
    TrainingConfig config;
    config.max_iterations = 50;
    config.tolerance = 1e-4;
    TrainingStats stats = model.fit(observations_, lengths_, config);

    EXPECT_GT(stats.iterations(), 0);
    const double fitted_score = model.score(observations_, lengths_);
    EXPECT_GT(fitted_score, baseline_score);
    EXPECT_NEAR(fitted_score, stats.final_log_likelihood(), std::abs(stats.final_log_likelihood()) * 0.05);

    // Decoded states match the generating path up to a label swap
    std::vector<int> predicted = model.predict(observations_, lengths_);
    ASSERT_EQ(predicted.size(), states_.size());
    size_t agree = 0;
    for (size_t t = 0; t < predicted.size(); ++t) {
        if (predicted[t] == states_[t]) ++agree;
    }
    const double accuracy = static_cast<double>(std::max(agree, predicted.size() - agree)) / predicted.size();
    EXPECT_GT(accuracy, 0.9);
}

TEST_F(HiddenMarkovModelTest, PredictMatchesViterbiDecode) {
    DecodeResult decoded = truth_->decode(observations_, lengths_, DecoderAlgorithm::VITERBI);
    EXPECT_EQ(decoded.algorithm, DecoderAlgorithm::VITERBI);
    ASSERT_EQ(decoded.state_sequences.size(), lengths_.size());
    ASSERT_EQ(decoded.scores.size(), lengths_.size());
    for (size_t i = 0; i < lengths_.size(); ++i) {
        EXPECT_EQ(decoded.state_sequences[i].size(), static_cast<size_t>(lengths_[i]));
        EXPECT_TRUE(std::isfinite(decoded.scores[i]));
    }
    EXPECT_EQ(truth_->predict(observations_, lengths_), decoded.concatenated());
}

TEST_F(HiddenMarkovModelTest, ViterbiScoreBoundedByLikelihood) {
    const Eigen::MatrixXd sequence = observations_.topRows(lengths_[0]);
    DecodeResult decoded = truth_->decode(sequence);
    EXPECT_LE(decoded.scores[0], truth_->score(sequence) + 1e-9);
}

TEST_F(HiddenMarkovModelTest, PosteriorsAreDistributions) {
    Eigen::MatrixXd posteriors = truth_->predict_proba(observations_, lengths_);
    ASSERT_EQ(posteriors.rows(), observations_.rows());
    ASSERT_EQ(posteriors.cols(), 2);
    for (Eigen::Index t = 0; t < posteriors.rows(); ++t) {
        EXPECT_NEAR(posteriors.row(t).sum(), 1.0, 1e-8);
        EXPECT_GE(posteriors.row(t).minCoeff(), 0.0);
    }

    ScoreSamplesResult scored = truth_->score_samples(observations_, lengths_);
    EXPECT_NEAR(scored.log_likelihood, truth_->score(observations_, lengths_), 1e-8);
}

TEST_F(HiddenMarkovModelTest, MapDecodeFollowsPosteriorArgmax) {
    DecodeResult decoded = truth_->decode(observations_, lengths_, DecoderAlgorithm::MAP);
    EXPECT_EQ(decoded.algorithm, DecoderAlgorithm::MAP);

    Eigen::MatrixXd posteriors = truth_->predict_proba(observations_, lengths_);
    std::vector<int> path = decoded.concatenated();
    ASSERT_EQ(path.size(), static_cast<size_t>(posteriors.rows()));
    for (Eigen::Index t = 0; t < posteriors.rows(); ++t) {
        Eigen::Index best;
        posteriors.row(t).maxCoeff(&best);
        EXPECT_EQ(path[t], static_cast<int>(best));
    }
    for (double score : decoded.scores) {
        EXPECT_GE(score, 0.5);
        EXPECT_LE(score, 1.0 + 1e-12);
    }
}

TEST_F(HiddenMarkovModelTest, ImpossibleSequenceScoresNegativeInfinity) {
    HiddenMarkovModel model = make_categorical_model();

    // Symbol 2 is impossible from state 0, which the model never leaves
    Eigen::MatrixXd symbols(3, 1);
    symbols << 0, 1, 2;

    EXPECT_TRUE(std::isinf(model.score(symbols)));
    EXPECT_LT(model.score(symbols), 0.0);
    EXPECT_THROW(model.score_samples(symbols), DegenerateSequenceError);
    EXPECT_THROW(model.decode(symbols), DegenerateSequenceError);
    EXPECT_THROW(model.decode(symbols, {}, DecoderAlgorithm::MAP), DegenerateSequenceError);

    Eigen::MatrixXd possible(3, 1);
    possible << 0, 1, 0;
    EXPECT_NEAR(model.score(possible), std::log(0.7 * 0.3 * 0.7), 1e-10);
}

TEST_F(HiddenMarkovModelTest, DegenerateErrorNamesSequence) {
    HiddenMarkovModel model = make_categorical_model();
    Eigen::MatrixXd symbols(4, 1);
    symbols << 0, 0, 0, 2;
    try {
        model.decode(symbols, {2, 2});
        FAIL() << "Expected DegenerateSequenceError";
    } catch (const DegenerateSequenceError& e) {
        EXPECT_EQ(e.sequence_index(), 1u);
    }
}

TEST_F(HiddenMarkovModelTest, CopiesAreIndependent) {
    HiddenMarkovModel copy = *truth_;
    Eigen::VectorXd startprob(2);
    startprob << 0.1, 0.9;
    copy.set_startprob(startprob);

    EXPECT_DOUBLE_EQ(truth_->startprob()(0), 0.5);
    EXPECT_NE(&copy.emission(), &truth_->emission());
}

TEST_F(HiddenMarkovModelTest, DecoderAlgorithmNames) {
    EXPECT_EQ(decoder_algorithm_from_string("viterbi"), DecoderAlgorithm::VITERBI);
    EXPECT_EQ(decoder_algorithm_from_string("map"), DecoderAlgorithm::MAP);
    EXPECT_EQ(decoder_algorithm_to_string(DecoderAlgorithm::MAP), "map");
    EXPECT_THROW(decoder_algorithm_from_string("beam"), ConfigurationError);
}
