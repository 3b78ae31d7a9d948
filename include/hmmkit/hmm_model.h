#pragma once

#include "hmm_types.h"
#include "emission_model.h"
#include "hmm_trainer.h"
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <Eigen/Core>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Decoding policy
     */
    enum class DecoderAlgorithm {
        VITERBI,    // Jointly most likely path
        MAP         // Per-frame posterior argmax
    };

    std::string decoder_algorithm_to_string(DecoderAlgorithm algorithm);
    // Accepts "viterbi" and "map"; throws ConfigurationError otherwise
    DecoderAlgorithm decoder_algorithm_from_string(const std::string& name);

    /**
     * @brief Per-sequence decoded paths
     *
     * Viterbi scores are joint log-probabilities; MAP scores are the mean
     * of the per-frame maximum posterior.
     */
    struct DecodeResult {
        DecoderAlgorithm algorithm;
        std::vector<std::vector<int>> state_sequences;
        std::vector<double> scores;

        DecodeResult() : algorithm(DecoderAlgorithm::VITERBI) {}

        // All paths concatenated in sequence order
        std::vector<int> concatenated() const;
    };

    struct ScoreSamplesResult {
        double log_likelihood;          // Sum over sequences
        Eigen::MatrixXd posteriors;     // T_total x N

        ScoreSamplesResult() : log_likelihood(0.0) {}
    };

    struct SampleResult {
        Eigen::MatrixXd observations;   // n_samples x D
        std::vector<int> states;        // n_samples
    };

    /**
     * @brief Hidden Markov Model with a pluggable emission family
     *
     * Owns start/transition probabilities and the emission model. All
     * observation arguments are concatenated sequences split by lengths
     * (empty lengths = a single sequence).
     */
    class HiddenMarkovModel {
    public:
        explicit HiddenMarkovModel(std::unique_ptr<EmissionModel> emission);

        HiddenMarkovModel(const HiddenMarkovModel& other) = default;
        HiddenMarkovModel& operator=(const HiddenMarkovModel& other) = default;
        HiddenMarkovModel(HiddenMarkovModel&&) = default;
        HiddenMarkovModel& operator=(HiddenMarkovModel&&) = default;

        int n_components() const { return params_.n_components(); }

        const EmissionModel& emission() const { return *params_.emission; }
        EmissionModel& emission() { return *params_.emission; }
        const HmmParameters& parameters() const { return params_; }

        const Eigen::VectorXd& startprob() const { return params_.startprob; }
        const Eigen::MatrixXd& transmat() const { return params_.transmat; }

        // Throw ConfigurationError on wrong shape or non-stochastic values
        void set_startprob(const Eigen::VectorXd& startprob);
        void set_transmat(const Eigen::MatrixXd& transmat);

        /**
         * @brief Estimate parameters with Baum-Welch EM
         *
         * Missing parameters listed in config.init_params are initialized
         * first. Fitted parameters stay in the model.
         */
        TrainingStats fit(const Eigen::MatrixXd& observations,
                          const std::vector<int>& lengths = std::vector<int>(),
                          const TrainingConfig& config = TrainingConfig());

        // Total log-likelihood over all sequences (forward pass only)
        double score(const Eigen::MatrixXd& observations,
                     const std::vector<int>& lengths = std::vector<int>()) const;

        ScoreSamplesResult score_samples(const Eigen::MatrixXd& observations,
                                         const std::vector<int>& lengths = std::vector<int>()) const;

        DecodeResult decode(const Eigen::MatrixXd& observations,
                            const std::vector<int>& lengths = std::vector<int>(),
                            DecoderAlgorithm algorithm = DecoderAlgorithm::VITERBI) const;

        // Viterbi states of every frame
        std::vector<int> predict(const Eigen::MatrixXd& observations,
                                 const std::vector<int>& lengths = std::vector<int>()) const;

        // State posteriors of every frame, T_total x N
        Eigen::MatrixXd predict_proba(const Eigen::MatrixXd& observations,
                                      const std::vector<int>& lengths = std::vector<int>()) const;

        /**
         * @brief Draw one sequence from the model
         * @throws NotInitializedError if any parameter is missing
         */
        SampleResult sample(int n_samples, unsigned int random_seed) const;
        SampleResult sample(int n_samples, std::mt19937& rng) const;

    private:
        HmmParameters params_;

        // Fail fast before any inference
        void check_ready(const Eigen::MatrixXd& observations) const;
    };

} // namespace hmm
} // namespace hmmkit
