#include "hmmkit/hmm_model.h"
#include "hmmkit/forward_backward.h"
#include "hmmkit/viterbi_decoder.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include "hmmkit/logger.h"

namespace hmmkit {
namespace hmm {

std::string decoder_algorithm_to_string(DecoderAlgorithm algorithm) {
    switch (algorithm) {
        case DecoderAlgorithm::VITERBI: return "viterbi";
        case DecoderAlgorithm::MAP: return "map";
    }
    return "unknown";
}

DecoderAlgorithm decoder_algorithm_from_string(const std::string& name) {
    if (name == "viterbi") return DecoderAlgorithm::VITERBI;
    if (name == "map") return DecoderAlgorithm::MAP;
    throw ConfigurationError("Unknown decoder algorithm: '" + name + "'");
}

std::vector<int> DecodeResult::concatenated() const {
    std::vector<int> states;
    for (const auto& sequence : state_sequences) {
        states.insert(states.end(), sequence.begin(), sequence.end());
    }
    return states;
}

HiddenMarkovModel::HiddenMarkovModel(std::unique_ptr<EmissionModel> emission)
    : params_(std::move(emission)) {
    if (!params_.emission) {
        throw ConfigurationError("HiddenMarkovModel needs an emission model");
    }
}

void HiddenMarkovModel::set_startprob(const Eigen::VectorXd& startprob) {
    if (startprob.size() != n_components()) {
        throw ConfigurationError("startprob must have " + std::to_string(n_components()) + " entries");
    }
    if (!math::is_stochastic(startprob)) {
        throw ConfigurationError("startprob must be non-negative and sum to 1");
    }
    params_.startprob = startprob;
}

void HiddenMarkovModel::set_transmat(const Eigen::MatrixXd& transmat) {
    const int N = n_components();
    if (transmat.rows() != N || transmat.cols() != N) {
        throw ConfigurationError("transmat must be " + std::to_string(N) + " x " + std::to_string(N));
    }
    for (int i = 0; i < N; ++i) {
        if (!math::is_stochastic(transmat.row(i).transpose())) {
            throw ConfigurationError("Row " + std::to_string(i) + " of transmat must be non-negative and sum to 1");
        }
    }
    params_.transmat = transmat;
}

void HiddenMarkovModel::check_ready(const Eigen::MatrixXd& observations) const {
    params_.validate();
    params_.emission->check_observations(observations);
}

TrainingStats HiddenMarkovModel::fit(const Eigen::MatrixXd& observations,
                                     const std::vector<int>& lengths,
                                     const TrainingConfig& config) {
    HmmTrainer trainer(config);
    return trainer.fit(params_, observations, lengths);
}

double HiddenMarkovModel::score(const Eigen::MatrixXd& observations, const std::vector<int>& lengths) const {
    check_ready(observations);
    const auto spans = split_sequences(observations, lengths);

    double total = 0.0;
    for (const auto& span : spans) {
        const Eigen::MatrixXd framelogprob =
            params_.emission->log_likelihoods(observations.middleRows(span.start, span.length));
        total += forward_log_likelihood(params_.startprob, params_.transmat, framelogprob);
    }
    return total;
}

ScoreSamplesResult HiddenMarkovModel::score_samples(const Eigen::MatrixXd& observations,
                                                    const std::vector<int>& lengths) const {
    check_ready(observations);
    const auto spans = split_sequences(observations, lengths);

    ScoreSamplesResult result;
    result.posteriors.resize(observations.rows(), n_components());
    for (size_t i = 0; i < spans.size(); ++i) {
        const Eigen::MatrixXd framelogprob =
            params_.emission->log_likelihoods(observations.middleRows(spans[i].start, spans[i].length));
        ForwardBackwardResult fb = forward_backward(params_.startprob, params_.transmat, framelogprob, i);
        result.log_likelihood += fb.log_likelihood;
        result.posteriors.middleRows(spans[i].start, spans[i].length) = fb.gamma;
    }
    return result;
}

DecodeResult HiddenMarkovModel::decode(const Eigen::MatrixXd& observations,
                                       const std::vector<int>& lengths,
                                       DecoderAlgorithm algorithm) const {
    check_ready(observations);
    const auto spans = split_sequences(observations, lengths);

    DecodeResult result;
    result.algorithm = algorithm;
    result.state_sequences.reserve(spans.size());
    result.scores.reserve(spans.size());

    for (size_t i = 0; i < spans.size(); ++i) {
        const Eigen::MatrixXd framelogprob =
            params_.emission->log_likelihoods(observations.middleRows(spans[i].start, spans[i].length));

        if (algorithm == DecoderAlgorithm::VITERBI) {
            ViterbiResult viterbi = viterbi_decode(params_.startprob, params_.transmat, framelogprob, i);
            result.state_sequences.push_back(std::move(viterbi.state_sequence));
            result.scores.push_back(viterbi.log_prob);
        } else {
            ForwardBackwardResult fb = forward_backward(params_.startprob, params_.transmat, framelogprob, i);
            MapDecodeResult map = map_decode(fb.gamma);
            result.state_sequences.push_back(std::move(map.state_sequence));
            result.scores.push_back(map.mean_max_posterior);
        }
    }
    return result;
}

std::vector<int> HiddenMarkovModel::predict(const Eigen::MatrixXd& observations,
                                            const std::vector<int>& lengths) const {
    return decode(observations, lengths, DecoderAlgorithm::VITERBI).concatenated();
}

Eigen::MatrixXd HiddenMarkovModel::predict_proba(const Eigen::MatrixXd& observations,
                                                 const std::vector<int>& lengths) const {
    return score_samples(observations, lengths).posteriors;
}

SampleResult HiddenMarkovModel::sample(int n_samples, unsigned int random_seed) const {
    std::mt19937 rng(random_seed);
    return sample(n_samples, rng);
}

SampleResult HiddenMarkovModel::sample(int n_samples, std::mt19937& rng) const {
    params_.validate();
    if (n_samples <= 0) {
        throw HmmException(HmmErrorCode::INVALID_ARGUMENT, "n_samples must be positive");
    }

    const int N = n_components();
    std::vector<std::discrete_distribution<int>> transitions;
    transitions.reserve(N);
    for (int i = 0; i < N; ++i) {
        const Eigen::VectorXd row = params_.transmat.row(i).transpose();
        transitions.emplace_back(row.data(), row.data() + row.size());
    }
    std::discrete_distribution<int> initial(params_.startprob.data(),
                                            params_.startprob.data() + params_.startprob.size());

    SampleResult result;
    result.states.reserve(n_samples);

    int state = initial(rng);
    Eigen::VectorXd first = params_.emission->generate_sample(state, rng);
    result.observations.resize(n_samples, first.size());
    result.observations.row(0) = first.transpose();
    result.states.push_back(state);

    for (int t = 1; t < n_samples; ++t) {
        state = transitions[state](rng);
        result.observations.row(t) = params_.emission->generate_sample(state, rng).transpose();
        result.states.push_back(state);
    }
    return result;
}

} // namespace hmm
} // namespace hmmkit
