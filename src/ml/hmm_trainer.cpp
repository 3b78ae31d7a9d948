#include "hmmkit/hmm_trainer.h"
#include "hmmkit/forward_backward.h"
#include "hmmkit/parameter_initializer.h"
#include "hmmkit/hmm_errors.h"
#include "hmmkit/math_utils.h"
#include "hmmkit/logger.h"
#include <algorithm>
#include <cmath>
#include <chrono>
#include <exception>
#include <thread>

#ifdef HMMKIT_OPENMP_ENABLED
#include <omp.h>
#endif

namespace hmmkit {
namespace hmm {

    // HmmParameters implementation
    HmmParameters::HmmParameters(const HmmParameters& other)
        : startprob(other.startprob)
        , transmat(other.transmat)
        , emission(other.emission ? other.emission->clone() : nullptr) {
    }

    HmmParameters& HmmParameters::operator=(const HmmParameters& other) {
        if (this != &other) {
            HmmParameters copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    void HmmParameters::validate() const {
        if (!emission) {
            throw ConfigurationError("Model has no emission model");
        }
        const int N = emission->n_components();

        if (startprob.size() == 0) {
            throw NotInitializedError("startprob is not set");
        }
        if (transmat.size() == 0) {
            throw NotInitializedError("transmat is not set");
        }
        if (startprob.size() != N) {
            throw ConfigurationError("startprob must have " + std::to_string(N) + " entries");
        }
        if (!math::is_stochastic(startprob)) {
            throw ConfigurationError("startprob must be non-negative and sum to 1");
        }
        if (transmat.rows() != N || transmat.cols() != N) {
            throw ConfigurationError("transmat must be " + std::to_string(N) + " x " + std::to_string(N));
        }
        for (int i = 0; i < N; ++i) {
            if (!math::is_stochastic(transmat.row(i).transpose())) {
                throw ConfigurationError("Row " + std::to_string(i) + " of transmat must be non-negative and sum to 1");
            }
        }
        emission->validate();
    }

    std::string trainer_state_to_string(TrainerState state) {
        switch (state) {
            case TrainerState::INITIALIZING: return "INITIALIZING";
            case TrainerState::ITERATING: return "ITERATING";
            case TrainerState::CONVERGED: return "CONVERGED";
            case TrainerState::ITERATION_LIMIT_REACHED: return "ITERATION_LIMIT_REACHED";
            case TrainerState::CANCELLED: return "CANCELLED";
        }
        return "UNKNOWN";
    }

    // HmmTrainer implementation
    HmmTrainer::HmmTrainer(const TrainingConfig& config) : config_(config), state_(TrainerState::INITIALIZING) {
    }

    void HmmTrainer::validate_config() const {
        if (config_.max_iterations <= 0) {
            throw ConfigurationError("max_iterations must be positive");
        }
        if (!(config_.tolerance >= 0.0)) {
            throw ConfigurationError("tolerance must be non-negative");
        }
        if (!(config_.decrease_tolerance >= 0.0)) {
            throw ConfigurationError("decrease_tolerance must be non-negative");
        }
        if (!std::isfinite(config_.startprob_prior) || !std::isfinite(config_.transmat_prior)) {
            throw ConfigurationError("startprob_prior and transmat_prior must be finite");
        }
        if (config_.num_threads < 0) {
            throw ConfigurationError("num_threads must be non-negative");
        }
        if (config_.min_sequences_per_thread <= 0) {
            throw ConfigurationError("min_sequences_per_thread must be positive");
        }
    }

    TrainingStats HmmTrainer::fit(HmmParameters& model,
                                  const Eigen::MatrixXd& observations,
                                  const std::vector<int>& lengths) {
        state_ = TrainerState::INITIALIZING;
        validate_config();
        if (!model.emission) {
            throw ConfigurationError("Model has no emission model");
        }

        const std::vector<SequenceSpan> spans = split_sequences(observations, lengths);
        model.emission->check_observations(observations);

        // Initialize on a copy so a configuration error leaves the caller's model untouched
        HmmParameters initialized(model);
        ParameterInitializer initializer(config_.random_seed);
        initializer.initialize(initialized.startprob, initialized.transmat, *initialized.emission,
                               observations, config_.init_params);
        initialized.validate();
        model = std::move(initialized);

        TrainingStats stats;
        stats.monitor = ConvergenceMonitor(config_.tolerance, config_.max_iterations, config_.decrease_tolerance);
        stats.n_sequences = spans.size();
        stats.n_frames = static_cast<size_t>(observations.rows());

        if (config_.verbose) {
            HMMKIT_LOG_INFO_F("Starting %s HMM training: %d states, %zu sequences, %zu frames",
                              model.emission->family_name().c_str(), model.n_components(),
                              stats.n_sequences, stats.n_frames);
        }

        SufficientStatisticsAccumulator accumulator(model.n_components(), model.emission->create_statistics());
        state_ = TrainerState::ITERATING;

        while (state_ == TrainerState::ITERATING) {
            // E-Step
            auto e_step_start = std::chrono::high_resolution_clock::now();
            try {
                stats.threads_used = expectation_step(model, observations, spans, accumulator);
            } catch (const DegenerateSequenceError& e) {
                HMMKIT_LOG_ERROR_F("Training aborted at iteration %d: %s",
                                   stats.monitor.iterations() + 1, e.what());
                throw;
            }
            auto e_step_end = std::chrono::high_resolution_clock::now();
            stats.e_step_timings.push_back(
                std::chrono::duration_cast<std::chrono::microseconds>(e_step_end - e_step_start).count() / 1e6);

            // M-Step
            auto m_step_start = std::chrono::high_resolution_clock::now();
            try {
                maximization_step(model, accumulator);
            } catch (const HmmException& e) {
                HMMKIT_LOG_ERROR_F("M-step failed at iteration %d: %s", stats.monitor.iterations() + 1, e.what());
                throw;
            }
            auto m_step_end = std::chrono::high_resolution_clock::now();
            stats.m_step_timings.push_back(
                std::chrono::duration_cast<std::chrono::microseconds>(m_step_end - m_step_start).count() / 1e6);

            const double log_likelihood = accumulator.log_likelihood();
            stats.monitor.report(log_likelihood);
            log_iteration_info(stats.monitor, stats);

            // Convergence check
            if (stats.monitor.converged()) {
                if (stats.monitor.tolerance_reached()) {
                    state_ = TrainerState::CONVERGED;
                    stats.convergence_reason = "Converged: log-likelihood change below tolerance";
                } else {
                    state_ = TrainerState::ITERATION_LIMIT_REACHED;
                    stats.convergence_reason = "Training completed: maximum iterations reached";
                }
            }

            if (config_.iteration_callback &&
                !config_.iteration_callback(stats.monitor.iterations(), log_likelihood) &&
                state_ == TrainerState::ITERATING) {
                state_ = TrainerState::CANCELLED;
                stats.convergence_reason = "Training cancelled by iteration callback";
            }
        }

        stats.final_state = state_;
        log_convergence_info(stats);
        return stats;
    }

    int HmmTrainer::expectation_step(const HmmParameters& model,
                                     const Eigen::MatrixXd& observations,
                                     const std::vector<SequenceSpan>& spans,
                                     SufficientStatisticsAccumulator& accumulator) const {
        accumulator.reset();
        if (config_.enable_parallel_estep && spans.size() > 1) {
            return parallel_expectation_step(model, observations, spans, accumulator);
        }
        return sequential_expectation_step(model, observations, spans, accumulator);
    }

    void HmmTrainer::process_sequence(const HmmParameters& model,
                                      const Eigen::MatrixXd& observations,
                                      const SequenceSpan& span,
                                      size_t sequence_index,
                                      SufficientStatisticsAccumulator& accumulator) {
        const Eigen::MatrixXd sequence = observations.middleRows(span.start, span.length);
        const Eigen::MatrixXd framelogprob = model.emission->log_likelihoods(sequence);
        ForwardBackwardResult fb_result = forward_backward(model.startprob, model.transmat,
                                                           framelogprob, sequence_index);
        accumulator.accumulate_sequence(*model.emission, sequence, framelogprob, fb_result);
    }

    int HmmTrainer::sequential_expectation_step(const HmmParameters& model,
                                                const Eigen::MatrixXd& observations,
                                                const std::vector<SequenceSpan>& spans,
                                                SufficientStatisticsAccumulator& accumulator) const {
        for (size_t i = 0; i < spans.size(); ++i) {
            process_sequence(model, observations, spans[i], i, accumulator);
        }
        return 1;
    }

    int HmmTrainer::parallel_expectation_step(const HmmParameters& model,
                                              const Eigen::MatrixXd& observations,
                                              const std::vector<SequenceSpan>& spans,
                                              SufficientStatisticsAccumulator& accumulator) const {
#ifdef HMMKIT_OPENMP_ENABLED
        const int num_threads = determine_optimal_thread_count(spans.size());
        if (num_threads <= 1) {
            return sequential_expectation_step(model, observations, spans, accumulator);
        }

        // Thread-local accumulators, merged in thread order after the region
        std::vector<SufficientStatisticsAccumulator> local_accumulators(num_threads, accumulator);
        std::vector<std::exception_ptr> errors(spans.size());
        const int num_sequences = static_cast<int>(spans.size());

        #pragma omp parallel num_threads(num_threads)
        {
            const int thread_id = omp_get_thread_num();

            #pragma omp for schedule(static)
            for (int i = 0; i < num_sequences; ++i) {
                try {
                    process_sequence(model, observations, spans[i], static_cast<size_t>(i),
                                     local_accumulators[thread_id]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        }

        // Lowest failing sequence index wins
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }

        for (const auto& local : local_accumulators) {
            accumulator.merge(local);
        }
        return num_threads;
#else
        HMMKIT_LOG_DEBUG("OpenMP not available, running the E-step sequentially");
        return sequential_expectation_step(model, observations, spans, accumulator);
#endif
    }

    void HmmTrainer::maximization_step(HmmParameters& model, const SufficientStatisticsAccumulator& accumulator) const {
        const ParamSet& params = config_.params;
        Eigen::VectorXd new_startprob = model.startprob;
        Eigen::MatrixXd new_transmat = model.transmat;

        if (params.contains(Param::STARTPROB)) {
            Eigen::VectorXd counts = (accumulator.start().array() + (config_.startprob_prior - 1.0)).cwiseMax(0.0).matrix();
            const double total = counts.sum();
            if (total > 0.0) {
                new_startprob = counts / total;
            } else {
                HMMKIT_LOG_WARN("startprob has no posterior mass, keeping previous values");
            }
        }

        if (params.contains(Param::TRANSMAT)) {
            Eigen::MatrixXd counts = (accumulator.trans().array() + (config_.transmat_prior - 1.0)).cwiseMax(0.0).matrix();
            for (Eigen::Index i = 0; i < counts.rows(); ++i) {
                const double total = counts.row(i).sum();
                if (total > 0.0) {
                    new_transmat.row(i) = counts.row(i) / total;
                } else {
                    HMMKIT_LOG_WARN_F("transmat row %d has no expected transitions, keeping previous values",
                                      static_cast<int>(i));
                }
            }
        }

        // Emission update is atomic; start/transition are committed only after it succeeds
        model.emission->do_mstep(accumulator.emission(), params);
        model.startprob = std::move(new_startprob);
        model.transmat = std::move(new_transmat);
    }

    int HmmTrainer::determine_optimal_thread_count(size_t num_sequences) const {
        int optimal_threads = config_.num_threads;

        if (optimal_threads <= 0) {
#ifdef HMMKIT_OPENMP_ENABLED
            optimal_threads = omp_get_max_threads();
#else
            optimal_threads = static_cast<int>(std::thread::hardware_concurrency());
            if (optimal_threads == 0) optimal_threads = 4;
#endif
        }

        // Don't use more threads than sequences (with minimum sequences per thread)
        int max_useful_threads = static_cast<int>(num_sequences / std::max(1, config_.min_sequences_per_thread));
        optimal_threads = std::min(optimal_threads, std::max(1, max_useful_threads));

        return optimal_threads;
    }

    void HmmTrainer::log_iteration_info(const ConvergenceMonitor& monitor, const TrainingStats& stats) const {
        const auto& history = monitor.history();
        const double delta = history.size() > 1
            ? history.back() - history[history.size() - 2]
            : std::numeric_limits<double>::quiet_NaN();

        if (config_.verbose) {
            HMMKIT_LOG_INFO_F("Iteration %d, Log-likelihood: %.6f, Delta: %.6g, E-step: %.4fs, M-step: %.4fs",
                              monitor.iterations(), history.back(), delta,
                              stats.e_step_timings.back(), stats.m_step_timings.back());
        } else {
            HMMKIT_LOG_DEBUG_F("Iteration %d, Log-likelihood: %.6f, Delta: %.6g",
                               monitor.iterations(), history.back(), delta);
        }
    }

    void HmmTrainer::log_convergence_info(const TrainingStats& stats) const {
        if (!config_.verbose) {
            return;
        }
        HMMKIT_LOG_INFO_F("Training finished after %d iterations in state %s (%s)",
                          stats.iterations(), trainer_state_to_string(stats.final_state).c_str(),
                          stats.convergence_reason.c_str());
        HMMKIT_LOG_INFO_F("Final log-likelihood: %.6f", stats.final_log_likelihood());
        if (stats.monitor.has_anomalies()) {
            HMMKIT_LOG_WARN_F("%zu iterations decreased the log-likelihood", stats.monitor.anomalies().size());
        }
    }

} // namespace hmm
} // namespace hmmkit
