#pragma once

#include "hmm_types.h"
#include "emission_model.h"
#include "convergence_monitor.h"
#include "sufficient_statistics.h"
#include <vector>
#include <memory>
#include <string>
#include <functional>
#include <limits>
#include <Eigen/Core>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Start, transition and emission parameters of one HMM
     *
     * Copying deep-copies the emission model. Empty startprob/transmat
     * mean "not set".
     */
    struct HmmParameters {
        Eigen::VectorXd startprob;
        Eigen::MatrixXd transmat;
        std::unique_ptr<EmissionModel> emission;

        HmmParameters() = default;
        explicit HmmParameters(std::unique_ptr<EmissionModel> emission_model)
            : emission(std::move(emission_model)) {}

        HmmParameters(const HmmParameters& other);
        HmmParameters& operator=(const HmmParameters& other);
        HmmParameters(HmmParameters&&) = default;
        HmmParameters& operator=(HmmParameters&&) = default;

        int n_components() const { return emission ? emission->n_components() : 0; }

        /**
         * @brief Check that every parameter is set and consistent
         * @throws NotInitializedError if a parameter is missing
         * @throws ConfigurationError on wrong shapes or non-stochastic values
         */
        void validate() const;
    };

    /**
     * @brief EM trainer lifecycle
     */
    enum class TrainerState {
        INITIALIZING,               // Defaults being assigned and validated
        ITERATING,                  // E-step / M-step loop running
        CONVERGED,                  // Score change fell below tolerance
        ITERATION_LIMIT_REACHED,    // Iteration cap hit first
        CANCELLED                   // Iteration callback asked to stop
    };

    std::string trainer_state_to_string(TrainerState state);

    /**
     * @brief Called after every iteration with (iteration, total log-likelihood)
     *
     * Returning false stops training before the next iteration.
     */
    using IterationCallback = std::function<bool(int, double)>;

    /**
     * @brief Training configuration for Baum-Welch EM
     */
    struct TrainingConfig {
        int max_iterations;             // Iteration cap
        double tolerance;               // Log-likelihood change threshold
        double decrease_tolerance;      // Decrease tolerated before reporting an anomaly
        ParamSet init_params;           // Parameters to initialize when missing
        ParamSet params;                // Parameters updated by the M-step
        double startprob_prior;         // Dirichlet concentration for startprob
        double transmat_prior;          // Dirichlet concentration for transmat rows
        unsigned int random_seed;       // Seed for data-driven initialization
        bool verbose;                   // Log every iteration at INFO

        // Parallel E-step
        bool enable_parallel_estep;     // Process sequences on several threads
        int num_threads;                // 0 = auto-detect
        int min_sequences_per_thread;   // Minimum sequences assigned to each thread

        IterationCallback iteration_callback;

        TrainingConfig()
            : max_iterations(10)
            , tolerance(1e-2)
            , decrease_tolerance(1e-6)
            , init_params(ParamSet::all())
            , params(ParamSet::all())
            , startprob_prior(1.0)
            , transmat_prior(1.0)
            , random_seed(0)
            , verbose(false)
            , enable_parallel_estep(false)
            , num_threads(0)
            , min_sequences_per_thread(1) {}
    };

    /**
     * @brief Outcome of one fit
     */
    struct TrainingStats {
        TrainerState final_state;
        ConvergenceMonitor monitor;             // Snapshot of the history and anomalies
        std::string convergence_reason;
        std::vector<double> e_step_timings;     // Seconds per iteration
        std::vector<double> m_step_timings;     // Seconds per iteration
        size_t n_sequences;
        size_t n_frames;
        int threads_used;

        TrainingStats()
            : final_state(TrainerState::INITIALIZING)
            , monitor(0.0, 1)
            , n_sequences(0)
            , n_frames(0)
            , threads_used(1) {}

        int iterations() const { return monitor.iterations(); }
        double final_log_likelihood() const { return monitor.last_log_likelihood(); }
    };

    /**
     * @brief Baum-Welch EM over a set of independent sequences
     *
     * The M-step is transactional: parameters change only when a whole
     * iteration succeeds, so an exception leaves the previous iteration's
     * parameters in place.
     */
    class HmmTrainer {
    public:
        explicit HmmTrainer(const TrainingConfig& config = TrainingConfig());

        /**
         * @brief Fit model parameters in place
         * @param observations Concatenated sequences, T_total x D
         * @param lengths Per-sequence lengths (empty = one sequence)
         * @throws ConfigurationError, NotInitializedError before any mutation
         * @throws DegenerateSequenceError from the E-step, with the sequence index
         */
        TrainingStats fit(HmmParameters& model,
                          const Eigen::MatrixXd& observations,
                          const std::vector<int>& lengths = std::vector<int>());

        /**
         * @brief One E-step over every sequence
         *
         * Resets accumulator and fills it with the posteriors of all sequences.
         * @return number of threads used
         */
        int expectation_step(const HmmParameters& model,
                             const Eigen::MatrixXd& observations,
                             const std::vector<SequenceSpan>& spans,
                             SufficientStatisticsAccumulator& accumulator) const;

        // Transactional M-step for the parameters in config().params
        void maximization_step(HmmParameters& model, const SufficientStatisticsAccumulator& accumulator) const;

        TrainerState state() const { return state_; }

        void set_config(const TrainingConfig& config) { config_ = config; }
        const TrainingConfig& get_config() const { return config_; }

    private:
        TrainingConfig config_;
        TrainerState state_;

        void validate_config() const;

        int sequential_expectation_step(const HmmParameters& model,
                                        const Eigen::MatrixXd& observations,
                                        const std::vector<SequenceSpan>& spans,
                                        SufficientStatisticsAccumulator& accumulator) const;

        int parallel_expectation_step(const HmmParameters& model,
                                      const Eigen::MatrixXd& observations,
                                      const std::vector<SequenceSpan>& spans,
                                      SufficientStatisticsAccumulator& accumulator) const;

        static void process_sequence(const HmmParameters& model,
                                     const Eigen::MatrixXd& observations,
                                     const SequenceSpan& span,
                                     size_t sequence_index,
                                     SufficientStatisticsAccumulator& accumulator);

        int determine_optimal_thread_count(size_t num_sequences) const;

        void log_iteration_info(const ConvergenceMonitor& monitor, const TrainingStats& stats) const;
        void log_convergence_info(const TrainingStats& stats) const;
    };

} // namespace hmm
} // namespace hmmkit
