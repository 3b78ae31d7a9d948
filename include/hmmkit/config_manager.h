#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cJSON.h>
#include "hmm_trainer.h"
#include "hmm_model.h"
#include "gaussian_emission.h"
#include "gmm_emission.h"
#include "logger.h"

namespace hmmkit {
namespace config {

    /**
     * @brief Logger settings applied to the global logger
     */
    struct LoggingSettings {
        std::string level;              // DEBUG, INFO, WARN, ERROR, FATAL
        std::string output;             // none, console, file, both
        std::string log_file_path;      // Required for file and both

        LoggingSettings()
            : level("INFO")
            , output("console") {}
    };

    /**
     * @brief Complete model and training configuration
     */
    struct HmmkitConfig {
        std::string config_version;

        // Model
        std::string emission_family;    // gaussian, gmm, categorical
        int n_components;
        int n_features;                 // Alphabet size for categorical

        hmm::GaussianEmissionConfig gaussian;
        hmm::GmmEmissionConfig gmm;
        double emissionprob_prior;

        hmm::TrainingConfig training;
        LoggingSettings logging;

        HmmkitConfig()
            : config_version("1.0")
            , emission_family("gaussian")
            , n_components(2)
            , n_features(1)
            , emissionprob_prior(1.0) {}
    };

    /**
     * @brief Configuration validation result
     */
    struct ConfigValidationResult {
        bool is_valid;                          // Overall validation result
        std::vector<std::string> errors;        // Validation errors
        std::vector<std::string> warnings;      // Validation warnings

        ConfigValidationResult() : is_valid(true) {}
    };

    /**
     * @brief Configuration file manager
     *
     * Loads and saves HmmkitConfig as JSON. File and parse failures are
     * logged and reported through the boolean return value.
     */
    class ConfigManager {
    public:
        ConfigManager();
        ~ConfigManager();

        // Configuration loading and saving
        bool load_config(const std::string& file_path, HmmkitConfig& config);
        bool save_config(const std::string& file_path, const HmmkitConfig& config);

        // JSON serialization
        std::string config_to_json(const HmmkitConfig& config);
        bool config_from_json(const std::string& json_str, HmmkitConfig& config);

        // Configuration validation
        ConfigValidationResult validate_config(const HmmkitConfig& config);

        HmmkitConfig get_default_config();

        // Emission model described by the configuration; throws ConfigurationError
        std::unique_ptr<hmm::EmissionModel> create_emission(const HmmkitConfig& config);
        hmm::HiddenMarkovModel create_model(const HmmkitConfig& config);

        // Apply the logging section to a logger; false if a setting is invalid
        bool apply_logging(const LoggingSettings& settings, logging::Logger& logger);

        static std::string get_supported_config_version();

    private:
        // Section converters
        cJSON* training_config_to_json(const hmm::TrainingConfig& config);
        bool training_config_from_json(const cJSON* json, hmm::TrainingConfig& config);

        cJSON* emission_config_to_json(const HmmkitConfig& config);
        bool emission_config_from_json(const cJSON* json, HmmkitConfig& config);

        cJSON* logging_config_to_json(const LoggingSettings& config);
        bool logging_config_from_json(const cJSON* json, LoggingSettings& config);

        cJSON* param_set_to_json(const hmm::ParamSet& params);
        bool param_set_from_json(const cJSON* json, hmm::ParamSet& params);

        bool output_from_string(const std::string& name, logging::LogOutput& output);
    };

} // namespace config
} // namespace hmmkit
