#include "hmmkit/config_manager.h"
#include "hmmkit/categorical_emission.h"
#include "hmmkit/hmm_errors.h"
#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace hmmkit {
namespace config {

ConfigManager::ConfigManager() {
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load_config(const std::string& file_path, HmmkitConfig& config) {
    try {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            HMMKIT_LOG_ERROR("Cannot open configuration file: " + file_path);
            return false;
        }

        // Read entire file content
        std::string json_content((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
        file.close();

        if (json_content.empty()) {
            HMMKIT_LOG_ERROR("Configuration file is empty: " + file_path);
            return false;
        }

        bool success = config_from_json(json_content, config);
        if (success) {
            HMMKIT_LOG_INFO("Loaded configuration from: " + file_path);
        } else {
            HMMKIT_LOG_ERROR("Failed to parse configuration file: " + file_path);
        }
        return success;

    } catch (const std::exception& e) {
        HMMKIT_LOG_ERROR("Exception loading configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::save_config(const std::string& file_path, const HmmkitConfig& config) {
    try {
        auto validation = validate_config(config);
        if (!validation.is_valid) {
            HMMKIT_LOG_ERROR("Cannot save invalid configuration");
            for (const auto& error : validation.errors) {
                HMMKIT_LOG_ERROR("Validation error: " + error);
            }
            return false;
        }

        std::string json_str = config_to_json(config);
        if (json_str.empty()) {
            HMMKIT_LOG_ERROR("Failed to serialize configuration to JSON");
            return false;
        }

        // Ensure output directory exists
        std::filesystem::path parent_dir = std::filesystem::path(file_path).parent_path();
        if (!parent_dir.empty()) {
            std::filesystem::create_directories(parent_dir);
        }

        std::ofstream file(file_path);
        if (!file.is_open()) {
            HMMKIT_LOG_ERROR("Cannot create configuration file: " + file_path);
            return false;
        }
        file << json_str;
        file.close();

        HMMKIT_LOG_INFO("Configuration saved to: " + file_path);
        return true;

    } catch (const std::exception& e) {
        HMMKIT_LOG_ERROR("Exception saving configuration: " + std::string(e.what()));
        return false;
    }
}

std::string ConfigManager::config_to_json(const HmmkitConfig& config) {
    cJSON* root = cJSON_CreateObject();
    if (!root) return "";

    try {
        cJSON_AddStringToObject(root, "config_version", config.config_version.c_str());
        cJSON_AddItemToObject(root, "model", emission_config_to_json(config));
        cJSON_AddItemToObject(root, "training", training_config_to_json(config.training));
        cJSON_AddItemToObject(root, "logging", logging_config_to_json(config.logging));

        char* json_string = cJSON_Print(root);
        std::string result = json_string ? json_string : "";

        if (json_string) free(json_string);
        cJSON_Delete(root);

        return result;

    } catch (const std::exception& e) {
        cJSON_Delete(root);
        HMMKIT_LOG_ERROR("Error serializing configuration: " + std::string(e.what()));
        return "";
    }
}

bool ConfigManager::config_from_json(const std::string& json_str, HmmkitConfig& config) {
    cJSON* root = cJSON_Parse(json_str.c_str());
    if (!root) {
        HMMKIT_LOG_ERROR("Invalid JSON format in configuration");
        return false;
    }

    // Parse into a copy so a bad section leaves the caller's config unchanged
    HmmkitConfig parsed = config;
    bool success = true;

    try {
        cJSON* item = cJSON_GetObjectItem(root, "config_version");
        if (item && cJSON_IsString(item)) {
            parsed.config_version = item->valuestring;
        }

        item = cJSON_GetObjectItem(root, "model");
        if (item) success = emission_config_from_json(item, parsed) && success;

        item = cJSON_GetObjectItem(root, "training");
        if (item) success = training_config_from_json(item, parsed.training) && success;

        item = cJSON_GetObjectItem(root, "logging");
        if (item) success = logging_config_from_json(item, parsed.logging) && success;

    } catch (const std::exception& e) {
        HMMKIT_LOG_ERROR("Error parsing configuration JSON: " + std::string(e.what()));
        success = false;
    }

    cJSON_Delete(root);
    if (success) {
        config = parsed;
    }
    return success;
}

ConfigValidationResult ConfigManager::validate_config(const HmmkitConfig& config) {
    ConfigValidationResult result;

    if (config.config_version.empty()) {
        result.errors.push_back("Configuration version is empty");
    } else if (config.config_version != get_supported_config_version()) {
        result.warnings.push_back("Configuration version " + config.config_version +
                                  " differs from supported version " + get_supported_config_version());
    }

    // Model
    if (config.emission_family != "gaussian" && config.emission_family != "gmm" &&
        config.emission_family != "categorical") {
        result.errors.push_back("Unknown emission family: " + config.emission_family);
    }
    if (config.n_components <= 0) {
        result.errors.push_back("n_components must be positive");
    }
    if (config.n_features <= 0) {
        result.errors.push_back("n_features must be positive");
    }
    if (config.gaussian.min_covar <= 0.0) {
        result.errors.push_back("gaussian.min_covar must be positive");
    }
    if (config.gaussian.means_weight < 0.0 || config.gaussian.covars_weight < 0.0) {
        result.errors.push_back("gaussian prior weights must be non-negative");
    }
    if (config.gmm.n_mix <= 0) {
        result.errors.push_back("gmm.n_mix must be positive");
    }
    if (config.gmm.inner_iterations <= 0) {
        result.errors.push_back("gmm.inner_iterations must be positive");
    }
    if (config.gmm.min_covar <= 0.0) {
        result.errors.push_back("gmm.min_covar must be positive");
    }

    // Training
    const auto& training = config.training;
    if (training.max_iterations <= 0) {
        result.errors.push_back("training.max_iterations must be positive");
    }
    if (training.tolerance < 0.0) {
        result.errors.push_back("training.tolerance must be non-negative");
    } else if (training.tolerance == 0.0) {
        result.warnings.push_back("training.tolerance is zero, training always runs max_iterations");
    }
    if (training.decrease_tolerance < 0.0) {
        result.errors.push_back("training.decrease_tolerance must be non-negative");
    }
    if (training.num_threads < 0) {
        result.errors.push_back("training.num_threads must be non-negative");
    }
    if (training.min_sequences_per_thread <= 0) {
        result.errors.push_back("training.min_sequences_per_thread must be positive");
    }
    if (training.params.empty()) {
        result.warnings.push_back("training.params is empty, fitting will not change any parameter");
    }
#ifndef HMMKIT_OPENMP_ENABLED
    if (training.enable_parallel_estep) {
        result.warnings.push_back("Parallel E-step requested but OpenMP is not available");
    }
#endif

    // Logging
    logging::LogLevel level;
    if (!logging::level_from_string(config.logging.level, level)) {
        result.errors.push_back("Unknown log level: " + config.logging.level);
    }
    logging::LogOutput output;
    if (!output_from_string(config.logging.output, output)) {
        result.errors.push_back("Unknown log output: " + config.logging.output);
    } else if ((output == logging::LogOutput::FILE || output == logging::LogOutput::BOTH) &&
               config.logging.log_file_path.empty()) {
        result.errors.push_back("Log output '" + config.logging.output + "' requires log_file_path");
    }

    result.is_valid = result.errors.empty();
    return result;
}

HmmkitConfig ConfigManager::get_default_config() {
    return HmmkitConfig();
}

std::unique_ptr<hmm::EmissionModel> ConfigManager::create_emission(const HmmkitConfig& config) {
    if (config.emission_family == "gaussian") {
        return std::make_unique<hmm::GaussianEmission>(config.n_components, config.n_features, config.gaussian);
    }
    if (config.emission_family == "gmm") {
        return std::make_unique<hmm::GmmEmission>(config.n_components, config.n_features, config.gmm);
    }
    if (config.emission_family == "categorical") {
        return std::make_unique<hmm::CategoricalEmission>(config.n_components, config.n_features,
                                                          config.emissionprob_prior);
    }
    throw ConfigurationError("Unknown emission family: '" + config.emission_family + "'");
}

hmm::HiddenMarkovModel ConfigManager::create_model(const HmmkitConfig& config) {
    return hmm::HiddenMarkovModel(create_emission(config));
}

bool ConfigManager::apply_logging(const LoggingSettings& settings, logging::Logger& logger) {
    logging::LogLevel level;
    if (!logging::level_from_string(settings.level, level)) {
        HMMKIT_LOG_ERROR("Unknown log level: " + settings.level);
        return false;
    }
    logging::LogOutput output;
    if (!output_from_string(settings.output, output)) {
        HMMKIT_LOG_ERROR("Unknown log output: " + settings.output);
        return false;
    }

    if (output == logging::LogOutput::FILE || output == logging::LogOutput::BOTH) {
        if (!logger.set_log_file(settings.log_file_path)) {
            return false;
        }
    }
    logger.set_level(level);
    logger.set_output(output);
    return true;
}

std::string ConfigManager::get_supported_config_version() {
    return "1.0";
}

// Private section converters
cJSON* ConfigManager::training_config_to_json(const hmm::TrainingConfig& config) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddNumberToObject(obj, "max_iterations", config.max_iterations);
    cJSON_AddNumberToObject(obj, "tolerance", config.tolerance);
    cJSON_AddNumberToObject(obj, "decrease_tolerance", config.decrease_tolerance);
    cJSON_AddItemToObject(obj, "init_params", param_set_to_json(config.init_params));
    cJSON_AddItemToObject(obj, "params", param_set_to_json(config.params));
    cJSON_AddNumberToObject(obj, "startprob_prior", config.startprob_prior);
    cJSON_AddNumberToObject(obj, "transmat_prior", config.transmat_prior);
    cJSON_AddNumberToObject(obj, "random_seed", config.random_seed);
    cJSON_AddBoolToObject(obj, "verbose", config.verbose);

    cJSON_AddBoolToObject(obj, "enable_parallel_estep", config.enable_parallel_estep);
    cJSON_AddNumberToObject(obj, "num_threads", config.num_threads);
    cJSON_AddNumberToObject(obj, "min_sequences_per_thread", config.min_sequences_per_thread);

    return obj;
}

bool ConfigManager::training_config_from_json(const cJSON* json, hmm::TrainingConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "max_iterations");
    if (item && cJSON_IsNumber(item)) config.max_iterations = item->valueint;

    item = cJSON_GetObjectItem(json, "tolerance");
    if (item && cJSON_IsNumber(item)) config.tolerance = item->valuedouble;

    item = cJSON_GetObjectItem(json, "decrease_tolerance");
    if (item && cJSON_IsNumber(item)) config.decrease_tolerance = item->valuedouble;

    item = cJSON_GetObjectItem(json, "init_params");
    if (item && !param_set_from_json(item, config.init_params)) return false;

    item = cJSON_GetObjectItem(json, "params");
    if (item && !param_set_from_json(item, config.params)) return false;

    item = cJSON_GetObjectItem(json, "startprob_prior");
    if (item && cJSON_IsNumber(item)) config.startprob_prior = item->valuedouble;

    item = cJSON_GetObjectItem(json, "transmat_prior");
    if (item && cJSON_IsNumber(item)) config.transmat_prior = item->valuedouble;

    item = cJSON_GetObjectItem(json, "random_seed");
    if (item && cJSON_IsNumber(item)) {
        if (item->valuedouble < 0.0) {
            HMMKIT_LOG_ERROR("training.random_seed must be non-negative");
            return false;
        }
        config.random_seed = static_cast<unsigned int>(item->valuedouble);
    }

    item = cJSON_GetObjectItem(json, "verbose");
    if (item && cJSON_IsBool(item)) config.verbose = cJSON_IsTrue(item);

    item = cJSON_GetObjectItem(json, "enable_parallel_estep");
    if (item && cJSON_IsBool(item)) config.enable_parallel_estep = cJSON_IsTrue(item);

    item = cJSON_GetObjectItem(json, "num_threads");
    if (item && cJSON_IsNumber(item)) config.num_threads = item->valueint;

    item = cJSON_GetObjectItem(json, "min_sequences_per_thread");
    if (item && cJSON_IsNumber(item)) config.min_sequences_per_thread = item->valueint;

    return true;
}

cJSON* ConfigManager::emission_config_to_json(const HmmkitConfig& config) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddStringToObject(obj, "emission_family", config.emission_family.c_str());
    cJSON_AddNumberToObject(obj, "n_components", config.n_components);
    cJSON_AddNumberToObject(obj, "n_features", config.n_features);

    cJSON* gaussian = cJSON_CreateObject();
    cJSON_AddStringToObject(gaussian, "covariance_type",
                            hmm::covariance_type_to_string(config.gaussian.covariance_type).c_str());
    cJSON_AddNumberToObject(gaussian, "min_covar", config.gaussian.min_covar);
    cJSON_AddNumberToObject(gaussian, "means_prior", config.gaussian.means_prior);
    cJSON_AddNumberToObject(gaussian, "means_weight", config.gaussian.means_weight);
    cJSON_AddNumberToObject(gaussian, "covars_prior", config.gaussian.covars_prior);
    cJSON_AddNumberToObject(gaussian, "covars_weight", config.gaussian.covars_weight);
    cJSON_AddItemToObject(obj, "gaussian", gaussian);

    cJSON* gmm = cJSON_CreateObject();
    cJSON_AddNumberToObject(gmm, "n_mix", config.gmm.n_mix);
    cJSON_AddNumberToObject(gmm, "min_covar", config.gmm.min_covar);
    cJSON_AddNumberToObject(gmm, "inner_iterations", config.gmm.inner_iterations);
    cJSON_AddItemToObject(obj, "gmm", gmm);

    cJSON* categorical = cJSON_CreateObject();
    cJSON_AddNumberToObject(categorical, "emissionprob_prior", config.emissionprob_prior);
    cJSON_AddItemToObject(obj, "categorical", categorical);

    return obj;
}

bool ConfigManager::emission_config_from_json(const cJSON* json, HmmkitConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "emission_family");
    if (item && cJSON_IsString(item)) config.emission_family = item->valuestring;

    item = cJSON_GetObjectItem(json, "n_components");
    if (item && cJSON_IsNumber(item)) config.n_components = item->valueint;

    item = cJSON_GetObjectItem(json, "n_features");
    if (item && cJSON_IsNumber(item)) config.n_features = item->valueint;

    cJSON* gaussian = cJSON_GetObjectItem(json, "gaussian");
    if (gaussian && cJSON_IsObject(gaussian)) {
        item = cJSON_GetObjectItem(gaussian, "covariance_type");
        if (item && cJSON_IsString(item)) {
            try {
                config.gaussian.covariance_type = hmm::covariance_type_from_string(item->valuestring);
            } catch (const ConfigurationError& e) {
                HMMKIT_LOG_ERROR(std::string("Invalid gaussian section: ") + e.what());
                return false;
            }
        }

        item = cJSON_GetObjectItem(gaussian, "min_covar");
        if (item && cJSON_IsNumber(item)) config.gaussian.min_covar = item->valuedouble;

        item = cJSON_GetObjectItem(gaussian, "means_prior");
        if (item && cJSON_IsNumber(item)) config.gaussian.means_prior = item->valuedouble;

        item = cJSON_GetObjectItem(gaussian, "means_weight");
        if (item && cJSON_IsNumber(item)) config.gaussian.means_weight = item->valuedouble;

        item = cJSON_GetObjectItem(gaussian, "covars_prior");
        if (item && cJSON_IsNumber(item)) config.gaussian.covars_prior = item->valuedouble;

        item = cJSON_GetObjectItem(gaussian, "covars_weight");
        if (item && cJSON_IsNumber(item)) config.gaussian.covars_weight = item->valuedouble;
    }

    cJSON* gmm = cJSON_GetObjectItem(json, "gmm");
    if (gmm && cJSON_IsObject(gmm)) {
        item = cJSON_GetObjectItem(gmm, "n_mix");
        if (item && cJSON_IsNumber(item)) config.gmm.n_mix = item->valueint;

        item = cJSON_GetObjectItem(gmm, "min_covar");
        if (item && cJSON_IsNumber(item)) config.gmm.min_covar = item->valuedouble;

        item = cJSON_GetObjectItem(gmm, "inner_iterations");
        if (item && cJSON_IsNumber(item)) config.gmm.inner_iterations = item->valueint;
    }

    cJSON* categorical = cJSON_GetObjectItem(json, "categorical");
    if (categorical && cJSON_IsObject(categorical)) {
        item = cJSON_GetObjectItem(categorical, "emissionprob_prior");
        if (item && cJSON_IsNumber(item)) config.emissionprob_prior = item->valuedouble;
    }

    return true;
}

cJSON* ConfigManager::logging_config_to_json(const LoggingSettings& config) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddStringToObject(obj, "level", config.level.c_str());
    cJSON_AddStringToObject(obj, "output", config.output.c_str());
    cJSON_AddStringToObject(obj, "log_file_path", config.log_file_path.c_str());

    return obj;
}

bool ConfigManager::logging_config_from_json(const cJSON* json, LoggingSettings& config) {
    cJSON* item = cJSON_GetObjectItem(json, "level");
    if (item && cJSON_IsString(item)) config.level = item->valuestring;

    item = cJSON_GetObjectItem(json, "output");
    if (item && cJSON_IsString(item)) config.output = item->valuestring;

    item = cJSON_GetObjectItem(json, "log_file_path");
    if (item && cJSON_IsString(item)) config.log_file_path = item->valuestring;

    return true;
}

cJSON* ConfigManager::param_set_to_json(const hmm::ParamSet& params) {
    cJSON* array = cJSON_CreateArray();
    for (const auto& name : params.names()) {
        cJSON_AddItemToArray(array, cJSON_CreateString(name.c_str()));
    }
    return array;
}

bool ConfigManager::param_set_from_json(const cJSON* json, hmm::ParamSet& params) {
    if (!cJSON_IsArray(json)) {
        HMMKIT_LOG_ERROR("Parameter set must be a JSON array of names");
        return false;
    }

    std::vector<std::string> names;
    cJSON* element = nullptr;
    cJSON_ArrayForEach(element, json) {
        if (!cJSON_IsString(element)) {
            HMMKIT_LOG_ERROR("Parameter set entries must be strings");
            return false;
        }
        names.push_back(element->valuestring);
    }

    try {
        params = hmm::ParamSet::from_names(names);
    } catch (const ConfigurationError& e) {
        HMMKIT_LOG_ERROR(std::string("Invalid parameter set: ") + e.what());
        return false;
    }
    return true;
}

bool ConfigManager::output_from_string(const std::string& name, logging::LogOutput& output) {
    if (name == "none") output = logging::LogOutput::NONE;
    else if (name == "console") output = logging::LogOutput::CONSOLE;
    else if (name == "file") output = logging::LogOutput::FILE;
    else if (name == "both") output = logging::LogOutput::BOTH;
    else return false;
    return true;
}

} // namespace config
} // namespace hmmkit
