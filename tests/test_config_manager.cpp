#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include "hmmkit/config_manager.h"
#include "hmmkit/categorical_emission.h"
#include "hmmkit/hmm_errors.h"

using namespace hmmkit;
using namespace hmmkit::config;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "hmmkit_config_tests";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static bool contains_message(const std::vector<std::string>& messages, const std::string& fragment) {
        for (const auto& message : messages) {
            if (message.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    std::filesystem::path test_dir_;
    ConfigManager manager_;
};

TEST_F(ConfigManagerTest, DefaultConfigIsValid) {
    HmmkitConfig config = manager_.get_default_config();
    EXPECT_EQ(config.config_version, ConfigManager::get_supported_config_version());
    EXPECT_EQ(config.emission_family, "gaussian");
    EXPECT_EQ(config.n_components, 2);
    EXPECT_EQ(config.training.max_iterations, 10);

    ConfigValidationResult result = manager_.validate_config(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigManagerTest, JsonRoundTrip) {
    HmmkitConfig config;
    config.emission_family = "gmm";
    config.n_components = 4;
    config.n_features = 3;
    config.gaussian.covariance_type = hmm::CovarianceType::FULL;
    config.gaussian.min_covar = 1e-4;
    config.gmm.n_mix = 3;
    config.gmm.inner_iterations = 2;
    config.emissionprob_prior = 1.5;
    config.training.max_iterations = 42;
    config.training.tolerance = 0.5;
    config.training.params = hmm::ParamSet{hmm::Param::TRANSMAT, hmm::Param::MEANS};
    config.training.init_params = hmm::ParamSet::none();
    config.training.random_seed = 99;
    config.training.num_threads = 3;
    config.training.enable_parallel_estep = true;
    config.logging.level = "DEBUG";
    config.logging.output = "none";

    std::string json = manager_.config_to_json(config);
    ASSERT_FALSE(json.empty());

    HmmkitConfig parsed;
    ASSERT_TRUE(manager_.config_from_json(json, parsed));
    EXPECT_EQ(parsed.emission_family, "gmm");
    EXPECT_EQ(parsed.n_components, 4);
    EXPECT_EQ(parsed.n_features, 3);
    EXPECT_EQ(parsed.gaussian.covariance_type, hmm::CovarianceType::FULL);
    EXPECT_DOUBLE_EQ(parsed.gaussian.min_covar, 1e-4);
    EXPECT_EQ(parsed.gmm.n_mix, 3);
    EXPECT_EQ(parsed.gmm.inner_iterations, 2);
    EXPECT_DOUBLE_EQ(parsed.emissionprob_prior, 1.5);
    EXPECT_EQ(parsed.training.max_iterations, 42);
    EXPECT_DOUBLE_EQ(parsed.training.tolerance, 0.5);
    EXPECT_EQ(parsed.training.params, config.training.params);
    EXPECT_TRUE(parsed.training.init_params.empty());
    EXPECT_EQ(parsed.training.random_seed, 99u);
    EXPECT_EQ(parsed.training.num_threads, 3);
    EXPECT_TRUE(parsed.training.enable_parallel_estep);
    EXPECT_EQ(parsed.logging.level, "DEBUG");
    EXPECT_EQ(parsed.logging.output, "none");
}

TEST_F(ConfigManagerTest, PartialJsonKeepsDefaults) {
    HmmkitConfig config;
    ASSERT_TRUE(manager_.config_from_json(R"({"training": {"max_iterations": 7}})", config));
    EXPECT_EQ(config.training.max_iterations, 7);
    EXPECT_DOUBLE_EQ(config.training.tolerance, 1e-2);
    EXPECT_EQ(config.emission_family, "gaussian");
}

TEST_F(ConfigManagerTest, InvalidJsonLeavesConfigUnchanged) {
    HmmkitConfig config;
    config.n_components = 5;

    EXPECT_FALSE(manager_.config_from_json("{ not json", config));
    EXPECT_EQ(config.n_components, 5);

    // A bad section rejects the whole document
    EXPECT_FALSE(manager_.config_from_json(
        R"({"model": {"n_components": 9}, "training": {"params": ["means", "bogus"]}})", config));
    EXPECT_EQ(config.n_components, 5);

    EXPECT_FALSE(manager_.config_from_json(R"({"model": {"gaussian": {"covariance_type": "banded"}}})", config));
    EXPECT_FALSE(manager_.config_from_json(R"({"training": {"random_seed": -1}})", config));
    EXPECT_FALSE(manager_.config_from_json(R"({"training": {"init_params": "means"}})", config));
}

TEST_F(ConfigManagerTest, ValidationReportsErrors) {
    HmmkitConfig config;
    config.emission_family = "poisson";
    config.n_components = 0;
    config.training.max_iterations = 0;
    config.training.tolerance = -1.0;
    config.logging.level = "LOUD";

    ConfigValidationResult result = manager_.validate_config(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains_message(result.errors, "emission family"));
    EXPECT_TRUE(contains_message(result.errors, "n_components"));
    EXPECT_TRUE(contains_message(result.errors, "max_iterations"));
    EXPECT_TRUE(contains_message(result.errors, "tolerance"));
    EXPECT_TRUE(contains_message(result.errors, "log level"));
}

TEST_F(ConfigManagerTest, FileOutputNeedsPath) {
    HmmkitConfig config;
    config.logging.output = "file";
    ConfigValidationResult result = manager_.validate_config(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains_message(result.errors, "log_file_path"));

    config.logging.log_file_path = (test_dir_ / "hmmkit.log").string();
    EXPECT_TRUE(manager_.validate_config(config).is_valid);
}

TEST_F(ConfigManagerTest, ValidationReportsWarnings) {
    HmmkitConfig config;
    config.config_version = "0.9";
    config.training.tolerance = 0.0;
    config.training.params = hmm::ParamSet::none();

    ConfigValidationResult result = manager_.validate_config(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(contains_message(result.warnings, "version"));
    EXPECT_TRUE(contains_message(result.warnings, "tolerance"));
    EXPECT_TRUE(contains_message(result.warnings, "params"));
}

TEST_F(ConfigManagerTest, SaveAndLoad) {
    HmmkitConfig config;
    config.emission_family = "categorical";
    config.n_components = 3;
    config.n_features = 6;
    config.training.transmat_prior = 2.0;

    std::string path = (test_dir_ / "nested" / "model.json").string();
    ASSERT_TRUE(manager_.save_config(path, config));
    EXPECT_TRUE(std::filesystem::exists(path));

    HmmkitConfig loaded;
    ASSERT_TRUE(manager_.load_config(path, loaded));
    EXPECT_EQ(loaded.emission_family, "categorical");
    EXPECT_EQ(loaded.n_components, 3);
    EXPECT_EQ(loaded.n_features, 6);
    EXPECT_DOUBLE_EQ(loaded.training.transmat_prior, 2.0);
}

TEST_F(ConfigManagerTest, SaveRejectsInvalidConfig) {
    HmmkitConfig config;
    config.n_features = -1;
    std::string path = (test_dir_ / "invalid.json").string();
    EXPECT_FALSE(manager_.save_config(path, config));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ConfigManagerTest, LoadMissingOrEmptyFile) {
    HmmkitConfig config;
    EXPECT_FALSE(manager_.load_config((test_dir_ / "missing.json").string(), config));

    std::string empty_path = (test_dir_ / "empty.json").string();
    std::ofstream(empty_path).close();
    EXPECT_FALSE(manager_.load_config(empty_path, config));
}

TEST_F(ConfigManagerTest, CreatesEmissionPerFamily) {
    HmmkitConfig config;
    config.n_components = 3;
    config.n_features = 2;

    auto gaussian = manager_.create_emission(config);
    EXPECT_EQ(gaussian->family_name(), "gaussian");
    EXPECT_EQ(gaussian->n_components(), 3);
    EXPECT_EQ(gaussian->n_features(), 2);

    config.emission_family = "gmm";
    config.gmm.n_mix = 4;
    auto gmm = manager_.create_emission(config);
    EXPECT_EQ(gmm->family_name(), "gmm");
    EXPECT_EQ(dynamic_cast<const hmm::GmmEmission&>(*gmm).n_mix(), 4);

    config.emission_family = "categorical";
    config.n_features = 5;
    auto categorical = manager_.create_emission(config);
    EXPECT_EQ(categorical->family_name(), "categorical");
    EXPECT_EQ(dynamic_cast<const hmm::CategoricalEmission&>(*categorical).n_symbols(), 5);

    config.emission_family = "poisson";
    EXPECT_THROW(manager_.create_emission(config), ConfigurationError);
}

TEST_F(ConfigManagerTest, CreatesUntrainedModel) {
    HmmkitConfig config;
    config.n_components = 3;
    hmm::HiddenMarkovModel model = manager_.create_model(config);
    EXPECT_EQ(model.n_components(), 3);
    EXPECT_FALSE(model.emission().is_initialized());
    EXPECT_EQ(model.startprob().size(), 0);
}

TEST_F(ConfigManagerTest, AppliesLoggingSettings) {
    logging::Logger logger("ConfigTest");

    LoggingSettings settings;
    settings.level = "WARN";
    settings.output = "file";
    settings.log_file_path = (test_dir_ / "logs" / "hmmkit.log").string();
    std::filesystem::create_directories(test_dir_ / "logs");

    ASSERT_TRUE(manager_.apply_logging(settings, logger));
    EXPECT_EQ(logger.level(), logging::LogLevel::WARN);

    logger.info("hidden");
    logger.warn("visible");
    logger.flush();

    std::ifstream file(settings.log_file_path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("visible"), std::string::npos);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
}

TEST_F(ConfigManagerTest, RejectsBadLoggingSettings) {
    logging::Logger logger("ConfigTest");
    logger.set_level(logging::LogLevel::INFO);

    LoggingSettings settings;
    settings.level = "VERBOSE";
    EXPECT_FALSE(manager_.apply_logging(settings, logger));

    settings.level = "ERROR";
    settings.output = "syslog";
    EXPECT_FALSE(manager_.apply_logging(settings, logger));
    EXPECT_EQ(logger.level(), logging::LogLevel::INFO);
}
