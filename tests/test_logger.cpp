#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include "hmmkit/logger.h"

using namespace hmmkit::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "hmmkit_logger_tests";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        test_log_file_ = test_dir_ / "test_log.txt";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::string read_log_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) return "";

        std::string content;
        std::string line;
        while (std::getline(file, line)) {
            if (!content.empty()) content += "\n";
            content += line;
        }
        return content;
    }

    size_t count_lines_in_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) return 0;

        size_t count = 0;
        std::string line;
        while (std::getline(file, line)) {
            count++;
        }
        return count;
    }

protected:
    std::filesystem::path test_dir_;
    std::filesystem::path test_log_file_;
};

TEST_F(LoggerTest, BasicLogging) {
    Logger logger("TestLogger");
    logger.set_output(LogOutput::CONSOLE);
    logger.set_level(LogLevel::DEBUG);

    EXPECT_NO_THROW(logger.debug("Debug message"));
    EXPECT_NO_THROW(logger.info("Info message"));
    EXPECT_NO_THROW(logger.warn("Warning message"));
    EXPECT_NO_THROW(logger.error("Error message"));
    EXPECT_NO_THROW(logger.fatal("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger logger("TestLogger");
    ASSERT_TRUE(logger.set_log_file(test_log_file_.string()));
    logger.set_output(LogOutput::FILE);
    logger.set_level(LogLevel::WARN);

    logger.debug("Debug message - should not appear");
    logger.info("Info message - should not appear");
    logger.warn("Warning message - should appear");
    logger.error("Error message - should appear");
    logger.fatal("Fatal message - should appear");
    logger.flush();

    std::string content = read_log_file(test_log_file_);
    EXPECT_EQ(content.find("Debug message"), std::string::npos);
    EXPECT_EQ(content.find("Info message"), std::string::npos);
    EXPECT_NE(content.find("Warning message"), std::string::npos);
    EXPECT_NE(content.find("Error message"), std::string::npos);
    EXPECT_NE(content.find("Fatal message"), std::string::npos);
    EXPECT_EQ(count_lines_in_file(test_log_file_), 3u);
}

TEST_F(LoggerTest, MessagePrefix) {
    Logger logger("Trainer");
    ASSERT_TRUE(logger.set_log_file(test_log_file_.string()));
    logger.set_output(LogOutput::FILE);

    LogFormat format;
    format.include_timestamp = false;
    logger.set_format(format);

    logger.info("Iteration 1");
    logger.flush();

    EXPECT_EQ(read_log_file(test_log_file_), "[INFO][Trainer] Iteration 1");
}

TEST_F(LoggerTest, FormattedLogging) {
    Logger logger("TestLogger");
    ASSERT_TRUE(logger.set_log_file(test_log_file_.string()));
    logger.set_output(LogOutput::FILE);

    logger.info_f("Iteration %d, Log-likelihood: %.2f", 3, -12.5);
    logger.flush();

    EXPECT_NE(read_log_file(test_log_file_).find("Iteration 3, Log-likelihood: -12.50"), std::string::npos);
}

TEST_F(LoggerTest, NoneOutputSuppressesEverything) {
    Logger logger("TestLogger");
    ASSERT_TRUE(logger.set_log_file(test_log_file_.string()));
    logger.set_output(LogOutput::NONE);

    logger.error("Not written");
    logger.flush();

    EXPECT_FALSE(logger.is_enabled(LogLevel::FATAL));
    EXPECT_EQ(logger.get_stats().error_count, 0u);
    EXPECT_EQ(read_log_file(test_log_file_), "");
}

TEST_F(LoggerTest, Statistics) {
    Logger logger("TestLogger");
    logger.set_output(LogOutput::FILE);
    ASSERT_TRUE(logger.set_log_file(test_log_file_.string()));
    logger.set_level(LogLevel::DEBUG);

    logger.debug("d");
    logger.info("i1");
    logger.info("i2");
    logger.warn("w");
    logger.error("e");

    Logger::LogStats stats = logger.get_stats();
    EXPECT_EQ(stats.debug_count, 1u);
    EXPECT_EQ(stats.info_count, 2u);
    EXPECT_EQ(stats.warn_count, 1u);
    EXPECT_EQ(stats.error_count, 1u);
    EXPECT_EQ(stats.fatal_count, 0u);
    EXPECT_GT(stats.total_bytes_written, 0u);

    logger.reset_stats();
    EXPECT_EQ(logger.get_stats().info_count, 0u);
}

TEST_F(LoggerTest, ScopedLevelRestores) {
    Logger logger("TestLogger");
    logger.set_level(LogLevel::INFO);
    {
        Logger::ScopedLevel scoped(logger, LogLevel::ERROR);
        EXPECT_EQ(logger.level(), LogLevel::ERROR);
    }
    EXPECT_EQ(logger.level(), LogLevel::INFO);
}

TEST_F(LoggerTest, LevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(level_from_string("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(level_from_string("FATAL", level));
    EXPECT_EQ(level, LogLevel::FATAL);
    EXPECT_FALSE(level_from_string("verbose", level));
    EXPECT_EQ(level, LogLevel::FATAL);
    EXPECT_EQ(level_to_string(LogLevel::WARN), "WARN");
}

TEST_F(LoggerTest, ThreadSafety) {
    Logger logger("TestLogger");
    ASSERT_TRUE(logger.set_log_file(test_log_file_.string()));
    logger.set_output(LogOutput::FILE);

    const int num_threads = 4;
    const int messages_per_thread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                logger.info_f("Thread %d message %d", t, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger.flush();

    EXPECT_EQ(count_lines_in_file(test_log_file_), static_cast<size_t>(num_threads * messages_per_thread));
    EXPECT_EQ(logger.get_stats().info_count, static_cast<size_t>(num_threads * messages_per_thread));
}
