#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <cstdio>

namespace hmmkit {
namespace logging {

/**
 * @brief Log levels ordered by severity from lowest (DEBUG) to highest (FATAL)
 */
enum class LogLevel {
    DEBUG = 0,    ///< Per-iteration and per-sequence details
    INFO = 1,     ///< Training progress
    WARN = 2,     ///< Anomalies that do not stop training
    ERROR = 3,    ///< Rejected or aborted operations
    FATAL = 4     ///< Unrecoverable errors
};

/**
 * @brief Log output destinations
 */
enum class LogOutput {
    NONE = 0,
    CONSOLE = 1,
    FILE = 2,
    BOTH = 3
};

/**
 * @brief Log line format
 */
struct LogFormat {
    bool include_timestamp = true;
    bool include_level = true;
    bool include_thread_id = false;
    std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
};

std::string level_to_string(LogLevel level);
bool level_from_string(const std::string& name, LogLevel& level);

/**
 * @brief Thread-safe logger with console and file destinations
 *
 * A process-wide instance backs the HMMKIT_LOG_* macros; separate instances
 * can be created for tests or embedding applications.
 */
class Logger {
public:
    static Logger& instance();

    explicit Logger(const std::string& name = "hmmkit");
    ~Logger();

    // Configuration
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
    void set_output(LogOutput output) { output_dest_ = output; }
    bool set_log_file(const std::string& file_path);
    void set_format(const LogFormat& format) { format_ = format; }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::DEBUG)) {
            log(LogLevel::DEBUG, format_string(format, args...));
        }
    }

    template<typename... Args>
    void info_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::INFO)) {
            log(LogLevel::INFO, format_string(format, args...));
        }
    }

    template<typename... Args>
    void warn_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::WARN)) {
            log(LogLevel::WARN, format_string(format, args...));
        }
    }

    template<typename... Args>
    void error_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::ERROR)) {
            log(LogLevel::ERROR, format_string(format, args...));
        }
    }

    void log(LogLevel level, const std::string& message);

    void flush();
    void close();
    bool is_enabled(LogLevel level) const { return should_log(level); }

    struct LogStats {
        size_t debug_count = 0;
        size_t info_count = 0;
        size_t warn_count = 0;
        size_t error_count = 0;
        size_t fatal_count = 0;
        size_t total_bytes_written = 0;
    };

    LogStats get_stats() const;
    void reset_stats();

    // Restores the previous level on destruction
    class ScopedLevel {
    public:
        ScopedLevel(Logger& logger, LogLevel new_level);
        ~ScopedLevel();
    private:
        Logger& logger_;
        LogLevel original_level_;
    };

    ScopedLevel scoped_level(LogLevel level) {
        return ScopedLevel(*this, level);
    }

private:
    std::string logger_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogOutput output_dest_ = LogOutput::CONSOLE;
    LogFormat format_;

    std::string log_file_path_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex log_mutex_;

    LogStats stats_;

    bool should_log(LogLevel level) const { return level >= min_level_ && output_dest_ != LogOutput::NONE; }
    std::string format_message(LogLevel level, const std::string& message) const;
    std::string get_timestamp() const;

    template<typename... Args>
    std::string format_string(const std::string& format, Args... args) {
        size_t size = std::snprintf(nullptr, 0, format.c_str(), args...) + 1;
        std::unique_ptr<char[]> buf(new char[size]);
        std::snprintf(buf.get(), size, format.c_str(), args...);
        return std::string(buf.get(), buf.get() + size - 1);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

} // namespace logging
} // namespace hmmkit

#define HMMKIT_LOG_DEBUG(msg) hmmkit::logging::Logger::instance().debug(msg)
#define HMMKIT_LOG_INFO(msg) hmmkit::logging::Logger::instance().info(msg)
#define HMMKIT_LOG_WARN(msg) hmmkit::logging::Logger::instance().warn(msg)
#define HMMKIT_LOG_ERROR(msg) hmmkit::logging::Logger::instance().error(msg)

#define HMMKIT_LOG_DEBUG_F(fmt, ...) hmmkit::logging::Logger::instance().debug_f(fmt, __VA_ARGS__)
#define HMMKIT_LOG_INFO_F(fmt, ...) hmmkit::logging::Logger::instance().info_f(fmt, __VA_ARGS__)
#define HMMKIT_LOG_WARN_F(fmt, ...) hmmkit::logging::Logger::instance().warn_f(fmt, __VA_ARGS__)
#define HMMKIT_LOG_ERROR_F(fmt, ...) hmmkit::logging::Logger::instance().error_f(fmt, __VA_ARGS__)
