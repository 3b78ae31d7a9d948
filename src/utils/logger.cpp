#include "hmmkit/logger.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <thread>
#include <ctime>

namespace hmmkit {
namespace logging {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

bool level_from_string(const std::string& name, LogLevel& level) {
    if (name == "DEBUG") level = LogLevel::DEBUG;
    else if (name == "INFO") level = LogLevel::INFO;
    else if (name == "WARN") level = LogLevel::WARN;
    else if (name == "ERROR") level = LogLevel::ERROR;
    else if (name == "FATAL") level = LogLevel::FATAL;
    else return false;
    return true;
}

Logger& Logger::instance() {
    static Logger global_instance("hmmkit");
    return global_instance;
}

Logger::Logger(const std::string& name)
    : logger_name_(name) {
}

Logger::~Logger() {
    close();
}

bool Logger::set_log_file(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    log_file_path_ = file_path;
    if (file_path.empty()) {
        return true;
    }

    std::filesystem::path log_path(file_path);
    std::error_code ec;
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    file_stream_ = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << file_path << std::endl;
        file_stream_.reset();
        return false;
    }
    return true;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!should_log(level)) return;

    std::lock_guard<std::mutex> lock(log_mutex_);

    switch (level) {
        case LogLevel::DEBUG: stats_.debug_count++; break;
        case LogLevel::INFO: stats_.info_count++; break;
        case LogLevel::WARN: stats_.warn_count++; break;
        case LogLevel::ERROR: stats_.error_count++; break;
        case LogLevel::FATAL: stats_.fatal_count++; break;
    }

    std::string formatted_message = format_message(level, message);
    stats_.total_bytes_written += formatted_message.size();

    if (output_dest_ == LogOutput::CONSOLE || output_dest_ == LogOutput::BOTH) {
        std::ostream& stream = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        stream << formatted_message << std::endl;
    }

    if ((output_dest_ == LogOutput::FILE || output_dest_ == LogOutput::BOTH) && file_stream_) {
        *file_stream_ << formatted_message << std::endl;
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
}

Logger::LogStats Logger::get_stats() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return stats_;
}

void Logger::reset_stats() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    stats_ = LogStats{};
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream oss;

    if (format_.include_timestamp) {
        oss << "[" << get_timestamp() << "]";
    }

    if (format_.include_level) {
        oss << "[" << level_to_string(level) << "]";
    }

    if (format_.include_thread_id) {
        oss << "[" << std::this_thread::get_id() << "]";
    }

    if (!logger_name_.empty()) {
        oss << "[" << logger_name_ << "]";
    }

    oss << " " << message;
    return oss.str();
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, format_.timestamp_format.c_str());
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

Logger::ScopedLevel::ScopedLevel(Logger& logger, LogLevel new_level)
    : logger_(logger), original_level_(logger.min_level_) {
    logger_.set_level(new_level);
}

Logger::ScopedLevel::~ScopedLevel() {
    logger_.set_level(original_level_);
}

} // namespace logging
} // namespace hmmkit
