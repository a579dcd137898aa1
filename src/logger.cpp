#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

// Static member definitions
Logger::Level Logger::current_level_ = Logger::Level::INFO;
std::string Logger::log_file_path_ = "";
std::mutex Logger::log_mutex_;
size_t Logger::max_file_size_ = 10 * 1024 * 1024; // 10MB default
bool Logger::rotate_logs_ = true;

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    current_level_ = level;
}

Logger::Level Logger::get_level() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return current_level_;
}

void Logger::set_log_file(const std::string& filepath, size_t max_size, bool rotate) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_path_ = filepath;
    max_file_size_ = max_size;
    rotate_logs_ = rotate;
}

bool Logger::parse_level(const std::string& name, Level& level) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        level = Level::DEBUG;
    } else if (lowered == "info") {
        level = Level::INFO;
    } else if (lowered == "warn" || lowered == "warning") {
        level = Level::WARN;
    } else if (lowered == "error") {
        level = Level::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Logger::level_to_string(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

void Logger::rotate_log_file() {
    if (!rotate_logs_ || log_file_path_.empty()) {
        return;
    }

    std::error_code ec;
    if (!std::filesystem::exists(log_file_path_, ec)) {
        return;
    }

    auto file_size = std::filesystem::file_size(log_file_path_, ec);
    if (ec || file_size < max_file_size_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream backup_name;
    backup_name << log_file_path_ << "."
               << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");

    std::filesystem::rename(log_file_path_, backup_name.str(), ec);
    if (ec) {
        std::cerr << "Error rotating log file: " << ec.message() << std::endl;
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (level < current_level_) {
        return;
    }

    // Format: [TIMESTAMP] [LEVEL] MESSAGE
    std::string log_entry = "[" + get_timestamp() + "] [" + level_to_string(level) + "] " + message;

    if (level >= Level::ERROR) {
        std::cerr << log_entry << std::endl;
    } else {
        std::cout << log_entry << std::endl;
    }

    if (!log_file_path_.empty()) {
        rotate_log_file();

        std::ofstream log_file(log_file_path_, std::ios::app);
        if (log_file.is_open()) {
            log_file << log_entry << std::endl;
        } else {
            std::cerr << "Failed to write to log file: " << log_file_path_ << std::endl;
        }
    }
}

void Logger::debug(const std::string& message) {
    log(Level::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(Level::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(Level::WARN, message);
}

void Logger::error(const std::string& message) {
    log(Level::ERROR, message);
}

void Logger::log_with_context(Level level, const std::string& context, const std::string& message) {
    log(level, "[" + context + "] " + message);
}

void Logger::debug(const std::string& context, const std::string& message) {
    log_with_context(Level::DEBUG, context, message);
}

void Logger::info(const std::string& context, const std::string& message) {
    log_with_context(Level::INFO, context, message);
}

void Logger::warn(const std::string& context, const std::string& message) {
    log_with_context(Level::WARN, context, message);
}

void Logger::error(const std::string& context, const std::string& message) {
    log_with_context(Level::ERROR, context, message);
}
