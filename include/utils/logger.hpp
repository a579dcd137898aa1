#pragma once
#include <cstddef>
#include <mutex>
#include <string>

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void set_level(Level level);
    static Level get_level();
    static void set_log_file(const std::string& filepath, size_t max_size = 10 * 1024 * 1024, bool rotate = true);

    // Parses "debug", "info", "warn"/"warning" or "error"; returns false if unknown
    static bool parse_level(const std::string& name, Level& level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void debug(const std::string& context, const std::string& message);
    static void info(const std::string& context, const std::string& message);
    static void warn(const std::string& context, const std::string& message);
    static void error(const std::string& context, const std::string& message);

private:
    static Level current_level_;
    static std::string log_file_path_;
    static std::mutex log_mutex_;
    static size_t max_file_size_;
    static bool rotate_logs_;

    static void log(Level level, const std::string& message);
    static void log_with_context(Level level, const std::string& context, const std::string& message);
    static std::string level_to_string(Level level);
    static std::string get_timestamp();
    static void rotate_log_file();
};
