#include "config_manager.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <set>

namespace Wav2Ulaw {

namespace {

const std::set<std::string> kTranscodeKeys = {
    "low_pass", "high_pass", "normalize", "compress_ratio", "compress_threshold",
    "window_size", "anti_aliasing_ratio", "anti_aliasing_type", "filter_order",
    "chebyshev_ripple", "force_mono", "strict", "sample_rate", "mode"
};

double require_number(const json& section, const std::string& key) {
    const json& value = section[key];
    if (!value.is_number()) {
        throw ConfigError("config key transcode." + key + " must be a number, got " + value.dump());
    }
    return value.get<double>();
}

int require_integer(const json& section, const std::string& key) {
    const json& value = section[key];
    if (!value.is_number_integer()) {
        throw ConfigError("config key transcode." + key + " must be an integer, got " + value.dump());
    }
    return value.get<int>();
}

bool require_bool(const json& section, const std::string& key) {
    const json& value = section[key];
    if (!value.is_boolean()) {
        throw ConfigError("config key transcode." + key + " must be true or false, got " + value.dump());
    }
    return value.get<bool>();
}

} // namespace

ConfigManager::ConfigManager() {
    // Defaults mirror TranscodeConfig; no ripple unless Chebyshev is chosen
    TranscodeConfig defaults;
    config_["transcode"] = {
        {"low_pass", defaults.low_pass},
        {"high_pass", defaults.high_pass},
        {"normalize", defaults.normalize},
        {"compress_ratio", defaults.compress_ratio},
        {"compress_threshold", defaults.compress_threshold},
        {"window_size", defaults.window_size},
        {"anti_aliasing_ratio", defaults.anti_aliasing_ratio},
        {"anti_aliasing_type", FilterDesigner::family_name(defaults.anti_aliasing_type)},
        {"filter_order", defaults.filter_order},
        {"force_mono", defaults.force_mono},
        {"strict", defaults.strict}
    };

    config_["logging"] = {
        {"level", "info"},
        {"file", ""},
        {"max_size", 10485760}, // 10MB
        {"rotate", true}
    };
}

bool ConfigManager::merge(const json& loaded, const std::string& origin) {
    if (!loaded.is_object()) {
        last_error_ = origin + ": top level must be a JSON object";
        Logger::error("Config", last_error_);
        return false;
    }

    for (const auto& section : {"transcode", "logging"}) {
        if (loaded.contains(section) && !loaded[section].is_object()) {
            last_error_ = origin + ": section \"" + section + "\" must be an object";
            Logger::error("Config", last_error_);
            return false;
        }
    }

    config_.merge_patch(loaded);
    last_error_.clear();
    return true;
}

bool ConfigManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "could not open config file: " + filename;
        Logger::error("Config", last_error_);
        return false;
    }

    try {
        json loaded;
        file >> loaded;
        if (!merge(loaded, filename)) {
            return false;
        }
    } catch (const json::exception& e) {
        last_error_ = "error parsing config file " + filename + ": " + e.what();
        Logger::error("Config", last_error_);
        return false;
    }

    Logger::info("Config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::load_from_string(const std::string& text) {
    try {
        return merge(json::parse(text), "<string>");
    } catch (const json::exception& e) {
        last_error_ = std::string("error parsing config: ") + e.what();
        Logger::error("Config", last_error_);
        return false;
    }
}

json ConfigManager::get_section(const std::string& section) const {
    auto it = config_.find(section);
    if (it != config_.end()) {
        return *it;
    }
    return json::object(); // Return empty object if section not found
}

bool ConfigManager::has_key(const std::string& section, const std::string& key) const {
    return config_.contains(section) && config_[section].contains(key);
}

bool ConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    try {
        if (has_key(section, key)) {
            return config_[section][key].get<bool>();
        }
    } catch (const json::exception& e) {
        Logger::warn("Config", "Error reading bool config " + section + "." + key + ": " + e.what());
    }
    return default_value;
}

int ConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    try {
        if (has_key(section, key)) {
            return config_[section][key].get<int>();
        }
    } catch (const json::exception& e) {
        Logger::warn("Config", "Error reading int config " + section + "." + key + ": " + e.what());
    }
    return default_value;
}

std::string ConfigManager::get_string(const std::string& section, const std::string& key,
                                      const std::string& default_value) const {
    try {
        if (has_key(section, key)) {
            return config_[section][key].get<std::string>();
        }
    } catch (const json::exception& e) {
        Logger::warn("Config", "Error reading string config " + section + "." + key + ": " + e.what());
    }
    return default_value;
}

void ConfigManager::apply_to(TranscodeConfig& config) const {
    const json transcode = get_section("transcode");

    for (auto it = transcode.begin(); it != transcode.end(); ++it) {
        if (kTranscodeKeys.count(it.key()) == 0) {
            Logger::warn("Config", "Unknown config key transcode." + it.key() + " ignored");
        }
    }

    if (transcode.contains("mode")) {
        const json& value = transcode["mode"];
        if (!value.is_string() || !TranscodeConfig::parse_mode(value.get<std::string>(), config.mode)) {
            throw ConfigError("config key transcode.mode must be \"wav2ulaw\" or \"ulaw2wav\", got " + value.dump());
        }
    }
    if (transcode.contains("sample_rate")) {
        config.sample_rate = require_integer(transcode, "sample_rate");
    }
    if (transcode.contains("low_pass")) {
        config.low_pass = require_number(transcode, "low_pass");
    }
    if (transcode.contains("high_pass")) {
        config.high_pass = require_number(transcode, "high_pass");
    }
    if (transcode.contains("normalize")) {
        config.normalize = require_number(transcode, "normalize");
    }
    if (transcode.contains("compress_ratio")) {
        config.compress_ratio = require_number(transcode, "compress_ratio");
    }
    if (transcode.contains("compress_threshold")) {
        config.compress_threshold = require_number(transcode, "compress_threshold");
    }
    if (transcode.contains("window_size")) {
        config.window_size = require_integer(transcode, "window_size");
    }
    if (transcode.contains("anti_aliasing_ratio")) {
        config.anti_aliasing_ratio = require_number(transcode, "anti_aliasing_ratio");
    }
    if (transcode.contains("anti_aliasing_type")) {
        const json& value = transcode["anti_aliasing_type"];
        bool parsed = false;
        if (value.is_number_integer()) {
            parsed = FilterDesigner::family_from_code(value.get<int>(), config.anti_aliasing_type);
        } else if (value.is_string()) {
            parsed = FilterDesigner::parse_family(value.get<std::string>(), config.anti_aliasing_type);
        }
        if (!parsed) {
            throw ConfigError("config key transcode.anti_aliasing_type must be 0-3 or one of "
                              "simple, butterworth, bessel, chebyshev; got " + value.dump());
        }
    }
    if (transcode.contains("filter_order")) {
        config.filter_order = require_integer(transcode, "filter_order");
    }
    if (transcode.contains("chebyshev_ripple")) {
        config.chebyshev_ripple = require_number(transcode, "chebyshev_ripple");
    }
    if (transcode.contains("force_mono")) {
        config.force_mono = require_bool(transcode, "force_mono");
    }
    if (transcode.contains("strict")) {
        config.strict = require_bool(transcode, "strict");
    }
}

LoggingSettings ConfigManager::logging_settings() const {
    LoggingSettings settings;
    settings.level = get_string("logging", "level", settings.level);
    settings.file = get_string("logging", "file", settings.file);
    int max_size = get_int("logging", "max_size", static_cast<int>(settings.max_size));
    if (max_size > 0) {
        settings.max_size = static_cast<size_t>(max_size);
    }
    settings.rotate = get_bool("logging", "rotate", settings.rotate);
    return settings;
}

} // namespace Wav2Ulaw
