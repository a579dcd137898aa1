#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "transcode_config.hpp"

namespace Wav2Ulaw {

using json = nlohmann::json;

struct LoggingSettings {
    std::string level = "info";
    std::string file;
    size_t max_size = 10 * 1024 * 1024;
    bool rotate = true;
};

/**
 * JSON configuration with a "transcode" and a "logging" section.
 * A loaded file is merged over the built-in defaults; keys set to null
 * in the file remove the default.
 */
class ConfigManager {
public:
    ConfigManager();

    bool load_from_file(const std::string& filename);
    bool load_from_string(const std::string& text);

    // Reason for the last failed load
    const std::string& last_error() const { return last_error_; }

    json get_section(const std::string& section) const;

    bool has_key(const std::string& section, const std::string& key) const;

    bool get_bool(const std::string& section, const std::string& key, bool default_value = false) const;
    int get_int(const std::string& section, const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& section, const std::string& key,
                           const std::string& default_value = "") const;

    /**
     * Overlay the "transcode" section onto config. Unlike the getters a
     * value of the wrong type is not replaced by a default: it throws
     * ConfigError naming the key.
     */
    void apply_to(TranscodeConfig& config) const;

    LoggingSettings logging_settings() const;

private:
    json config_;
    std::string last_error_;

    bool merge(const json& loaded, const std::string& origin);
};

} // namespace Wav2Ulaw
