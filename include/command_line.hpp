#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "transcode_config.hpp"

namespace Wav2Ulaw {

namespace ExitCode {
    constexpr int kSuccess = 0;
    constexpr int kFailure = 1;
    constexpr int kConfig = 2;
    constexpr int kIO = 3;
    constexpr int kFormat = 4;
}

struct CommandLineOptions {
    TranscodeConfig config;
    LoggingSettings logging;
    std::string input_path;
    std::string output_path;
    std::string config_path;
    std::string report_path;
    bool show_help = false;
    bool verbose = false;
    bool quiet = false;
};

/**
 * Build the options of one invocation: defaults, then the --config file,
 * then every other flag. args[0] is the program name.
 * Throws ConfigError for unknown flags, missing or malformed values and
 * an unreadable config file. Value ranges are checked later by
 * TranscodeConfig::validate().
 */
CommandLineOptions parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& program_name);

/**
 * Full CLI: parse, configure logging, transcode, write the report.
 * Returns the process exit code; never throws.
 */
int run_command_line(const std::vector<std::string>& args);

} // namespace Wav2Ulaw
