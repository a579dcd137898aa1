#include "command_line.hpp"
#include "transcode_error.hpp"
#include "transcode_report.hpp"
#include "transcoder.hpp"
#include "utils/logger.hpp"
#include <filesystem>
#include <iostream>

namespace Wav2Ulaw {

namespace {

int parse_int(const std::string& flag, const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    throw ConfigError(flag + " expects an integer, got \"" + text + "\"");
}

double parse_double(const std::string& flag, const std::string& text) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ConfigError(flag + " expects a number, got \"" + text + "\"");
}

bool is_switch(const std::string& flag) {
    return flag == "--no-mono" || flag == "--lenient" || flag == "--verbose" ||
           flag == "--quiet" || flag == "--help" || flag == "-h";
}

// One flag with its value, "--name value" or "--name=value"
struct Argument {
    std::string flag;
    std::string value;
    bool has_value = false;
};

std::vector<Argument> split_arguments(const std::vector<std::string>& args) {
    std::vector<Argument> result;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        Argument parsed;

        size_t equals = arg.find('=');
        if (arg.rfind("--", 0) == 0 && equals != std::string::npos) {
            parsed.flag = arg.substr(0, equals);
            parsed.value = arg.substr(equals + 1);
            parsed.has_value = true;
        } else {
            parsed.flag = arg;
        }

        if (parsed.flag.rfind("-", 0) != 0) {
            throw ConfigError("Unexpected argument " + arg);
        }

        if (!is_switch(parsed.flag) && !parsed.has_value) {
            if (i + 1 >= args.size()) {
                throw ConfigError(parsed.flag + " requires a value");
            }
            parsed.value = args[++i];
            parsed.has_value = true;
        } else if (is_switch(parsed.flag) && parsed.has_value) {
            throw ConfigError(parsed.flag + " does not take a value");
        }

        result.push_back(parsed);
    }

    return result;
}

void configure_logging(const CommandLineOptions& options) {
    Logger::Level level;
    if (!Logger::parse_level(options.logging.level, level)) {
        throw ConfigError("unknown log level \"" + options.logging.level + "\"");
    }
    if (options.verbose) {
        level = Logger::Level::DEBUG;
    } else if (options.quiet) {
        level = Logger::Level::WARN;
    }
    Logger::set_level(level);

    if (!options.logging.file.empty()) {
        Logger::set_log_file(options.logging.file, options.logging.max_size, options.logging.rotate);
    }
}

std::string program_name_of(const std::vector<std::string>& args) {
    return args.empty() ? "wav2ulaw" : std::filesystem::path(args[0]).filename().string();
}

} // namespace

void print_usage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " --input <path> --output <path> --mode {wav2ulaw|ulaw2wav}"
        << " --sample-rate <Hz> [options]" << std::endl;
    out << std::endl;
    out << "Required:" << std::endl;
    out << "  --input <path>                 Input file (16-bit PCM WAV or raw μ-law)" << std::endl;
    out << "  --output <path>                Output file (raw μ-law or 16-bit PCM WAV)" << std::endl;
    out << "  --mode <mode>                  wav2ulaw or ulaw2wav" << std::endl;
    out << "  --sample-rate <Hz>             ulaw2wav: output rate; wav2ulaw: input rate (0 = WAV header)" << std::endl;
    out << std::endl;
    out << "Processing:" << std::endl;
    out << "  --low-pass <Hz>                Low-pass cutoff, <= 0 disables (default: 3400)" << std::endl;
    out << "  --high-pass <Hz>               High-pass cutoff, <= 0 disables (default: 200)" << std::endl;
    out << "  --normalize <0..1>             Target peak level (default: 0.95)" << std::endl;
    out << "  --compress-ratio <ratio>       Compression ratio, 1 disables (default: 1.5)" << std::endl;
    out << "  --compress-threshold <0..1>    Compression threshold (default: 0.5)" << std::endl;
    out << "  --window-size <n>              Resampler sinc half-width in zero crossings (default: 64)" << std::endl;
    out << "  --anti-aliasing-ratio <0..1>   Fraction of the output Nyquist kept (default: 0.95)" << std::endl;
    out << "  --anti-aliasing-type <type>    0=Simple 1=Butterworth 2=Bessel 3=Chebyshev (default: 1)" << std::endl;
    out << "  --filter-order <2|4|6>         Anti-aliasing filter order (default: 4)" << std::endl;
    out << "  --chebyshev-ripple <dB>        Passband ripple, Chebyshev only" << std::endl;
    out << "  --no-mono                      Reject multi-channel input instead of downmixing" << std::endl;
    out << "  --lenient                      Ignore inconsistent options with a warning" << std::endl;
    out << std::endl;
    out << "Other:" << std::endl;
    out << "  --config <file.json>           Load settings; command-line flags take precedence" << std::endl;
    out << "  --report <file.json>           Write an analysis report after a successful run" << std::endl;
    out << "  --log-file <path>              Also append log lines to this file" << std::endl;
    out << "  --verbose | --quiet            Debug output or warnings only" << std::endl;
    out << "  -h, --help                     Show this help message" << std::endl;
    out << std::endl;
    out << "Examples:" << std::endl;
    out << "  " << program_name << " --input speech.wav --output speech.ulaw --mode wav2ulaw --sample-rate 0" << std::endl;
    out << "  " << program_name << " --input speech.ulaw --output speech.wav --mode ulaw2wav --sample-rate 16000" << std::endl;
}

CommandLineOptions parse_command_line(const std::vector<std::string>& args) {
    CommandLineOptions options;
    std::vector<Argument> arguments = split_arguments(args);

    // First pass: help and the config file, which every other flag overrides
    for (const auto& arg : arguments) {
        if (arg.flag == "--help" || arg.flag == "-h") {
            options.show_help = true;
            return options;
        }
        if (arg.flag == "--config") {
            options.config_path = arg.value;
        }
    }

    ConfigManager config_manager;
    if (!options.config_path.empty()) {
        if (!config_manager.load_from_file(options.config_path)) {
            throw ConfigError(config_manager.last_error());
        }
    }
    config_manager.apply_to(options.config);
    options.logging = config_manager.logging_settings();

    // The config file may supply the two required settings
    bool have_mode = config_manager.has_key("transcode", "mode");
    bool have_sample_rate = config_manager.has_key("transcode", "sample_rate");
    bool family_flag = false;
    bool ripple_flag = false;

    for (const auto& arg : arguments) {
        const std::string& flag = arg.flag;
        const std::string& value = arg.value;

        if (flag == "--config") {
            continue;
        } else if (flag == "--input") {
            options.input_path = value;
        } else if (flag == "--output") {
            options.output_path = value;
        } else if (flag == "--mode") {
            if (!TranscodeConfig::parse_mode(value, options.config.mode)) {
                throw ConfigError("--mode must be wav2ulaw or ulaw2wav, got \"" + value + "\"");
            }
            have_mode = true;
        } else if (flag == "--sample-rate") {
            options.config.sample_rate = parse_int(flag, value);
            have_sample_rate = true;
        } else if (flag == "--low-pass") {
            options.config.low_pass = parse_double(flag, value);
        } else if (flag == "--high-pass") {
            options.config.high_pass = parse_double(flag, value);
        } else if (flag == "--normalize") {
            options.config.normalize = parse_double(flag, value);
        } else if (flag == "--compress-ratio") {
            options.config.compress_ratio = parse_double(flag, value);
        } else if (flag == "--compress-threshold") {
            options.config.compress_threshold = parse_double(flag, value);
        } else if (flag == "--window-size") {
            options.config.window_size = parse_int(flag, value);
        } else if (flag == "--anti-aliasing-ratio") {
            options.config.anti_aliasing_ratio = parse_double(flag, value);
        } else if (flag == "--anti-aliasing-type") {
            if (!FilterDesigner::parse_family(value, options.config.anti_aliasing_type)) {
                throw ConfigError("--anti-aliasing-type must be 0 (Simple), 1 (Butterworth), "
                                  "2 (Bessel) or 3 (Chebyshev), got \"" + value + "\"");
            }
            family_flag = true;
        } else if (flag == "--filter-order") {
            options.config.filter_order = parse_int(flag, value);
        } else if (flag == "--chebyshev-ripple") {
            options.config.chebyshev_ripple = parse_double(flag, value);
            ripple_flag = true;
        } else if (flag == "--no-mono") {
            options.config.force_mono = false;
        } else if (flag == "--lenient") {
            options.config.strict = false;
        } else if (flag == "--report") {
            options.report_path = value;
        } else if (flag == "--log-file") {
            options.logging.file = value;
        } else if (flag == "--verbose") {
            options.verbose = true;
        } else if (flag == "--quiet") {
            options.quiet = true;
        } else {
            throw ConfigError("Unknown argument " + flag);
        }
    }

    // A ripple from the config file belongs to the family chosen there
    if (family_flag && !ripple_flag && options.config.chebyshev_ripple &&
        options.config.anti_aliasing_type != FilterFamily::Chebyshev1) {
        options.config.chebyshev_ripple.reset();
    }

    if (options.verbose && options.quiet) {
        throw ConfigError("--verbose and --quiet are mutually exclusive");
    }
    if (options.input_path.empty()) {
        throw ConfigError("--input is required");
    }
    if (options.output_path.empty()) {
        throw ConfigError("--output is required");
    }
    if (!have_mode) {
        throw ConfigError("--mode is required");
    }
    if (!have_sample_rate) {
        throw ConfigError("--sample-rate is required");
    }
    if (std::filesystem::path(options.input_path).lexically_normal() ==
        std::filesystem::path(options.output_path).lexically_normal()) {
        throw ConfigError("--input and --output must name different files");
    }

    return options;
}

int run_command_line(const std::vector<std::string>& args) {
    const std::string program_name = program_name_of(args);

    try {
        CommandLineOptions options = parse_command_line(args);
        if (options.show_help) {
            print_usage(std::cout, program_name);
            return ExitCode::kSuccess;
        }

        configure_logging(options);

        // Validates the whole configuration before any file is opened
        Transcoder transcoder(options.config);
        TranscodeResult result = transcoder.run(options.input_path, options.output_path);

        // The output is already committed; a report failure does not undo it
        if (!options.report_path.empty()) {
            try {
                TranscodeReport::write(options.report_path, result, options.config);
            } catch (const IOError& e) {
                Logger::warn("Report", std::string(e.what()) + "; output was written to " + options.output_path);
            }
        }

        return ExitCode::kSuccess;
    } catch (const ConfigError& e) {
        Logger::error("Configuration error: " + std::string(e.what()));
        Logger::error("Run " + program_name + " --help for usage");
        return ExitCode::kConfig;
    } catch (const IOError& e) {
        Logger::error("I/O error: " + std::string(e.what()));
        return ExitCode::kIO;
    } catch (const FormatError& e) {
        Logger::error("Format error: " + std::string(e.what()));
        return ExitCode::kFormat;
    } catch (const std::exception& e) {
        Logger::error("Fatal error: " + std::string(e.what()));
        return ExitCode::kFailure;
    }
}

} // namespace Wav2Ulaw
