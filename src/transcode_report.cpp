#include "transcode_report.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <json/json.h>

namespace Wav2Ulaw {
namespace TranscodeReport {

namespace {

Json::Value stats_to_json(const SignalStats& stats) {
    Json::Value value;
    value["sample_rate"] = stats.sample_rate;
    value["channels"] = stats.channels;
    value["frames"] = static_cast<Json::UInt64>(stats.frames);
    value["duration"] = stats.duration;
    value["peak"] = stats.peak;
    value["rms"] = stats.rms;
    value["peak_dbfs"] = stats.peak_dbfs;
    value["rms_dbfs"] = stats.rms_dbfs;
    value["dominant_frequency"] = stats.dominant_frequency;
    return value;
}

Json::Value config_to_json(const TranscodeConfig& config) {
    Json::Value value;
    value["sample_rate"] = config.sample_rate;
    value["force_mono"] = config.force_mono;
    value["low_pass"] = config.low_pass;
    value["high_pass"] = config.high_pass;
    value["normalize"] = config.normalize;
    value["compress_ratio"] = config.compress_ratio;
    value["compress_threshold"] = config.compress_threshold;
    value["window_size"] = config.window_size;
    value["anti_aliasing_ratio"] = config.anti_aliasing_ratio;
    value["anti_aliasing_type"] = FilterDesigner::family_name(config.anti_aliasing_type);
    value["filter_order"] = config.filter_order;
    if (config.chebyshev_ripple) {
        value["chebyshev_ripple"] = *config.chebyshev_ripple;
    } else {
        value["chebyshev_ripple"] = Json::Value(Json::nullValue);
    }
    value["strict"] = config.strict;
    return value;
}

} // namespace

std::string export_to_json(const TranscodeResult& result, const TranscodeConfig& config) {
    Json::Value root;

    root["mode"] = TranscodeConfig::mode_name(result.mode);
    root["input_path"] = result.input_path;
    root["output_path"] = result.output_path;
    root["input_bytes"] = static_cast<Json::UInt64>(result.input_bytes);
    root["output_bytes"] = static_cast<Json::UInt64>(result.output_bytes);
    root["size_ratio"] = result.size_ratio();
    root["elapsed_ms"] = result.elapsed_ms;
    root["input"] = stats_to_json(result.input_stats);
    root["output"] = stats_to_json(result.output_stats);
    root["config"] = config_to_json(config);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

void write(const std::string& path, const TranscodeResult& result, const TranscodeConfig& config) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw IOError(path, "cannot open report for writing");
    }

    file << export_to_json(result, config) << std::endl;
    if (!file) {
        throw IOError(path, "report write failed");
    }

    Logger::info("Report", "Analysis report written to " + path);
}

} // namespace TranscodeReport
} // namespace Wav2Ulaw
