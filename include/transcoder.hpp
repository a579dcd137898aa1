#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "audio_buffer.hpp"
#include "dynamics_processor.hpp"
#include "filter_designer.hpp"
#include "resampler.hpp"
#include "signal_analyzer.hpp"
#include "transcode_config.hpp"

namespace Wav2Ulaw {

// What one file-level run did, for logging and the JSON report
struct TranscodeResult {
    TranscodeMode mode = TranscodeMode::WavToUlaw;
    std::string input_path;
    std::string output_path;
    uint64_t input_bytes = 0;
    uint64_t output_bytes = 0;
    SignalStats input_stats;
    SignalStats output_stats;
    double elapsed_ms = 0.0;

    double size_ratio() const {
        return input_bytes > 0 ? static_cast<double>(output_bytes) / input_bytes : 0.0;
    }
};

/**
 * The transcoding pipeline.
 *
 * wav2ulaw: mono downmix, band limiting, dynamics, resampling to 8 kHz,
 * output level re-targeting, μ-law encoding.
 * ulaw2wav: μ-law decoding and resampling to the configured rate.
 */
class Transcoder {
public:
    // Throws ConfigError before anything else happens
    explicit Transcoder(const TranscodeConfig& config);

    const TranscodeConfig& config() const { return config_; }

    std::vector<uint8_t> wav_to_ulaw(AudioBuffer input) const;
    AudioBuffer ulaw_to_wav(const std::vector<uint8_t>& codes) const;

    /**
     * Read input_path, transcode per config().mode and commit the result
     * to output_path. Nothing is written when any stage fails.
     */
    TranscodeResult run(const std::string& input_path, const std::string& output_path) const;

private:
    TranscodeConfig config_;
    FilterDesigner designer_;
    DynamicsProcessor dynamics_;
    Resampler resampler_;

    static const TranscodeConfig& validated(const TranscodeConfig& config);

    AudioBuffer to_mono(AudioBuffer input) const;
};

} // namespace Wav2Ulaw
