#pragma once

#include <optional>
#include <string>
#include "dynamics_processor.hpp"
#include "filter_designer.hpp"
#include "resampler.hpp"

namespace Wav2Ulaw {

enum class TranscodeMode {
    WavToUlaw,
    UlawToWav
};

/**
 * Every tunable of one transcoding run. Built once from defaults, the
 * config file and the command line, validated, then treated as read-only.
 */
struct TranscodeConfig {
    TranscodeMode mode = TranscodeMode::WavToUlaw;

    // ulaw2wav: output rate. wav2ulaw: input rate, 0 = take it from the WAV header
    int sample_rate = 0;
    bool force_mono = true;

    double low_pass = 3400.0;     // Hz, <= 0 disables
    double high_pass = 200.0;     // Hz, <= 0 disables

    double normalize = 0.95;
    double compress_ratio = 1.5;
    double compress_threshold = 0.5;

    int window_size = 64;
    double anti_aliasing_ratio = 0.95;
    FilterFamily anti_aliasing_type = FilterFamily::Butterworth;
    int filter_order = 4;
    std::optional<double> chebyshev_ripple;

    bool strict = true;

    static constexpr int kMaxFilterOrder = 6;
    static constexpr double kMaxRippleDb = 3.0;

    /**
     * Throws ConfigError on the first out-of-range or inconsistent value.
     */
    void validate() const;

    DynamicsSettings dynamics_settings() const;
    ResamplerSettings resampler_settings() const;

    // Band-limiting stages (Simple family, one RC section); empty when disabled
    std::optional<FilterSpec> high_pass_spec() const;
    std::optional<FilterSpec> low_pass_spec() const;

    static std::string mode_name(TranscodeMode mode);
    static bool parse_mode(const std::string& text, TranscodeMode& mode);
};

} // namespace Wav2Ulaw
