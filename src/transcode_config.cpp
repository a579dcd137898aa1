#include "transcode_config.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <sstream>

namespace Wav2Ulaw {

namespace {

template <typename T>
void reject(const std::string& name, const T& value, const std::string& expected) {
    std::ostringstream error;
    error << "invalid " << name << " " << value << ": expected " << expected;
    throw ConfigError(error.str());
}

} // namespace

void TranscodeConfig::validate() const {
    if (mode == TranscodeMode::UlawToWav) {
        if (sample_rate <= 0) {
            reject("sample rate", sample_rate, "a positive output rate for ulaw2wav");
        }
    } else if (sample_rate < 0) {
        reject("sample rate", sample_rate, "0 (use the WAV header) or a positive rate");
    }

    if (!std::isfinite(low_pass)) {
        reject("low-pass cutoff", low_pass, "a finite frequency in Hz");
    }
    if (!std::isfinite(high_pass)) {
        reject("high-pass cutoff", high_pass, "a finite frequency in Hz");
    }
    if (low_pass > 0.0 && high_pass > 0.0 && low_pass <= high_pass) {
        std::ostringstream error;
        error << "low-pass cutoff " << low_pass << " Hz must be above high-pass cutoff "
              << high_pass << " Hz";
        throw ConfigError(error.str());
    }

    if (!(normalize > 0.0 && normalize <= 1.0)) {
        reject("normalize level", normalize, "a value in (0, 1]");
    }
    if (!(compress_ratio >= 1.0) || !std::isfinite(compress_ratio)) {
        reject("compression ratio", compress_ratio, "a value >= 1.0");
    }
    if (!(compress_threshold >= 0.0 && compress_threshold <= 1.0)) {
        reject("compression threshold", compress_threshold, "a value in [0, 1]");
    }

    if (window_size < 2) {
        reject("window size", window_size, "an integer >= 2");
    }
    if (!(anti_aliasing_ratio > 0.0 && anti_aliasing_ratio <= 1.0)) {
        reject("anti-aliasing ratio", anti_aliasing_ratio, "a value in (0, 1]");
    }

    if (filter_order < 2 || filter_order > kMaxFilterOrder || filter_order % 2 != 0) {
        reject("filter order", filter_order, "2, 4 or 6");
    }

    if (anti_aliasing_type == FilterFamily::Chebyshev1) {
        if (!chebyshev_ripple) {
            throw ConfigError("Chebyshev anti-aliasing requires --chebyshev-ripple");
        }
    } else if (chebyshev_ripple) {
        if (strict) {
            throw ConfigError("--chebyshev-ripple is only valid with the Chebyshev anti-aliasing type (" +
                              FilterDesigner::family_name(anti_aliasing_type) + " selected)");
        }
        Logger::warn("Config", "Ignoring chebyshev ripple for " +
                     FilterDesigner::family_name(anti_aliasing_type) + " anti-aliasing");
    }

    if (chebyshev_ripple && anti_aliasing_type == FilterFamily::Chebyshev1) {
        double ripple = *chebyshev_ripple;
        if (!(ripple > 0.0 && ripple <= kMaxRippleDb)) {
            std::ostringstream expected;
            expected << "a value in (0, " << kMaxRippleDb << "] dB";
            reject("chebyshev ripple", ripple, expected.str());
        }
    }
}

DynamicsSettings TranscodeConfig::dynamics_settings() const {
    DynamicsSettings settings;
    settings.normalize = static_cast<float>(normalize);
    settings.ratio = static_cast<float>(compress_ratio);
    settings.threshold = static_cast<float>(compress_threshold);
    return settings;
}

ResamplerSettings TranscodeConfig::resampler_settings() const {
    ResamplerSettings settings;
    settings.window_size = window_size;
    settings.anti_aliasing_ratio = anti_aliasing_ratio;
    settings.anti_aliasing_type = anti_aliasing_type;
    settings.filter_order = filter_order;
    // A ripple that survived validation on another family is dropped here
    if (anti_aliasing_type == FilterFamily::Chebyshev1) {
        settings.chebyshev_ripple = chebyshev_ripple;
    }
    settings.strict = strict;
    return settings;
}

std::optional<FilterSpec> TranscodeConfig::high_pass_spec() const {
    if (high_pass <= 0.0) {
        return std::nullopt;
    }
    FilterSpec spec;
    spec.family = FilterFamily::Simple;
    spec.response = FilterResponse::HighPass;
    spec.cutoff_hz = high_pass;
    spec.order = 2;
    return spec;
}

std::optional<FilterSpec> TranscodeConfig::low_pass_spec() const {
    if (low_pass <= 0.0) {
        return std::nullopt;
    }
    FilterSpec spec;
    spec.family = FilterFamily::Simple;
    spec.response = FilterResponse::LowPass;
    spec.cutoff_hz = low_pass;
    spec.order = 2;
    return spec;
}

std::string TranscodeConfig::mode_name(TranscodeMode mode) {
    return mode == TranscodeMode::WavToUlaw ? "wav2ulaw" : "ulaw2wav";
}

bool TranscodeConfig::parse_mode(const std::string& text, TranscodeMode& mode) {
    if (text == "wav2ulaw") {
        mode = TranscodeMode::WavToUlaw;
        return true;
    }
    if (text == "ulaw2wav") {
        mode = TranscodeMode::UlawToWav;
        return true;
    }
    return false;
}

} // namespace Wav2Ulaw
