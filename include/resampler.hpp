#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "audio_buffer.hpp"
#include "filter_designer.hpp"

namespace Wav2Ulaw {

/**
 * Blackman-windowed sinc sampled at kPointsPerZeroCrossing points per
 * zero crossing over [0, window_size]. Immutable once built.
 */
class KernelTable {
public:
    static constexpr int kPointsPerZeroCrossing = 512;

    explicit KernelTable(int window_size);

    int window_size() const { return window_size_; }

    // Kernel value at distance t (in zero crossings), linearly interpolated
    double value(double t) const;

    // Shared table for a window size, built on first use
    static std::shared_ptr<const KernelTable> get(int window_size);

private:
    int window_size_;
    std::vector<double> values_;
};

struct ResamplerSettings {
    int window_size = 64;
    double anti_aliasing_ratio = 0.95;
    FilterFamily anti_aliasing_type = FilterFamily::Butterworth;
    int filter_order = 4;
    std::optional<double> chebyshev_ripple;
    bool strict = true;
};

/**
 * Band-limited sample rate conversion by windowed-sinc interpolation.
 *
 * When downsampling the sinc cutoff moves to anti_aliasing_ratio times
 * the output Nyquist, and for every family except Simple the input is
 * first low-passed by the matching IIR design at that cutoff.
 */
class Resampler {
public:
    explicit Resampler(const ResamplerSettings& settings);

    const ResamplerSettings& settings() const { return settings_; }

    AudioBuffer resample(AudioBuffer buffer, int target_rate) const;

    static size_t output_length(size_t frames, int source_rate, int target_rate);

private:
    ResamplerSettings settings_;

    void pre_filter(AudioBuffer& buffer, int target_rate) const;
};

} // namespace Wav2Ulaw
