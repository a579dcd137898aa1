#include "resampler.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <map>
#include <mutex>
#include <sstream>

namespace Wav2Ulaw {

namespace {

const double kPi = 3.14159265358979323846;

std::mutex table_mutex;
std::map<int, std::shared_ptr<const KernelTable>> table_cache;

} // namespace

// KernelTable Implementation
KernelTable::KernelTable(int window_size) : window_size_(window_size) {
    const size_t points = static_cast<size_t>(window_size) * kPointsPerZeroCrossing;
    values_.resize(points + 2, 0.0);

    values_[0] = 1.0;
    for (size_t i = 1; i <= points; ++i) {
        double t = static_cast<double>(i) / kPointsPerZeroCrossing;
        double sinc = std::sin(kPi * t) / (kPi * t);
        double u = t / window_size;
        double window = 0.42 + 0.5 * std::cos(kPi * u) + 0.08 * std::cos(2.0 * kPi * u);
        values_[i] = sinc * window;
    }
    // values_[points + 1] stays zero so interpolation at the edge needs no branch
}

double KernelTable::value(double t) const {
    t = std::abs(t);
    if (t >= window_size_) {
        return 0.0;
    }

    double position = t * kPointsPerZeroCrossing;
    size_t index = static_cast<size_t>(position);
    double fraction = position - static_cast<double>(index);
    return values_[index] + fraction * (values_[index + 1] - values_[index]);
}

std::shared_ptr<const KernelTable> KernelTable::get(int window_size) {
    std::lock_guard<std::mutex> lock(table_mutex);

    auto it = table_cache.find(window_size);
    if (it != table_cache.end()) {
        return it->second;
    }

    std::shared_ptr<const KernelTable> table = std::make_shared<KernelTable>(window_size);
    table_cache[window_size] = table;
    Logger::debug("Resampler", "Built sinc table for window size " + std::to_string(window_size));
    return table;
}

// Resampler Implementation
Resampler::Resampler(const ResamplerSettings& settings) : settings_(settings) {
    if (settings_.window_size < 2) {
        throw ConfigError("resampler window size must be at least 2, got " +
                          std::to_string(settings_.window_size));
    }
    if (!(settings_.anti_aliasing_ratio > 0.0) || settings_.anti_aliasing_ratio > 1.0) {
        std::ostringstream error;
        error << "anti-aliasing ratio must be in (0, 1], got " << settings_.anti_aliasing_ratio;
        throw ConfigError(error.str());
    }
}

size_t Resampler::output_length(size_t frames, int source_rate, int target_rate) {
    if (source_rate <= 0 || target_rate <= 0) {
        return 0;
    }
    int64_t length = static_cast<int64_t>(frames) * target_rate / source_rate;
    return static_cast<size_t>(length);
}

void Resampler::pre_filter(AudioBuffer& buffer, int target_rate) const {
    FilterSpec spec;
    spec.family = settings_.anti_aliasing_type;
    spec.response = FilterResponse::LowPass;
    spec.cutoff_hz = settings_.anti_aliasing_ratio * target_rate / 2.0;
    spec.order = settings_.filter_order;
    spec.ripple_db = settings_.chebyshev_ripple;

    FilterDesigner designer(settings_.strict);
    FilterDesign design = designer.design(spec, buffer.sample_rate);

    const size_t frames = buffer.frames();
    std::vector<float> channel(frames);
    for (int ch = 0; ch < buffer.channels; ++ch) {
        for (size_t i = 0; i < frames; ++i) {
            channel[i] = buffer.samples[i * buffer.channels + ch];
        }

        FilterState state = design.create_state();
        design.process(channel, state);

        for (size_t i = 0; i < frames; ++i) {
            buffer.samples[i * buffer.channels + ch] = channel[i];
        }
    }
}

AudioBuffer Resampler::resample(AudioBuffer buffer, int target_rate) const {
    if (target_rate <= 0 || buffer.sample_rate <= 0) {
        throw ConfigError("sample rates must be positive");
    }

    if (target_rate == buffer.sample_rate) {
        return buffer;
    }

    auto start_time = std::chrono::steady_clock::now();

    const int source_rate = buffer.sample_rate;
    const bool downsampling = target_rate < source_rate;

    if (downsampling && settings_.anti_aliasing_type != FilterFamily::Simple) {
        pre_filter(buffer, target_rate);
    }

    std::shared_ptr<const KernelTable> table = KernelTable::get(settings_.window_size);

    // Sinc cutoff relative to the input Nyquist
    const double cutoff = downsampling
                              ? settings_.anti_aliasing_ratio * target_rate / source_rate
                              : 1.0;
    const double half_width = settings_.window_size / cutoff;
    const double step = static_cast<double>(source_rate) / target_rate;

    const int channels = std::max(1, buffer.channels);
    const size_t in_frames = buffer.frames();
    const size_t out_frames = output_length(in_frames, source_rate, target_rate);
    const int64_t last = static_cast<int64_t>(in_frames) - 1;

    AudioBuffer output;
    output.sample_rate = target_rate;
    output.channels = channels;
    output.samples.assign(out_frames * channels, 0.0f);

    std::vector<double> weights;
    for (size_t n = 0; n < out_frames; ++n) {
        const double position = static_cast<double>(n) * step;
        const int64_t first_tap = std::max<int64_t>(0, static_cast<int64_t>(std::ceil(position - half_width)));
        const int64_t last_tap = std::min<int64_t>(last, static_cast<int64_t>(std::floor(position + half_width)));
        if (last_tap < first_tap) {
            continue;
        }

        weights.resize(static_cast<size_t>(last_tap - first_tap + 1));
        double weight_sum = 0.0;
        for (int64_t i = first_tap; i <= last_tap; ++i) {
            double w = table->value((position - static_cast<double>(i)) * cutoff);
            weights[static_cast<size_t>(i - first_tap)] = w;
            weight_sum += w;
        }
        if (weight_sum == 0.0) {
            continue;
        }

        for (int ch = 0; ch < channels; ++ch) {
            double acc = 0.0;
            for (int64_t i = first_tap; i <= last_tap; ++i) {
                acc += weights[static_cast<size_t>(i - first_tap)] *
                       buffer.samples[static_cast<size_t>(i) * channels + ch];
            }
            output.samples[n * channels + ch] = static_cast<float>(acc / weight_sum);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    std::ostringstream msg;
    msg << source_rate << " Hz -> " << target_rate << " Hz, " << in_frames << " -> " << out_frames
        << " frames, window " << settings_.window_size << " (" << elapsed.count() << " ms)";
    Logger::debug("Resampler", msg.str());

    return output;
}

} // namespace Wav2Ulaw
