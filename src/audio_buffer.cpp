#include "audio_buffer.hpp"
#include <algorithm>
#include <cmath>

namespace Wav2Ulaw {
namespace AudioUtils {

AudioBuffer int16ToFloat(const std::vector<int16_t>& data, int sample_rate, int channels) {
    AudioBuffer buffer;
    buffer.sample_rate = sample_rate;
    buffer.channels = channels;
    buffer.samples.resize(data.size());

    for (size_t i = 0; i < data.size(); ++i) {
        buffer.samples[i] = static_cast<float>(data[i]) / kPcm16FullScale;
    }

    return buffer;
}

int16_t floatToInt16(float sample) {
    float scaled = std::round(sample * kPcm16FullScale);
    scaled = std::max(-32768.0f, std::min(32767.0f, scaled));
    return static_cast<int16_t>(scaled);
}

std::vector<int16_t> floatToInt16(const AudioBuffer& buffer) {
    std::vector<int16_t> result(buffer.samples.size());
    for (size_t i = 0; i < buffer.samples.size(); ++i) {
        result[i] = floatToInt16(buffer.samples[i]);
    }
    return result;
}

AudioBuffer downmixToMono(const AudioBuffer& buffer) {
    if (buffer.channels <= 1) {
        return buffer;
    }

    const size_t frames = buffer.frames();
    AudioBuffer mono;
    mono.sample_rate = buffer.sample_rate;
    mono.channels = 1;
    mono.samples.resize(frames);

    for (size_t i = 0; i < frames; ++i) {
        double sum = 0.0;
        for (int ch = 0; ch < buffer.channels; ++ch) {
            sum += buffer.samples[i * buffer.channels + ch];
        }
        mono.samples[i] = static_cast<float>(sum / buffer.channels);
    }

    return mono;
}

float peakAmplitude(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float sample : samples) {
        peak = std::max(peak, std::abs(sample));
    }
    return peak;
}

float rmsAmplitude(const std::vector<float>& samples) {
    if (samples.empty()) {
        return 0.0f;
    }

    double sum_squares = 0.0;
    for (float sample : samples) {
        sum_squares += static_cast<double>(sample) * sample;
    }
    return static_cast<float>(std::sqrt(sum_squares / samples.size()));
}

void hardClip(std::vector<float>& samples, float limit) {
    for (auto& sample : samples) {
        sample = std::max(-limit, std::min(limit, sample));
    }
}

float linearToDb(float linear) {
    if (linear <= 0.0f) {
        return -120.0f;
    }
    return 20.0f * std::log10(linear);
}

float dbToLinear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

} // namespace AudioUtils
} // namespace Wav2Ulaw
