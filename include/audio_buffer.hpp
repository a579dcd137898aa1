#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace Wav2Ulaw {

// Linear sample container shared by all pipeline stages.
// Samples are interleaved floats with full scale at 1.0.
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate = 0;
    int channels = 1;

    AudioBuffer() = default;
    AudioBuffer(std::vector<float> data, int sr, int ch = 1)
        : samples(std::move(data)), sample_rate(sr), channels(ch) {}

    size_t frames() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
    }

    bool empty() const { return samples.empty(); }
};

namespace AudioUtils {

    // Scale factor between int16 PCM and float samples
    constexpr float kPcm16FullScale = 32767.0f;

    // Convert 16-bit PCM to float samples
    AudioBuffer int16ToFloat(const std::vector<int16_t>& data, int sample_rate, int channels = 1);

    // Round to 16-bit PCM; values outside full scale are clamped, never wrapped
    std::vector<int16_t> floatToInt16(const AudioBuffer& buffer);

    int16_t floatToInt16(float sample);

    // Average all channels of an interleaved buffer into one
    AudioBuffer downmixToMono(const AudioBuffer& buffer);

    // Largest absolute sample value
    float peakAmplitude(const std::vector<float>& samples);

    float rmsAmplitude(const std::vector<float>& samples);

    // Clamp every sample into [-limit, limit]
    void hardClip(std::vector<float>& samples, float limit = 1.0f);

    float linearToDb(float linear);
    float dbToLinear(float db);
}

} // namespace Wav2Ulaw
