#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <fftw3.h>
#include "audio_buffer.hpp"

namespace Wav2Ulaw {

/**
 * Level and spectral summary of one signal
 */
struct SignalStats {
    int sample_rate = 0;
    int channels = 0;
    uint64_t frames = 0;
    double duration = 0.0;      // seconds
    float peak = 0.0f;          // linear, 1.0 = full scale
    float rms = 0.0f;
    float peak_dbfs = 0.0f;
    float rms_dbfs = 0.0f;
    double dominant_frequency = 0.0; // Hz, 0 for silence
};

/**
 * Offline signal analyzer used for reports and verification
 */
class SignalAnalyzer {
public:
    static constexpr uint32_t kMaxFftSize = 65536;

    SignalAnalyzer();
    ~SignalAnalyzer();

    SignalAnalyzer(const SignalAnalyzer&) = delete;
    SignalAnalyzer& operator=(const SignalAnalyzer&) = delete;

    SignalStats analyze(const AudioBuffer& buffer);

    /**
     * Strongest spectral component of a mono signal.
     * The magnitude spectrum is averaged over Hann-windowed segments of
     * up to kMaxFftSize samples (half overlap) and the peak bin is refined
     * by parabolic interpolation. DC is ignored.
     */
    double dominant_frequency(const std::vector<float>& samples, int sample_rate);

private:
    // FFTW resources
    float* fft_input_;
    fftwf_complex* fft_output_;
    fftwf_plan fft_plan_;
    uint32_t fft_size_;

    std::vector<float> window_;

    void initialize_fft(uint32_t fft_size);
    void cleanup_fft();

    /**
     * Generate Hanning window over the first size samples of a frame
     */
    void generate_window(uint32_t size);

    static uint32_t fft_size_for(size_t length);
};

} // namespace Wav2Ulaw
