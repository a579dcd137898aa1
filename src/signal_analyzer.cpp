#include "signal_analyzer.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace Wav2Ulaw {

SignalAnalyzer::SignalAnalyzer()
    : fft_input_(nullptr)
    , fft_output_(nullptr)
    , fft_plan_(nullptr)
    , fft_size_(0)
{
}

SignalAnalyzer::~SignalAnalyzer() {
    cleanup_fft();
}

void SignalAnalyzer::initialize_fft(uint32_t fft_size) {
    if (fft_size_ == fft_size && fft_input_ != nullptr) {
        return; // Already initialized with correct size
    }

    cleanup_fft();

    fft_size_ = fft_size;
    fft_input_ = fftwf_alloc_real(fft_size_);
    fft_output_ = fftwf_alloc_complex(fft_size_ / 2 + 1);

    fft_plan_ = fftwf_plan_dft_r2c_1d(
        static_cast<int>(fft_size_),
        fft_input_,
        fft_output_,
        FFTW_ESTIMATE
    );
}

void SignalAnalyzer::cleanup_fft() {
    if (fft_plan_) {
        fftwf_destroy_plan(fft_plan_);
        fft_plan_ = nullptr;
    }

    if (fft_input_) {
        fftwf_free(fft_input_);
        fft_input_ = nullptr;
    }

    if (fft_output_) {
        fftwf_free(fft_output_);
        fft_output_ = nullptr;
    }

    fft_size_ = 0;
}

void SignalAnalyzer::generate_window(uint32_t size) {
    window_.resize(size);

    if (size == 1) {
        window_[0] = 1.0f;
        return;
    }

    const double pi = 3.14159265358979323846;
    for (uint32_t i = 0; i < size; ++i) {
        window_[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * pi * i / (size - 1))));
    }
}

uint32_t SignalAnalyzer::fft_size_for(size_t length) {
    size_t target = std::min<size_t>(length, kMaxFftSize);
    uint32_t power_of_2 = 1;
    while (power_of_2 < target) {
        power_of_2 <<= 1;
    }
    return power_of_2;
}

double SignalAnalyzer::dominant_frequency(const std::vector<float>& samples, int sample_rate) {
    if (samples.size() < 4 || sample_rate <= 0 || AudioUtils::peakAmplitude(samples) <= 0.0f) {
        return 0.0;
    }

    initialize_fft(fft_size_for(samples.size()));

    const uint32_t frame_length = static_cast<uint32_t>(std::min<size_t>(samples.size(), fft_size_));
    const uint32_t hop = std::max<uint32_t>(1, frame_length / 2);
    const uint32_t num_bins = fft_size_ / 2 + 1;
    generate_window(frame_length);

    std::vector<double> magnitude(num_bins, 0.0);
    size_t segments = 0;

    for (size_t start = 0; start + frame_length <= samples.size(); start += hop) {
        std::fill(fft_input_, fft_input_ + fft_size_, 0.0f);
        for (uint32_t i = 0; i < frame_length; ++i) {
            fft_input_[i] = samples[start + i] * window_[i];
        }

        fftwf_execute(fft_plan_);

        for (uint32_t k = 0; k < num_bins; ++k) {
            double real = fft_output_[k][0];
            double imag = fft_output_[k][1];
            magnitude[k] += std::sqrt(real * real + imag * imag);
        }
        ++segments;
    }

    if (segments == 0) {
        return 0.0;
    }

    uint32_t peak_bin = 1; // Skip DC component
    for (uint32_t k = 2; k < num_bins; ++k) {
        if (magnitude[k] > magnitude[peak_bin]) {
            peak_bin = k;
        }
    }

    // Parabolic interpolation on log magnitude
    double offset = 0.0;
    if (peak_bin > 1 && peak_bin + 1 < num_bins) {
        const double floor = 1e-20;
        double a = std::log(magnitude[peak_bin - 1] + floor);
        double b = std::log(magnitude[peak_bin] + floor);
        double c = std::log(magnitude[peak_bin + 1] + floor);
        double denominator = a - 2.0 * b + c;
        if (denominator != 0.0) {
            offset = std::max(-0.5, std::min(0.5, 0.5 * (a - c) / denominator));
        }
    }

    double bin_size = static_cast<double>(sample_rate) / fft_size_;
    return (peak_bin + offset) * bin_size;
}

SignalStats SignalAnalyzer::analyze(const AudioBuffer& buffer) {
    SignalStats stats;
    stats.sample_rate = buffer.sample_rate;
    stats.channels = buffer.channels;
    stats.frames = buffer.frames();
    stats.duration = buffer.duration();
    stats.peak = AudioUtils::peakAmplitude(buffer.samples);
    stats.rms = AudioUtils::rmsAmplitude(buffer.samples);
    stats.peak_dbfs = AudioUtils::linearToDb(stats.peak);
    stats.rms_dbfs = AudioUtils::linearToDb(stats.rms);

    if (buffer.channels > 1) {
        AudioBuffer mono = AudioUtils::downmixToMono(buffer);
        stats.dominant_frequency = dominant_frequency(mono.samples, buffer.sample_rate);
    } else {
        stats.dominant_frequency = dominant_frequency(buffer.samples, buffer.sample_rate);
    }

    std::ostringstream msg;
    msg << "peak " << stats.peak_dbfs << " dBFS, rms " << stats.rms_dbfs
        << " dBFS, dominant " << stats.dominant_frequency << " Hz";
    Logger::debug("SignalAnalyzer", msg.str());

    return stats;
}

} // namespace Wav2Ulaw
