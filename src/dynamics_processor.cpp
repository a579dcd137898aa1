#include "dynamics_processor.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <sstream>

namespace Wav2Ulaw {

DynamicsProcessor::DynamicsProcessor(const DynamicsSettings& settings)
    : settings_(settings) {
    threshold_db_ = settings_.threshold > 0.0f
                        ? AudioUtils::linearToDb(settings_.threshold)
                        : kSilenceFloorDb;
}

float DynamicsProcessor::gain_curve_db(float input_db) const {
    const float ratio = settings_.ratio;
    const float knee = settings_.knee_width_db;
    const float overshoot = input_db - threshold_db_;

    if (2.0f * overshoot < -knee) {
        return input_db;
    }

    if (knee > 0.0f && 2.0f * std::abs(overshoot) <= knee) {
        float distance = overshoot + knee / 2.0f;
        return input_db + (1.0f / ratio - 1.0f) * distance * distance / (2.0f * knee);
    }

    return threshold_db_ + overshoot / ratio;
}

void DynamicsProcessor::normalize(std::vector<float>& samples) const {
    float peak = AudioUtils::peakAmplitude(samples);
    if (peak <= 0.0f) {
        return;
    }

    float gain = settings_.normalize / peak;
    for (auto& sample : samples) {
        sample *= gain;
    }
}

void DynamicsProcessor::compress(std::vector<float>& samples) const {
    if (settings_.ratio == 1.0f) {
        return;
    }

    for (auto& sample : samples) {
        float magnitude = std::abs(sample);
        if (magnitude <= 0.0f) {
            continue;
        }

        float level_db = AudioUtils::linearToDb(magnitude);
        float gain_db = gain_curve_db(level_db) - level_db;
        sample *= AudioUtils::dbToLinear(gain_db);
    }
}

AudioBuffer DynamicsProcessor::apply(AudioBuffer buffer) const {
    float input_peak = AudioUtils::peakAmplitude(buffer.samples);
    if (input_peak <= 0.0f) {
        Logger::debug("DynamicsProcessor", "Silent buffer, skipping dynamics");
        return buffer;
    }

    normalize(buffer.samples);

    if (settings_.ratio != 1.0f) {
        compress(buffer.samples);
        // Make-up gain
        normalize(buffer.samples);
    }

    AudioUtils::hardClip(buffer.samples);

    std::ostringstream msg;
    msg << "Peak " << input_peak << " -> " << AudioUtils::peakAmplitude(buffer.samples)
        << " (ratio " << settings_.ratio << ", threshold " << threshold_db_ << " dB)";
    Logger::debug("DynamicsProcessor", msg.str());

    return buffer;
}

} // namespace Wav2Ulaw
