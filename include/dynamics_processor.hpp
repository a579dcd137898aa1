#pragma once

#include <vector>
#include "audio_buffer.hpp"

namespace Wav2Ulaw {

struct DynamicsSettings {
    float normalize = 0.95f;      // target peak, fraction of full scale
    float ratio = 1.5f;           // compression ratio, >= 1
    float threshold = 0.5f;       // linear threshold, 0 means -90 dBFS
    float knee_width_db = 6.0f;
};

/**
 * Peak normalization followed by soft-knee downward compression and
 * make-up gain back to the normalize level.
 */
class DynamicsProcessor {
public:
    static constexpr float kSilenceFloorDb = -90.0f;

    explicit DynamicsProcessor(const DynamicsSettings& settings);

    const DynamicsSettings& settings() const { return settings_; }

    AudioBuffer apply(AudioBuffer buffer) const;

    // Scale so the peak equals settings().normalize; silence is left alone
    void normalize(std::vector<float>& samples) const;

    void compress(std::vector<float>& samples) const;

    /**
     * Static gain curve in dB: input level -> output level.
     */
    float gain_curve_db(float input_db) const;

private:
    DynamicsSettings settings_;
    float threshold_db_;
};

} // namespace Wav2Ulaw
