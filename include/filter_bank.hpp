#pragma once

#include <memory>
#include <optional>
#include "audio_buffer.hpp"
#include "filter_designer.hpp"

namespace Wav2Ulaw {

// Running state of both band-limiting stages, one per processed stream
struct BandLimitState {
    FilterState high_pass;
    FilterState low_pass;

    void reset() {
        high_pass.reset();
        low_pass.reset();
    }
};

/**
 * Telephone band limiting: high-pass to remove rumble, then low-pass
 * to keep the signal inside the 8 kHz channel.
 */
class FilterBank {
public:
    /**
     * Designs both stages once. A stage that is not given, or whose
     * cutoff is <= 0, is disabled.
     */
    FilterBank(double sample_rate,
               const std::optional<FilterSpec>& high_pass,
               const std::optional<FilterSpec>& low_pass,
               const FilterDesigner& designer = FilterDesigner());

    // Single pass over the whole buffer with zeroed state
    AudioBuffer apply(AudioBuffer buffer) const;

    BandLimitState create_state() const;

    // Chunked processing; pass the state returned by the previous chunk
    void process(float* samples, size_t count, BandLimitState& state) const;

    bool has_high_pass() const { return high_pass_ != nullptr; }
    bool has_low_pass() const { return low_pass_ != nullptr; }
    double sample_rate() const { return sample_rate_; }

    // Combined response magnitude of the enabled stages
    double magnitude_at(double frequency_hz) const;

private:
    double sample_rate_;
    std::unique_ptr<FilterDesign> high_pass_;
    std::unique_ptr<FilterDesign> low_pass_;
};

} // namespace Wav2Ulaw
