#include "filter_bank.hpp"
#include "utils/logger.hpp"
#include <sstream>
#include <stdexcept>

namespace Wav2Ulaw {

FilterBank::FilterBank(double sample_rate,
                       const std::optional<FilterSpec>& high_pass,
                       const std::optional<FilterSpec>& low_pass,
                       const FilterDesigner& designer)
    : sample_rate_(sample_rate) {

    if (high_pass && high_pass->cutoff_hz > 0.0) {
        FilterSpec spec = *high_pass;
        spec.response = FilterResponse::HighPass;
        high_pass_ = std::make_unique<FilterDesign>(designer.design(spec, sample_rate));
    }

    if (low_pass && low_pass->cutoff_hz > 0.0) {
        FilterSpec spec = *low_pass;
        spec.response = FilterResponse::LowPass;
        low_pass_ = std::make_unique<FilterDesign>(designer.design(spec, sample_rate));
    }

    std::ostringstream msg;
    msg << "Band limit at " << sample_rate << " Hz: high-pass ";
    if (high_pass_) {
        msg << high_pass_->spec().cutoff_hz << " Hz";
    } else {
        msg << "off";
    }
    msg << ", low-pass ";
    if (low_pass_) {
        msg << low_pass_->spec().cutoff_hz << " Hz";
    } else {
        msg << "off";
    }
    Logger::debug("FilterBank", msg.str());
}

BandLimitState FilterBank::create_state() const {
    BandLimitState state;
    if (high_pass_) {
        state.high_pass = high_pass_->create_state();
    }
    if (low_pass_) {
        state.low_pass = low_pass_->create_state();
    }
    return state;
}

void FilterBank::process(float* samples, size_t count, BandLimitState& state) const {
    if (high_pass_) {
        high_pass_->process(samples, count, state.high_pass);
    }
    if (low_pass_) {
        low_pass_->process(samples, count, state.low_pass);
    }
}

AudioBuffer FilterBank::apply(AudioBuffer buffer) const {
    if (buffer.channels != 1) {
        throw std::invalid_argument("FilterBank expects a mono buffer");
    }

    BandLimitState state = create_state();
    process(buffer.samples.data(), buffer.samples.size(), state);
    return buffer;
}

double FilterBank::magnitude_at(double frequency_hz) const {
    double magnitude = 1.0;
    if (high_pass_) {
        magnitude *= high_pass_->magnitude_at(frequency_hz);
    }
    if (low_pass_) {
        magnitude *= low_pass_->magnitude_at(frequency_hz);
    }
    return magnitude;
}

} // namespace Wav2Ulaw
