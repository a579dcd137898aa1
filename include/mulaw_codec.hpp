#pragma once

#include <cstdint>
#include <vector>
#include "audio_buffer.hpp"

namespace Wav2Ulaw {

/**
 * ITU-T G.711 μ-law companding.
 *
 * A 16-bit linear sample is biased by 0x84, clipped at 32635 and stored as
 * sign + 3-bit segment + 4-bit mantissa with all bits inverted, so 0xFF and
 * 0x7F both decode to silence.
 */
class MuLawCodec {
public:
    static constexpr int kBias = 0x84;
    static constexpr int kClip = 32635;
    static constexpr int kCanonicalRate = 8000;

    static uint8_t encode(int16_t sample);
    static int16_t decode(uint8_t code);

    /**
     * Quantization step of the segment a code belongs to.
     * decode(encode(x)) never differs from x by more than this.
     */
    static int step_size(uint8_t code);

    static std::vector<uint8_t> encode(const std::vector<int16_t>& samples);
    static std::vector<int16_t> decode(const std::vector<uint8_t>& codes);

    // Float helpers; full scale 1.0 maps to 32767
    static std::vector<uint8_t> encode(const AudioBuffer& buffer);
    static AudioBuffer decode_to_buffer(const std::vector<uint8_t>& codes, int sample_rate = kCanonicalRate);

private:
    static int segment_for(int biased_magnitude);
    static const int16_t* decode_table();
};

} // namespace Wav2Ulaw
