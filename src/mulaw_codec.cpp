#include "mulaw_codec.hpp"

namespace Wav2Ulaw {

namespace {

// Upper bound of each segment, applied to the biased magnitude
const int kSegmentEnd[8] = {
    0xFF, 0x1FF, 0x3FF, 0x7FF, 0xFFF, 0x1FFF, 0x3FFF, 0x7FFF
};

int16_t expand(uint8_t code) {
    code = static_cast<uint8_t>(~code);

    int sign = code & 0x80;
    int exponent = (code >> 4) & 0x07;
    int mantissa = code & 0x0F;

    int magnitude = (((mantissa << 3) + MuLawCodec::kBias) << exponent) - MuLawCodec::kBias;
    return static_cast<int16_t>(sign ? -magnitude : magnitude);
}

} // namespace

int MuLawCodec::segment_for(int biased_magnitude) {
    for (int segment = 0; segment < 8; ++segment) {
        if (biased_magnitude <= kSegmentEnd[segment]) {
            return segment;
        }
    }
    return 7;
}

const int16_t* MuLawCodec::decode_table() {
    struct Table {
        int16_t values[256];
        Table() {
            for (int i = 0; i < 256; ++i) {
                values[i] = expand(static_cast<uint8_t>(i));
            }
        }
    };
    static const Table table;
    return table.values;
}

uint8_t MuLawCodec::encode(int16_t sample) {
    // Widen first so -32768 can be negated
    int pcm = sample;
    int sign = 0;
    if (pcm < 0) {
        sign = 0x80;
        pcm = -pcm;
    }

    if (pcm > kClip) {
        pcm = kClip;
    }
    pcm += kBias;

    int exponent = segment_for(pcm);
    int mantissa = (pcm >> (exponent + 3)) & 0x0F;

    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t MuLawCodec::decode(uint8_t code) {
    return decode_table()[code];
}

int MuLawCodec::step_size(uint8_t code) {
    int exponent = (static_cast<uint8_t>(~code) >> 4) & 0x07;
    return 1 << (exponent + 3);
}

std::vector<uint8_t> MuLawCodec::encode(const std::vector<int16_t>& samples) {
    std::vector<uint8_t> codes(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        codes[i] = encode(samples[i]);
    }
    return codes;
}

std::vector<int16_t> MuLawCodec::decode(const std::vector<uint8_t>& codes) {
    const int16_t* table = decode_table();
    std::vector<int16_t> samples(codes.size());
    for (size_t i = 0; i < codes.size(); ++i) {
        samples[i] = table[codes[i]];
    }
    return samples;
}

std::vector<uint8_t> MuLawCodec::encode(const AudioBuffer& buffer) {
    std::vector<uint8_t> codes(buffer.samples.size());
    for (size_t i = 0; i < buffer.samples.size(); ++i) {
        codes[i] = encode(AudioUtils::floatToInt16(buffer.samples[i]));
    }
    return codes;
}

AudioBuffer MuLawCodec::decode_to_buffer(const std::vector<uint8_t>& codes, int sample_rate) {
    return AudioUtils::int16ToFloat(decode(codes), sample_rate, 1);
}

} // namespace Wav2Ulaw
