#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "audio_buffer.hpp"

namespace Wav2Ulaw {

// Header facts of a WAV file as reported by libsndfile
struct WavInfo {
    int sample_rate = 0;
    int channels = 0;
    int64_t frames = 0;
    int format = 0;
};

/**
 * File helpers for both sides of the transcoder.
 *
 * Failures to open, read or write a path raise IOError; files that open
 * but hold the wrong kind of data raise FormatError.
 */
namespace WavFile {

    // Header only; does not require PCM16
    WavInfo probe(const std::string& path);

    /**
     * Read a 16-bit PCM WAV file into float samples (interleaved).
     */
    AudioBuffer read_wav(const std::string& path);

    /**
     * Write samples as a 16-bit PCM WAV file. The file is written under a
     * temporary name in the same directory and renamed into place, so a
     * failed write never leaves a partial file at path.
     */
    void write_wav(const std::string& path, const AudioBuffer& buffer);

    std::vector<uint8_t> read_bytes(const std::string& path);

    // Atomic like write_wav
    void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes);

    // File size in bytes, 0 if it cannot be determined
    uint64_t file_size(const std::string& path);
}

} // namespace Wav2Ulaw
