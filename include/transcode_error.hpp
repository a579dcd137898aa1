#pragma once

#include <stdexcept>
#include <string>

namespace Wav2Ulaw {

/**
 * Base class for every fatal transcoding failure.
 * Each subclass maps to its own process exit code.
 */
class TranscodeError : public std::runtime_error {
public:
    explicit TranscodeError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Invalid, out-of-range, missing or inconsistent parameter.
 * Raised before any input is read.
 */
class ConfigError : public TranscodeError {
public:
    explicit ConfigError(const std::string& message) : TranscodeError(message) {}
};

/**
 * Unreadable input or unwritable output path.
 */
class IOError : public TranscodeError {
public:
    IOError(const std::string& path, const std::string& cause)
        : TranscodeError(path + ": " + cause), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Input bytes are not what the selected mode expects
 * (not a 16-bit PCM WAV, empty stream, ...).
 */
class FormatError : public TranscodeError {
public:
    explicit FormatError(const std::string& message) : TranscodeError(message) {}
};

} // namespace Wav2Ulaw
