#include "wav_file.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include <sndfile.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace Wav2Ulaw {
namespace WavFile {

namespace {

void check_readable(const std::string& path) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw IOError(path, "no such file");
    }
    if (std::filesystem::is_directory(status)) {
        throw IOError(path, "is a directory");
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe.is_open()) {
        throw IOError(path, "cannot open for reading: " + std::string(std::strerror(errno)));
    }
}

std::string temporary_path_for(const std::string& path) {
    std::filesystem::path target(path);
    std::string name = "." + target.filename().string() + ".partial";
    return (target.parent_path() / name).string();
}

void discard(const std::string& temp_path) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
}

// Move a finished temporary file over the destination
void commit(const std::string& temp_path, const std::string& path) {
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        discard(temp_path);
        throw IOError(path, "cannot move output into place: " + ec.message());
    }
}

} // namespace

WavInfo probe(const std::string& path) {
    check_readable(path);

    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* sf_file = sf_open(path.c_str(), SFM_READ, &sf_info);
    if (!sf_file) {
        throw FormatError(path + ": not a readable audio file (" + sf_strerror(nullptr) + ")");
    }
    sf_close(sf_file);

    WavInfo info;
    info.sample_rate = sf_info.samplerate;
    info.channels = sf_info.channels;
    info.frames = sf_info.frames;
    info.format = sf_info.format;
    return info;
}

AudioBuffer read_wav(const std::string& path) {
    check_readable(path);

    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* sf_file = sf_open(path.c_str(), SFM_READ, &sf_info);
    if (!sf_file) {
        throw FormatError(path + ": not a WAV file (" + sf_strerror(nullptr) + ")");
    }

    const int container = sf_info.format & SF_FORMAT_TYPEMASK;
    const int encoding = sf_info.format & SF_FORMAT_SUBMASK;

    if (container != SF_FORMAT_WAV && container != SF_FORMAT_WAVEX) {
        sf_close(sf_file);
        throw FormatError(path + ": not a WAV container");
    }
    if (encoding != SF_FORMAT_PCM_16) {
        sf_close(sf_file);
        throw FormatError(path + ": only 16-bit PCM WAV input is supported");
    }
    if (sf_info.frames <= 0 || sf_info.channels <= 0) {
        sf_close(sf_file);
        throw FormatError(path + ": WAV file contains no samples");
    }

    std::vector<int16_t> pcm(static_cast<size_t>(sf_info.frames) * sf_info.channels);
    sf_count_t frames_read = sf_readf_short(sf_file, pcm.data(), sf_info.frames);
    std::string read_error = sf_strerror(sf_file);
    sf_close(sf_file);

    if (frames_read <= 0) {
        throw IOError(path, "read failed: " + read_error);
    }
    if (frames_read != sf_info.frames) {
        std::ostringstream msg;
        msg << "Only read " << frames_read << " of " << sf_info.frames << " frames from " << path;
        Logger::warn("WavFile", msg.str());
        pcm.resize(static_cast<size_t>(frames_read) * sf_info.channels);
    }

    std::ostringstream msg;
    msg << "Read " << path << ": " << sf_info.samplerate << " Hz, " << sf_info.channels
        << " channel(s), " << frames_read << " frames";
    Logger::debug("WavFile", msg.str());

    return AudioUtils::int16ToFloat(pcm, sf_info.samplerate, sf_info.channels);
}

void write_wav(const std::string& path, const AudioBuffer& buffer) {
    if (buffer.sample_rate <= 0 || buffer.channels <= 0) {
        throw FormatError("cannot write WAV with sample rate " + std::to_string(buffer.sample_rate) +
                          " and " + std::to_string(buffer.channels) + " channel(s)");
    }

    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));
    sf_info.samplerate = buffer.sample_rate;
    sf_info.channels = buffer.channels;
    sf_info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    if (!sf_format_check(&sf_info)) {
        throw FormatError("libsndfile rejected the output format for " + path);
    }

    const std::string temp_path = temporary_path_for(path);
    SNDFILE* sf_file = sf_open(temp_path.c_str(), SFM_WRITE, &sf_info);
    if (!sf_file) {
        throw IOError(path, std::string("cannot open for writing: ") + sf_strerror(nullptr));
    }

    std::vector<int16_t> pcm = AudioUtils::floatToInt16(buffer);
    const sf_count_t frames = static_cast<sf_count_t>(buffer.frames());
    sf_count_t written = sf_writef_short(sf_file, pcm.data(), frames);
    std::string write_error = sf_strerror(sf_file);

    if (sf_close(sf_file) != 0 || written != frames) {
        discard(temp_path);
        throw IOError(path, "write failed: " + write_error);
    }

    commit(temp_path, path);

    std::ostringstream msg;
    msg << "Wrote " << path << ": " << buffer.sample_rate << " Hz, " << frames << " frames";
    Logger::debug("WavFile", msg.str());
}

std::vector<uint8_t> read_bytes(const std::string& path) {
    check_readable(path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError(path, "cannot open for reading");
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError(path, "read failed");
    }

    Logger::debug("WavFile", "Read " + std::to_string(bytes.size()) + " bytes from " + path);
    return bytes;
}

void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    const std::string temp_path = temporary_path_for(path);

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError(path, "cannot open for writing: " + std::string(std::strerror(errno)));
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (file.fail()) {
        discard(temp_path);
        throw IOError(path, "write failed");
    }

    commit(temp_path, path);
    Logger::debug("WavFile", "Wrote " + std::to_string(bytes.size()) + " bytes to " + path);
}

uint64_t file_size(const std::string& path) {
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

} // namespace WavFile
} // namespace Wav2Ulaw
