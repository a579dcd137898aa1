#include "transcoder.hpp"
#include "filter_bank.hpp"
#include "mulaw_codec.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include "wav_file.hpp"
#include <chrono>
#include <sstream>

namespace Wav2Ulaw {

const TranscodeConfig& Transcoder::validated(const TranscodeConfig& config) {
    config.validate();
    return config;
}

Transcoder::Transcoder(const TranscodeConfig& config)
    : config_(validated(config))
    , designer_(config.strict)
    , dynamics_(config.dynamics_settings())
    , resampler_(config.resampler_settings())
{
}

AudioBuffer Transcoder::to_mono(AudioBuffer input) const {
    if (input.channels == 1) {
        return input;
    }

    if (!config_.force_mono) {
        throw FormatError("input has " + std::to_string(input.channels) +
                          " channels; mono downmix is disabled (--no-mono)");
    }

    Logger::debug("Transcoder", "Downmixing " + std::to_string(input.channels) + " channels to mono");
    return AudioUtils::downmixToMono(input);
}

std::vector<uint8_t> Transcoder::wav_to_ulaw(AudioBuffer input) const {
    if (input.empty()) {
        throw FormatError("input contains no samples");
    }

    if (config_.sample_rate > 0 && config_.sample_rate != input.sample_rate) {
        std::ostringstream msg;
        msg << "Treating input as " << config_.sample_rate << " Hz (header says "
            << input.sample_rate << " Hz)";
        Logger::info("Transcoder", msg.str());
        input.sample_rate = config_.sample_rate;
    }
    if (input.sample_rate <= 0) {
        throw FormatError("input has no usable sample rate");
    }

    AudioBuffer signal = to_mono(std::move(input));

    FilterBank band_limit(signal.sample_rate, config_.high_pass_spec(), config_.low_pass_spec(), designer_);
    signal = band_limit.apply(std::move(signal));

    signal = dynamics_.apply(std::move(signal));

    signal = resampler_.resample(std::move(signal), MuLawCodec::kCanonicalRate);
    if (signal.samples.empty()) {
        throw FormatError("input too short to produce any " +
                          std::to_string(MuLawCodec::kCanonicalRate) + " Hz sample");
    }

    // Resampling and filter transients move the peak; re-target it
    dynamics_.normalize(signal.samples);
    AudioUtils::hardClip(signal.samples);

    std::vector<uint8_t> codes = MuLawCodec::encode(signal);

    std::ostringstream msg;
    msg << "Encoded " << codes.size() << " μ-law samples at " << MuLawCodec::kCanonicalRate << " Hz";
    Logger::debug("Transcoder", msg.str());

    return codes;
}

AudioBuffer Transcoder::ulaw_to_wav(const std::vector<uint8_t>& codes) const {
    if (codes.empty()) {
        throw FormatError("μ-law input is empty");
    }

    AudioBuffer decoded = MuLawCodec::decode_to_buffer(codes, MuLawCodec::kCanonicalRate);
    AudioBuffer output = resampler_.resample(std::move(decoded), config_.sample_rate);

    std::ostringstream msg;
    msg << "Decoded " << codes.size() << " μ-law samples to " << output.frames()
        << " frames at " << output.sample_rate << " Hz";
    Logger::debug("Transcoder", msg.str());

    return output;
}

TranscodeResult Transcoder::run(const std::string& input_path, const std::string& output_path) const {
    TranscodeResult result;
    result.mode = config_.mode;
    result.input_path = input_path;
    result.output_path = output_path;

    Logger::info("Transcoder", TranscodeConfig::mode_name(config_.mode) + ": " + input_path + " -> " + output_path);

    SignalAnalyzer analyzer;
    auto start_time = std::chrono::steady_clock::now();

    if (config_.mode == TranscodeMode::WavToUlaw) {
        AudioBuffer input = WavFile::read_wav(input_path);
        result.input_stats = analyzer.analyze(input);

        std::vector<uint8_t> codes = wav_to_ulaw(std::move(input));
        result.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_time).count();

        WavFile::write_bytes(output_path, codes);
        result.output_stats = analyzer.analyze(MuLawCodec::decode_to_buffer(codes));
    } else {
        std::vector<uint8_t> codes = WavFile::read_bytes(input_path);
        if (!codes.empty()) {
            result.input_stats = analyzer.analyze(MuLawCodec::decode_to_buffer(codes));
        }

        AudioBuffer output = ulaw_to_wav(codes);
        result.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_time).count();

        WavFile::write_wav(output_path, output);
        result.output_stats = analyzer.analyze(output);
    }

    result.input_bytes = WavFile::file_size(input_path);
    result.output_bytes = WavFile::file_size(output_path);

    std::ostringstream msg;
    msg << "Done in " << result.elapsed_ms << " ms: " << result.input_bytes << " -> "
        << result.output_bytes << " bytes (ratio " << result.size_ratio() << ")";
    Logger::info("Transcoder", msg.str());

    return result;
}

} // namespace Wav2Ulaw
