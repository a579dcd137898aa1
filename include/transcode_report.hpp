#pragma once

#include <string>
#include "transcode_config.hpp"
#include "transcoder.hpp"

namespace Wav2Ulaw {

namespace TranscodeReport {

    // Pretty-printed JSON document describing a finished run
    std::string export_to_json(const TranscodeResult& result, const TranscodeConfig& config);

    // Throws IOError when path cannot be written
    void write(const std::string& path, const TranscodeResult& result, const TranscodeConfig& config);
}

} // namespace Wav2Ulaw
