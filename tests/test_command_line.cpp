#include <gtest/gtest.h>
#include <fstream>
#include <json/json.h>
#include "command_line.hpp"
#include "test_helpers.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include "wav_file.hpp"

using namespace Wav2Ulaw;

class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        wav_path_ = dir_.file("speech.wav");
        ulaw_path_ = dir_.file("speech.ulaw");
        WavFile::write_wav(wav_path_, Testing::make_sine(1000.0, 0.5, 16000, 1.0));
    }

    std::vector<std::string> encode_args() const {
        return {"wav2ulaw", "--input", wav_path_, "--output", ulaw_path_,
                "--mode", "wav2ulaw", "--sample-rate", "0", "--quiet"};
    }

    static std::vector<std::string> with(std::vector<std::string> args, const std::vector<std::string>& extra) {
        args.insert(args.end(), extra.begin(), extra.end());
        return args;
    }

    Testing::TempDir dir_;
    std::string wav_path_;
    std::string ulaw_path_;
};

TEST_F(CommandLineTest, HelpExitsWithSuccess) {
    EXPECT_EQ(run_command_line({"wav2ulaw", "--help"}), ExitCode::kSuccess);
    EXPECT_EQ(run_command_line({"wav2ulaw", "--input", "x", "-h"}), ExitCode::kSuccess);
}

TEST_F(CommandLineTest, EncodesAndWritesReport) {
    const std::string report_path = dir_.file("report.json");
    int code = run_command_line(with(encode_args(), {"--report", report_path}));

    ASSERT_EQ(code, ExitCode::kSuccess);
    EXPECT_EQ(WavFile::file_size(ulaw_path_), 8000u);

    std::ifstream report(report_path);
    ASSERT_TRUE(report.is_open());
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(builder, report, &root, &errors)) << errors;

    EXPECT_EQ(root["mode"].asString(), "wav2ulaw");
    EXPECT_EQ(root["output_bytes"].asUInt64(), 8000u);
    EXPECT_EQ(root["input"]["sample_rate"].asInt(), 16000);
    EXPECT_EQ(root["output"]["sample_rate"].asInt(), 8000);
    EXPECT_EQ(root["config"]["anti_aliasing_type"].asString(), "butterworth");
    EXPECT_TRUE(root["config"]["chebyshev_ripple"].isNull());
}

TEST_F(CommandLineTest, InvalidSettingIsConfigErrorWithoutOutput) {
    EXPECT_EQ(run_command_line(with(encode_args(), {"--anti-aliasing-type", "9"})), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--window-size", "1"})), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--filter-order", "5"})), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--normalize", "loud"})), ExitCode::kConfig);
    EXPECT_FALSE(Testing::file_exists(ulaw_path_));
}

TEST_F(CommandLineTest, MissingOrUnknownFlagsAreConfigErrors) {
    EXPECT_EQ(run_command_line({"wav2ulaw"}), ExitCode::kConfig);
    EXPECT_EQ(run_command_line({"wav2ulaw", "--input", wav_path_, "--output", ulaw_path_,
                                "--sample-rate", "0"}), ExitCode::kConfig);
    EXPECT_EQ(run_command_line({"wav2ulaw", "--input", wav_path_, "--output", ulaw_path_,
                                "--mode", "wav2ulaw"}), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--bitrate", "64"})), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--low-pass"})), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--mode", "mp3"})), ExitCode::kConfig);
    EXPECT_EQ(run_command_line(with(encode_args(), {"--verbose"})), ExitCode::kConfig);
}

TEST_F(CommandLineTest, FileErrorsMapToExitCodes) {
    std::vector<std::string> args = encode_args();
    args[2] = dir_.file("missing.wav");
    EXPECT_EQ(run_command_line(args), ExitCode::kIO);

    const std::string text_path = dir_.file("notes.txt");
    Testing::write_text(text_path, "plain text\n");
    args[2] = text_path;
    EXPECT_EQ(run_command_line(args), ExitCode::kFormat);
    EXPECT_FALSE(Testing::file_exists(ulaw_path_));
}

TEST_F(CommandLineTest, DecodesToRequestedRate) {
    ASSERT_EQ(run_command_line(encode_args()), ExitCode::kSuccess);

    const std::string decoded_path = dir_.file("decoded.wav");
    int code = run_command_line({"wav2ulaw", "--input", ulaw_path_, "--output", decoded_path,
                                 "--mode", "ulaw2wav", "--sample-rate", "22050", "--quiet"});
    ASSERT_EQ(code, ExitCode::kSuccess);

    WavInfo info = WavFile::probe(decoded_path);
    EXPECT_EQ(info.sample_rate, 22050);
    EXPECT_EQ(info.channels, 1);
    EXPECT_EQ(info.frames, 22050);
}

TEST_F(CommandLineTest, CommandLineOverridesConfigFile) {
    const std::string config_path = dir_.file("settings.json");
    Testing::write_text(config_path, R"({
        "transcode": { "normalize": 0.5, "window_size": 32, "mode": "ulaw2wav", "sample_rate": 16000 },
        "logging": { "level": "warn" }
    })");

    CommandLineOptions from_file = parse_command_line(
        {"wav2ulaw", "--config", config_path, "--input", "a.ulaw", "--output", "a.wav"});
    EXPECT_DOUBLE_EQ(from_file.config.normalize, 0.5);
    EXPECT_EQ(from_file.config.window_size, 32);
    EXPECT_EQ(from_file.config.mode, TranscodeMode::UlawToWav);
    EXPECT_EQ(from_file.config.sample_rate, 16000);
    EXPECT_EQ(from_file.logging.level, "warn");

    CommandLineOptions overridden = parse_command_line(
        {"wav2ulaw", "--normalize", "0.8", "--config", config_path, "--input", "a.ulaw", "--output", "a.wav"});
    EXPECT_DOUBLE_EQ(overridden.config.normalize, 0.8);
    EXPECT_EQ(overridden.config.window_size, 32);
}

TEST_F(CommandLineTest, UnreadableConfigFileThrows) {
    EXPECT_THROW(parse_command_line({"wav2ulaw", "--config", dir_.file("absent.json"),
                                     "--input", "a", "--output", "b", "--mode", "wav2ulaw",
                                     "--sample-rate", "0"}),
                 ConfigError);
}

TEST_F(CommandLineTest, RippleWithoutChebyshevNeedsLenient) {
    std::vector<std::string> args = with(encode_args(), {"--chebyshev-ripple", "0.5"});
    EXPECT_EQ(run_command_line(args), ExitCode::kConfig);
    EXPECT_FALSE(Testing::file_exists(ulaw_path_));

    EXPECT_EQ(run_command_line(with(args, {"--lenient"})), ExitCode::kSuccess);
    EXPECT_TRUE(Testing::file_exists(ulaw_path_));
}

TEST_F(CommandLineTest, FamilyFlagDropsRippleFromConfigFile) {
    const std::string config_path = dir_.file("chebyshev.json");
    Testing::write_text(config_path, R"({
        "transcode": { "anti_aliasing_type": "chebyshev", "chebyshev_ripple": 0.5 }
    })");

    CommandLineOptions from_file = parse_command_line(
        with(encode_args(), {"--config", config_path}));
    EXPECT_EQ(from_file.config.anti_aliasing_type, FilterFamily::Chebyshev1);
    ASSERT_TRUE(from_file.config.chebyshev_ripple.has_value());

    CommandLineOptions overridden = parse_command_line(
        with(encode_args(), {"--config", config_path, "--anti-aliasing-type", "1"}));
    EXPECT_EQ(overridden.config.anti_aliasing_type, FilterFamily::Butterworth);
    EXPECT_FALSE(overridden.config.chebyshev_ripple.has_value());
    EXPECT_NO_THROW(overridden.config.validate());

    // An explicit ripple flag is still checked against the family
    CommandLineOptions both = parse_command_line(
        with(encode_args(), {"--config", config_path, "--anti-aliasing-type", "1",
                             "--chebyshev-ripple", "0.5"}));
    EXPECT_THROW(both.config.validate(), ConfigError);

    EXPECT_EQ(run_command_line(with(encode_args(), {"--config", config_path, "--anti-aliasing-type", "1"})),
              ExitCode::kSuccess);
    EXPECT_EQ(WavFile::file_size(ulaw_path_), 8000u);
}

TEST_F(CommandLineTest, ReportFailureKeepsSuccessfulRun) {
    int code = run_command_line(with(encode_args(), {"--report", dir_.file("no/such/dir/report.json")}));

    EXPECT_EQ(code, ExitCode::kSuccess);
    EXPECT_EQ(WavFile::file_size(ulaw_path_), 8000u);
}

TEST_F(CommandLineTest, AcceptsEqualsSyntax) {
    CommandLineOptions options = parse_command_line(
        {"wav2ulaw", "--input=in.wav", "--output=out.ulaw", "--mode=wav2ulaw", "--sample-rate=0",
         "--low-pass=3000", "--anti-aliasing-type=bessel", "--no-mono"});

    EXPECT_EQ(options.input_path, "in.wav");
    EXPECT_DOUBLE_EQ(options.config.low_pass, 3000.0);
    EXPECT_EQ(options.config.anti_aliasing_type, FilterFamily::Bessel);
    EXPECT_FALSE(options.config.force_mono);

    EXPECT_THROW(parse_command_line({"wav2ulaw", "--input=x.wav", "--output=x.wav",
                                     "--mode=wav2ulaw", "--sample-rate=0"}),
                 ConfigError);
}

TEST_F(CommandLineTest, VerbosityFlagsSetLogLevel) {
    ASSERT_EQ(run_command_line(with(encode_args(), {"--report", dir_.file("r.json")})), ExitCode::kSuccess);
    EXPECT_EQ(Logger::get_level(), Logger::Level::WARN);

    std::vector<std::string> args = encode_args();
    args.back() = "--verbose";
    args.push_back("--log-file");
    args.push_back(dir_.file("wav2ulaw.log"));
    ASSERT_EQ(run_command_line(args), ExitCode::kSuccess);
    EXPECT_EQ(Logger::get_level(), Logger::Level::DEBUG);
    EXPECT_TRUE(Testing::file_exists(dir_.file("wav2ulaw.log")));

    Logger::set_log_file("");
    Logger::set_level(Logger::Level::INFO);
}
