#include <gtest/gtest.h>
#include <cmath>
#include "dynamics_processor.hpp"
#include "test_helpers.hpp"

using namespace Wav2Ulaw;

namespace {

DynamicsSettings make_settings(float normalize, float ratio, float threshold) {
    DynamicsSettings settings;
    settings.normalize = normalize;
    settings.ratio = ratio;
    settings.threshold = threshold;
    return settings;
}

// Loud first half, quiet second half
AudioBuffer make_two_level_signal() {
    AudioBuffer buffer = Testing::make_sine(440.0, 1.0, 8000, 1.0);
    for (size_t i = buffer.samples.size() / 2; i < buffer.samples.size(); ++i) {
        buffer.samples[i] *= 0.1f;
    }
    return buffer;
}

} // namespace

TEST(DynamicsProcessorTest, SilentBufferIsReturnedUnchanged) {
    DynamicsProcessor processor(make_settings(0.95f, 4.0f, 0.5f));
    AudioBuffer silence(std::vector<float>(1000, 0.0f), 8000);

    AudioBuffer output = processor.apply(silence);
    EXPECT_EQ(output.samples, silence.samples);
    EXPECT_EQ(output.sample_rate, 8000);
}

TEST(DynamicsProcessorTest, RatioOfOneIsExactIdentity) {
    DynamicsProcessor processor(make_settings(0.95f, 1.0f, 0.1f));
    AudioBuffer input = make_two_level_signal();

    std::vector<float> compressed = input.samples;
    processor.compress(compressed);
    EXPECT_EQ(compressed, input.samples);

    // apply() then reduces to plain peak normalization
    AudioBuffer output = processor.apply(input);
    float gain = 0.95f / AudioUtils::peakAmplitude(input.samples);
    for (size_t i = 0; i < input.samples.size(); ++i) {
        ASSERT_NEAR(output.samples[i], input.samples[i] * gain, 1e-6f);
    }
}

TEST(DynamicsProcessorTest, NormalizeHitsTargetPeak) {
    DynamicsProcessor processor(make_settings(0.5f, 1.0f, 0.5f));
    std::vector<float> samples = {0.1f, -0.2f, 0.05f};

    processor.normalize(samples);
    EXPECT_FLOAT_EQ(AudioUtils::peakAmplitude(samples), 0.5f);
    EXPECT_FLOAT_EQ(samples[0], 0.25f);
    EXPECT_FLOAT_EQ(samples[1], -0.5f);
}

TEST(DynamicsProcessorTest, CompressionReducesDynamicRangeAndRestoresPeak) {
    DynamicsProcessor processor(make_settings(0.9f, 4.0f, 0.25f));
    AudioBuffer input = make_two_level_signal();
    AudioBuffer output = processor.apply(input);

    const size_t half = input.samples.size() / 2;
    double input_ratio = Testing::rms_range(input.samples, half, input.samples.size()) /
                         Testing::rms_range(input.samples, 0, half);
    double output_ratio = Testing::rms_range(output.samples, half, output.samples.size()) /
                          Testing::rms_range(output.samples, 0, half);

    EXPECT_GT(output_ratio, input_ratio * 1.5);
    EXPECT_NEAR(AudioUtils::peakAmplitude(output.samples), 0.9f, 1e-5f);
}

TEST(DynamicsProcessorTest, GainCurveFollowsSoftKnee) {
    DynamicsProcessor processor(make_settings(0.95f, 1.5f, 0.5f));
    const float threshold_db = AudioUtils::linearToDb(0.5f);
    const float knee = processor.settings().knee_width_db;

    // Below the knee nothing changes
    EXPECT_FLOAT_EQ(processor.gain_curve_db(-40.0f), -40.0f);

    // Above the knee the slope is 1/ratio
    EXPECT_NEAR(processor.gain_curve_db(0.0f), threshold_db + (0.0f - threshold_db) / 1.5f, 1e-4f);

    // Continuous at both knee edges
    float lower = threshold_db - knee / 2.0f;
    float upper = threshold_db + knee / 2.0f;
    EXPECT_NEAR(processor.gain_curve_db(lower), lower, 1e-4f);
    EXPECT_NEAR(processor.gain_curve_db(upper), threshold_db + (upper - threshold_db) / 1.5f, 1e-4f);

    // Never boosts
    for (float level = -60.0f; level <= 0.0f; level += 0.5f) {
        EXPECT_LE(processor.gain_curve_db(level), level + 1e-5f);
    }
}

TEST(DynamicsProcessorTest, ZeroThresholdMeansMinus90Dbfs) {
    DynamicsProcessor processor(make_settings(0.95f, 2.0f, 0.0f));
    EXPECT_NEAR(processor.gain_curve_db(-60.0f), -90.0f + 30.0f / 2.0f, 1e-4f);
}

TEST(DynamicsProcessorTest, OutputNeverExceedsFullScale) {
    DynamicsProcessor processor(make_settings(1.0f, 1.5f, 0.5f));
    AudioBuffer input = Testing::make_sine(1000.0, 3.0, 8000, 0.1);

    AudioBuffer output = processor.apply(input);
    EXPECT_LE(AudioUtils::peakAmplitude(output.samples), 1.0f);
}
