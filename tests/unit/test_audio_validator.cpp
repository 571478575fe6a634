#include <gtest/gtest.h>
#include "core/audio_validator.h"
#include "../wav_fixtures.h"
#include <cmath>
#include <vector>

using namespace vc;
using namespace vc_test;

static WaveformBuffer make_wave(std::vector<float> samples, int rate = 16000) {
    WaveformBuffer w;
    w.samples = std::move(samples);
    w.sample_rate = rate;
    w.source_sample_rate = rate;
    return w;
}

TEST(AudioValidatorTest, AcceptsCleanRecording) {
    AudioValidator validator;
    ErrorInfo info;
    auto wave = make_wave(sine(220.0f, 12.0f));
    EXPECT_EQ(validator.validate(wave, ValidationMode::Analysis, &info), ErrorCode::OK);
    EXPECT_EQ(info.code, ErrorCode::OK);
}

TEST(AudioValidatorTest, TooShortReportsMeasuredAndLimit) {
    AudioValidator validator;
    ErrorInfo info;
    auto wave = make_wave(std::vector<float>(5 * 16000, 0.0f));

    EXPECT_EQ(validator.validate(wave, ValidationMode::Analysis, &info), ErrorCode::AUDIO_TOO_SHORT);
    EXPECT_EQ(info.code, ErrorCode::AUDIO_TOO_SHORT);
    EXPECT_NEAR(info.measured, 5.0f, 1e-3f);
    EXPECT_FLOAT_EQ(info.limit, 10.0f);
    EXPECT_NE(info.message.find("below minimum"), std::string::npos);
}

TEST(AudioValidatorTest, CalibrationModeIsLenientOnDuration) {
    AudioValidator validator;
    auto wave = make_wave(sine(220.0f, 6.0f));
    EXPECT_EQ(validator.validate(wave, ValidationMode::Analysis), ErrorCode::AUDIO_TOO_SHORT);
    EXPECT_EQ(validator.validate(wave, ValidationMode::Calibration), ErrorCode::OK);
}

TEST(AudioValidatorTest, TooLong) {
    IngestionConfig config;
    config.max_duration_sec = 20.0f;
    AudioValidator validator(config);
    ErrorInfo info;
    auto wave = make_wave(sine(220.0f, 25.0f));
    EXPECT_EQ(validator.validate(wave, ValidationMode::Analysis, &info), ErrorCode::AUDIO_TOO_LONG);
    EXPECT_FLOAT_EQ(info.limit, 20.0f);

    config.max_duration_sec = 0.0f;   // no upper bound
    AudioValidator unbounded(config);
    EXPECT_EQ(unbounded.validate(wave, ValidationMode::Analysis), ErrorCode::OK);
}

TEST(AudioValidatorTest, Clipped) {
    AudioValidator validator;
    ErrorInfo info;
    auto samples = sine(220.0f, 12.0f);
    samples[1000] = 1.2f;
    auto wave = make_wave(samples);

    EXPECT_EQ(validator.validate(wave, ValidationMode::Analysis, &info), ErrorCode::AUDIO_CLIPPED);
    EXPECT_NEAR(info.measured, 1.2f, 1e-6f);
    EXPECT_FLOAT_EQ(info.limit, 1.0f);
}

TEST(AudioValidatorTest, DurationIsCheckedBeforeClipping) {
    AudioValidator validator;
    auto samples = sine(220.0f, 3.0f);
    samples[10] = 1.5f;
    EXPECT_EQ(validator.validate(make_wave(samples), ValidationMode::Analysis),
              ErrorCode::AUDIO_TOO_SHORT);
}

TEST(AudioValidatorTest, NoisyInAnalysisButAcceptedForCalibration) {
    // Uniform noise: SNR against the |x| < 0.001 samples is 10*log10(9) ~ 9.5 dB
    AudioValidator validator;
    ErrorInfo info;
    auto wave = make_wave(uniform_noise(0.003f, 12.0f, 42));

    EXPECT_EQ(validator.validate(wave, ValidationMode::Analysis, &info), ErrorCode::AUDIO_TOO_NOISY);
    EXPECT_NEAR(info.measured, 9.54f, 0.3f);
    EXPECT_FLOAT_EQ(info.limit, 10.0f);

    EXPECT_EQ(validator.validate(wave, ValidationMode::Calibration), ErrorCode::OK);
}

TEST(AudioValidatorTest, SnrSkippedWithoutQuietSamples) {
    AudioValidator validator;
    std::vector<float> constant(16000, 0.3f);
    float snr = 0.0f;
    EXPECT_FALSE(validator.estimate_snr_db(constant, snr));
}

TEST(AudioValidatorTest, SegmentsOverlapByHalf) {
    AudioValidator validator;
    auto wave = make_wave(sine(220.0f, 12.0f));
    auto segments = validator.segment(wave);

    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].start_sample, 0u);
    EXPECT_EQ(segments[1].start_sample, 40000u);
    EXPECT_EQ(segments[2].start_sample, 80000u);
    for (const auto& s : segments) {
        EXPECT_EQ(s.samples.size(), 80000u);
        EXPECT_FALSE(s.padded);
    }
}

TEST(AudioValidatorTest, QuietWindowsAreDropped) {
    AudioValidator validator;
    auto samples = sine(220.0f, 12.0f);
    // Silence the second half: windows starting at 80000 become quiet
    std::fill(samples.begin() + 80000, samples.end(), 0.0f);
    auto segments = validator.segment(make_wave(samples));
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].start_sample, 0u);
    EXPECT_EQ(segments[1].start_sample, 40000u);
}

TEST(AudioValidatorTest, SilentRecordingFallsBackToFirstWindow) {
    AudioValidator validator;
    auto segments = validator.segment(make_wave(std::vector<float>(12 * 16000, 0.0f)));
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].samples.size(), 80000u);
    EXPECT_FALSE(segments[0].padded);
}

TEST(AudioValidatorTest, ShortRecordingIsZeroPadded) {
    AudioValidator validator;
    auto segments = validator.segment(make_wave(sine(220.0f, 3.0f)));
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].samples.size(), 80000u);
    EXPECT_TRUE(segments[0].padded);
    EXPECT_FLOAT_EQ(segments[0].samples.back(), 0.0f);
}
