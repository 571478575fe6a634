#include <gtest/gtest.h>
#include "manager/assessment_engine.h"
#include "../wav_fixtures.h"

using namespace vc;
using namespace vc_test;

namespace {

EngineConfig heuristic_only() {
    EngineConfig config;
    config.heuristic.perturbation_std = 0.0f;
    return config;
}

} // namespace

TEST(AssessmentEngineTest, InitWithoutModels) {
    EngineConfig config = heuristic_only();
    config.model_dir = "no_such_model_dir";
    AssessmentEngine engine(config);

    ASSERT_TRUE(engine.init());
    EXPECT_TRUE(engine.is_initialized());
    EXPECT_FALSE(engine.is_model_loaded());
    EXPECT_EQ(engine.loaded_model_count(), 0);
    EXPECT_FALSE(engine.init());

    engine.release();
    EXPECT_FALSE(engine.is_initialized());
}

TEST(AssessmentEngineTest, AnalyzeVoice) {
    AssessmentEngine engine(heuristic_only());
    ASSERT_TRUE(engine.init());

    auto audio = voice_like(180.0f, 12.0f, 11);
    AnalysisResult result;
    ErrorInfo err;
    ASSERT_EQ(engine.analyze(AudioInput::from_pcm(audio.data(), audio.size()), AnalysisOptions{}, result, &err),
              ErrorCode::OK);

    EXPECT_EQ(result.segments_analyzed, 3);
    EXPECT_NEAR(result.duration, 12.0f, 1e-3f);
    EXPECT_EQ(result.classifier_used, "heuristic");
    EXPECT_TRUE(result.features.all_finite());
    EXPECT_GT(result.features.pitch_mean, 100.0f);
    EXPECT_EQ(result.scale_scores.phq9.max_score, 27);
    EXPECT_GE(result.recommendations.size(), 2u);
}

TEST(AssessmentEngineTest, OptionsSkipNotes) {
    AssessmentEngine engine(heuristic_only());
    AnalysisOptions options;
    options.include_interpretations = false;
    options.include_recommendations = false;

    AnalysisResult result;
    ASSERT_TRUE(engine.assess(FeatureVector(), options, result));
    EXPECT_TRUE(result.interpretations.empty());
    EXPECT_TRUE(result.recommendations.empty());
    EXPECT_EQ(result.risk_level, risk_level(result.probabilities));
    EXPECT_FLOAT_EQ(result.mental_health_score,
                    mental_health_score(result.probabilities, result.confidence));
}

TEST(AssessmentEngineTest, ValidationFailureIsReported) {
    AssessmentEngine engine(heuristic_only());
    auto audio = voice_like(180.0f, 6.0f, 12);

    AnalysisResult result;
    ErrorInfo err;
    EXPECT_EQ(engine.analyze(AudioInput::from_pcm(audio.data(), audio.size()), AnalysisOptions{}, result, &err),
              ErrorCode::AUDIO_TOO_SHORT);
    EXPECT_FLOAT_EQ(err.limit, 10.0f);

    // The same clip is long enough for calibration
    FeatureVector features;
    int segments = 0;
    EXPECT_EQ(engine.extract_features(AudioInput::from_pcm(audio.data(), audio.size()),
                                      ValidationMode::Calibration, features, &segments),
              ErrorCode::OK);
    EXPECT_EQ(segments, 1);
}

TEST(AssessmentEngineTest, ForcedHeuristic) {
    AssessmentEngine engine(heuristic_only());
    ClassScore a, b;
    ASSERT_TRUE(engine.classify(FeatureVector(), a, true));
    ASSERT_TRUE(engine.classify(FeatureVector(), b, false));
    EXPECT_EQ(a.probabilities, b.probabilities);
    EXPECT_EQ(b.classifier, "heuristic");
}
