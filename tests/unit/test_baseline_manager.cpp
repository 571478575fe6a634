#include <gtest/gtest.h>
#include "manager/baseline_manager.h"
#include "manager/assessment_engine.h"
#include "storage/baseline_store.h"
#include "../wav_fixtures.h"
#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace vc;
using namespace vc_test;

namespace {

EngineConfig quiet_engine_config() {
    EngineConfig config;
    config.heuristic.perturbation_std = 0.0f;
    return config;
}

FeatureVector sample_with_pitch(float pitch) {
    FeatureVector fv;
    fv.pitch_mean = pitch;
    fv.rms.mean = 0.1f;
    fv.hnr = 15.0f;
    return fv;
}

} // namespace

class BaselineManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryBaselineStore>();
        manager_ = std::make_unique<BaselineManager>(engine_, store_);
    }

    // Pitch 100, 110, ... 180: mean 140, population std sqrt(6000 / 9)
    void add_nine(const std::string& user) {
        CalibrationStatus status;
        for (int i = 0; i < 9; ++i) {
            ASSERT_EQ(manager_->add_calibration_sample(user, sample_with_pitch(100.0f + 10.0f * i), status),
                      ErrorCode::OK);
        }
    }

    UserBaseline stored(const std::string& user) {
        UserBaseline b;
        EXPECT_EQ(store_->get(user, b, nullptr), ErrorCode::OK);
        return b;
    }

    AssessmentEngine engine_{quiet_engine_config()};
    std::shared_ptr<InMemoryBaselineStore> store_;
    std::unique_ptr<BaselineManager> manager_;
};

TEST_F(BaselineManagerTest, CalibratesOnNinthSample) {
    CalibrationStatus status;
    for (int i = 0; i < 8; ++i) {
        ASSERT_EQ(manager_->add_calibration_sample("alice", sample_with_pitch(100.0f + 10.0f * i), status),
                  ErrorCode::OK);
        EXPECT_FALSE(status.is_calibrated);
        EXPECT_EQ(status.samples_collected, i + 1);
    }
    EXPECT_EQ(status.samples_required, 9);
    EXPECT_NEAR(status.progress_percentage, 800.0f / 9.0f, 1e-3f);
    EXPECT_EQ(status.message, "Collect 1 more samples to establish your personal baseline");

    ASSERT_EQ(manager_->add_calibration_sample("alice", sample_with_pitch(180.0f), status), ErrorCode::OK);
    EXPECT_TRUE(status.is_calibrated);
    EXPECT_FLOAT_EQ(status.progress_percentage, 100.0f);
    EXPECT_GT(status.calibrated_at, 0);
    EXPECT_EQ(status.message, "Personal baseline established from 9 samples");

    UserBaseline b = stored("alice");
    EXPECT_EQ(b.samples_used, 9);
    EXPECT_NEAR(b.feature_means.at("pitch_mean"), 140.0f, 1e-4f);
    EXPECT_NEAR(b.feature_stds.at("pitch_mean"), std::sqrt(6000.0f / 9.0f), 1e-3f);
    EXPECT_FLOAT_EQ(b.feature_stds.at("hnr"), 0.0f);
    EXPECT_EQ(b.feature_means.size(), FeatureSchema::v1().size());
}

TEST_F(BaselineManagerTest, CalibrationRecordsAssessmentScores) {
    add_nine("amy");
    UserBaseline b = stored("amy");
    ASSERT_EQ(b.score_samples.size(), 9u);
    ASSERT_EQ(b.score_means.size(), kNumBaselineScores);
    ASSERT_EQ(b.score_stds.size(), kNumBaselineScores);

    AnalysisOptions scoring;
    scoring.include_interpretations = false;
    scoring.include_recommendations = false;
    double mhs_total = 0.0, phq_total = 0.0;
    for (int i = 0; i < 9; ++i) {
        AnalysisResult r;
        ASSERT_TRUE(engine_.assess(sample_with_pitch(100.0f + 10.0f * i), scoring, r));
        ScoreSample expected = BaselineManager::score_sample(r);
        EXPECT_FLOAT_EQ(b.score_samples[i][4], expected[4]);
        mhs_total += expected[4];
        phq_total += expected[0];
    }
    EXPECT_NEAR(b.score_means.at("mental_health_score"), mhs_total / 9.0, 1e-3);
    EXPECT_NEAR(b.score_means.at("phq9"), phq_total / 9.0, 1e-4);
    EXPECT_GE(b.score_stds.at("wemwbs"), 0.0f);
}

TEST_F(BaselineManagerTest, ScoreStatisticsNeedThreeSamples) {
    UserBaseline b("abe");
    b.samples.push_back(sample_with_pitch(120.0f));
    b.samples.push_back(sample_with_pitch(130.0f));
    b.score_samples.push_back({5.0f, 4.0f, 10.0f, 50.0f, 70.0f});
    b.score_samples.push_back({7.0f, 6.0f, 12.0f, 46.0f, 60.0f});
    BaselineManager::compute_statistics(b);
    EXPECT_FALSE(b.feature_means.empty());
    EXPECT_TRUE(b.score_means.empty());

    b.score_samples.push_back({9.0f, 8.0f, 14.0f, 42.0f, 50.0f});
    BaselineManager::compute_statistics(b);
    EXPECT_FLOAT_EQ(b.score_means.at("phq9"), 7.0f);
    EXPECT_NEAR(b.score_stds.at("phq9"), std::sqrt(8.0f / 3.0f), 1e-5f);
    EXPECT_FLOAT_EQ(b.score_means.at("mental_health_score"), 60.0f);
}

TEST_F(BaselineManagerTest, StatisticsFrozenAfterCalibration) {
    add_nine("bob");
    CalibrationStatus status;
    ASSERT_EQ(manager_->add_calibration_sample("bob", sample_with_pitch(1000.0f), status), ErrorCode::OK);
    EXPECT_EQ(status.samples_collected, 10);

    UserBaseline b = stored("bob");
    EXPECT_NEAR(b.feature_means.at("pitch_mean"), 140.0f, 1e-4f);
    EXPECT_EQ(b.samples_used, 9);
    EXPECT_EQ(b.total_samples, 10);
}

TEST_F(BaselineManagerTest, RollingRefreshRecomputes) {
    PersonalizationConfig config;
    config.rolling_refresh = true;
    BaselineManager rolling(engine_, store_, config);

    CalibrationStatus status;
    for (int i = 0; i < 9; ++i) {
        ASSERT_EQ(rolling.add_calibration_sample("carol", sample_with_pitch(100.0f + 10.0f * i), status),
                  ErrorCode::OK);
    }
    ASSERT_EQ(rolling.add_calibration_sample("carol", sample_with_pitch(1000.0f), status), ErrorCode::OK);

    UserBaseline b = stored("carol");
    EXPECT_EQ(b.samples_used, 10);
    EXPECT_NEAR(b.feature_means.at("pitch_mean"), 226.0f, 1e-3f);
}

TEST_F(BaselineManagerTest, RingIsBounded) {
    CalibrationStatus status;
    for (int i = 0; i < 15; ++i) {
        ASSERT_EQ(manager_->add_calibration_sample("dave", sample_with_pitch(100.0f + i), status),
                  ErrorCode::OK);
    }
    EXPECT_EQ(status.samples_collected, 12);

    UserBaseline b = stored("dave");
    ASSERT_EQ(b.samples.size(), 12u);
    EXPECT_EQ(b.total_samples, 15);
    EXPECT_FLOAT_EQ(b.samples.front().pitch_mean, 103.0f);
    EXPECT_FLOAT_EQ(b.samples.back().pitch_mean, 114.0f);
}

TEST_F(BaselineManagerTest, RecalibrateUsesCurrentRing) {
    add_nine("erin");
    CalibrationStatus status;
    ASSERT_EQ(manager_->add_calibration_sample("erin", sample_with_pitch(1000.0f), status), ErrorCode::OK);

    ASSERT_EQ(manager_->recalibrate("erin", status), ErrorCode::OK);
    EXPECT_EQ(status.message, "Personal baseline established from 10 samples");
    EXPECT_NEAR(stored("erin").feature_means.at("pitch_mean"), 226.0f, 1e-3f);
}

TEST_F(BaselineManagerTest, RecalibrateNeedsEnoughSamples) {
    CalibrationStatus status;
    ErrorInfo err;
    EXPECT_EQ(manager_->recalibrate("nobody", status, &err), ErrorCode::NO_BASELINE);

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(manager_->add_calibration_sample("frank", sample_with_pitch(120.0f), status), ErrorCode::OK);
    }
    EXPECT_EQ(manager_->recalibrate("frank", status, &err), ErrorCode::NOT_CALIBRATED);
    EXPECT_EQ(err.code, ErrorCode::NOT_CALIBRATED);
    EXPECT_EQ(status.samples_collected, 3);
    EXPECT_FALSE(status.is_calibrated);
}

TEST_F(BaselineManagerTest, ResetRemovesBaseline) {
    add_nine("gina");
    EXPECT_EQ(manager_->reset("gina"), ErrorCode::OK);
    EXPECT_EQ(store_->count(), 0);

    CalibrationStatus status;
    ASSERT_EQ(manager_->status("gina", status), ErrorCode::OK);
    EXPECT_EQ(status.samples_collected, 0);
    EXPECT_EQ(manager_->reset("gina"), ErrorCode::NO_BASELINE);
}

TEST_F(BaselineManagerTest, StatusForUnknownUser) {
    CalibrationStatus status;
    ASSERT_EQ(manager_->status("new_user", status), ErrorCode::OK);
    EXPECT_EQ(status.user_id, "new_user");
    EXPECT_EQ(status.samples_collected, 0);
    EXPECT_EQ(status.samples_required, 9);
    EXPECT_FALSE(status.is_calibrated);
    EXPECT_FLOAT_EQ(status.progress_percentage, 0.0f);
    EXPECT_EQ(status.message, "Collect 9 more samples to establish your personal baseline");
}

TEST_F(BaselineManagerTest, EmptyUserIdRejected) {
    CalibrationStatus status;
    EXPECT_EQ(manager_->status("", status), ErrorCode::INVALID_PARAM);
    EXPECT_EQ(manager_->add_calibration_sample("", FeatureVector(), status), ErrorCode::INVALID_PARAM);
    EXPECT_EQ(manager_->reset(""), ErrorCode::INVALID_PARAM);
}

TEST_F(BaselineManagerTest, NonFiniteSampleIsSanitized) {
    FeatureVector fv = sample_with_pitch(120.0f);
    fv.jitter_mean = std::nanf("");
    CalibrationStatus status;
    ASSERT_EQ(manager_->add_calibration_sample("hank", fv, status), ErrorCode::OK);
    EXPECT_TRUE(stored("hank").samples.front().all_finite());
}

TEST_F(BaselineManagerTest, MinSamplesClamped) {
    PersonalizationConfig config;
    config.min_samples = 0;
    config.max_samples = -3;
    BaselineManager eager(engine_, store_, config);
    EXPECT_EQ(eager.config().min_samples, 1);
    EXPECT_EQ(eager.config().max_samples, 1);

    CalibrationStatus status;
    ASSERT_EQ(eager.add_calibration_sample("ivy", sample_with_pitch(150.0f), status), ErrorCode::OK);
    EXPECT_TRUE(status.is_calibrated);
}

// ============================================================
// Calibration from audio
// ============================================================

TEST_F(BaselineManagerTest, CalibrateFromPcm) {
    auto audio = voice_like(170.0f, 6.0f, 3);
    CalibrationStatus status;
    ASSERT_EQ(manager_->calibrate("jack", AudioInput::from_pcm(audio.data(), audio.size()), status),
              ErrorCode::OK);
    EXPECT_EQ(status.samples_collected, 1);

    auto short_clip = voice_like(170.0f, 3.0f, 4);
    ErrorInfo err;
    EXPECT_EQ(manager_->calibrate("jack", AudioInput::from_pcm(short_clip.data(), short_clip.size()),
                                  status, &err),
              ErrorCode::AUDIO_TOO_SHORT);
    EXPECT_NEAR(err.measured, 3.0f, 1e-3f);
    EXPECT_FLOAT_EQ(err.limit, 5.0f);
    EXPECT_EQ(stored("jack").samples.size(), 1u);
}

TEST_F(BaselineManagerTest, PersonalizedWithoutBaseline) {
    auto audio = voice_like(180.0f, 12.0f, 5);
    PersonalizedResult result;
    ASSERT_EQ(manager_->analyze_personalized("kate", AudioInput::from_pcm(audio.data(), audio.size()), result),
              ErrorCode::OK);
    EXPECT_EQ(result.status, PersonalizationStatus::NoBaseline);
    EXPECT_EQ(result.adjusted_risk, result.analysis.risk_level);
    EXPECT_EQ(result.calibration.samples_collected, 0);
    EXPECT_TRUE(result.deviation.features.empty());
}

TEST_F(BaselineManagerTest, PersonalizedBeforeCalibration) {
    CalibrationStatus status;
    ASSERT_EQ(manager_->add_calibration_sample("liam", sample_with_pitch(150.0f), status), ErrorCode::OK);

    auto audio = voice_like(180.0f, 12.0f, 6);
    PersonalizedResult result;
    ASSERT_EQ(manager_->analyze_personalized("liam", AudioInput::from_pcm(audio.data(), audio.size()), result),
              ErrorCode::OK);
    EXPECT_EQ(result.status, PersonalizationStatus::NotCalibrated);
    EXPECT_EQ(result.calibration.samples_collected, 1);
}

TEST_F(BaselineManagerTest, PersonalizedAgainstBaseline) {
    add_nine("mia");
    auto audio = voice_like(180.0f, 12.0f, 7);
    PersonalizedResult result;
    ASSERT_EQ(manager_->analyze_personalized("mia", AudioInput::from_pcm(audio.data(), audio.size()), result),
              ErrorCode::OK);
    EXPECT_EQ(result.status, PersonalizationStatus::Applied);
    EXPECT_TRUE(result.calibration.is_calibrated);

    // Only pitch varied across the calibration samples
    ASSERT_EQ(result.deviation.features.size(), 1u);
    const FeatureDeviation& d = result.deviation.features[0];
    EXPECT_EQ(d.feature, "pitch_mean");
    EXPECT_NEAR(d.z_score, (result.analysis.features.pitch_mean - 140.0f) / std::sqrt(6000.0f / 9.0f), 1e-3f);
    EXPECT_NEAR(result.deviation.score, std::fabs(d.z_score), 1e-4f);
    EXPECT_EQ(result.adjusted_risk,
              BaselineManager::adjust_risk(result.analysis.risk_level, result.deviation.score));

    EXPECT_LE(result.deviation.scores.size(), kNumBaselineScores);
    for (const auto& sd : result.deviation.scores) {
        EXPECT_EQ(sd.direction, sd.z_score > 0.0f ? "increased" : "decreased");
        EXPECT_GT(sd.baseline_std, 0.0f);
    }
    ASSERT_FALSE(result.deviation.insights.empty());
    EXPECT_EQ(result.deviation.insights,
              BaselineManager::baseline_insights(result.deviation));
}

// ============================================================
// Deviation scoring
// ============================================================

TEST_F(BaselineManagerTest, DeviationIsWeightedMeanAbsZ) {
    UserBaseline b("nora");
    b.calibrated = true;
    b.feature_means = {{"pitch_mean", 100.0f}, {"rms_mean", 0.1f}, {"hnr", 10.0f}};
    b.feature_stds = {{"pitch_mean", 10.0f}, {"rms_mean", 0.01f}, {"hnr", 0.0f}};

    FeatureVector fv;
    fv.pitch_mean = 80.0f;
    fv.rms.mean = 0.1f;
    fv.hnr = 30.0f;

    DeviationReport r = manager_->score_deviation(fv, b);
    ASSERT_EQ(r.features.size(), 2u);   // zero-spread hnr skipped
    EXPECT_EQ(r.features[0].feature, "pitch_mean");
    EXPECT_NEAR(r.features[0].z_score, -2.0f, 1e-5f);
    EXPECT_EQ(r.features[0].interpretation, "moderately outside normal range");
    EXPECT_NEAR(r.features[1].z_score, 0.0f, 1e-4f);
    EXPECT_NEAR(r.score, 1.0f, 1e-4f);

    DeviationReport again = manager_->score_deviation(fv, b);
    EXPECT_FLOAT_EQ(again.score, r.score);
    EXPECT_EQ(b.feature_means.at("pitch_mean"), 100.0f);
}

TEST_F(BaselineManagerTest, DeviationWithoutUsableFeatures) {
    UserBaseline b("omar");
    DeviationReport r = manager_->score_deviation(FeatureVector(), b);
    EXPECT_TRUE(r.features.empty());
    EXPECT_FLOAT_EQ(r.score, 0.0f);
    EXPECT_EQ(r.band, "consistent with baseline");
}

TEST_F(BaselineManagerTest, ScoreDeviationsAgainstCalibrationScores) {
    UserBaseline b("pia");
    b.calibrated = true;
    b.score_means = {{"phq9", 5.0f}, {"gad7", 4.0f}, {"wemwbs", 50.0f}, {"mental_health_score", 70.0f}};
    b.score_stds = {{"phq9", 2.0f}, {"gad7", 0.0f}, {"wemwbs", 4.0f}, {"mental_health_score", 10.0f}};

    ScoreSample current = {9.0f, 6.0f, 20.0f, 42.0f, 75.0f};
    std::vector<ScoreDeviation> d = manager_->score_deviations(current, b);

    // pss has no baseline, gad7 has no spread
    ASSERT_EQ(d.size(), 3u);
    EXPECT_EQ(d[0].score, "phq9");
    EXPECT_FLOAT_EQ(d[0].z_score, 2.0f);
    EXPECT_EQ(d[0].direction, "increased");
    EXPECT_EQ(d[0].interpretation, "Higher than your baseline - may need attention");

    EXPECT_EQ(d[1].score, "wemwbs");
    EXPECT_FLOAT_EQ(d[1].z_score, -2.0f);
    EXPECT_EQ(d[1].direction, "decreased");
    EXPECT_EQ(d[1].interpretation, "Below your baseline - may need attention");

    EXPECT_EQ(d[2].score, "mental_health_score");
    EXPECT_FLOAT_EQ(d[2].z_score, 0.5f);
    EXPECT_FLOAT_EQ(d[2].value, 75.0f);
    EXPECT_FLOAT_EQ(d[2].baseline_mean, 70.0f);
    EXPECT_EQ(d[2].interpretation, "Consistent with your baseline");
}

TEST_F(BaselineManagerTest, ScoreDeviationsWithoutScoreBaseline) {
    UserBaseline b("quinn");
    b.calibrated = true;
    EXPECT_TRUE(manager_->score_deviations({1.0f, 1.0f, 1.0f, 60.0f, 80.0f}, b).empty());
}

TEST(BaselineInsightsTest, OverallLineFollowsDeviation) {
    DeviationReport r;
    r.score = 0.99f;
    ASSERT_EQ(BaselineManager::baseline_insights(r).size(), 1u);
    EXPECT_EQ(BaselineManager::baseline_insights(r)[0],
              "Your voice patterns are consistent with your established baseline.");
    r.score = 1.0f;
    EXPECT_EQ(BaselineManager::baseline_insights(r)[0],
              "Some variation from your baseline detected, but within expected range.");
    r.score = 2.0f;
    EXPECT_EQ(BaselineManager::baseline_insights(r)[0],
              "Significant variation from your baseline detected. Consider monitoring closely.");
}

TEST(BaselineInsightsTest, OnlyUnfavourableScoreChangesAreReported) {
    auto change = [](const std::string& name, float z) {
        ScoreDeviation d;
        d.score = name;
        d.z_score = z;
        d.direction = z > 0.0f ? "increased" : "decreased";
        return d;
    };
    DeviationReport r;
    r.score = 0.5f;
    r.scores = {
        change("phq9", 2.0f),                 // worse
        change("gad7", -2.0f),                // better
        change("pss", 1.5f),                  // not past 1.5
        change("wemwbs", -1.6f),              // worse
        change("mental_health_score", 3.0f),  // better
    };

    std::vector<std::string> lines = BaselineManager::baseline_insights(r);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "Your PHQ-9 score has increased compared to your baseline.");
    EXPECT_EQ(lines[2], "Your WEMWBS score has decreased compared to your baseline.");

    r.scores = {change("mental_health_score", -2.5f)};
    lines = BaselineManager::baseline_insights(r);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "Your mental health score has decreased compared to your baseline.");
}

TEST(DeviationLabelTest, ScoreChangeLabels) {
    // phq9: lower is better
    EXPECT_EQ(BaselineManager::score_change_label(0, 1.2f), "Higher than your baseline - may need attention");
    EXPECT_EQ(BaselineManager::score_change_label(0, -1.2f), "Lower than your baseline - positive trend");
    EXPECT_EQ(BaselineManager::score_change_label(0, 1.0f), "Consistent with your baseline");
    // wemwbs: higher is better
    EXPECT_EQ(BaselineManager::score_change_label(3, 1.2f), "Better than your baseline - positive trend");
    EXPECT_EQ(BaselineManager::score_change_label(3, -1.2f), "Below your baseline - may need attention");
    EXPECT_EQ(BaselineManager::score_change_label(4, -0.5f), "Consistent with your baseline");
}

TEST_F(BaselineManagerTest, LockTableStaysBounded) {
    CalibrationStatus status;
    for (int i = 0; i < 200; ++i) {
        ASSERT_EQ(manager_->add_calibration_sample("user" + std::to_string(i), sample_with_pitch(150.0f), status),
                  ErrorCode::OK);
    }
    EXPECT_LE(manager_->lock_table_size(), 64u);
}

TEST(DeviationLabelTest, ZScoreLabels) {
    EXPECT_EQ(BaselineManager::z_score_label(0.5f), "within normal range");
    EXPECT_EQ(BaselineManager::z_score_label(-1.5f), "slightly outside normal range");
    EXPECT_EQ(BaselineManager::z_score_label(2.5f), "moderately outside normal range");
    EXPECT_EQ(BaselineManager::z_score_label(-3.0f), "significantly outside normal range");
}

TEST(DeviationLabelTest, Bands) {
    EXPECT_EQ(BaselineManager::deviation_band(0.49f), "consistent with baseline");
    EXPECT_EQ(BaselineManager::deviation_band(0.5f), "minor variation");
    EXPECT_EQ(BaselineManager::deviation_band(1.5f), "moderate change");
    EXPECT_EQ(BaselineManager::deviation_band(2.0f), "significant change");
}

TEST(DeviationLabelTest, RiskAdjustment) {
    EXPECT_EQ(BaselineManager::adjust_risk(RiskLevel::Low, 2.0f), RiskLevel::Moderate);
    EXPECT_EQ(BaselineManager::adjust_risk(RiskLevel::Low, 1.99f), RiskLevel::Low);
    EXPECT_EQ(BaselineManager::adjust_risk(RiskLevel::Moderate, 5.0f), RiskLevel::Moderate);
    EXPECT_EQ(BaselineManager::adjust_risk(RiskLevel::High, 3.0f), RiskLevel::High);
}

TEST(PersonalizationStatusTest, Names) {
    EXPECT_STREQ(personalization_status_name(PersonalizationStatus::Applied), "applied");
    EXPECT_STREQ(personalization_status_name(PersonalizationStatus::NoBaseline), "no_baseline");
    EXPECT_STREQ(personalization_status_name(PersonalizationStatus::NotCalibrated), "not_calibrated");
}
