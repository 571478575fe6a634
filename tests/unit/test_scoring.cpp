#include <gtest/gtest.h>
#include "core/wellness_score.h"

using namespace vc;

TEST(WellnessScoreTest, Extremes) {
    EXPECT_FLOAT_EQ(mental_health_score({1.0f, 0.0f, 0.0f, 0.0f}, 1.0f), 100.0f);
    EXPECT_FLOAT_EQ(mental_health_score({0.0f, 1.0f, 0.0f, 0.0f}, 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(mental_health_score({0.0f, 0.0f, 0.5f, 0.5f}, 0.5f), 0.0f);
}

TEST(WellnessScoreTest, ConfidenceScalesTheScore) {
    ClassProbabilities p = {0.6f, 0.2f, 0.1f, 0.1f};
    EXPECT_NEAR(mental_health_score(p, 0.6f), 90.0f * 0.88f, 1e-3f);
    EXPECT_NEAR(mental_health_score(p, 0.0f), 90.0f * 0.7f, 1e-3f);

    ClassProbabilities uniform = {0.25f, 0.25f, 0.25f, 0.25f};
    EXPECT_NEAR(mental_health_score(uniform, 0.25f), 37.5f * 0.775f, 1e-3f);
}

TEST(WellnessScoreTest, ConfidenceIsClamped) {
    ClassProbabilities p = {0.5f, 0.2f, 0.2f, 0.1f};
    EXPECT_FLOAT_EQ(mental_health_score(p, 5.0f), mental_health_score(p, 1.0f));
    EXPECT_FLOAT_EQ(mental_health_score(p, -1.0f), mental_health_score(p, 0.0f));
}

TEST(WellnessScoreTest, MoreNormalNeverLowersTheScore) {
    float previous = -1.0f;
    for (int i = 0; i <= 10; ++i) {
        float n = 0.1f * i;
        float rest = (1.0f - n) / 3.0f;
        float score = mental_health_score({n, rest, rest, rest}, 0.8f);
        EXPECT_GE(score, previous);
        EXPECT_GE(score, 0.0f);
        EXPECT_LE(score, 100.0f);
        previous = score;
    }
}

TEST(WellnessScoreTest, MoreConcernNeverRaisesTheScore) {
    const int concerns[] = {
        static_cast<int>(MentalState::Anxiety),
        static_cast<int>(MentalState::Depression),
        static_cast<int>(MentalState::Stress),
    };
    for (int concern : concerns) {
        for (float confidence : {0.0f, 0.5f, 1.0f}) {
            float previous = 101.0f;
            for (int i = 0; i <= 20; ++i) {
                ClassProbabilities p = {0.55f, 0.1f, 0.1f, 0.1f};
                p[concern] = 0.05f * i;
                float score = mental_health_score(p, confidence);
                EXPECT_LE(score, previous) << "class " << concern << " at " << p[concern];
                EXPECT_GE(score, 0.0f);
                EXPECT_LE(score, 100.0f);
                previous = score;
            }
        }
    }
}

TEST(RiskLevelTest, Thresholds) {
    EXPECT_EQ(risk_level({0.7f, 0.1f, 0.1f, 0.1f}), RiskLevel::Low);
    EXPECT_EQ(risk_level({0.6f, 0.2f, 0.1f, 0.1f}), RiskLevel::Moderate);
    EXPECT_EQ(risk_level({0.5f, 0.05f, 0.39f, 0.06f}), RiskLevel::Moderate);
    EXPECT_EQ(risk_level({0.5f, 0.1f, 0.4f, 0.0f}), RiskLevel::High);
    EXPECT_EQ(risk_level({0.05f, 0.05f, 0.05f, 0.85f}), RiskLevel::High);
}

TEST(RiskLevelTest, Names) {
    EXPECT_STREQ(risk_level_name(RiskLevel::Low), "low");
    EXPECT_STREQ(risk_level_name(RiskLevel::Moderate), "moderate");
    EXPECT_STREQ(risk_level_name(RiskLevel::High), "high");
}
