#include "core/wellness_score.h"
#include <algorithm>

namespace vc {

const char* risk_level_name(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:      return "low";
        case RiskLevel::Moderate: return "moderate";
        case RiskLevel::High:     return "high";
    }
    return "unknown";
}

float mental_health_score(const ClassProbabilities& p, float confidence) {
    const float n = p[static_cast<int>(MentalState::Normal)];
    const float a = p[static_cast<int>(MentalState::Anxiety)];
    const float d = p[static_cast<int>(MentalState::Depression)];
    const float s = p[static_cast<int>(MentalState::Stress)];

    float base = n - 0.5f * (a + d + s);
    float score = (base + 0.5f) * 100.0f;
    confidence = std::max(0.0f, std::min(1.0f, confidence));
    score *= 0.7f + 0.3f * confidence;
    return std::max(0.0f, std::min(100.0f, score));
}

RiskLevel risk_level(const ClassProbabilities& p) {
    float concern = std::max({p[static_cast<int>(MentalState::Anxiety)],
                              p[static_cast<int>(MentalState::Depression)],
                              p[static_cast<int>(MentalState::Stress)]});
    if (concern < 0.2f) return RiskLevel::Low;
    if (concern < 0.4f) return RiskLevel::Moderate;
    return RiskLevel::High;
}

} // namespace vc
