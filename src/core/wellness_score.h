#ifndef VC_WELLNESS_SCORE_H
#define VC_WELLNESS_SCORE_H

#include "core/classifier.h"

namespace vc {

enum class RiskLevel {
    Low = 0,
    Moderate = 1,
    High = 2
};

const char* risk_level_name(RiskLevel level);

// 0-100, higher is better. Normal probability raises the score, the three
// concern classes lower it, and low confidence pulls it towards zero.
float mental_health_score(const ClassProbabilities& probabilities, float confidence);

// From the largest concern probability: < 0.2 low, < 0.4 moderate, else high
RiskLevel risk_level(const ClassProbabilities& probabilities);

} // namespace vc

#endif // VC_WELLNESS_SCORE_H
