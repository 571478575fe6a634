#ifndef VC_SCALE_MAPPER_H
#define VC_SCALE_MAPPER_H

#include "core/classifier.h"
#include "core/feature_vector.h"
#include <map>
#include <string>
#include <vector>

namespace vc {

struct ScaleScore {
    std::string scale;           // "PHQ-9", "GAD-7", "PSS", "WEMWBS"
    int score = 0;
    int min_score = 0;
    int max_score = 0;
    std::string interpretation;  // severity band
};

struct ScaleScores {
    ScaleScore phq9;
    ScaleScore gad7;
    ScaleScore pss;
    ScaleScore wemwbs;

    // In the order PHQ-9, GAD-7, PSS, WEMWBS
    std::vector<const ScaleScore*> all() const { return {&phq9, &gad7, &pss, &wemwbs}; }

    // Severity band keyed by scale name
    std::map<std::string, std::string> interpretations() const;
};

// Estimated self-report scale scores. Deterministic in its inputs.
ScaleScores map_to_scales(const ClassProbabilities& probabilities, float mental_health_score);

// Band names for each scale, exposed for tests and the demo
std::string phq9_band(int score);
std::string gad7_band(int score);
std::string pss_band(int score);
std::string wemwbs_band(int score);

// Plain-language notes for acoustic markers outside their typical range
std::vector<std::string> interpret_features(const FeatureVector& features);

std::vector<std::string> recommendations(const ClassProbabilities& probabilities,
                                         float mental_health_score,
                                         const ScaleScores& scales);

} // namespace vc

#endif // VC_SCALE_MAPPER_H
