#ifndef VC_USER_BASELINE_H
#define VC_USER_BASELINE_H

#include "core/feature_vector.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>

namespace vc {

// Assessment scores recorded with each calibration sample, in storage order
constexpr size_t kNumBaselineScores = 5;
using ScoreSample = std::array<float, kNumBaselineScores>;

inline const char* baseline_score_name(size_t index) {
    static const char* const names[kNumBaselineScores] = {
        "phq9", "gad7", "pss", "wemwbs", "mental_health_score"
    };
    return index < kNumBaselineScores ? names[index] : "";
}

// WEMWBS and the mental health score improve upwards, the symptom scales downwards
inline bool baseline_score_higher_is_better(size_t index) {
    return index == 3 || index == 4;
}

// Per-user voice baseline: the most recent calibration samples plus the
// statistics frozen when calibration completed.
struct UserBaseline {
    std::string user_id;
    int schema_version = kFeatureSchemaVersion;

    std::deque<FeatureVector> samples;   // oldest first, bounded by max_samples
    int total_samples = 0;               // samples ever added, including evicted ones

    bool calibrated = false;
    int samples_used = 0;                // samples behind the current statistics
    std::map<std::string, float> feature_means;
    std::map<std::string, float> feature_stds;   // population std
    int64_t calibrated_at = 0;           // unix seconds, 0 while uncalibrated

    std::deque<ScoreSample> score_samples;       // oldest first, alongside samples
    std::map<std::string, float> score_means;    // keyed by baseline_score_name()
    std::map<std::string, float> score_stds;

    UserBaseline() = default;
    explicit UserBaseline(const std::string& id) : user_id(id) {}
};

} // namespace vc

#endif // VC_USER_BASELINE_H
