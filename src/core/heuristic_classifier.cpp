#include "core/heuristic_classifier.h"
#include <algorithm>

namespace vc {

namespace {

enum { kNormal = 0, kAnxiety = 1, kDepression = 2, kStress = 3 };

inline float capped(float excess, float per_unit, float cap) {
    return std::min(cap, excess * per_unit);
}

} // anonymous namespace

HeuristicClassifier::HeuristicClassifier(const HeuristicConfig& config, float probability_floor)
    : config_(config), floor_(probability_floor),
      rng_(config.seed != 0 ? config.seed : std::random_device{}()) {}

ClassProbabilities HeuristicClassifier::raw_scores(const FeatureVector& f) const {
    const HeuristicConfig& c = config_;
    ClassProbabilities p = {c.base_normal, c.base_anxiety, c.base_depression, c.base_stress};
    float concern = 0.0f;
    auto raise = [&](int cls, float amount) {
        p[cls] += amount;
        concern += amount;
    };

    // Pitch variability
    if (f.pitch_std > c.pitch_std_high) {
        raise(kAnxiety, capped(f.pitch_std - c.pitch_std_high, 0.005f, 0.15f));
    } else if (f.pitch_std > 0.0f && f.pitch_std < c.pitch_std_low) {
        raise(kDepression, capped(c.pitch_std_low - f.pitch_std, 0.01f, 0.12f));
    }

    // Speech rate
    if (f.speech_rate > c.speech_rate_high) {
        float excess = f.speech_rate - c.speech_rate_high;
        raise(kAnxiety, capped(excess, 0.05f, 0.10f));
        raise(kStress, capped(excess, 0.025f, 0.05f));
    } else if (f.speech_rate > 0.0f && f.speech_rate < c.speech_rate_low) {
        raise(kDepression, capped(c.speech_rate_low - f.speech_rate, 0.08f, 0.12f));
    }

    // Energy
    if (f.rms.mean < c.rms_low) {
        raise(kDepression, capped(c.rms_low - f.rms.mean, 5.0f, 0.10f));
    }

    // Voice quality
    if (f.jitter_mean > c.jitter_high) {
        raise(kStress, capped(f.jitter_mean - c.jitter_high, 3.0f, 0.12f));
    }
    if (f.hnr < c.hnr_low) {
        raise(kStress, capped(c.hnr_low - f.hnr, 0.02f, 0.10f));
    }

    if (concern > 0.0f) {
        p[kNormal] -= 0.5f * concern;
    } else {
        p[kNormal] += c.normal_bonus;
    }
    return p;
}

bool HeuristicClassifier::score(const FeatureVector& features, ClassScore& out) const {
    ClassProbabilities p = raw_scores(features);

    if (config_.perturbation_std > 0.0f) {
        std::normal_distribution<float> noise(0.0f, config_.perturbation_std);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        for (float& v : p) v += noise(rng_);
    }

    // Clamp to the floor before renormalizing so no class goes negative
    for (float& v : p) v = std::max(v, floor_);
    probability::apply_floor(p, floor_);

    out.probabilities = p;
    out.confidence = probability::max_value(p);
    out.classifier = name();
    return true;
}

} // namespace vc
