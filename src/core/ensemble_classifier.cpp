#include "core/ensemble_classifier.h"
#include "utils/logger.h"
#include <algorithm>

namespace vc {

// ============================================================
// EnsembleClassifier
// ============================================================

EnsembleClassifier::EnsembleClassifier(float temperature, float probability_floor)
    : temperature_(temperature), floor_(probability_floor) {}

void EnsembleClassifier::add(std::shared_ptr<const Classifier> classifier, float weight) {
    if (!classifier) return;
    members_.push_back({std::move(classifier), weight});
}

std::vector<float> EnsembleClassifier::normalized_weights() const {
    std::vector<float> w(members_.size(), 0.0f);
    if (members_.empty()) return w;

    bool all_known = true;
    float total = 0.0f;
    for (const auto& m : members_) {
        if (!(m.weight > 0.0f)) all_known = false;
        total += m.weight;
    }
    if (!all_known || total <= 0.0f) {
        std::fill(w.begin(), w.end(), 1.0f / members_.size());
        return w;
    }
    for (size_t i = 0; i < members_.size(); ++i) w[i] = members_[i].weight / total;
    return w;
}

bool EnsembleClassifier::score(const FeatureVector& features, ClassScore& out) const {
    if (members_.empty()) return false;

    std::vector<float> weights = normalized_weights();
    ClassProbabilities combined{};

    for (size_t i = 0; i < members_.size(); ++i) {
        ClassScore member;
        if (!members_[i].classifier->score(features, member)) {
            VC_LOG_WARN("Ensemble member '{}' failed", members_[i].classifier->name());
            return false;
        }
        ClassProbabilities p = member.probabilities;
        probability::normalize(p);
        for (int k = 0; k < kNumClasses; ++k) combined[k] += weights[i] * p[k];
    }

    probability::soften(combined, temperature_);
    probability::apply_floor(combined, floor_);

    out.probabilities = combined;
    out.confidence = probability::max_value(combined);
    out.classifier = name();
    return true;
}

// ============================================================
// FallbackClassifier
// ============================================================

FallbackClassifier::FallbackClassifier(std::shared_ptr<const Classifier> primary,
                                       std::shared_ptr<const Classifier> secondary)
    : primary_(std::move(primary)), secondary_(std::move(secondary)) {}

std::string FallbackClassifier::name() const {
    return primary_ ? primary_->name() : (secondary_ ? secondary_->name() : "none");
}

bool FallbackClassifier::score(const FeatureVector& features, ClassScore& out) const {
    if (primary_) {
        if (primary_->score(features, out)) return true;
        VC_LOG_WARN("Classifier '{}' failed, falling back to '{}'", primary_->name(),
                    secondary_ ? secondary_->name() : "none");
    }
    if (!secondary_) return false;
    return secondary_->score(features, out);
}

} // namespace vc
