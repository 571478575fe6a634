#ifndef VC_HEURISTIC_CLASSIFIER_H
#define VC_HEURISTIC_CLASSIFIER_H

#include "core/classifier.h"
#include "utils/config.h"
#include <mutex>
#include <random>

namespace vc {

// Rule-based scorer. Needs no trained parameters, so it is always available.
class HeuristicClassifier : public Classifier {
public:
    explicit HeuristicClassifier(const HeuristicConfig& config = {}, float probability_floor = 0.05f);

    bool score(const FeatureVector& features, ClassScore& out) const override;
    std::string name() const override { return "heuristic"; }

    // Rule adjustments only: no perturbation, no floor
    ClassProbabilities raw_scores(const FeatureVector& features) const;

private:
    HeuristicConfig config_;
    float floor_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};

} // namespace vc

#endif // VC_HEURISTIC_CLASSIFIER_H
