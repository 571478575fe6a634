#ifndef VC_ENSEMBLE_CLASSIFIER_H
#define VC_ENSEMBLE_CLASSIFIER_H

#include "core/classifier.h"
#include <memory>
#include <string>
#include <vector>

namespace vc {

// Weighted average of several members, softened by a temperature and floored.
// Members are weighted by their validation F1; when any member lacks one the
// weights are equal.
class EnsembleClassifier : public Classifier {
public:
    struct Member {
        std::shared_ptr<const Classifier> classifier;
        float weight = 0.0f;   // <= 0 means unknown
    };

    EnsembleClassifier(float temperature = 1.5f, float probability_floor = 0.05f);

    void add(std::shared_ptr<const Classifier> classifier, float weight);

    // Fails when there are no members or any member fails
    bool score(const FeatureVector& features, ClassScore& out) const override;
    std::string name() const override { return "ensemble"; }

    size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }
    std::vector<float> normalized_weights() const;

private:
    std::vector<Member> members_;
    float temperature_;
    float floor_;
};

// Uses `primary` when it is present and succeeds, otherwise `secondary`.
class FallbackClassifier : public Classifier {
public:
    FallbackClassifier(std::shared_ptr<const Classifier> primary,
                       std::shared_ptr<const Classifier> secondary);

    bool score(const FeatureVector& features, ClassScore& out) const override;
    std::string name() const override;

    bool has_primary() const { return primary_ != nullptr; }

private:
    std::shared_ptr<const Classifier> primary_;
    std::shared_ptr<const Classifier> secondary_;
};

} // namespace vc

#endif // VC_ENSEMBLE_CLASSIFIER_H
