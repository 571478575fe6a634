#ifndef VC_CLASSIFIER_H
#define VC_CLASSIFIER_H

#include "core/feature_vector.h"
#include <array>
#include <string>

namespace vc {

constexpr int kNumClasses = 4;

enum class MentalState {
    Normal = 0,
    Anxiety = 1,
    Depression = 2,
    Stress = 3
};

const char* class_name(int index);

using ClassProbabilities = std::array<float, kNumClasses>;

struct ClassScore {
    ClassProbabilities probabilities{};   // normal, anxiety, depression, stress
    float confidence = 0.0f;              // max probability after flooring
    std::string classifier;               // which implementation produced it

    int dominant() const;
};

// One scoring capability shared by every strategy. Implementations must be
// safe to call from several threads at once.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual bool score(const FeatureVector& features, ClassScore& out) const = 0;
    virtual std::string name() const = 0;
};

namespace probability {

// Scale to sum 1; a non-positive sum becomes uniform
void normalize(ClassProbabilities& p);

// Sum to 1 with every entry >= floor. Entries pinned at the floor take their
// mass from the others proportionally.
void apply_floor(ClassProbabilities& p, float floor);

// p^(1/T), renormalized. T > 1 flattens the distribution.
void soften(ClassProbabilities& p, float temperature);

// In-place softmax
void softmax(float* x, int n);

float max_value(const ClassProbabilities& p);

} // namespace probability

} // namespace vc

#endif // VC_CLASSIFIER_H
