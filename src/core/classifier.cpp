#include "core/classifier.h"
#include <algorithm>
#include <cmath>

namespace vc {

const char* class_name(int index) {
    switch (index) {
        case 0: return "normal";
        case 1: return "anxiety";
        case 2: return "depression";
        case 3: return "stress";
        default: return "unknown";
    }
}

int ClassScore::dominant() const {
    return static_cast<int>(std::max_element(probabilities.begin(), probabilities.end()) -
                            probabilities.begin());
}

namespace probability {

void normalize(ClassProbabilities& p) {
    float sum = 0.0f;
    for (float& v : p) {
        if (!std::isfinite(v) || v < 0.0f) v = 0.0f;
        sum += v;
    }
    if (sum <= 0.0f) {
        p.fill(1.0f / kNumClasses);
        return;
    }
    for (float& v : p) v /= sum;
}

void apply_floor(ClassProbabilities& p, float floor) {
    normalize(p);
    if (floor <= 0.0f) return;
    if (floor * kNumClasses >= 1.0f) {
        p.fill(1.0f / kNumClasses);
        return;
    }

    std::array<bool, kNumClasses> pinned{};
    for (int round = 0; round < kNumClasses; ++round) {
        int pinned_count = 0;
        float free_sum = 0.0f;
        for (int i = 0; i < kNumClasses; ++i) {
            if (pinned[i]) ++pinned_count;
            else free_sum += p[i];
        }
        float free_mass = 1.0f - floor * pinned_count;

        bool changed = false;
        for (int i = 0; i < kNumClasses; ++i) {
            if (pinned[i]) {
                p[i] = floor;
                continue;
            }
            p[i] = free_sum > 0.0f ? p[i] * free_mass / free_sum
                                   : free_mass / (kNumClasses - pinned_count);
            if (p[i] < floor) {
                pinned[i] = true;
                changed = true;
            }
        }
        if (!changed) break;
    }
    for (int i = 0; i < kNumClasses; ++i) {
        if (pinned[i]) p[i] = floor;
    }
}

void soften(ClassProbabilities& p, float temperature) {
    if (temperature <= 0.0f || temperature == 1.0f) return;
    const float exponent = 1.0f / temperature;
    for (float& v : p) v = v > 0.0f ? std::pow(v, exponent) : 0.0f;
    normalize(p);
}

void softmax(float* x, int n) {
    float max_val = *std::max_element(x, x + n);
    float sum = 0.0f;
    for (int i = 0; i < n; ++i) { x[i] = std::exp(x[i] - max_val); sum += x[i]; }
    if (sum > 1e-8f) for (int i = 0; i < n; ++i) x[i] /= sum;
}

float max_value(const ClassProbabilities& p) {
    return *std::max_element(p.begin(), p.end());
}

} // namespace probability

} // namespace vc
