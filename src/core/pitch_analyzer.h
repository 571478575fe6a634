#pragma once
#ifndef VC_PITCH_ANALYZER_H
#define VC_PITCH_ANALYZER_H

// F0 tracking by spectral peak salience: per frame, the strongest local
// maximum of the magnitude spectrum inside [fmin, fmax], refined by
// parabolic interpolation.

#include "core/stft.h"
#include <vector>
#include <cmath>
#include <algorithm>

namespace vc {
namespace dsp {

// ----------------------------------------------------------------
// Peak-salience pitch tracker
// ----------------------------------------------------------------
class PitchAnalyzer {
public:
    PitchAnalyzer(float min_f0 = 60.0f, float max_f0 = 1000.0f, float threshold = 0.1f)
        : min_f0_(min_f0), max_f0_(max_f0), threshold_(threshold) {}

    // One value per spectrogram frame, 0 = no pitch
    std::vector<float> track(const Spectrogram& spec) const {
        std::vector<float> f0(spec.num_frames, 0.0f);
        if (spec.empty() || spec.n_fft <= 0) return f0;

        const float bin_hz = static_cast<float>(spec.sample_rate) / spec.n_fft;
        int lo = std::max(1, static_cast<int>(std::ceil(min_f0_ / bin_hz)));
        int hi = std::min(spec.num_bins - 2, static_cast<int>(std::floor(max_f0_ / bin_hz)));
        if (hi < lo) return f0;

        for (int t = 0; t < spec.num_frames; ++t) {
            const float* S = spec.frame(t);
            float frame_max = *std::max_element(S, S + spec.num_bins);
            if (frame_max <= 0.0f) continue;
            const float floor = threshold_ * frame_max;

            int best = -1;
            for (int k = lo; k <= hi; ++k) {
                if (S[k] > floor && S[k] > S[k - 1] && S[k] >= S[k + 1]) {
                    if (best < 0 || S[k] > S[best]) best = k;
                }
            }
            if (best < 0) continue;

            float a = S[best - 1], b = S[best], c = S[best + 1];
            float denom = a - 2.0f * b + c;
            float shift = std::fabs(denom) > 1e-12f ? 0.5f * (a - c) / denom : 0.0f;
            shift = std::max(-0.5f, std::min(0.5f, shift));
            f0[t] = (static_cast<float>(best) + shift) * bin_hz;
        }
        return f0;
    }

    // Frames with a detected pitch, in order
    static std::vector<float> voiced(const std::vector<float>& track) {
        std::vector<float> out;
        for (float f : track)
            if (f > 0.0f) out.push_back(f);
        return out;
    }

private:
    float min_f0_, max_f0_, threshold_;
};

} // namespace dsp
} // namespace vc

#endif // VC_PITCH_ANALYZER_H
