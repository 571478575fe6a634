#pragma once
#ifndef VC_HARMONIC_ANALYZER_H
#define VC_HARMONIC_ANALYZER_H

// Harmonic-to-noise ratio from a median-filter harmonic/percussive split
// of the magnitude spectrogram.

#include "core/stft.h"
#include <vector>
#include <cmath>
#include <algorithm>

namespace vc {
namespace dsp {

// ----------------------------------------------------------------
// Median filtering with half-sample symmetric edges (d c b a | a b c d | d c b a)
// ----------------------------------------------------------------
inline int reflect_index(int i, int n) {
    if (n == 1) return 0;
    const int period = 2 * n;
    i %= period;
    if (i < 0) i += period;
    return i < n ? i : period - 1 - i;
}

inline void median_filter_1d(const float* in, int n, int stride, int kernel,
                             float* out, int out_stride, std::vector<float>& scratch) {
    const int half = kernel / 2;
    scratch.resize(kernel);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < kernel; ++j) {
            scratch[j] = in[static_cast<size_t>(reflect_index(i - half + j, n)) * stride];
        }
        std::nth_element(scratch.begin(), scratch.begin() + half, scratch.end());
        out[static_cast<size_t>(i) * out_stride] = scratch[half];
    }
}

// ----------------------------------------------------------------
// HNR in dB. 0 when the residual carries no energy.
// ----------------------------------------------------------------
inline float harmonic_to_noise_db(const Spectrogram& spec, int kernel = 31) {
    const int T = spec.num_frames;
    const int K = spec.num_bins;
    if (T == 0 || K == 0) return 0.0f;
    if (kernel % 2 == 0) ++kernel;

    const size_t total = static_cast<size_t>(T) * K;
    std::vector<float> harmonic(total), percussive(total);
    std::vector<float> scratch;

    // Harmonic: smooth each bin along time
    for (int k = 0; k < K; ++k) {
        median_filter_1d(spec.magnitude.data() + k, T, K, kernel,
                         harmonic.data() + k, K, scratch);
    }
    // Percussive: smooth each frame along frequency
    for (int t = 0; t < T; ++t) {
        median_filter_1d(spec.frame(t), K, 1, kernel,
                         percussive.data() + static_cast<size_t>(t) * K, 1, scratch);
    }

    double harmonic_energy = 0.0, noise_energy = 0.0;
    for (size_t i = 0; i < total; ++i) {
        double h2 = static_cast<double>(harmonic[i]) * harmonic[i];
        double p2 = static_cast<double>(percussive[i]) * percussive[i];
        double denom = h2 + p2;
        double mask = denom > 1e-20 ? h2 / denom : 0.0;
        double h = spec.magnitude[i] * mask;
        double r = spec.magnitude[i] - h;
        harmonic_energy += h * h;
        noise_energy += r * r;
    }

    if (noise_energy <= 0.0 || harmonic_energy <= 0.0) return 0.0f;
    return static_cast<float>(10.0 * std::log10(harmonic_energy / noise_energy));
}

} // namespace dsp
} // namespace vc

#endif // VC_HARMONIC_ANALYZER_H
