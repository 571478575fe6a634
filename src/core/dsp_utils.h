#pragma once
#ifndef VC_DSP_UTILS_H
#define VC_DSP_UTILS_H

// Small framing and statistics helpers shared by the feature extractors.

#include "core/feature_vector.h"
#include <vector>
#include <cmath>
#include <numeric>
#include <algorithm>

namespace vc {
namespace dsp {

// ----------------------------------------------------------------
// Statistics (population std, as used for every *_std feature)
// ----------------------------------------------------------------
inline float mean(const std::vector<float>& v) {
    if (v.empty()) return 0.0f;
    double sum = 0.0;
    for (float x : v) sum += x;
    return static_cast<float>(sum / v.size());
}

inline float pstd(const std::vector<float>& v) {
    if (v.size() < 2) return 0.0f;
    double m = mean(v);
    double var = 0.0;
    for (float x : v) var += (x - m) * (x - m);
    return static_cast<float>(std::sqrt(var / v.size()));
}

inline Stats4 summarize(const std::vector<float>& v) {
    Stats4 s;
    if (v.empty()) return s;
    s.mean = mean(v);
    s.std = pstd(v);
    auto mm = std::minmax_element(v.begin(), v.end());
    s.min = *mm.first;
    s.max = *mm.second;
    return s;
}

inline Stats2 summarize2(const std::vector<float>& v) {
    Stats2 s;
    s.mean = mean(v);
    s.std = pstd(v);
    return s;
}

// Absolute first differences divided by the earlier value
inline std::vector<float> relative_changes(const std::vector<float>& v) {
    std::vector<float> out;
    if (v.size() < 2) return out;
    out.reserve(v.size() - 1);
    for (size_t i = 1; i < v.size(); ++i) {
        out.push_back(std::fabs(v[i] - v[i - 1]) / (std::fabs(v[i - 1]) + 1e-10f));
    }
    return out;
}

// ----------------------------------------------------------------
// Framing. Frames start at 0 and are not centered; a signal shorter
// than one frame is treated as a single zero-padded frame.
// ----------------------------------------------------------------
inline int num_frames(size_t num_samples, int frame_length, int hop) {
    if (num_samples == 0 || frame_length <= 0 || hop <= 0) return 0;
    if (num_samples <= static_cast<size_t>(frame_length)) return 1;
    return 1 + static_cast<int>((num_samples - frame_length) / hop);
}

inline std::vector<float> frame_rms(const std::vector<float>& x, int frame_length, int hop) {
    int n = num_frames(x.size(), frame_length, hop);
    std::vector<float> out(n, 0.0f);
    for (int t = 0; t < n; ++t) {
        size_t start = static_cast<size_t>(t) * hop;
        size_t end = std::min(x.size(), start + frame_length);
        double acc = 0.0;
        for (size_t i = start; i < end; ++i) acc += static_cast<double>(x[i]) * x[i];
        out[t] = static_cast<float>(std::sqrt(acc / frame_length));
    }
    return out;
}

// Sign changes per sample; zero counts as positive
inline std::vector<float> frame_zcr(const std::vector<float>& x, int frame_length, int hop) {
    int n = num_frames(x.size(), frame_length, hop);
    std::vector<float> out(n, 0.0f);
    for (int t = 0; t < n; ++t) {
        size_t start = static_cast<size_t>(t) * hop;
        size_t end = std::min(x.size(), start + frame_length);
        int crossings = 0;
        for (size_t i = start + 1; i < end; ++i) {
            if ((x[i] >= 0.0f) != (x[i - 1] >= 0.0f)) ++crossings;
        }
        out[t] = static_cast<float>(crossings) / frame_length;
    }
    return out;
}

// ----------------------------------------------------------------
// Peak picking: local maxima (plateaus resolved to their middle) at or
// above min_height, then greedy removal of lower peaks closer than
// min_distance samples to a higher one.
// ----------------------------------------------------------------
inline std::vector<int> find_peaks(const std::vector<float>& x, float min_height, int min_distance) {
    std::vector<int> peaks;
    const int n = static_cast<int>(x.size());
    int i = 1;
    while (i < n - 1) {
        if (x[i - 1] < x[i]) {
            int ahead = i + 1;
            while (ahead < n - 1 && x[ahead] == x[i]) ++ahead;
            if (x[ahead] < x[i]) {
                int peak = (i + ahead - 1) / 2;
                if (x[peak] >= min_height) peaks.push_back(peak);
                i = ahead;
                continue;
            }
        }
        ++i;
    }

    if (min_distance > 1 && peaks.size() > 1) {
        std::vector<size_t> order(peaks.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return x[peaks[a]] > x[peaks[b]];
        });
        std::vector<bool> keep(peaks.size(), true);
        for (size_t oi = 0; oi < order.size(); ++oi) {
            size_t p = order[oi];
            if (!keep[p]) continue;
            for (size_t q = p; q-- > 0 && peaks[p] - peaks[q] < min_distance;) keep[q] = false;
            for (size_t q = p + 1; q < peaks.size() && peaks[q] - peaks[p] < min_distance; ++q)
                keep[q] = false;
        }
        std::vector<int> kept;
        for (size_t k = 0; k < peaks.size(); ++k)
            if (keep[k]) kept.push_back(peaks[k]);
        peaks.swap(kept);
    }
    return peaks;
}

} // namespace dsp
} // namespace vc

#endif // VC_DSP_UTILS_H
