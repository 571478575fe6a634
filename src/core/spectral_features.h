#ifndef VC_SPECTRAL_FEATURES_H
#define VC_SPECTRAL_FEATURES_H

#include "core/feature_vector.h"
#include "core/stft.h"
#include "utils/config.h"
#include <vector>

namespace vc {

// Centroid, bandwidth, roll-off, flatness and octave-band contrast from a
// magnitude spectrogram. Silent frames give 0 for centroid, bandwidth and
// roll-off, and 1 for flatness.
void compute_spectral_features(const Spectrogram& spec, const FeatureConfig& config,
                               FeatureVector& out);

// 13 MFCCs over the same frame/hop as the spectrogram, summarized per coefficient.
void compute_mfcc_features(const std::vector<float>& samples, int sample_rate,
                           const FeatureConfig& config, FeatureVector& out);

} // namespace vc

#endif // VC_SPECTRAL_FEATURES_H
