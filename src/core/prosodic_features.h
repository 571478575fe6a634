#ifndef VC_PROSODIC_FEATURES_H
#define VC_PROSODIC_FEATURES_H

#include "core/feature_vector.h"
#include "core/stft.h"
#include "utils/config.h"
#include <vector>

namespace vc {

// Pitch, speech rate, rhythm, jitter, shimmer and HNR.
void compute_prosodic_features(const std::vector<float>& samples, int sample_rate,
                               const Spectrogram& spec, const std::vector<float>& rms,
                               const FeatureConfig& config, FeatureVector& out);

} // namespace vc

#endif // VC_PROSODIC_FEATURES_H
