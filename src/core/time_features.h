#ifndef VC_TIME_FEATURES_H
#define VC_TIME_FEATURES_H

#include "core/feature_vector.h"
#include "utils/config.h"
#include <vector>

namespace vc {

// Amplitude envelope, RMS, zero-crossing rate and pause statistics.
// rms is the frame RMS track (frame_length / hop_length framing), computed
// once by the caller and shared with the prosodic extractor.
void compute_time_features(const std::vector<float>& samples, int sample_rate,
                           const std::vector<float>& rms, const FeatureConfig& config,
                           FeatureVector& out);

} // namespace vc

#endif // VC_TIME_FEATURES_H
