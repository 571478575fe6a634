#ifndef VC_FEATURE_EXTRACTOR_H
#define VC_FEATURE_EXTRACTOR_H

#include "core/feature_vector.h"
#include "core/audio_validator.h"
#include "core/stft.h"
#include "utils/config.h"
#include <vector>

namespace vc {

class FeatureExtractor {
public:
    explicit FeatureExtractor(const FeatureConfig& config = {});

    // All three feature families for one segment. The result is always finite.
    FeatureVector extract_segment(const std::vector<float>& samples, int sample_rate) const;

    // Per-segment extraction, then the mean over segments. Segments are spread
    // over config.num_threads workers when there is more than one.
    FeatureVector extract(const std::vector<AudioSegment>& segments, int sample_rate) const;

    const FeatureConfig& config() const { return config_; }

private:
    FeatureConfig config_;
    StftAnalyzer stft_;
};

} // namespace vc

#endif // VC_FEATURE_EXTRACTOR_H
