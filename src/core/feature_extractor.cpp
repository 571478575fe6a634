#include "core/feature_extractor.h"
#include "core/dsp_utils.h"
#include "core/time_features.h"
#include "core/spectral_features.h"
#include "core/prosodic_features.h"
#include "utils/logger.h"
#include "utils/parallel.h"
#include <algorithm>

namespace vc {

FeatureExtractor::FeatureExtractor(const FeatureConfig& config)
    : config_(config), stft_(config.frame_length, config.hop_length) {}

FeatureVector FeatureExtractor::extract_segment(const std::vector<float>& samples,
                                                int sample_rate) const {
    FeatureVector fv;
    if (samples.empty() || sample_rate <= 0) {
        return fv;
    }
    fv.duration = static_cast<float>(samples.size()) / sample_rate;

    const std::vector<float> rms = dsp::frame_rms(samples, config_.frame_length, config_.hop_length);
    const Spectrogram spec = stft_.magnitude(samples, sample_rate);

    compute_time_features(samples, sample_rate, rms, config_, fv);
    compute_spectral_features(spec, config_, fv);
    compute_mfcc_features(samples, sample_rate, config_, fv);
    compute_prosodic_features(samples, sample_rate, spec, rms, config_, fv);

    int fixed = fv.sanitize();
    if (fixed > 0) {
        VC_LOG_DEBUG("Replaced {} non-finite feature values with defaults", fixed);
    }
    return fv;
}

FeatureVector FeatureExtractor::extract(const std::vector<AudioSegment>& segments,
                                        int sample_rate) const {
    std::vector<FeatureVector> per_segment(segments.size());
    int workers = std::min<int>(std::max(1, config_.num_threads),
                                static_cast<int>(segments.size()));

    // Worker exceptions resurface here, on the calling thread
    parallel_for(segments.size(), workers, [&](size_t i) {
        per_segment[i] = extract_segment(segments[i].samples, sample_rate);
    });

    VC_LOG_DEBUG("Extracted features from {} segments ({} workers)", segments.size(), workers);
    // Reduced in segment order so the result does not depend on scheduling
    return mean_features(per_segment);
}

} // namespace vc
