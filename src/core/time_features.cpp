#include "core/time_features.h"
#include "core/dsp_utils.h"
#include <algorithm>

namespace vc {

void compute_time_features(const std::vector<float>& samples, int sample_rate,
                           const std::vector<float>& rms, const FeatureConfig& config,
                           FeatureVector& out) {
    const int hop = config.hop_length;

    // Envelope: largest sample of each non-overlapping hop-sized block
    std::vector<float> envelope;
    envelope.reserve(samples.size() / hop + 1);
    for (size_t i = 0; i < samples.size(); i += hop) {
        size_t end = std::min(samples.size(), i + hop);
        envelope.push_back(*std::max_element(samples.begin() + i, samples.begin() + end));
    }
    out.amplitude_envelope = dsp::summarize(envelope);

    out.rms = dsp::summarize(rms);
    out.zcr = dsp::summarize(dsp::frame_zcr(samples, config.frame_length, hop));

    // Pauses: runs of consecutive frames below the silence threshold
    std::vector<float> runs;
    int silent_frames = 0;
    int run = 0;
    for (float r : rms) {
        if (r < config.silence_rms) {
            ++run;
            ++silent_frames;
        } else if (run > 0) {
            runs.push_back(static_cast<float>(run));
            run = 0;
        }
    }
    if (run > 0) runs.push_back(static_cast<float>(run));

    if (runs.empty() || sample_rate <= 0) {
        out.silence_rate = 0.0f;
        out.silence_mean_duration = 0.0f;
        out.silence_std_duration = 0.0f;
        out.silence_max_duration = 0.0f;
        out.silence_total_duration = 0.0f;
        out.silence_percentage = 0.0f;
        return;
    }

    const float frame_sec = static_cast<float>(hop) / sample_rate;
    const float duration = static_cast<float>(samples.size()) / sample_rate;
    Stats4 s = dsp::summarize(runs);
    float total = 0.0f;
    for (float r : runs) total += r;

    out.silence_rate = static_cast<float>(runs.size()) / duration;
    out.silence_mean_duration = s.mean * frame_sec;
    out.silence_std_duration = s.std * frame_sec;
    out.silence_max_duration = s.max * frame_sec;
    out.silence_total_duration = total * frame_sec;
    out.silence_percentage = static_cast<float>(silent_frames) / rms.size();
}

} // namespace vc
