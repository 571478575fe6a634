#include "core/prosodic_features.h"
#include "core/dsp_utils.h"
#include "core/pitch_analyzer.h"
#include "core/harmonic_analyzer.h"
#include <cmath>

namespace vc {

void compute_prosodic_features(const std::vector<float>& samples, int sample_rate,
                               const Spectrogram& spec, const std::vector<float>& rms,
                               const FeatureConfig& config, FeatureVector& out) {
    // ---- pitch ----
    dsp::PitchAnalyzer tracker(config.pitch_fmin, config.pitch_fmax, config.pitch_threshold);
    const std::vector<float> pitch = dsp::PitchAnalyzer::voiced(tracker.track(spec));

    Stats4 p = dsp::summarize(pitch);
    out.pitch_mean = p.mean;
    out.pitch_std = p.std;
    out.pitch_max = p.max;
    out.pitch_min = p.min;
    out.pitch_range = p.max - p.min;

    out.pitch_changes_mean = 0.0f;
    out.pitch_changes_std = 0.0f;
    out.pitch_changes_max = 0.0f;
    out.jitter_mean = 0.0f;
    out.jitter_std = 0.0f;
    if (pitch.size() > 1) {
        std::vector<float> deltas, abs_deltas, periods;
        for (size_t i = 1; i < pitch.size(); ++i) {
            float d = pitch[i] - pitch[i - 1];
            deltas.push_back(d);
            abs_deltas.push_back(std::fabs(d));
        }
        Stats4 a = dsp::summarize(abs_deltas);
        out.pitch_changes_mean = a.mean;
        out.pitch_changes_max = a.max;
        out.pitch_changes_std = dsp::pstd(deltas);

        // Jitter: relative cycle-to-cycle change of the pitch period
        periods.reserve(pitch.size());
        for (float f : pitch) periods.push_back(1.0f / f);
        Stats2 j = dsp::summarize2(dsp::relative_changes(periods));
        out.jitter_mean = j.mean;
        out.jitter_std = j.std;
    }

    // ---- speech rate and rhythm from energy peaks ----
    const float duration = sample_rate > 0 ? static_cast<float>(samples.size()) / sample_rate : 0.0f;
    const std::vector<int> peaks = dsp::find_peaks(
        rms, config.peak_height_ratio * dsp::mean(rms), config.peak_distance);

    out.speech_rate = (duration > 0.0f) ? static_cast<float>(peaks.size()) / duration : 0.0f;
    out.rhythm_mean_interval = 0.0f;
    out.rhythm_std_interval = 0.0f;
    out.rhythm_max_interval = 0.0f;
    out.rhythm_min_interval = 0.0f;
    out.rhythm_regularity = 0.0f;
    out.shimmer_mean = 0.0f;
    out.shimmer_std = 0.0f;
    if (peaks.size() > 1 && sample_rate > 0) {
        const float frame_sec = static_cast<float>(config.hop_length) / sample_rate;
        std::vector<float> intervals, amplitudes;
        for (size_t i = 1; i < peaks.size(); ++i) {
            intervals.push_back((peaks[i] - peaks[i - 1]) * frame_sec);
        }
        Stats4 r = dsp::summarize(intervals);
        out.rhythm_mean_interval = r.mean;
        out.rhythm_std_interval = r.std;
        out.rhythm_max_interval = r.max;
        out.rhythm_min_interval = r.min;
        out.rhythm_regularity = r.mean / (r.std + 1e-10f);

        for (int idx : peaks) amplitudes.push_back(rms[idx]);
        Stats2 s = dsp::summarize2(dsp::relative_changes(amplitudes));
        out.shimmer_mean = s.mean;
        out.shimmer_std = s.std;
    }

    // ---- voice quality ----
    out.hnr = dsp::harmonic_to_noise_db(spec, config.hpss_kernel);
}

} // namespace vc
