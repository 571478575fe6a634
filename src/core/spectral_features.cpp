#include "core/spectral_features.h"
#include "core/dsp_utils.h"
#include "utils/logger.h"
#include "kaldi-native-fbank/csrc/online-feature.h"
#include <algorithm>
#include <cmath>

namespace vc {

namespace {

constexpr float kAmin = 1e-10f;

float to_db(float power) {
    return 10.0f * std::log10(std::max(kAmin, power));
}

// Bin ranges of the contrast bands: [0, fmin], then octaves above fmin.
// Every band after the first also takes the bin just below it, and the
// last band runs to Nyquist.
std::vector<std::pair<int, int>> contrast_bands(const Spectrogram& spec, float fmin) {
    std::vector<std::pair<int, int>> bands;
    std::vector<float> edges(kNumContrastBands + 1, 0.0f);
    for (int i = 1; i <= kNumContrastBands; ++i) {
        edges[i] = fmin * std::pow(2.0f, static_cast<float>(i - 1));
    }
    for (int b = 0; b < kNumContrastBands; ++b) {
        int lo = -1, hi = -1;
        for (int k = 0; k < spec.num_bins; ++k) {
            float f = spec.bin_hz(k);
            if (f >= edges[b] && f <= edges[b + 1]) {
                if (lo < 0) lo = k;
                hi = k;
            }
        }
        if (b == kNumContrastBands - 1) {
            if (lo < 0) lo = spec.num_bins - 1;
            hi = spec.num_bins - 1;
        }
        if (lo < 0) {
            bands.emplace_back(0, -1);
            continue;
        }
        if (b > 0 && lo > 0) --lo;
        bands.emplace_back(lo, hi);
    }
    return bands;
}

} // anonymous namespace

void compute_spectral_features(const Spectrogram& spec, const FeatureConfig& config,
                               FeatureVector& out) {
    const int T = spec.num_frames;
    const int K = spec.num_bins;
    std::vector<float> centroid(T, 0.0f), bandwidth(T, 0.0f), rolloff(T, 0.0f), flatness(T, 1.0f);
    std::vector<std::vector<float>> contrast(kNumContrastBands, std::vector<float>(T, 0.0f));
    const auto bands = contrast_bands(spec, config.contrast_fmin);
    std::vector<float> sorted;

    for (int t = 0; t < T; ++t) {
        const float* S = spec.frame(t);

        double total = 0.0, weighted = 0.0;
        for (int k = 0; k < K; ++k) {
            total += S[k];
            weighted += static_cast<double>(S[k]) * spec.bin_hz(k);
        }
        if (total > 0.0) {
            double c = weighted / total;
            double spread = 0.0;
            for (int k = 0; k < K; ++k) {
                double d = spec.bin_hz(k) - c;
                spread += (S[k] / total) * d * d;
            }
            centroid[t] = static_cast<float>(c);
            bandwidth[t] = static_cast<float>(std::sqrt(spread));

            double target = config.rolloff_percent * total;
            double cum = 0.0;
            for (int k = 0; k < K; ++k) {
                cum += S[k];
                if (cum >= target) {
                    rolloff[t] = spec.bin_hz(k);
                    break;
                }
            }
        }

        // Flatness on the power spectrum: geometric over arithmetic mean
        double log_sum = 0.0, lin_sum = 0.0;
        for (int k = 0; k < K; ++k) {
            double p = std::max(static_cast<double>(kAmin), static_cast<double>(S[k]) * S[k]);
            log_sum += std::log(p);
            lin_sum += p;
        }
        flatness[t] = static_cast<float>(std::exp(log_sum / K) / (lin_sum / K));

        for (int b = 0; b < kNumContrastBands; ++b) {
            int lo = bands[b].first, hi = bands[b].second;
            if (hi < lo) continue;
            int count = hi - lo + 1;
            // Upper edge belongs to the next band, except for the last one
            int used = (b < kNumContrastBands - 1 && count > 1) ? count - 1 : count;
            sorted.assign(S + lo, S + lo + used);
            std::sort(sorted.begin(), sorted.end());
            int q = std::max(1, static_cast<int>(std::lround(config.contrast_quantile * count)));
            q = std::min(q, used);
            double valley = 0.0, peak = 0.0;
            for (int i = 0; i < q; ++i) {
                valley += sorted[i];
                peak += sorted[used - 1 - i];
            }
            contrast[b][t] = to_db(static_cast<float>(peak / q)) - to_db(static_cast<float>(valley / q));
        }
    }

    out.spectral_centroid = dsp::summarize(centroid);
    out.spectral_bandwidth = dsp::summarize(bandwidth);
    out.spectral_rolloff = dsp::summarize(rolloff);
    out.spectral_flatness = dsp::summarize2(flatness);
    for (int b = 0; b < kNumContrastBands; ++b) {
        out.spectral_contrast[b] = dsp::summarize2(contrast[b]);
    }
}

void compute_mfcc_features(const std::vector<float>& samples, int sample_rate,
                           const FeatureConfig& config, FeatureVector& out) {
    knf::MfccOptions opts;
    opts.frame_opts.samp_freq = static_cast<float>(sample_rate);
    opts.frame_opts.frame_length_ms = 1000.0f * config.frame_length / sample_rate;
    opts.frame_opts.frame_shift_ms = 1000.0f * config.hop_length / sample_rate;
    opts.frame_opts.dither = 0.0f;
    opts.frame_opts.preemph_coeff = 0.0f;
    opts.frame_opts.remove_dc_offset = true;
    opts.frame_opts.window_type = "hanning";
    opts.mel_opts.num_bins = config.num_mel_bins;
    opts.mel_opts.low_freq = 0.0f;
    opts.mel_opts.high_freq = 0.0f; // Nyquist
    opts.num_ceps = kNumMfcc;
    opts.use_energy = false;
    opts.cepstral_lifter = 0.0f;

    knf::OnlineMfcc mfcc(opts);
    mfcc.AcceptWaveform(static_cast<float>(sample_rate), samples.data(),
                        static_cast<int32_t>(samples.size()));
    mfcc.InputFinished();

    int num_frames = mfcc.NumFramesReady();
    if (num_frames <= 0) {
        VC_LOG_DEBUG("MFCC: no frames from {} samples", samples.size());
        for (auto& c : out.mfcc) c = Stats4();
        return;
    }

    std::vector<std::vector<float>> coeffs(kNumMfcc, std::vector<float>(num_frames));
    for (int t = 0; t < num_frames; ++t) {
        const float* frame = mfcc.GetFrame(t);
        for (int c = 0; c < kNumMfcc; ++c) {
            coeffs[c][t] = frame[c];
        }
    }
    for (int c = 0; c < kNumMfcc; ++c) {
        out.mfcc[c] = dsp::summarize(coeffs[c]);
    }
}

} // namespace vc
