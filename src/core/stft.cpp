#include "core/stft.h"
#include "core/dsp_utils.h"
#include "kaldi-native-fbank/csrc/rfft.h"
#include <cmath>
#include <algorithm>

namespace vc {

StftAnalyzer::StftAnalyzer(int n_fft, int hop_length)
    : n_fft_(n_fft), hop_(hop_length), window_(n_fft) {
    // Periodic Hann
    const double pi = 3.14159265358979323846;
    for (int i = 0; i < n_fft_; ++i) {
        window_[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * pi * i / n_fft_));
    }
}

Spectrogram StftAnalyzer::magnitude(const std::vector<float>& samples, int sample_rate) const {
    Spectrogram spec;
    spec.n_fft = n_fft_;
    spec.sample_rate = sample_rate;
    spec.num_bins = n_fft_ / 2 + 1;
    spec.num_frames = dsp::num_frames(samples.size(), n_fft_, hop_);
    spec.magnitude.assign(static_cast<size_t>(spec.num_frames) * spec.num_bins, 0.0f);
    if (spec.num_frames == 0) return spec;

    knf::Rfft rfft(n_fft_);
    std::vector<float> buf(n_fft_);

    for (int t = 0; t < spec.num_frames; ++t) {
        size_t start = static_cast<size_t>(t) * hop_;
        std::fill(buf.begin(), buf.end(), 0.0f);
        size_t avail = std::min(static_cast<size_t>(n_fft_), samples.size() - start);
        for (size_t i = 0; i < avail; ++i) {
            buf[i] = samples[start + i] * window_[i];
        }

        // Packed result: [Re0, Re(N/2), Re1, Im1, Re2, Im2, ...]
        rfft.Compute(buf.data());

        float* out = spec.frame(t);
        out[0] = std::fabs(buf[0]);
        out[spec.num_bins - 1] = std::fabs(buf[1]);
        for (int k = 1; k < spec.num_bins - 1; ++k) {
            float re = buf[2 * k];
            float im = buf[2 * k + 1];
            out[k] = std::sqrt(re * re + im * im);
        }
    }
    return spec;
}

} // namespace vc
