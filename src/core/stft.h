#ifndef VC_STFT_H
#define VC_STFT_H

#include <vector>

namespace vc {

// Magnitude spectrogram, frame-major: magnitude[t * num_bins + k].
struct Spectrogram {
    int num_frames = 0;
    int num_bins = 0;
    int n_fft = 0;
    int sample_rate = 0;
    std::vector<float> magnitude;

    const float* frame(int t) const { return magnitude.data() + static_cast<size_t>(t) * num_bins; }
    float* frame(int t) { return magnitude.data() + static_cast<size_t>(t) * num_bins; }
    float bin_hz(int k) const {
        return n_fft > 0 ? static_cast<float>(k) * sample_rate / n_fft : 0.0f;
    }
    bool empty() const { return num_frames == 0; }
};

class StftAnalyzer {
public:
    // n_fft must be a power of two
    explicit StftAnalyzer(int n_fft = 2048, int hop_length = 512);

    // Hann-windowed frames at the same positions as dsp::frame_rms()
    Spectrogram magnitude(const std::vector<float>& samples, int sample_rate) const;

    int n_fft() const { return n_fft_; }
    int hop_length() const { return hop_; }

private:
    int n_fft_;
    int hop_;
    std::vector<float> window_;
};

} // namespace vc

#endif // VC_STFT_H
