#ifndef VC_AUDIO_PROCESSOR_H
#define VC_AUDIO_PROCESSOR_H

#include "utils/error_codes.h"
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace vc {

// Mono float samples in [-1, 1]. Produced by ingestion, read-only afterwards.
struct WaveformBuffer {
    std::vector<float> samples;
    int sample_rate = 0;
    int source_sample_rate = 0;
    int source_channels = 1;

    float duration_sec() const {
        return sample_rate > 0 ? static_cast<float>(samples.size()) / sample_rate : 0.0f;
    }
};

// Where the audio comes from. Pointers are borrowed and must outlive the call.
struct AudioInput {
    enum class Kind { File, WavBytes, Pcm };

    Kind kind = Kind::Pcm;
    std::string path;
    const uint8_t* bytes = nullptr;
    size_t byte_count = 0;
    const float* pcm = nullptr;
    size_t sample_count = 0;
    int sample_rate = 16000;

    static AudioInput from_file(const std::string& wav_path);
    static AudioInput from_wav_bytes(const uint8_t* data, size_t size);
    static AudioInput from_pcm(const float* data, size_t count, int rate = 16000);
};

class AudioProcessor {
public:
    explicit AudioProcessor(int target_sample_rate = 16000)
        : target_rate_(target_sample_rate) {}

    // Decode, downmix and resample any input into a WaveformBuffer at the target rate
    bool load(const AudioInput& input, WaveformBuffer& out);

    // Read WAV file and return float32 PCM samples in [-1.0, 1.0], downmixed to mono
    bool read_wav(const std::string& wav_path, std::vector<float>& out_samples,
                  int& out_sample_rate, int* out_channels = nullptr);

    // Same as read_wav() for a RIFF/WAVE container already in memory
    bool decode_wav(const uint8_t* data, size_t size, std::vector<float>& out_samples,
                    int& out_sample_rate, int* out_channels = nullptr);

    // Convert int16 PCM to float32 [-1.0, 1.0]
    static std::vector<float> int16_to_float(const int16_t* data, size_t count);

    // Average interleaved channels into one
    static std::vector<float> downmix(const std::vector<float>& interleaved, int channels);

    // Resample audio to target sample rate (linear interpolation)
    static std::vector<float> resample(const std::vector<float>& input,
                                       int src_rate, int dst_rate);

    // Ensure audio is at the target rate
    std::vector<float> normalize(const std::vector<float>& input, int sample_rate);

    int target_sample_rate() const { return target_rate_; }

    ErrorCode last_code() const { return last_code_; }
    const std::string& last_error() const { return last_error_; }

private:
    bool set_error(ErrorCode code, const std::string& message);

    int target_rate_;
    ErrorCode last_code_ = ErrorCode::OK;
    std::string last_error_;
};

} // namespace vc

#endif // VC_AUDIO_PROCESSOR_H
