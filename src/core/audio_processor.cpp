#include "core/audio_processor.h"
#include "utils/logger.h"
#include <fstream>
#include <iterator>
#include <cstring>
#include <cmath>
#include <algorithm>

namespace vc {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

float sample_at(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == kFormatFloat) {
        if (bits == 32) {
            float v;
            std::memcpy(&v, p, sizeof(v));
            return v;
        }
        double v;
        std::memcpy(&v, p, sizeof(v));
        return static_cast<float>(v);
    }
    switch (bits) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(read_u16(p))) / 32768.0f;
        case 24: {
            int32_t v = static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
            if (v & 0x800000) v |= ~0xFFFFFF;
            return static_cast<float>(v) / 8388608.0f;
        }
        default:
            return static_cast<float>(static_cast<int32_t>(read_u32(p))) / 2147483648.0f;
    }
}

} // anonymous namespace

AudioInput AudioInput::from_file(const std::string& wav_path) {
    AudioInput in;
    in.kind = Kind::File;
    in.path = wav_path;
    return in;
}

AudioInput AudioInput::from_wav_bytes(const uint8_t* data, size_t size) {
    AudioInput in;
    in.kind = Kind::WavBytes;
    in.bytes = data;
    in.byte_count = size;
    return in;
}

AudioInput AudioInput::from_pcm(const float* data, size_t count, int rate) {
    AudioInput in;
    in.kind = Kind::Pcm;
    in.pcm = data;
    in.sample_count = count;
    in.sample_rate = rate;
    return in;
}

bool AudioProcessor::set_error(ErrorCode code, const std::string& message) {
    last_code_ = code;
    last_error_ = message;
    VC_LOG_ERROR(last_error_);
    return false;
}

bool AudioProcessor::load(const AudioInput& input, WaveformBuffer& out) {
    last_code_ = ErrorCode::OK;
    last_error_.clear();

    std::vector<float> samples;
    int rate = 0;
    int channels = 1;

    switch (input.kind) {
        case AudioInput::Kind::File:
            if (!read_wav(input.path, samples, rate, &channels)) return false;
            break;
        case AudioInput::Kind::WavBytes:
            if (!input.bytes || input.byte_count == 0) {
                return set_error(ErrorCode::INVALID_PARAM, "Empty WAV buffer");
            }
            if (!decode_wav(input.bytes, input.byte_count, samples, rate, &channels)) return false;
            break;
        case AudioInput::Kind::Pcm:
            if (!input.pcm || input.sample_count == 0 || input.sample_rate <= 0) {
                return set_error(ErrorCode::INVALID_PARAM,
                                 "PCM input needs samples and a positive sample rate");
            }
            samples.assign(input.pcm, input.pcm + input.sample_count);
            rate = input.sample_rate;
            break;
    }

    out.source_sample_rate = rate;
    out.source_channels = channels;
    out.samples = normalize(samples, rate);
    out.sample_rate = target_rate_;
    return true;
}

bool AudioProcessor::read_wav(const std::string& wav_path, std::vector<float>& out_samples,
                              int& out_sample_rate, int* out_channels) {
    std::ifstream file(wav_path, std::ios::binary);
    if (!file.is_open()) {
        return set_error(ErrorCode::FILE_NOT_FOUND, "Cannot open file: " + wav_path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        return set_error(ErrorCode::AUDIO_DECODE, "Empty file: " + wav_path);
    }
    return decode_wav(bytes.data(), bytes.size(), out_samples, out_sample_rate, out_channels);
}

bool AudioProcessor::decode_wav(const uint8_t* data, size_t size, std::vector<float>& out_samples,
                                int& out_sample_rate, int* out_channels) {
    if (size < 12 || std::memcmp(data, "RIFF", 4) != 0) {
        return set_error(ErrorCode::AUDIO_DECODE, "Not a valid RIFF file");
    }
    if (std::memcmp(data + 8, "WAVE", 4) != 0) {
        return set_error(ErrorCode::AUDIO_DECODE, "Not a valid WAVE file");
    }

    // Parse chunks
    uint16_t audio_format = 0;
    uint16_t num_channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    bool have_fmt = false;
    const uint8_t* audio_data = nullptr;
    size_t audio_size = 0;

    size_t pos = 12;
    while (pos + 8 <= size) {
        const uint8_t* chunk_id = data + pos;
        uint32_t chunk_size = read_u32(data + pos + 4);
        pos += 8;
        size_t remaining = size - pos;

        if (std::memcmp(chunk_id, "fmt ", 4) == 0) {
            if (chunk_size < 16 || chunk_size > remaining) {
                return set_error(ErrorCode::AUDIO_DECODE, "Truncated fmt chunk");
            }
            const uint8_t* fmt = data + pos;
            audio_format = read_u16(fmt);
            num_channels = read_u16(fmt + 2);
            sample_rate = read_u32(fmt + 4);
            bits_per_sample = read_u16(fmt + 14);
            // WAVE_FORMAT_EXTENSIBLE carries the real format in the sub-format GUID
            if (audio_format == kFormatExtensible && chunk_size >= 26) {
                audio_format = read_u16(fmt + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(chunk_id, "data", 4) == 0) {
            if (chunk_size > remaining) {
                // Streaming writers leave the size unset; anything else is a cut-off file
                if (chunk_size != 0xFFFFFFFFu && chunk_size != 0) {
                    return set_error(ErrorCode::AUDIO_DECODE,
                                     "Truncated data chunk: declared " +
                                     std::to_string(chunk_size) + " bytes, " +
                                     std::to_string(remaining) + " available");
                }
                chunk_size = static_cast<uint32_t>(remaining);
            }
            audio_data = data + pos;
            audio_size = chunk_size;
            break; // We have the data
        }
        // Chunks are word aligned
        size_t advance = static_cast<size_t>(chunk_size) + (chunk_size & 1u);
        if (advance > remaining) break;
        pos += advance;
    }

    if (!have_fmt) {
        return set_error(ErrorCode::AUDIO_DECODE, "No fmt chunk found in WAV data");
    }
    if (!audio_data || audio_size == 0) {
        return set_error(ErrorCode::AUDIO_DECODE, "No audio data found in WAV data");
    }

    bool pcm_ok = audio_format == kFormatPcm &&
                  (bits_per_sample == 8 || bits_per_sample == 16 ||
                   bits_per_sample == 24 || bits_per_sample == 32);
    bool float_ok = audio_format == kFormatFloat &&
                    (bits_per_sample == 32 || bits_per_sample == 64);
    if (!pcm_ok && !float_ok) {
        return set_error(ErrorCode::WAV_FORMAT,
                         "Unsupported audio format " + std::to_string(audio_format) +
                         " with " + std::to_string(bits_per_sample) + " bits");
    }
    if (num_channels == 0 || sample_rate == 0) {
        return set_error(ErrorCode::AUDIO_DECODE, "Invalid channel count or sample rate");
    }

    VC_LOG_DEBUG("WAV: format={}, channels={}, rate={}, bits={}",
                 audio_format, num_channels, sample_rate, bits_per_sample);

    size_t bytes_per_sample = bits_per_sample / 8;
    size_t num_samples = audio_size / bytes_per_sample;
    std::vector<float> samples(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        samples[i] = sample_at(audio_data + i * bytes_per_sample, audio_format, bits_per_sample);
    }

    out_samples = downmix(samples, num_channels);
    out_sample_rate = static_cast<int>(sample_rate);
    if (out_channels) *out_channels = num_channels;
    return true;
}

std::vector<float> AudioProcessor::int16_to_float(const int16_t* data, size_t count) {
    std::vector<float> result(count);
    for (size_t i = 0; i < count; ++i) {
        result[i] = static_cast<float>(data[i]) / 32768.0f;
    }
    return result;
}

std::vector<float> AudioProcessor::downmix(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }
    std::vector<float> mono(interleaved.size() / channels);
    for (size_t i = 0; i < mono.size(); ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = sum / static_cast<float>(channels);
    }
    return mono;
}

std::vector<float> AudioProcessor::resample(const std::vector<float>& input,
                                            int src_rate, int dst_rate) {
    if (src_rate == dst_rate || input.empty()) {
        return input;
    }

    double ratio = static_cast<double>(dst_rate) / static_cast<double>(src_rate);
    size_t output_size = static_cast<size_t>(std::ceil(input.size() * ratio));
    std::vector<float> output(output_size);

    for (size_t i = 0; i < output_size; ++i) {
        double src_pos = static_cast<double>(i) / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - static_cast<double>(idx);

        if (idx + 1 < input.size()) {
            output[i] = static_cast<float>(
                input[idx] * (1.0 - frac) + input[idx + 1] * frac);
        } else if (idx < input.size()) {
            output[i] = input[idx];
        } else {
            output[i] = 0.0f;
        }
    }

    return output;
}

std::vector<float> AudioProcessor::normalize(const std::vector<float>& input, int sample_rate) {
    if (sample_rate == target_rate_) {
        return input;
    }
    VC_LOG_DEBUG("Resampling from {}Hz to {}Hz", sample_rate, target_rate_);
    return resample(input, sample_rate, target_rate_);
}

} // namespace vc
