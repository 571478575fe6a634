#include "core/audio_validator.h"
#include "utils/logger.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace vc {

namespace {

double mean_power(const float* x, size_t n) {
    if (n == 0) return 0.0;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) acc += static_cast<double>(x[i]) * x[i];
    return acc / static_cast<double>(n);
}

} // anonymous namespace

AudioValidator::AudioValidator(const IngestionConfig& ingestion,
                               const CalibrationConfig& calibration)
    : ingestion_(ingestion), calibration_(calibration) {}

ValidationLimits AudioValidator::limits(ValidationMode mode) const {
    ValidationLimits l;
    l.max_duration_sec = ingestion_.max_duration_sec;
    l.clip_level = ingestion_.clip_level;
    if (mode == ValidationMode::Calibration) {
        l.min_duration_sec = calibration_.min_duration_sec;
        l.min_snr_db = calibration_.min_snr_db;
    } else {
        l.min_duration_sec = ingestion_.min_duration_sec;
        l.min_snr_db = ingestion_.min_snr_db;
    }
    return l;
}

ErrorCode AudioValidator::validate(const WaveformBuffer& wave, ValidationMode mode,
                                   ErrorInfo* info) const {
    const ValidationLimits l = limits(mode);

    float duration = wave.duration_sec();
    if (duration < l.min_duration_sec) {
        auto msg = fmt::format("duration {:.2f}s below minimum {:.2f}s",
                               duration, l.min_duration_sec);
        VC_LOG_WARN("Validation failed: {}", msg);
        return fail(info, ErrorCode::AUDIO_TOO_SHORT, msg, duration, l.min_duration_sec);
    }
    if (l.max_duration_sec > 0.0f && duration > l.max_duration_sec) {
        auto msg = fmt::format("duration {:.2f}s above maximum {:.2f}s",
                               duration, l.max_duration_sec);
        VC_LOG_WARN("Validation failed: {}", msg);
        return fail(info, ErrorCode::AUDIO_TOO_LONG, msg, duration, l.max_duration_sec);
    }

    float peak = 0.0f;
    for (float s : wave.samples) peak = std::max(peak, std::fabs(s));
    if (peak >= l.clip_level) {
        auto msg = fmt::format("peak amplitude {:.3f} at or above clipping level {:.3f}",
                               peak, l.clip_level);
        VC_LOG_WARN("Validation failed: {}", msg);
        return fail(info, ErrorCode::AUDIO_CLIPPED, msg, peak, l.clip_level);
    }

    float snr_db = 0.0f;
    if (estimate_snr_db(wave.samples, snr_db) && snr_db < l.min_snr_db) {
        auto msg = fmt::format("SNR {:.1f}dB below minimum {:.1f}dB", snr_db, l.min_snr_db);
        VC_LOG_WARN("Validation failed: {}", msg);
        return fail(info, ErrorCode::AUDIO_TOO_NOISY, msg, snr_db, l.min_snr_db);
    }

    return ErrorCode::OK;
}

bool AudioValidator::estimate_snr_db(const std::vector<float>& samples, float& snr_db) const {
    double signal_power = mean_power(samples.data(), samples.size());
    double noise_acc = 0.0;
    size_t noise_count = 0;
    for (float s : samples) {
        if (std::fabs(s) < ingestion_.silence_amplitude) {
            noise_acc += static_cast<double>(s) * s;
            ++noise_count;
        }
    }
    if (noise_count == 0 || noise_acc <= 0.0 || signal_power <= 0.0) {
        return false;
    }
    double noise_power = noise_acc / static_cast<double>(noise_count);
    snr_db = static_cast<float>(10.0 * std::log10(signal_power / noise_power));
    return true;
}

std::vector<AudioSegment> AudioValidator::segment(const WaveformBuffer& wave) const {
    std::vector<AudioSegment> segments;
    const auto& x = wave.samples;
    if (x.empty() || wave.sample_rate <= 0) return segments;

    size_t seg_len = static_cast<size_t>(ingestion_.segment_sec * wave.sample_rate);
    float overlap = std::min(std::max(ingestion_.segment_overlap, 0.0f), 0.95f);
    size_t hop = std::max<size_t>(1, static_cast<size_t>(seg_len * (1.0f - overlap)));
    if (seg_len == 0) return segments;

    for (size_t start = 0; start + seg_len <= x.size(); start += hop) {
        if (mean_power(x.data() + start, seg_len) > ingestion_.segment_energy_floor) {
            AudioSegment seg;
            seg.samples.assign(x.begin() + start, x.begin() + start + seg_len);
            seg.start_sample = start;
            segments.push_back(std::move(seg));
        }
    }

    if (segments.empty()) {
        AudioSegment seg;
        if (x.size() < seg_len) {
            seg.samples = x;
            seg.samples.resize(seg_len, 0.0f);
            seg.padded = true;
        } else {
            seg.samples.assign(x.begin(), x.begin() + seg_len);
        }
        segments.push_back(std::move(seg));
        VC_LOG_DEBUG("No window above energy floor, using fallback segment (padded={})",
                     segments.back().padded);
    }
    return segments;
}

} // namespace vc
