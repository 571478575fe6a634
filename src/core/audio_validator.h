#ifndef VC_AUDIO_VALIDATOR_H
#define VC_AUDIO_VALIDATOR_H

#include "core/audio_processor.h"
#include "utils/config.h"
#include "utils/error_codes.h"
#include <vector>

namespace vc {

enum class ValidationMode {
    Analysis,     // full thresholds
    Calibration   // lenient duration and SNR
};

struct ValidationLimits {
    float min_duration_sec = 10.0f;
    float max_duration_sec = 300.0f;
    float min_snr_db = 10.0f;
    float clip_level = 1.0f;
};

// Fixed-length analysis window cut from a WaveformBuffer.
struct AudioSegment {
    std::vector<float> samples;
    size_t start_sample = 0;
    bool padded = false;
};

class AudioValidator {
public:
    explicit AudioValidator(const IngestionConfig& ingestion = {},
                            const CalibrationConfig& calibration = {});

    ValidationLimits limits(ValidationMode mode) const;

    // Duration, then clipping, then noise floor. First failure wins.
    ErrorCode validate(const WaveformBuffer& wave, ValidationMode mode,
                       ErrorInfo* info = nullptr) const;

    // Overlapping windows above the energy floor; never returns an empty list
    // for a non-empty waveform.
    std::vector<AudioSegment> segment(const WaveformBuffer& wave) const;

    // SNR of the whole buffer against its near-silent samples.
    // Returns false when there are no usable noise samples.
    bool estimate_snr_db(const std::vector<float>& samples, float& snr_db) const;

private:
    IngestionConfig ingestion_;
    CalibrationConfig calibration_;
};

} // namespace vc

#endif // VC_AUDIO_VALIDATOR_H
