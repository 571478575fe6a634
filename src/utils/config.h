#ifndef VC_CONFIG_H
#define VC_CONFIG_H

#include <string>
#include <utility>
#include <vector>
#include <cstdint>

namespace vc {

// All thresholds below are tunable defaults for a screening aid, not clinical cut-offs.

struct IngestionConfig {
    int   target_sample_rate   = 16000;
    float min_duration_sec     = 10.0f;
    float max_duration_sec     = 300.0f;   // 0 disables the upper bound
    float min_snr_db           = 10.0f;
    float clip_level           = 1.0f;     // peak |x| at or above this is clipped
    float silence_amplitude    = 0.001f;   // |x| below this counts as noise floor
    float segment_sec          = 5.0f;
    float segment_overlap      = 0.5f;
    float segment_energy_floor = 1e-4f;    // mean(x^2) a window must exceed
};

// Lenient overrides applied when capturing calibration samples.
struct CalibrationConfig {
    float min_duration_sec = 5.0f;
    float min_snr_db       = 5.0f;
};

struct FeatureConfig {
    int   frame_length       = 2048;
    int   hop_length         = 512;
    float silence_rms        = 0.01f;
    float rolloff_percent    = 0.85f;
    float contrast_fmin      = 200.0f;
    float contrast_quantile  = 0.02f;
    int   num_mel_bins       = 40;
    float pitch_fmin         = 60.0f;
    float pitch_fmax         = 1000.0f;
    float pitch_threshold    = 0.1f;   // relative to the frame's peak magnitude
    float peak_height_ratio  = 0.5f;   // energy peaks must exceed ratio * mean RMS
    int   peak_distance      = 8;      // frames
    int   hpss_kernel        = 31;
    int   num_threads        = 1;      // segment fan-out, 1 = inline
};

struct HeuristicConfig {
    float base_normal     = 0.35f;
    float base_anxiety    = 0.22f;
    float base_depression = 0.21f;
    float base_stress     = 0.22f;

    float pitch_std_high   = 35.0f;
    float pitch_std_low    = 15.0f;
    float speech_rate_high = 4.5f;
    float speech_rate_low  = 2.5f;
    float rms_low          = 0.02f;
    float jitter_high      = 0.03f;
    float hnr_low          = 10.0f;

    float normal_bonus      = 0.10f;  // applied when no rule fires
    float perturbation_std  = 0.02f;  // 0 disables the random perturbation
    uint32_t seed           = 0;      // 0 seeds from std::random_device
};

struct EnsembleConfig {
    float temperature       = 1.5f;
    float probability_floor = 0.05f;
};

struct PersonalizationConfig {
    int   min_samples     = 9;
    int   max_samples     = 12;
    bool  rolling_refresh = false;  // recompute stats on every sample once calibrated
    float min_std         = 1e-9f;  // features at or below this spread are skipped

    std::vector<std::pair<std::string, float>> weights = {
        {"pitch_mean", 0.15f},
        {"pitch_std", 0.10f},
        {"speech_rate", 0.15f},
        {"rms_mean", 0.15f},
        {"jitter_mean", 0.10f},
        {"hnr", 0.15f},
        {"spectral_centroid_mean", 0.10f},
        {"zcr_mean", 0.10f},
    };
};

struct EngineConfig {
    std::string model_dir;        // empty: heuristic classifier only
    std::string db_path;          // empty: in-memory baseline store
    int model_threads = 2;

    IngestionConfig       ingestion;
    CalibrationConfig     calibration;
    FeatureConfig         features;
    HeuristicConfig       heuristic;
    EnsembleConfig        ensemble;
    PersonalizationConfig personalization;
};

} // namespace vc

#endif // VC_CONFIG_H
