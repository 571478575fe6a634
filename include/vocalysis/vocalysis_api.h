#ifndef VOCALYSIS_API_H
#define VOCALYSIS_API_H

#include <vocalysis/vocalysis_types.h>

#ifdef _WIN32
    #ifdef VOCALYSIS_EXPORTS
        #define VC_API extern "C" __declspec(dllexport)
    #else
        #define VC_API extern "C" __declspec(dllimport)
    #endif
#else
    #define VC_API extern "C" __attribute__((visibility("default")))
#endif

#define VC_VERSION "1.0.0"

// Error codes
#define VC_OK                          0
#define VC_ERROR_UNKNOWN              -1
#define VC_ERROR_INVALID_PARAM        -2
#define VC_ERROR_NOT_INIT             -3
#define VC_ERROR_ALREADY_INIT         -4
#define VC_ERROR_MODEL_LOAD           -5
#define VC_ERROR_AUDIO_TOO_SHORT      -6
#define VC_ERROR_AUDIO_TOO_LONG       -7
#define VC_ERROR_AUDIO_CLIPPED        -8
#define VC_ERROR_AUDIO_TOO_NOISY      -9
#define VC_ERROR_DB_ERROR             -10
#define VC_ERROR_FILE_NOT_FOUND       -11
#define VC_ERROR_BUFFER_TOO_SMALL     -12
#define VC_ERROR_AUDIO_DECODE         -13
#define VC_ERROR_WAV_FORMAT           -14
#define VC_ERROR_INFERENCE            -15
#define VC_ERROR_MODEL_NOT_AVAILABLE  -16
#define VC_ERROR_NO_BASELINE          -17
#define VC_ERROR_NOT_CALIBRATED       -18
#define VC_ERROR_FEATURE_EXTRACTION   -19
#define VC_ERROR_BASELINE_OUTDATED    -20

/**
 * Initialize the SDK with default settings.
 * @param model_dir Directory with mlp/cnn/rnn/attention.onnx; NULL = heuristic only
 * @param db_path SQLite file for user baselines (created if missing); NULL = in memory
 * @return VC_OK on success. Missing models are not an error.
 */
VC_API int vc_init(const char* model_dir, const char* db_path);

/**
 * Initialize the SDK with explicit settings.
 * @param config Settings filled by vc_default_config() and then adjusted
 */
VC_API int vc_init_ex(const VcConfig* config);

/**
 * Release all resources held by the SDK.
 */
VC_API void vc_release();

/**
 * Fill a VcConfig with the built-in defaults.
 */
VC_API void vc_default_config(VcConfig* out);

// ============================================================
// Analysis
// ============================================================

/**
 * Analyze a WAV file.
 * @return VC_OK, an input error (VC_ERROR_FILE_NOT_FOUND, VC_ERROR_AUDIO_DECODE,
 *         VC_ERROR_WAV_FORMAT) or a validation error (VC_ERROR_AUDIO_*).
 *         Validation details are available from vc_get_last_validation().
 */
VC_API int vc_analyze_file(const char* wav_path, VcAnalysisResult* out);

/**
 * Analyze mono float32 PCM in [-1, 1] at any sample rate.
 */
VC_API int vc_analyze_pcm(const float* pcm_data, int sample_count, int sample_rate,
                          VcAnalysisResult* out);

/**
 * Analyze a complete WAV container held in memory.
 */
VC_API int vc_analyze_wav_bytes(const uint8_t* data, int size, VcAnalysisResult* out);

// ============================================================
// Personal baseline
// ============================================================

/**
 * Add one calibration recording for a user. Uses the lenient calibration
 * limits. The baseline is established once enough samples are collected.
 */
VC_API int vc_calibrate_file(const char* user_id, const char* wav_path, VcCalibrationStatus* out);
VC_API int vc_calibrate_pcm(const char* user_id, const float* pcm_data, int sample_count,
                            int sample_rate, VcCalibrationStatus* out);

/**
 * Calibration progress. Unknown users report zero samples.
 */
VC_API int vc_get_calibration_status(const char* user_id, VcCalibrationStatus* out);

/**
 * Recompute a user's baseline from the samples currently held.
 * @return VC_ERROR_NO_BASELINE or VC_ERROR_NOT_CALIBRATED when there is too little data,
 *         VC_ERROR_BASELINE_OUTDATED when the stored baseline predates the feature schema
 */
VC_API int vc_recalibrate(const char* user_id, VcCalibrationStatus* out);

/**
 * Delete a user's baseline and calibration samples.
 * @return VC_OK, or VC_ERROR_NO_BASELINE if the user had none
 */
VC_API int vc_reset_baseline(const char* user_id);

/**
 * Analyze and compare against the user's baseline. Users without a calibrated
 * baseline still get the plain analysis, with out->status explaining why.
 */
VC_API int vc_analyze_personalized_file(const char* user_id, const char* wav_path,
                                        VcPersonalizedResult* out);
VC_API int vc_analyze_personalized_pcm(const char* user_id, const float* pcm_data,
                                       int sample_count, int sample_rate,
                                       VcPersonalizedResult* out);

// ============================================================
// Introspection
// ============================================================

/**
 * Number of entries in VcAnalysisResult::features.
 */
VC_API int vc_get_feature_count();

/**
 * Name of the feature at a position of VcAnalysisResult::features.
 * @return VC_OK, VC_ERROR_INVALID_PARAM or VC_ERROR_BUFFER_TOO_SMALL
 */
VC_API int vc_get_feature_name(int index, char* out_name, int buf_size);

/**
 * Get the last error message.
 * @return Error message string (thread-local, valid until next API call)
 */
VC_API const char* vc_get_last_error();

/**
 * Validation detail of the last analysis or calibration call on this thread.
 */
VC_API int vc_get_last_validation(VcValidationInfo* out);

/**
 * @return 1 if at least one learned model is loaded, 0 if running heuristic only
 */
VC_API int vc_is_model_loaded();

VC_API const char* vc_get_version();

#endif // VOCALYSIS_API_H
