#ifndef VOCALYSIS_TYPES_H
#define VOCALYSIS_TYPES_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================
// Class indices (order of VcAnalysisResult::probabilities)
// ============================================================
#define VC_CLASS_NORMAL      0
#define VC_CLASS_ANXIETY     1
#define VC_CLASS_DEPRESSION  2
#define VC_CLASS_STRESS      3
#define VC_NUM_CLASSES       4

// ============================================================
// Risk levels
// ============================================================
#define VC_RISK_LOW       0
#define VC_RISK_MODERATE  1
#define VC_RISK_HIGH      2

// ============================================================
// Personalization status
// ============================================================
#define VC_PERSONALIZED_APPLIED         0
#define VC_PERSONALIZED_NO_BASELINE     1
#define VC_PERSONALIZED_NOT_CALIBRATED  2

// ============================================================
// Log levels for VcConfig::log_level
// ============================================================
#define VC_LOG_LEVEL_TRACE  0
#define VC_LOG_LEVEL_DEBUG  1
#define VC_LOG_LEVEL_INFO   2
#define VC_LOG_LEVEL_WARN   3
#define VC_LOG_LEVEL_ERROR  4
#define VC_LOG_LEVEL_OFF    6

// ============================================================
// Fixed capacities
// ============================================================
#define VC_MAX_FEATURES      128
#define VC_MAX_NOTES         8
#define VC_MAX_NOTE_LEN      256
#define VC_MAX_DEVIATIONS    16
#define VC_NUM_BASELINE_SCORES 5

// ============================================================
// Configuration
// ============================================================

/** Commonly tuned settings. Fill with vc_default_config() first. */
typedef struct VcConfig {
    const char* model_dir;    /**< ONNX models; NULL or "" = heuristic classifier only */
    const char* db_path;      /**< SQLite baseline database; NULL or "" = in memory */
    const char* log_file;     /**< NULL = "vocalysis.log" */
    int   log_level;          /**< VC_LOG_LEVEL_* */

    float min_duration_sec;               /**< analysis minimum, default 10 */
    float max_duration_sec;               /**< analysis maximum, default 300, 0 = none */
    float min_snr_db;                     /**< analysis minimum, default 10 */
    float calibration_min_duration_sec;   /**< default 5 */
    float calibration_min_snr_db;         /**< default 5 */

    int   num_threads;        /**< segment featurization workers, default 1 */
    int   model_threads;      /**< ONNX Runtime intra-op threads, default 2 */

    float probability_floor;  /**< default 0.05 */
    float temperature;        /**< ensemble softening, default 1.5 */
    float perturbation_std;   /**< heuristic noise, default 0.02, 0 = deterministic */
    uint32_t seed;            /**< heuristic noise seed, 0 = random */

    int   calibration_min_samples;  /**< default 9 */
    int   calibration_max_samples;  /**< default 12 */
    int   rolling_refresh;          /**< 1 = refresh statistics on every new sample */

    int   reserved[4];
} VcConfig;

// ============================================================
// Result structures (all POD / C-compatible)
// ============================================================

/** One clinical scale estimate */
typedef struct VcScaleScore {
    char  scale[16];            /**< "PHQ-9", "GAD-7", "PSS", "WEMWBS" */
    int   score;
    int   min_score;
    int   max_score;
    char  interpretation[64];   /**< severity band */
} VcScaleScore;

/** Result of vc_analyze_*() */
typedef struct VcAnalysisResult {
    float probabilities[VC_NUM_CLASSES];  /**< normal, anxiety, depression, stress */
    float confidence;                     /**< [0,1] */
    int   dominant_class;                 /**< VC_CLASS_* */
    float mental_health_score;            /**< [0,100], higher is better */
    int   risk_level;                     /**< VC_RISK_* */

    VcScaleScore phq9;
    VcScaleScore gad7;
    VcScaleScore pss;
    VcScaleScore wemwbs;

    int   interpretation_count;
    char  interpretations[VC_MAX_NOTES][VC_MAX_NOTE_LEN];
    int   recommendation_count;
    char  recommendations[VC_MAX_NOTES][VC_MAX_NOTE_LEN];

    int   segments_analyzed;
    float duration_sec;
    char  classifier_used[32];

    int   feature_count;                  /**< see vc_get_feature_name() */
    float features[VC_MAX_FEATURES];

    int   reserved[4];
} VcAnalysisResult;

/** Calibration progress for one user */
typedef struct VcCalibrationStatus {
    int     samples_collected;
    int     samples_required;
    int     is_calibrated;
    float   progress_percentage;   /**< [0,100] */
    int64_t calibrated_at;         /**< unix seconds, 0 while uncalibrated */
    char    message[128];
    int     reserved[2];
} VcCalibrationStatus;

/** Deviation of one weighted feature from the user's baseline */
typedef struct VcFeatureDeviation {
    char  feature[48];
    float value;
    float baseline_mean;
    float baseline_std;
    float z_score;
    char  interpretation[48];
} VcFeatureDeviation;

/** Change of one assessment score against the scores seen during calibration */
typedef struct VcScoreDeviation {
    char  score[32];               /**< "phq9", "gad7", "pss", "wemwbs", "mental_health_score" */
    float value;
    float baseline_mean;
    float baseline_std;
    float z_score;
    char  direction[16];           /**< "increased" or "decreased" */
    char  interpretation[64];
} VcScoreDeviation;

/** Result of vc_analyze_personalized_*() */
typedef struct VcPersonalizedResult {
    VcAnalysisResult analysis;
    int   status;                  /**< VC_PERSONALIZED_* */
    float deviation_score;         /**< weighted mean |z|, valid when applied */
    char  deviation_band[48];
    int   adjusted_risk_level;     /**< VC_RISK_* */
    int   deviation_count;
    VcFeatureDeviation deviations[VC_MAX_DEVIATIONS];
    int   score_deviation_count;
    VcScoreDeviation score_deviations[VC_NUM_BASELINE_SCORES];
    int   insight_count;
    char  insights[VC_MAX_NOTES][VC_MAX_NOTE_LEN];
    VcCalibrationStatus calibration;
    int   reserved[4];
} VcPersonalizedResult;

/** Detail of the last validation failure on this thread */
typedef struct VcValidationInfo {
    int   code;           /**< VC_ERROR_AUDIO_*, or VC_OK when the last call passed */
    float measured;
    float limit;
    char  message[128];
} VcValidationInfo;

#ifdef __cplusplus
} // extern "C"
#endif

#endif // VOCALYSIS_TYPES_H
