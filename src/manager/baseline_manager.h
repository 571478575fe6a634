#ifndef VC_BASELINE_MANAGER_H
#define VC_BASELINE_MANAGER_H

#include "manager/assessment_engine.h"
#include "storage/baseline_store.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vc {

struct CalibrationStatus {
    std::string user_id;
    int samples_collected = 0;
    int samples_required = 0;
    bool is_calibrated = false;
    float progress_percentage = 0.0f;   // 0-100
    int64_t calibrated_at = 0;
    std::string message;
};

struct FeatureDeviation {
    std::string feature;
    float value = 0.0f;
    float baseline_mean = 0.0f;
    float baseline_std = 0.0f;
    float z_score = 0.0f;
    float weight = 0.0f;
    std::string interpretation;
};

// Change of one assessment score (PHQ-9, GAD-7, PSS, WEMWBS or the mental
// health score) against the scores recorded during calibration
struct ScoreDeviation {
    std::string score;                      // baseline_score_name()
    float value = 0.0f;
    float baseline_mean = 0.0f;
    float baseline_std = 0.0f;
    float z_score = 0.0f;
    std::string direction;                  // "increased" or "decreased"
    std::string interpretation;
};

struct DeviationReport {
    float score = 0.0f;                     // weighted mean |z|
    std::string band;
    std::vector<FeatureDeviation> features; // only features with usable spread
    std::vector<ScoreDeviation> scores;     // only scores with usable spread
    std::vector<std::string> insights;
};

enum class PersonalizationStatus {
    Applied = 0,
    NoBaseline = 1,
    NotCalibrated = 2
};

const char* personalization_status_name(PersonalizationStatus status);

struct PersonalizedResult {
    AnalysisResult analysis;
    PersonalizationStatus status = PersonalizationStatus::NoBaseline;
    DeviationReport deviation;               // filled when status is Applied
    RiskLevel adjusted_risk = RiskLevel::Low;
    CalibrationStatus calibration;
};

// Per-user voice baselines: collects calibration samples, freezes statistics
// once enough are collected, and scores new recordings against them.
class BaselineManager {
public:
    BaselineManager(const AssessmentEngine& engine, std::shared_ptr<BaselineStore> store,
                    const PersonalizationConfig& config = {});

    // Lenient validation, feature extraction, then add_calibration_sample()
    ErrorCode calibrate(const std::string& user_id, const AudioInput& input,
                        CalibrationStatus& status, ErrorInfo* err = nullptr);

    ErrorCode add_calibration_sample(const std::string& user_id, const FeatureVector& features,
                                     CalibrationStatus& status, ErrorInfo* err = nullptr);

    // Recompute statistics from the samples currently held
    ErrorCode recalibrate(const std::string& user_id, CalibrationStatus& status,
                          ErrorInfo* err = nullptr);

    ErrorCode reset(const std::string& user_id, ErrorInfo* err = nullptr);

    // Unknown users report zero samples collected
    ErrorCode status(const std::string& user_id, CalibrationStatus& status,
                     ErrorInfo* err = nullptr);

    ErrorCode analyze_personalized(const std::string& user_id, const AudioInput& input,
                                   PersonalizedResult& result, ErrorInfo* err = nullptr,
                                   const AnalysisOptions& options = {});

    // Weighted mean |z| over the configured features. Pure: the baseline is not modified.
    DeviationReport score_deviation(const FeatureVector& features, const UserBaseline& baseline) const;

    std::vector<ScoreDeviation> score_deviations(const ScoreSample& current,
                                                 const UserBaseline& baseline) const;

    // Overall consistency line, then one line per score that moved past 1.5 std
    // in the unfavourable direction
    static std::vector<std::string> baseline_insights(const DeviationReport& report);

    static std::string deviation_band(float score);
    static std::string z_score_label(float z);
    static std::string score_change_label(size_t score_index, float z);
    static RiskLevel adjust_risk(RiskLevel base, float deviation);

    static ScoreSample score_sample(const AnalysisResult& result);

    // Means and population stds over the held samples, keyed by schema name.
    // Score statistics need at least kMinScoreSamples recorded scores.
    static void compute_statistics(UserBaseline& baseline);
    static constexpr size_t kMinScoreSamples = 3;

    // Entries in the per-user lock table, including ones not yet pruned
    size_t lock_table_size();

    const PersonalizationConfig& config() const { return config_; }

private:
    std::shared_ptr<std::mutex> user_lock(const std::string& user_id);
    CalibrationStatus make_status(const UserBaseline& baseline) const;
    CalibrationStatus empty_status(const std::string& user_id) const;

    const AssessmentEngine& engine_;
    std::shared_ptr<BaselineStore> store_;
    PersonalizationConfig config_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> user_locks_;
    size_t prune_at_ = 64;
};

} // namespace vc

#endif // VC_BASELINE_MANAGER_H
