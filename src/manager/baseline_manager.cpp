#include "manager/baseline_manager.h"
#include "utils/logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace vc {

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* score_display_name(size_t index) {
    static const char* const names[kNumBaselineScores] = {
        "PHQ-9", "GAD-7", "PSS", "WEMWBS", "mental health"
    };
    return index < kNumBaselineScores ? names[index] : "";
}

} // anonymous namespace

const char* personalization_status_name(PersonalizationStatus status) {
    switch (status) {
        case PersonalizationStatus::Applied:       return "applied";
        case PersonalizationStatus::NoBaseline:    return "no_baseline";
        case PersonalizationStatus::NotCalibrated: return "not_calibrated";
    }
    return "unknown";
}

BaselineManager::BaselineManager(const AssessmentEngine& engine, std::shared_ptr<BaselineStore> store,
                                 const PersonalizationConfig& config)
    : engine_(engine), store_(std::move(store)), config_(config) {
    config_.min_samples = std::max(1, config_.min_samples);
    config_.max_samples = std::max(config_.min_samples, config_.max_samples);
}

std::shared_ptr<std::mutex> BaselineManager::user_lock(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = user_locks_[user_id];
    std::shared_ptr<std::mutex> m = slot.lock();
    if (!m) {
        m = std::make_shared<std::mutex>();
        slot = m;
    }

    // Drop entries nobody holds any more
    if (user_locks_.size() >= prune_at_) {
        for (auto it = user_locks_.begin(); it != user_locks_.end();) {
            if (it->second.expired()) it = user_locks_.erase(it);
            else ++it;
        }
        prune_at_ = std::max<size_t>(64, 2 * user_locks_.size());
    }
    return m;
}

size_t BaselineManager::lock_table_size() {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return user_locks_.size();
}

// ============================================================
// Status
// ============================================================

CalibrationStatus BaselineManager::empty_status(const std::string& user_id) const {
    UserBaseline empty(user_id);
    return make_status(empty);
}

CalibrationStatus BaselineManager::make_status(const UserBaseline& baseline) const {
    CalibrationStatus s;
    s.user_id = baseline.user_id;
    s.samples_collected = static_cast<int>(baseline.samples.size());
    s.samples_required = config_.min_samples;
    s.is_calibrated = baseline.calibrated;
    s.calibrated_at = baseline.calibrated_at;

    if (baseline.calibrated) {
        s.progress_percentage = 100.0f;
        s.message = "Personal baseline established from " +
                    std::to_string(baseline.samples_used) + " samples";
    } else {
        s.progress_percentage = std::min(100.0f,
            100.0f * static_cast<float>(s.samples_collected) / s.samples_required);
        int remaining = std::max(0, s.samples_required - s.samples_collected);
        s.message = "Collect " + std::to_string(remaining) +
                    " more samples to establish your personal baseline";
    }
    return s;
}

ErrorCode BaselineManager::status(const std::string& user_id, CalibrationStatus& out, ErrorInfo* err) {
    if (user_id.empty()) return fail(err, ErrorCode::INVALID_PARAM, "User ID cannot be empty");

    UserBaseline baseline;
    ErrorCode code = store_->get(user_id, baseline, err);
    if (code == ErrorCode::NO_BASELINE || code == ErrorCode::BASELINE_OUTDATED) {
        if (err) err->clear();
        out = empty_status(user_id);
        if (code == ErrorCode::BASELINE_OUTDATED) {
            out.message = "Stored baseline is out of date; collect " +
                          std::to_string(config_.min_samples) + " new samples to rebuild it";
        }
        return ErrorCode::OK;
    }
    if (code != ErrorCode::OK) return code;

    out = make_status(baseline);
    return ErrorCode::OK;
}

// ============================================================
// Calibration
// ============================================================

void BaselineManager::compute_statistics(UserBaseline& baseline) {
    const FeatureSchema& schema = FeatureSchema::v1();
    const size_t n = baseline.samples.size();

    baseline.feature_means.clear();
    baseline.feature_stds.clear();
    baseline.score_means.clear();
    baseline.score_stds.clear();
    baseline.samples_used = static_cast<int>(n);
    if (n == 0) return;

    std::vector<double> sum(schema.size(), 0.0), sum_sq(schema.size(), 0.0);
    std::vector<std::vector<float>> rows;
    rows.reserve(n);
    for (const auto& fv : baseline.samples) rows.push_back(fv.to_array());

    for (const auto& row : rows) {
        for (size_t i = 0; i < schema.size(); ++i) sum[i] += row[i];
    }
    for (size_t i = 0; i < schema.size(); ++i) {
        double mean = sum[i] / n;
        for (const auto& row : rows) {
            double d = row[i] - mean;
            sum_sq[i] += d * d;
        }
        baseline.feature_means[schema.name(i)] = static_cast<float>(mean);
        baseline.feature_stds[schema.name(i)] = static_cast<float>(std::sqrt(sum_sq[i] / n));
    }

    const size_t m = baseline.score_samples.size();
    if (m < kMinScoreSamples) return;

    for (size_t i = 0; i < kNumBaselineScores; ++i) {
        double total = 0.0;
        for (const auto& scores : baseline.score_samples) total += scores[i];
        double mean = total / m;
        double var = 0.0;
        for (const auto& scores : baseline.score_samples) {
            double d = scores[i] - mean;
            var += d * d;
        }
        baseline.score_means[baseline_score_name(i)] = static_cast<float>(mean);
        baseline.score_stds[baseline_score_name(i)] = static_cast<float>(std::sqrt(var / m));
    }
}

ScoreSample BaselineManager::score_sample(const AnalysisResult& result) {
    return {
        static_cast<float>(result.scale_scores.phq9.score),
        static_cast<float>(result.scale_scores.gad7.score),
        static_cast<float>(result.scale_scores.pss.score),
        static_cast<float>(result.scale_scores.wemwbs.score),
        result.mental_health_score,
    };
}

ErrorCode BaselineManager::calibrate(const std::string& user_id, const AudioInput& input,
                                     CalibrationStatus& status, ErrorInfo* err) {
    if (user_id.empty()) return fail(err, ErrorCode::INVALID_PARAM, "User ID cannot be empty");

    FeatureVector features;
    ErrorCode code = engine_.extract_features(input, ValidationMode::Calibration, features,
                                              nullptr, nullptr, err);
    if (code != ErrorCode::OK) {
        VC_LOG_WARN("Calibration sample rejected for {}: {}", user_id, error_code_to_string(code));
        return code;
    }
    return add_calibration_sample(user_id, features, status, err);
}

ErrorCode BaselineManager::add_calibration_sample(const std::string& user_id, const FeatureVector& features,
                                                  CalibrationStatus& status, ErrorInfo* err) {
    if (user_id.empty()) return fail(err, ErrorCode::INVALID_PARAM, "User ID cannot be empty");

    FeatureVector sample = features;
    if (sample.sanitize() > 0) {
        VC_LOG_WARN("Calibration sample for {} had non-finite features", user_id);
    }

    AnalysisOptions scoring;
    scoring.include_interpretations = false;
    scoring.include_recommendations = false;
    AnalysisResult assessed;
    const bool scored = engine_.assess(sample, scoring, assessed);
    if (!scored) {
        VC_LOG_WARN("Calibration sample for {} could not be scored; keeping features only", user_id);
    }

    auto lock_ptr = user_lock(user_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    UserBaseline baseline;
    ErrorCode code = store_->get(user_id, baseline, err);
    if (code == ErrorCode::NO_BASELINE || code == ErrorCode::BASELINE_OUTDATED) {
        if (code == ErrorCode::BASELINE_OUTDATED) {
            VC_LOG_WARN("Replacing outdated baseline for {} with a new calibration", user_id);
        }
        if (err) err->clear();
        baseline = UserBaseline(user_id);
    } else if (code != ErrorCode::OK) {
        return code;
    }

    baseline.samples.push_back(sample);
    while (static_cast<int>(baseline.samples.size()) > config_.max_samples) {
        baseline.samples.pop_front();
    }
    if (scored) baseline.score_samples.push_back(score_sample(assessed));
    while (static_cast<int>(baseline.score_samples.size()) > config_.max_samples) {
        baseline.score_samples.pop_front();
    }
    ++baseline.total_samples;

    const int collected = static_cast<int>(baseline.samples.size());
    if (!baseline.calibrated && collected >= config_.min_samples) {
        compute_statistics(baseline);
        baseline.calibrated = true;
        baseline.calibrated_at = unix_now();
        VC_LOG_INFO("Baseline calibrated for {} from {} samples", user_id, baseline.samples_used);
    } else if (baseline.calibrated && config_.rolling_refresh) {
        compute_statistics(baseline);
        baseline.calibrated_at = unix_now();
        VC_LOG_DEBUG("Baseline refreshed for {} ({} samples)", user_id, baseline.samples_used);
    }

    code = store_->save(baseline, err);
    if (code != ErrorCode::OK) return code;

    status = make_status(baseline);
    VC_LOG_DEBUG("Calibration sample added for {}: {}/{}", user_id, collected, config_.min_samples);
    return ErrorCode::OK;
}

ErrorCode BaselineManager::recalibrate(const std::string& user_id, CalibrationStatus& status, ErrorInfo* err) {
    if (user_id.empty()) return fail(err, ErrorCode::INVALID_PARAM, "User ID cannot be empty");

    auto lock_ptr = user_lock(user_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    UserBaseline baseline;
    ErrorCode code = store_->get(user_id, baseline, err);
    if (code != ErrorCode::OK) return code;

    const int collected = static_cast<int>(baseline.samples.size());
    if (collected < config_.min_samples) {
        status = make_status(baseline);
        return fail(err, ErrorCode::NOT_CALIBRATED,
                    "Recalibration needs " + std::to_string(config_.min_samples) +
                    " samples, have " + std::to_string(collected));
    }

    compute_statistics(baseline);
    baseline.calibrated = true;
    baseline.calibrated_at = unix_now();

    code = store_->save(baseline, err);
    if (code != ErrorCode::OK) return code;

    status = make_status(baseline);
    VC_LOG_INFO("Baseline recalibrated for {} from {} samples", user_id, baseline.samples_used);
    return ErrorCode::OK;
}

ErrorCode BaselineManager::reset(const std::string& user_id, ErrorInfo* err) {
    if (user_id.empty()) return fail(err, ErrorCode::INVALID_PARAM, "User ID cannot be empty");

    auto lock_ptr = user_lock(user_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    ErrorCode code = store_->remove(user_id, err);
    if (code == ErrorCode::OK) {
        VC_LOG_INFO("Baseline reset for {}", user_id);
    }
    return code;
}

// ============================================================
// Deviation scoring
// ============================================================

std::string BaselineManager::deviation_band(float score) {
    if (score < 0.5f) return "consistent with baseline";
    if (score < 1.0f) return "minor variation";
    if (score < 2.0f) return "moderate change";
    return "significant change";
}

std::string BaselineManager::z_score_label(float z) {
    float a = std::fabs(z);
    if (a < 1.0f) return "within normal range";
    if (a < 2.0f) return "slightly outside normal range";
    if (a < 3.0f) return "moderately outside normal range";
    return "significantly outside normal range";
}

std::string BaselineManager::score_change_label(size_t score_index, float z) {
    if (baseline_score_higher_is_better(score_index)) {
        if (z > 1.0f) return "Better than your baseline - positive trend";
        if (z < -1.0f) return "Below your baseline - may need attention";
    } else {
        if (z > 1.0f) return "Higher than your baseline - may need attention";
        if (z < -1.0f) return "Lower than your baseline - positive trend";
    }
    return "Consistent with your baseline";
}

RiskLevel BaselineManager::adjust_risk(RiskLevel base, float deviation) {
    if (deviation >= 2.0f && base == RiskLevel::Low) return RiskLevel::Moderate;
    return base;
}

DeviationReport BaselineManager::score_deviation(const FeatureVector& features,
                                                 const UserBaseline& baseline) const {
    DeviationReport report;
    double weighted = 0.0, total_weight = 0.0;

    for (const auto& entry : config_.weights) {
        const std::string& name = entry.first;
        const float weight = entry.second;

        auto m = baseline.feature_means.find(name);
        auto s = baseline.feature_stds.find(name);
        float value = 0.0f;
        if (m == baseline.feature_means.end() || s == baseline.feature_stds.end()) continue;
        if (!features.get(name, value)) continue;
        if (!(s->second > config_.min_std) || weight <= 0.0f) continue;

        FeatureDeviation d;
        d.feature = name;
        d.value = value;
        d.baseline_mean = m->second;
        d.baseline_std = s->second;
        d.z_score = (value - m->second) / s->second;
        d.weight = weight;
        d.interpretation = z_score_label(d.z_score);

        weighted += weight * std::fabs(d.z_score);
        total_weight += weight;
        report.features.push_back(std::move(d));
    }

    report.score = total_weight > 0.0 ? static_cast<float>(weighted / total_weight) : 0.0f;
    report.band = deviation_band(report.score);
    return report;
}

std::vector<ScoreDeviation> BaselineManager::score_deviations(const ScoreSample& current,
                                                              const UserBaseline& baseline) const {
    std::vector<ScoreDeviation> out;
    for (size_t i = 0; i < kNumBaselineScores; ++i) {
        const std::string name = baseline_score_name(i);
        auto m = baseline.score_means.find(name);
        auto s = baseline.score_stds.find(name);
        if (m == baseline.score_means.end() || s == baseline.score_stds.end()) continue;
        if (!(s->second > config_.min_std)) continue;

        ScoreDeviation d;
        d.score = name;
        d.value = current[i];
        d.baseline_mean = m->second;
        d.baseline_std = s->second;
        d.z_score = (current[i] - m->second) / s->second;
        d.direction = d.z_score > 0.0f ? "increased" : "decreased";
        d.interpretation = score_change_label(i, d.z_score);
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<std::string> BaselineManager::baseline_insights(const DeviationReport& report) {
    std::vector<std::string> lines;
    if (report.score < 1.0f) {
        lines.push_back("Your voice patterns are consistent with your established baseline.");
    } else if (report.score < 2.0f) {
        lines.push_back("Some variation from your baseline detected, but within expected range.");
    } else {
        lines.push_back("Significant variation from your baseline detected. Consider monitoring closely.");
    }

    for (const auto& d : report.scores) {
        size_t index = kNumBaselineScores;
        for (size_t i = 0; i < kNumBaselineScores; ++i) {
            if (d.score == baseline_score_name(i)) index = i;
        }
        if (index == kNumBaselineScores) continue;

        const bool worse = baseline_score_higher_is_better(index) ? d.z_score < -1.5f
                                                                  : d.z_score > 1.5f;
        if (!worse) continue;
        lines.push_back(std::string("Your ") + score_display_name(index) + " score has " +
                        d.direction + " compared to your baseline.");
    }
    return lines;
}

ErrorCode BaselineManager::analyze_personalized(const std::string& user_id, const AudioInput& input,
                                                PersonalizedResult& result, ErrorInfo* err,
                                                const AnalysisOptions& options) {
    if (user_id.empty()) return fail(err, ErrorCode::INVALID_PARAM, "User ID cannot be empty");

    PersonalizedResult out;
    ErrorCode code = engine_.analyze(input, options, out.analysis, err);
    if (code != ErrorCode::OK) return code;
    out.adjusted_risk = out.analysis.risk_level;

    UserBaseline baseline;
    code = store_->get(user_id, baseline, err);
    if (code == ErrorCode::NO_BASELINE || code == ErrorCode::BASELINE_OUTDATED) {
        if (err) err->clear();
        out.status = PersonalizationStatus::NoBaseline;
        out.calibration = empty_status(user_id);
        result = std::move(out);
        return ErrorCode::OK;
    }
    if (code != ErrorCode::OK) return code;

    out.calibration = make_status(baseline);
    if (!baseline.calibrated) {
        out.status = PersonalizationStatus::NotCalibrated;
        result = std::move(out);
        return ErrorCode::OK;
    }

    out.status = PersonalizationStatus::Applied;
    out.deviation = score_deviation(out.analysis.features, baseline);
    out.deviation.scores = score_deviations(score_sample(out.analysis), baseline);
    out.deviation.insights = baseline_insights(out.deviation);
    out.adjusted_risk = adjust_risk(out.analysis.risk_level, out.deviation.score);

    VC_LOG_INFO("Personalized analysis for {}: deviation={:.2f} ({}), risk {} -> {}",
                user_id, out.deviation.score, out.deviation.band,
                risk_level_name(out.analysis.risk_level), risk_level_name(out.adjusted_risk));
    result = std::move(out);
    return ErrorCode::OK;
}

} // namespace vc
