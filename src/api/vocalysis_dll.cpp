#include <vocalysis/vocalysis_api.h>
#include "manager/assessment_engine.h"
#include "manager/baseline_manager.h"
#include "storage/baseline_store.h"
#include "storage/sqlite_store.h"
#include "utils/error_codes.h"
#include "utils/logger.h"
#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

// Global SDK state
static std::unique_ptr<vc::AssessmentEngine> g_engine;
static std::shared_ptr<vc::BaselineStore>    g_store;
static std::unique_ptr<vc::BaselineManager>  g_baselines;
static std::shared_mutex g_state_mutex;   // init/release exclusive, calls shared

static thread_local VcValidationInfo g_last_validation{};

namespace {

void copy_str(char* dst, size_t capacity, const std::string& src) {
    if (capacity == 0) return;
    size_t n = std::min(capacity - 1, src.size());
    std::memcpy(dst, src.data(), n);
    dst[n] = '\0';
}

template <size_t N>
void copy_str(char (&dst)[N], const std::string& src) {
    copy_str(dst, N, src);
}

int to_api(vc::ErrorCode code) {
    return static_cast<int>(code);
}

// Records the outcome of a call in the thread-local error and validation slots
int report(vc::ErrorCode code, const vc::ErrorInfo& info) {
    g_last_validation = VcValidationInfo{};
    if (code == vc::ErrorCode::OK) return VC_OK;

    if (vc::is_validation_error(code)) {
        g_last_validation.code = to_api(code);
        g_last_validation.measured = info.measured;
        g_last_validation.limit = info.limit;
        copy_str(g_last_validation.message, info.message);
    }
    if (info.message.empty()) vc::set_last_error(code);
    else vc::set_last_error(code, info.message);
    return to_api(code);
}

template <typename Fn>
int guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        vc::set_last_error(vc::ErrorCode::UNKNOWN, e.what());
        return VC_ERROR_UNKNOWN;
    } catch (...) {
        vc::set_last_error(vc::ErrorCode::UNKNOWN);
        return VC_ERROR_UNKNOWN;
    }
}

int not_initialized() {
    vc::set_last_error(vc::ErrorCode::NOT_INIT);
    return VC_ERROR_NOT_INIT;
}

int invalid_param(const char* detail) {
    vc::set_last_error(vc::ErrorCode::INVALID_PARAM, detail);
    return VC_ERROR_INVALID_PARAM;
}

vc::EngineConfig to_engine_config(const VcConfig& c) {
    vc::EngineConfig cfg;
    cfg.model_dir = c.model_dir ? c.model_dir : "";
    cfg.db_path = c.db_path ? c.db_path : "";
    cfg.model_threads = std::max(1, c.model_threads);

    cfg.ingestion.min_duration_sec = c.min_duration_sec;
    cfg.ingestion.max_duration_sec = c.max_duration_sec;
    cfg.ingestion.min_snr_db = c.min_snr_db;
    cfg.calibration.min_duration_sec = c.calibration_min_duration_sec;
    cfg.calibration.min_snr_db = c.calibration_min_snr_db;

    cfg.features.num_threads = std::max(1, c.num_threads);

    cfg.ensemble.probability_floor = c.probability_floor;
    cfg.ensemble.temperature = c.temperature;
    cfg.heuristic.perturbation_std = c.perturbation_std;
    cfg.heuristic.seed = c.seed;

    cfg.personalization.min_samples = c.calibration_min_samples;
    cfg.personalization.max_samples = c.calibration_max_samples;
    cfg.personalization.rolling_refresh = c.rolling_refresh != 0;
    return cfg;
}

void fill_scale(VcScaleScore& dst, const vc::ScaleScore& src) {
    copy_str(dst.scale, src.scale);
    dst.score = src.score;
    dst.min_score = src.min_score;
    dst.max_score = src.max_score;
    copy_str(dst.interpretation, src.interpretation);
}

void fill_notes(char (&dst)[VC_MAX_NOTES][VC_MAX_NOTE_LEN], int& count,
                const std::vector<std::string>& notes) {
    count = static_cast<int>(std::min<size_t>(VC_MAX_NOTES, notes.size()));
    for (int i = 0; i < count; ++i) copy_str(dst[i], notes[i]);
}

void fill_analysis(VcAnalysisResult& out, const vc::AnalysisResult& r) {
    std::memset(&out, 0, sizeof(out));
    for (int k = 0; k < VC_NUM_CLASSES; ++k) out.probabilities[k] = r.probabilities[k];
    out.confidence = r.confidence;
    out.dominant_class = static_cast<int>(
        std::max_element(r.probabilities.begin(), r.probabilities.end()) - r.probabilities.begin());
    out.mental_health_score = r.mental_health_score;
    out.risk_level = static_cast<int>(r.risk_level);

    fill_scale(out.phq9, r.scale_scores.phq9);
    fill_scale(out.gad7, r.scale_scores.gad7);
    fill_scale(out.pss, r.scale_scores.pss);
    fill_scale(out.wemwbs, r.scale_scores.wemwbs);

    fill_notes(out.interpretations, out.interpretation_count, r.interpretations);
    fill_notes(out.recommendations, out.recommendation_count, r.recommendations);

    out.segments_analyzed = r.segments_analyzed;
    out.duration_sec = r.duration;
    copy_str(out.classifier_used, r.classifier_used);

    std::vector<float> values = r.features.to_array();
    out.feature_count = static_cast<int>(std::min<size_t>(VC_MAX_FEATURES, values.size()));
    std::copy(values.begin(), values.begin() + out.feature_count, out.features);
}

void fill_status(VcCalibrationStatus& out, const vc::CalibrationStatus& s) {
    std::memset(&out, 0, sizeof(out));
    out.samples_collected = s.samples_collected;
    out.samples_required = s.samples_required;
    out.is_calibrated = s.is_calibrated ? 1 : 0;
    out.progress_percentage = s.progress_percentage;
    out.calibrated_at = s.calibrated_at;
    copy_str(out.message, s.message);
}

static_assert(VC_NUM_BASELINE_SCORES == vc::kNumBaselineScores, "baseline score count mismatch");

void fill_personalized(VcPersonalizedResult& out, const vc::PersonalizedResult& r) {
    std::memset(&out, 0, sizeof(out));
    fill_analysis(out.analysis, r.analysis);
    out.status = static_cast<int>(r.status);
    out.deviation_score = r.deviation.score;
    copy_str(out.deviation_band, r.deviation.band);
    out.adjusted_risk_level = static_cast<int>(r.adjusted_risk);
    out.deviation_count = static_cast<int>(
        std::min<size_t>(VC_MAX_DEVIATIONS, r.deviation.features.size()));
    for (int i = 0; i < out.deviation_count; ++i) {
        const auto& d = r.deviation.features[i];
        VcFeatureDeviation& dst = out.deviations[i];
        copy_str(dst.feature, d.feature);
        dst.value = d.value;
        dst.baseline_mean = d.baseline_mean;
        dst.baseline_std = d.baseline_std;
        dst.z_score = d.z_score;
        copy_str(dst.interpretation, d.interpretation);
    }
    out.score_deviation_count = static_cast<int>(
        std::min<size_t>(VC_NUM_BASELINE_SCORES, r.deviation.scores.size()));
    for (int i = 0; i < out.score_deviation_count; ++i) {
        const auto& d = r.deviation.scores[i];
        VcScoreDeviation& dst = out.score_deviations[i];
        copy_str(dst.score, d.score);
        dst.value = d.value;
        dst.baseline_mean = d.baseline_mean;
        dst.baseline_std = d.baseline_std;
        dst.z_score = d.z_score;
        copy_str(dst.direction, d.direction);
        copy_str(dst.interpretation, d.interpretation);
    }
    fill_notes(out.insights, out.insight_count, r.deviation.insights);
    fill_status(out.calibration, r.calibration);
}

int analyze_input(const vc::AudioInput& input, VcAnalysisResult* out) {
    std::shared_lock<std::shared_mutex> lock(g_state_mutex);
    if (!g_engine) return not_initialized();

    vc::AnalysisResult result;
    vc::ErrorInfo info;
    vc::ErrorCode code = g_engine->analyze(input, vc::AnalysisOptions{}, result, &info);
    if (code == vc::ErrorCode::OK) fill_analysis(*out, result);
    return report(code, info);
}

int calibrate_input(const char* user_id, const vc::AudioInput& input, VcCalibrationStatus* out) {
    std::shared_lock<std::shared_mutex> lock(g_state_mutex);
    if (!g_baselines) return not_initialized();

    vc::CalibrationStatus status;
    vc::ErrorInfo info;
    vc::ErrorCode code = g_baselines->calibrate(user_id, input, status, &info);
    if (code == vc::ErrorCode::OK) fill_status(*out, status);
    return report(code, info);
}

int personalized_input(const char* user_id, const vc::AudioInput& input, VcPersonalizedResult* out) {
    std::shared_lock<std::shared_mutex> lock(g_state_mutex);
    if (!g_baselines) return not_initialized();

    vc::PersonalizedResult result;
    vc::ErrorInfo info;
    vc::ErrorCode code = g_baselines->analyze_personalized(user_id, input, result, &info);
    if (code == vc::ErrorCode::OK) fill_personalized(*out, result);
    return report(code, info);
}

} // anonymous namespace

// ============================================================
// Lifecycle
// ============================================================

VC_API void vc_default_config(VcConfig* out) {
    if (!out) return;
    const vc::EngineConfig d;
    std::memset(out, 0, sizeof(*out));
    out->model_dir = nullptr;
    out->db_path = nullptr;
    out->log_file = nullptr;
    out->log_level = VC_LOG_LEVEL_INFO;
    out->min_duration_sec = d.ingestion.min_duration_sec;
    out->max_duration_sec = d.ingestion.max_duration_sec;
    out->min_snr_db = d.ingestion.min_snr_db;
    out->calibration_min_duration_sec = d.calibration.min_duration_sec;
    out->calibration_min_snr_db = d.calibration.min_snr_db;
    out->num_threads = d.features.num_threads;
    out->model_threads = d.model_threads;
    out->probability_floor = d.ensemble.probability_floor;
    out->temperature = d.ensemble.temperature;
    out->perturbation_std = d.heuristic.perturbation_std;
    out->seed = d.heuristic.seed;
    out->calibration_min_samples = d.personalization.min_samples;
    out->calibration_max_samples = d.personalization.max_samples;
    out->rolling_refresh = d.personalization.rolling_refresh ? 1 : 0;
}

VC_API int vc_init_ex(const VcConfig* config) {
    if (!config) return invalid_param("config must not be null");

    std::unique_lock<std::shared_mutex> lock(g_state_mutex);
    if (g_engine) {
        vc::set_last_error(vc::ErrorCode::ALREADY_INIT);
        return VC_ERROR_ALREADY_INIT;
    }

    return guarded([&]() -> int {
        int level = std::max(0, std::min(static_cast<int>(spdlog::level::off), config->log_level));
        vc::Logger::instance().init(config->log_file ? config->log_file : "vocalysis.log",
                                    static_cast<spdlog::level::level_enum>(level));
        // init() keeps an existing logger, so apply the level explicitly
        vc::Logger::instance().set_level(static_cast<spdlog::level::level_enum>(level));
        VC_LOG_INFO("Initializing Vocalysis SDK v{}", VC_VERSION);

        vc::EngineConfig cfg = to_engine_config(*config);

        std::shared_ptr<vc::BaselineStore> store;
        if (cfg.db_path.empty()) {
            store = std::make_shared<vc::InMemoryBaselineStore>();
            VC_LOG_INFO("Using in-memory baseline store");
        } else {
            auto sqlite = std::make_shared<vc::SqliteBaselineStore>();
            if (!sqlite->open(cfg.db_path)) {
                vc::set_last_error(vc::ErrorCode::DB_ERROR, sqlite->last_error());
                return VC_ERROR_DB_ERROR;
            }
            store = sqlite;
        }

        auto engine = std::make_unique<vc::AssessmentEngine>(cfg);
        if (!engine->init()) {
            vc::set_last_error(vc::ErrorCode::MODEL_LOAD, engine->last_error());
            return VC_ERROR_MODEL_LOAD;
        }

        g_store = store;
        g_engine = std::move(engine);
        g_baselines = std::make_unique<vc::BaselineManager>(*g_engine, g_store, cfg.personalization);

        VC_LOG_INFO("Vocalysis SDK initialized successfully");
        return VC_OK;
    });
}

VC_API int vc_init(const char* model_dir, const char* db_path) {
    VcConfig config;
    vc_default_config(&config);
    config.model_dir = model_dir;
    config.db_path = db_path;
    return vc_init_ex(&config);
}

VC_API void vc_release() {
    std::unique_lock<std::shared_mutex> lock(g_state_mutex);
    if (!g_engine) return;

    g_baselines.reset();
    g_store.reset();
    g_engine->release();
    g_engine.reset();
    VC_LOG_INFO("Vocalysis SDK released");
    vc::Logger::instance().shutdown();
}

// ============================================================
// Analysis
// ============================================================

VC_API int vc_analyze_file(const char* wav_path, VcAnalysisResult* out) {
    if (!wav_path || !out) return invalid_param("wav_path and out must not be null");
    return guarded([&]() { return analyze_input(vc::AudioInput::from_file(wav_path), out); });
}

VC_API int vc_analyze_pcm(const float* pcm_data, int sample_count, int sample_rate,
                          VcAnalysisResult* out) {
    if (!pcm_data || sample_count <= 0 || sample_rate <= 0 || !out) {
        return invalid_param("pcm_data, sample_count, sample_rate and out are required");
    }
    return guarded([&]() {
        return analyze_input(vc::AudioInput::from_pcm(pcm_data, sample_count, sample_rate), out);
    });
}

VC_API int vc_analyze_wav_bytes(const uint8_t* data, int size, VcAnalysisResult* out) {
    if (!data || size <= 0 || !out) return invalid_param("data, size and out are required");
    return guarded([&]() {
        return analyze_input(vc::AudioInput::from_wav_bytes(data, static_cast<size_t>(size)), out);
    });
}

// ============================================================
// Personal baseline
// ============================================================

VC_API int vc_calibrate_file(const char* user_id, const char* wav_path, VcCalibrationStatus* out) {
    if (!user_id || !wav_path || !out) return invalid_param("user_id, wav_path and out are required");
    return guarded([&]() { return calibrate_input(user_id, vc::AudioInput::from_file(wav_path), out); });
}

VC_API int vc_calibrate_pcm(const char* user_id, const float* pcm_data, int sample_count,
                            int sample_rate, VcCalibrationStatus* out) {
    if (!user_id || !pcm_data || sample_count <= 0 || sample_rate <= 0 || !out) {
        return invalid_param("user_id, pcm_data, sample_count, sample_rate and out are required");
    }
    return guarded([&]() {
        return calibrate_input(user_id, vc::AudioInput::from_pcm(pcm_data, sample_count, sample_rate), out);
    });
}

VC_API int vc_get_calibration_status(const char* user_id, VcCalibrationStatus* out) {
    if (!user_id || !out) return invalid_param("user_id and out are required");
    return guarded([&]() {
        std::shared_lock<std::shared_mutex> lock(g_state_mutex);
        if (!g_baselines) return not_initialized();

        vc::CalibrationStatus status;
        vc::ErrorInfo info;
        vc::ErrorCode code = g_baselines->status(user_id, status, &info);
        if (code == vc::ErrorCode::OK) fill_status(*out, status);
        return report(code, info);
    });
}

VC_API int vc_recalibrate(const char* user_id, VcCalibrationStatus* out) {
    if (!user_id || !out) return invalid_param("user_id and out are required");
    return guarded([&]() {
        std::shared_lock<std::shared_mutex> lock(g_state_mutex);
        if (!g_baselines) return not_initialized();

        vc::CalibrationStatus status;
        vc::ErrorInfo info;
        vc::ErrorCode code = g_baselines->recalibrate(user_id, status, &info);
        fill_status(*out, status);
        return report(code, info);
    });
}

VC_API int vc_reset_baseline(const char* user_id) {
    if (!user_id) return invalid_param("user_id must not be null");
    return guarded([&]() {
        std::shared_lock<std::shared_mutex> lock(g_state_mutex);
        if (!g_baselines) return not_initialized();

        vc::ErrorInfo info;
        return report(g_baselines->reset(user_id, &info), info);
    });
}

VC_API int vc_analyze_personalized_file(const char* user_id, const char* wav_path,
                                        VcPersonalizedResult* out) {
    if (!user_id || !wav_path || !out) return invalid_param("user_id, wav_path and out are required");
    return guarded([&]() {
        return personalized_input(user_id, vc::AudioInput::from_file(wav_path), out);
    });
}

VC_API int vc_analyze_personalized_pcm(const char* user_id, const float* pcm_data,
                                       int sample_count, int sample_rate,
                                       VcPersonalizedResult* out) {
    if (!user_id || !pcm_data || sample_count <= 0 || sample_rate <= 0 || !out) {
        return invalid_param("user_id, pcm_data, sample_count, sample_rate and out are required");
    }
    return guarded([&]() {
        return personalized_input(user_id,
                                  vc::AudioInput::from_pcm(pcm_data, sample_count, sample_rate), out);
    });
}

// ============================================================
// Introspection
// ============================================================

VC_API int vc_get_feature_count() {
    return static_cast<int>(vc::FeatureSchema::v1().size());
}

VC_API int vc_get_feature_name(int index, char* out_name, int buf_size) {
    const auto& schema = vc::FeatureSchema::v1();
    if (!out_name || buf_size <= 0 || index < 0 || static_cast<size_t>(index) >= schema.size()) {
        return invalid_param("index out of range or no output buffer");
    }
    const std::string& name = schema.name(static_cast<size_t>(index));
    if (name.size() + 1 > static_cast<size_t>(buf_size)) {
        vc::set_last_error(vc::ErrorCode::BUFFER_TOO_SMALL,
                           "need " + std::to_string(name.size() + 1) + " bytes");
        return VC_ERROR_BUFFER_TOO_SMALL;
    }
    copy_str(out_name, static_cast<size_t>(buf_size), name);
    return VC_OK;
}

VC_API const char* vc_get_last_error() {
    return vc::get_last_error();
}

VC_API int vc_get_last_validation(VcValidationInfo* out) {
    if (!out) return invalid_param("out must not be null");
    *out = g_last_validation;
    return VC_OK;
}

VC_API int vc_is_model_loaded() {
    std::shared_lock<std::shared_mutex> lock(g_state_mutex);
    return (g_engine && g_engine->is_model_loaded()) ? 1 : 0;
}

VC_API const char* vc_get_version() {
    return VC_VERSION;
}
