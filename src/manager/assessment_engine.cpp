#include "manager/assessment_engine.h"
#include "core/ensemble_classifier.h"
#include "core/heuristic_classifier.h"
#include "core/learned_classifier.h"
#include "utils/logger.h"
#include <onnxruntime_cxx_api.h>
#include <filesystem>

namespace vc {

// Global ONNX Runtime environment (singleton)
static std::unique_ptr<Ort::Env> g_ort_env;

AssessmentEngine::AssessmentEngine(const EngineConfig& config)
    : config_(config),
      validator_(config.ingestion, config.calibration),
      extractor_(config.features),
      heuristic_(std::make_shared<HeuristicClassifier>(config.heuristic,
                                                       config.ensemble.probability_floor)),
      classifier_(heuristic_) {}

AssessmentEngine::~AssessmentEngine() {
    unload();
}

bool AssessmentEngine::init() {
    if (initialized_) {
        last_error_ = "Already initialized";
        return false;
    }

    if (config_.model_dir.empty()) {
        VC_LOG_INFO("No model directory configured, using heuristic classifier");
    } else if (!std::filesystem::is_directory(config_.model_dir)) {
        VC_LOG_WARN("Model directory not found: {}, using heuristic classifier", config_.model_dir);
    } else {
        // Create ONNX Runtime environment
        if (!g_ort_env) {
            g_ort_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "vocalysis");
        }

        auto ensemble = std::make_shared<EnsembleClassifier>(config_.ensemble.temperature,
                                                             config_.ensemble.probability_floor);
        const ModelArchitecture architectures[] = {
            ModelArchitecture::FeedForward,
            ModelArchitecture::Convolutional,
            ModelArchitecture::Recurrent,
            ModelArchitecture::Attention,
        };
        for (ModelArchitecture arch : architectures) {
            auto variant = std::make_shared<LearnedVariantClassifier>(arch);
            if (!variant->load(config_.model_dir, *g_ort_env, config_.model_threads)) {
                VC_LOG_WARN("Optional model not available ({}): {}",
                            architecture_name(arch), variant->last_error());
                continue;
            }
            ensemble->add(variant, variant->has_f1() ? variant->f1_score() : 0.0f);
        }

        loaded_models_ = static_cast<int>(ensemble->size());
        if (!ensemble->empty()) {
            ensemble_ = ensemble;
            classifier_ = std::make_shared<FallbackClassifier>(ensemble_, heuristic_);
        } else {
            VC_LOG_WARN("No learned models loaded from {}, using heuristic classifier",
                        config_.model_dir);
        }
    }

    initialized_ = true;
    VC_LOG_INFO("AssessmentEngine initialized: models={}, rate={}Hz, min_duration={:.1f}s, "
                "min_snr={:.1f}dB, threads={}",
                loaded_models_, config_.ingestion.target_sample_rate,
                config_.ingestion.min_duration_sec, config_.ingestion.min_snr_db,
                config_.features.num_threads);
    return true;
}

void AssessmentEngine::release() {
    if (!initialized_) return;
    unload();
    VC_LOG_INFO("AssessmentEngine released");
}

void AssessmentEngine::unload() {
    classifier_ = heuristic_;
    ensemble_.reset();
    loaded_models_ = 0;
    initialized_ = false;
}

bool AssessmentEngine::is_model_loaded() const {
    return ensemble_ != nullptr;
}

ErrorCode AssessmentEngine::extract_features(const AudioInput& input, ValidationMode mode,
                                             FeatureVector& features, int* segments,
                                             float* duration, ErrorInfo* err) const {
    AudioProcessor processor(config_.ingestion.target_sample_rate);
    WaveformBuffer wave;
    if (!processor.load(input, wave)) {
        return fail(err, processor.last_code(), processor.last_error());
    }

    ErrorCode code = validator_.validate(wave, mode, err);
    if (code != ErrorCode::OK) return code;

    std::vector<AudioSegment> parts = validator_.segment(wave);
    if (parts.empty()) {
        return fail(err, ErrorCode::FEATURE_EXTRACTION, "No analyzable segments");
    }

    features = extractor_.extract(parts, wave.sample_rate);
    if (segments) *segments = static_cast<int>(parts.size());
    if (duration) *duration = wave.duration_sec();

    VC_LOG_DEBUG("Extracted features from {} segments ({:.2f}s)", parts.size(), wave.duration_sec());
    return ErrorCode::OK;
}

bool AssessmentEngine::classify(const FeatureVector& features, ClassScore& out, bool use_models) const {
    if (!use_models) return heuristic_->score(features, out);
    return classifier_->score(features, out);
}

bool AssessmentEngine::assess(const FeatureVector& features, const AnalysisOptions& options,
                              AnalysisResult& result) const {
    ClassScore score;
    if (!classify(features, score, options.use_models)) {
        return false;
    }

    result.features = features;
    result.probabilities = score.probabilities;
    result.confidence = score.confidence;
    result.classifier_used = score.classifier;
    result.mental_health_score = mental_health_score(score.probabilities, score.confidence);
    result.risk_level = risk_level(score.probabilities);
    result.scale_scores = map_to_scales(score.probabilities, result.mental_health_score);

    result.interpretations.clear();
    result.recommendations.clear();
    if (options.include_interpretations) {
        result.interpretations = interpret_features(features);
    }
    if (options.include_recommendations) {
        result.recommendations = recommendations(score.probabilities, result.mental_health_score,
                                                 result.scale_scores);
    }
    return true;
}

ErrorCode AssessmentEngine::analyze(const AudioInput& input, const AnalysisOptions& options,
                                    AnalysisResult& result, ErrorInfo* err) const {
    AnalysisResult out;
    ErrorCode code = extract_features(input, ValidationMode::Analysis, out.features,
                                      &out.segments_analyzed, &out.duration, err);
    if (code != ErrorCode::OK) return code;

    if (!assess(out.features, options, out)) {
        return fail(err, ErrorCode::INFERENCE, "Classification failed");
    }

    VC_LOG_INFO("Analysis complete: score={:.1f}, risk={}, classifier={}, segments={}",
                out.mental_health_score, risk_level_name(out.risk_level),
                out.classifier_used, out.segments_analyzed);
    result = std::move(out);
    return ErrorCode::OK;
}

} // namespace vc
