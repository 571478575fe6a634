#ifndef VC_ASSESSMENT_ENGINE_H
#define VC_ASSESSMENT_ENGINE_H

#include "core/audio_processor.h"
#include "core/audio_validator.h"
#include "core/classifier.h"
#include "core/feature_extractor.h"
#include "core/scale_mapper.h"
#include "core/wellness_score.h"
#include "utils/config.h"
#include "utils/error_codes.h"
#include <memory>
#include <string>
#include <vector>

namespace vc {

class HeuristicClassifier;
class EnsembleClassifier;

struct AnalysisOptions {
    bool use_models = true;                // false forces the heuristic classifier
    bool include_interpretations = true;
    bool include_recommendations = true;
};

struct AnalysisResult {
    FeatureVector features;
    ClassProbabilities probabilities{};
    float confidence = 0.0f;
    float mental_health_score = 0.0f;
    RiskLevel risk_level = RiskLevel::Low;
    ScaleScores scale_scores;
    std::vector<std::string> interpretations;
    std::vector<std::string> recommendations;
    int segments_analyzed = 0;
    float duration = 0.0f;                 // seconds of input audio
    std::string classifier_used;
};

// Ingestion -> feature extraction -> classification -> scale mapping.
// After init() every const method is safe to call from several threads.
class AssessmentEngine {
public:
    explicit AssessmentEngine(const EngineConfig& config = {});
    ~AssessmentEngine();

    // Loads whatever learned models are present in config.model_dir. Missing
    // or broken models leave the engine on the heuristic classifier.
    bool init();

    // Release models, back to heuristic only
    void release();

    ErrorCode analyze(const AudioInput& input, const AnalysisOptions& options,
                      AnalysisResult& result, ErrorInfo* err = nullptr) const;

    // Load, validate, segment and featurize. segments/duration are optional outputs.
    ErrorCode extract_features(const AudioInput& input, ValidationMode mode,
                               FeatureVector& features, int* segments = nullptr,
                               float* duration = nullptr, ErrorInfo* err = nullptr) const;

    // Classification and everything derived from it, for features already extracted
    bool assess(const FeatureVector& features, const AnalysisOptions& options,
                AnalysisResult& result) const;

    bool classify(const FeatureVector& features, ClassScore& out, bool use_models = true) const;

    bool is_initialized() const { return initialized_; }
    bool is_model_loaded() const;
    int loaded_model_count() const { return loaded_models_; }
    const EngineConfig& config() const { return config_; }
    const std::string& last_error() const { return last_error_; }

private:
    EngineConfig config_;
    AudioValidator validator_;
    FeatureExtractor extractor_;

    // release() without logging, safe during static destruction
    void unload();

    std::shared_ptr<const HeuristicClassifier> heuristic_;
    std::shared_ptr<const EnsembleClassifier> ensemble_;
    std::shared_ptr<const Classifier> classifier_;   // ensemble with heuristic fallback

    int loaded_models_ = 0;
    bool initialized_ = false;
    std::string last_error_;
};

} // namespace vc

#endif // VC_ASSESSMENT_ENGINE_H
