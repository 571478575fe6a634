#ifndef VC_LEARNED_CLASSIFIER_H
#define VC_LEARNED_CLASSIFIER_H

#include "core/classifier.h"
#include <memory>
#include <string>
#include <vector>

namespace Ort { struct Env; }

namespace vc {

class OnnxModel;

enum class ModelArchitecture {
    FeedForward,
    Convolutional,
    Recurrent,
    Attention
};

const char* architecture_name(ModelArchitecture arch);
const char* architecture_model_file(ModelArchitecture arch);

// Per-feature standardization fitted at training time: (x - mean) / scale.
struct FeatureScaler {
    std::vector<float> mean;
    std::vector<float> scale;

    bool empty() const { return mean.empty(); }
    size_t size() const { return mean.size(); }

    // Zero scales are treated as 1
    bool transform(const std::vector<float>& in, std::vector<float>& out) const;

    // Comma separated values, as stored in the model metadata
    static bool parse(const std::string& mean_csv, const std::string& scale_csv,
                      FeatureScaler& out);
};

// One trained network run through ONNX Runtime. The input is the schema v1
// feature array, standardized, in the layout its architecture expects.
class LearnedVariantClassifier : public Classifier {
public:
    explicit LearnedVariantClassifier(ModelArchitecture arch);
    ~LearnedVariantClassifier() override;

    // Loads <model_dir>/<architecture file> with its F1 and scaler metadata
    bool load(const std::string& model_dir, Ort::Env& env, int num_threads = 2);

    bool score(const FeatureVector& features, ClassScore& out) const override;
    std::string name() const override { return architecture_name(arch_); }

    bool is_loaded() const;
    ModelArchitecture architecture() const { return arch_; }
    float f1_score() const { return f1_; }
    bool has_f1() const { return has_f1_; }
    const FeatureScaler& scaler() const { return scaler_; }
    const std::string& last_error() const { return last_error_; }

    std::vector<int64_t> input_shape(size_t num_features) const;

private:
    ModelArchitecture arch_;
    std::unique_ptr<OnnxModel> model_;
    FeatureScaler scaler_;
    float f1_ = 0.0f;
    bool has_f1_ = false;
    std::string last_error_;
};

} // namespace vc

#endif // VC_LEARNED_CLASSIFIER_H
