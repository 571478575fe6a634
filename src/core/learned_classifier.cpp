#include "core/learned_classifier.h"
#include "core/onnx_model.h"
#include "utils/logger.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace vc {

namespace {

bool parse_csv(const std::string& text, std::vector<float>& out) {
    out.clear();
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            out.push_back(std::stof(item));
        } catch (const std::exception&) {
            return false;
        }
    }
    return !out.empty();
}

inline float sigmoid(float x) { return 1.0f / (1.0f + std::exp(-x)); }

} // anonymous namespace

const char* architecture_name(ModelArchitecture arch) {
    switch (arch) {
        case ModelArchitecture::FeedForward:   return "feedforward";
        case ModelArchitecture::Convolutional: return "convolutional";
        case ModelArchitecture::Recurrent:     return "recurrent";
        case ModelArchitecture::Attention:     return "attention";
    }
    return "unknown";
}

const char* architecture_model_file(ModelArchitecture arch) {
    switch (arch) {
        case ModelArchitecture::FeedForward:   return "mlp.onnx";
        case ModelArchitecture::Convolutional: return "cnn.onnx";
        case ModelArchitecture::Recurrent:     return "rnn.onnx";
        case ModelArchitecture::Attention:     return "attention.onnx";
    }
    return "";
}

// ============================================================
// FeatureScaler
// ============================================================

bool FeatureScaler::transform(const std::vector<float>& in, std::vector<float>& out) const {
    if (empty()) {
        out = in;
        return true;
    }
    if (in.size() != mean.size() || scale.size() != mean.size()) return false;
    out.resize(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        float s = scale[i] != 0.0f ? scale[i] : 1.0f;
        out[i] = (in[i] - mean[i]) / s;
    }
    return true;
}

bool FeatureScaler::parse(const std::string& mean_csv, const std::string& scale_csv,
                          FeatureScaler& out) {
    FeatureScaler s;
    if (!parse_csv(mean_csv, s.mean) || !parse_csv(scale_csv, s.scale)) return false;
    if (s.mean.size() != s.scale.size()) return false;
    out = std::move(s);
    return true;
}

// ============================================================
// LearnedVariantClassifier
// ============================================================

LearnedVariantClassifier::LearnedVariantClassifier(ModelArchitecture arch)
    : arch_(arch), model_(std::make_unique<OnnxModel>()) {}

LearnedVariantClassifier::~LearnedVariantClassifier() = default;

bool LearnedVariantClassifier::is_loaded() const {
    return model_ && model_->is_loaded();
}

bool LearnedVariantClassifier::load(const std::string& model_dir, Ort::Env& env, int num_threads) {
    namespace fs = std::filesystem;
    std::string path = (fs::path(model_dir) / architecture_model_file(arch_)).string();
    if (!fs::exists(path)) {
        last_error_ = "Model file not found: " + path;
        return false;
    }
    if (!model_->load(path, env, num_threads)) {
        last_error_ = model_->last_error();
        return false;
    }

    std::string value;
    if (model_->metadata("f1_score", value)) {
        try {
            f1_ = std::stof(value);
            has_f1_ = f1_ > 0.0f;
        } catch (const std::exception&) {
            VC_LOG_WARN("{}: unreadable f1_score metadata '{}'", name(), value);
        }
    }

    std::string mean_csv, scale_csv;
    if (model_->metadata("scaler_mean", mean_csv) && model_->metadata("scaler_scale", scale_csv)) {
        if (!FeatureScaler::parse(mean_csv, scale_csv, scaler_)) {
            last_error_ = "Corrupt scaler metadata in " + path;
            model_ = std::make_unique<OnnxModel>();
            return false;
        }
        if (scaler_.size() != FeatureSchema::v1().size()) {
            last_error_ = "Scaler has " + std::to_string(scaler_.size()) +
                          " features, schema v1 has " + std::to_string(FeatureSchema::v1().size());
            model_ = std::make_unique<OnnxModel>();
            return false;
        }
    } else {
        VC_LOG_WARN("{}: no scaler metadata, features are passed unscaled", name());
    }

    VC_LOG_INFO("Loaded {} classifier (f1={:.3f})", name(), f1_);
    return true;
}

std::vector<int64_t> LearnedVariantClassifier::input_shape(size_t num_features) const {
    const int64_t n = static_cast<int64_t>(num_features);
    switch (arch_) {
        case ModelArchitecture::Convolutional:
        case ModelArchitecture::Recurrent:
            return {1, 1, n};   // one channel / one time step
        case ModelArchitecture::Attention:
            return {1, n, 1};   // features as a sequence of scalars
        case ModelArchitecture::FeedForward:
        default:
            return {1, n};
    }
}

bool LearnedVariantClassifier::score(const FeatureVector& features, ClassScore& out) const {
    if (!is_loaded()) return false;

    std::vector<float> input;
    if (!scaler_.transform(features.to_array(), input)) {
        VC_LOG_ERROR("{}: feature count does not match scaler", name());
        return false;
    }

    std::vector<std::vector<float>> outputs;
    std::string error;
    if (!model_->run(input, input_shape(input.size()), outputs, &error)) {
        return false;
    }
    if (outputs.empty() || outputs[0].size() < static_cast<size_t>(kNumClasses)) {
        VC_LOG_ERROR("{}: expected {} class scores", name(), kNumClasses);
        return false;
    }

    ClassProbabilities p;
    std::copy(outputs[0].begin(), outputs[0].begin() + kNumClasses, p.begin());
    float sum = 0.0f;
    bool negative = false;
    for (float v : p) {
        sum += v;
        negative = negative || v < 0.0f;
    }
    // Exported graphs may stop at the logits
    if (negative || std::fabs(sum - 1.0f) > 1e-3f) {
        probability::softmax(p.data(), kNumClasses);
    }

    float confidence = probability::max_value(p);
    if (outputs.size() > 1 && !outputs[1].empty()) {
        confidence = outputs[1][0];
        if (confidence < 0.0f || confidence > 1.0f) confidence = sigmoid(confidence);
    }

    out.probabilities = p;
    out.confidence = confidence;
    out.classifier = name();
    return true;
}

} // namespace vc
