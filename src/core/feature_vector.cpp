#include "core/feature_vector.h"
#include <cmath>

namespace vc {

// ============================================================
// FeatureSchema
// ============================================================

void FeatureSchema::add(const std::string& name, Accessor accessor) {
    index_[name] = names_.size();
    names_.push_back(name);
    accessors_.push_back(std::move(accessor));
}

void FeatureSchema::add_stats4(const std::string& prefix,
                               std::function<Stats4&(FeatureVector&)> stats) {
    add(prefix + "_mean", [stats](FeatureVector& f) -> float& { return stats(f).mean; });
    add(prefix + "_std",  [stats](FeatureVector& f) -> float& { return stats(f).std; });
    add(prefix + "_max",  [stats](FeatureVector& f) -> float& { return stats(f).max; });
    add(prefix + "_min",  [stats](FeatureVector& f) -> float& { return stats(f).min; });
}

const FeatureSchema& FeatureSchema::v1() {
    static const FeatureSchema schema = [] {
        FeatureSchema s;
        using F = FeatureVector;

        s.add("duration", [](F& f) -> float& { return f.duration; });

        s.add_stats4("ae", [](F& f) -> Stats4& { return f.amplitude_envelope; });
        s.add_stats4("rms", [](F& f) -> Stats4& { return f.rms; });
        s.add_stats4("zcr", [](F& f) -> Stats4& { return f.zcr; });
        s.add("silence_rate",           [](F& f) -> float& { return f.silence_rate; });
        s.add("silence_mean_duration",  [](F& f) -> float& { return f.silence_mean_duration; });
        s.add("silence_std_duration",   [](F& f) -> float& { return f.silence_std_duration; });
        s.add("silence_max_duration",   [](F& f) -> float& { return f.silence_max_duration; });
        s.add("silence_total_duration", [](F& f) -> float& { return f.silence_total_duration; });
        s.add("silence_percentage",     [](F& f) -> float& { return f.silence_percentage; });

        s.add_stats4("spectral_centroid", [](F& f) -> Stats4& { return f.spectral_centroid; });
        s.add_stats4("spectral_bandwidth", [](F& f) -> Stats4& { return f.spectral_bandwidth; });
        s.add_stats4("spectral_rolloff", [](F& f) -> Stats4& { return f.spectral_rolloff; });
        for (int i = 0; i < kNumMfcc; ++i) {
            s.add_stats4("mfcc" + std::to_string(i + 1),
                         [i](F& f) -> Stats4& { return f.mfcc[i]; });
        }
        for (int i = 0; i < kNumContrastBands; ++i) {
            std::string prefix = "spectral_contrast" + std::to_string(i + 1);
            s.add(prefix + "_mean", [i](F& f) -> float& { return f.spectral_contrast[i].mean; });
            s.add(prefix + "_std",  [i](F& f) -> float& { return f.spectral_contrast[i].std; });
        }
        s.add("spectral_flatness_mean", [](F& f) -> float& { return f.spectral_flatness.mean; });
        s.add("spectral_flatness_std",  [](F& f) -> float& { return f.spectral_flatness.std; });

        s.add("pitch_mean",           [](F& f) -> float& { return f.pitch_mean; });
        s.add("pitch_std",            [](F& f) -> float& { return f.pitch_std; });
        s.add("pitch_max",            [](F& f) -> float& { return f.pitch_max; });
        s.add("pitch_min",            [](F& f) -> float& { return f.pitch_min; });
        s.add("pitch_range",          [](F& f) -> float& { return f.pitch_range; });
        s.add("pitch_changes_mean",   [](F& f) -> float& { return f.pitch_changes_mean; });
        s.add("pitch_changes_std",    [](F& f) -> float& { return f.pitch_changes_std; });
        s.add("pitch_changes_max",    [](F& f) -> float& { return f.pitch_changes_max; });
        s.add("speech_rate",          [](F& f) -> float& { return f.speech_rate; });
        s.add("rhythm_mean_interval", [](F& f) -> float& { return f.rhythm_mean_interval; });
        s.add("rhythm_std_interval",  [](F& f) -> float& { return f.rhythm_std_interval; });
        s.add("rhythm_max_interval",  [](F& f) -> float& { return f.rhythm_max_interval; });
        s.add("rhythm_min_interval",  [](F& f) -> float& { return f.rhythm_min_interval; });
        s.add("rhythm_regularity",    [](F& f) -> float& { return f.rhythm_regularity; });
        s.add("jitter_mean",          [](F& f) -> float& { return f.jitter_mean; });
        s.add("jitter_std",           [](F& f) -> float& { return f.jitter_std; });
        s.add("shimmer_mean",         [](F& f) -> float& { return f.shimmer_mean; });
        s.add("shimmer_std",          [](F& f) -> float& { return f.shimmer_std; });
        s.add("hnr",                  [](F& f) -> float& { return f.hnr; });
        return s;
    }();
    return schema;
}

int FeatureSchema::index_of(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? -1 : static_cast<int>(it->second);
}

float FeatureSchema::get(const FeatureVector& fv, size_t index) const {
    // Accessors hand out mutable references; reading through them does not modify fv
    return accessors_[index](const_cast<FeatureVector&>(fv));
}

void FeatureSchema::set(FeatureVector& fv, size_t index, float value) const {
    accessors_[index](fv) = value;
}

// ============================================================
// FeatureVector
// ============================================================

int FeatureVector::sanitize() {
    const auto& schema = FeatureSchema::v1();
    int fixed = 0;
    for (size_t i = 0; i < schema.size(); ++i) {
        if (!std::isfinite(schema.get(*this, i))) {
            schema.set(*this, i, 0.0f);
            ++fixed;
        }
    }
    return fixed;
}

bool FeatureVector::all_finite() const {
    const auto& schema = FeatureSchema::v1();
    for (size_t i = 0; i < schema.size(); ++i) {
        if (!std::isfinite(schema.get(*this, i))) return false;
    }
    return true;
}

std::map<std::string, float> FeatureVector::to_map() const {
    const auto& schema = FeatureSchema::v1();
    std::map<std::string, float> out;
    for (size_t i = 0; i < schema.size(); ++i) {
        out[schema.name(i)] = schema.get(*this, i);
    }
    return out;
}

FeatureVector FeatureVector::from_map(const std::map<std::string, float>& values) {
    const auto& schema = FeatureSchema::v1();
    FeatureVector fv;
    for (const auto& [name, value] : values) {
        int idx = schema.index_of(name);
        if (idx >= 0) schema.set(fv, static_cast<size_t>(idx), value);
    }
    return fv;
}

std::vector<float> FeatureVector::to_array() const {
    const auto& schema = FeatureSchema::v1();
    std::vector<float> out(schema.size());
    for (size_t i = 0; i < schema.size(); ++i) {
        out[i] = schema.get(*this, i);
    }
    return out;
}

bool FeatureVector::from_array(const std::vector<float>& values, FeatureVector& out) {
    const auto& schema = FeatureSchema::v1();
    if (values.size() != schema.size()) return false;
    out = FeatureVector();
    for (size_t i = 0; i < schema.size(); ++i) {
        schema.set(out, i, values[i]);
    }
    return true;
}

bool FeatureVector::get(const std::string& name, float& value) const {
    const auto& schema = FeatureSchema::v1();
    int idx = schema.index_of(name);
    if (idx < 0) return false;
    value = schema.get(*this, static_cast<size_t>(idx));
    return true;
}

FeatureVector mean_features(const std::vector<FeatureVector>& vectors) {
    FeatureVector result;
    if (vectors.empty()) return result;

    const auto& schema = FeatureSchema::v1();
    std::vector<double> acc(schema.size(), 0.0);
    for (const auto& fv : vectors) {
        for (size_t i = 0; i < schema.size(); ++i) {
            acc[i] += schema.get(fv, i);
        }
    }
    for (size_t i = 0; i < schema.size(); ++i) {
        schema.set(result, i, static_cast<float>(acc[i] / static_cast<double>(vectors.size())));
    }
    return result;
}

} // namespace vc
