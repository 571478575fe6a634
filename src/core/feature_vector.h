#ifndef VC_FEATURE_VECTOR_H
#define VC_FEATURE_VECTOR_H

#include <array>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace vc {

constexpr int kNumMfcc = 13;
constexpr int kNumContrastBands = 7;
constexpr int kFeatureSchemaVersion = 1;

struct Stats4 {
    float mean = 0.0f;
    float std = 0.0f;
    float max = 0.0f;
    float min = 0.0f;
};

struct Stats2 {
    float mean = 0.0f;
    float std = 0.0f;
};

// Per-segment (or per-recording, after averaging) acoustic features.
// Every field defaults to 0, which is also the value used for undefined
// statistics (no pitch, no pauses, silent frames).
struct FeatureVector {
    float duration = 0.0f;

    // ---- time domain ----
    Stats4 amplitude_envelope;
    Stats4 rms;
    Stats4 zcr;
    float silence_rate = 0.0f;            // pauses per second
    float silence_mean_duration = 0.0f;   // seconds
    float silence_std_duration = 0.0f;
    float silence_max_duration = 0.0f;
    float silence_total_duration = 0.0f;
    float silence_percentage = 0.0f;      // fraction of frames in [0, 1]

    // ---- frequency domain ----
    Stats4 spectral_centroid;
    Stats4 spectral_bandwidth;
    Stats4 spectral_rolloff;
    std::array<Stats4, kNumMfcc> mfcc{};
    std::array<Stats2, kNumContrastBands> spectral_contrast{};
    Stats2 spectral_flatness;

    // ---- prosodic / voice quality ----
    float pitch_mean = 0.0f;
    float pitch_std = 0.0f;
    float pitch_max = 0.0f;
    float pitch_min = 0.0f;
    float pitch_range = 0.0f;
    float pitch_changes_mean = 0.0f;
    float pitch_changes_std = 0.0f;
    float pitch_changes_max = 0.0f;
    float speech_rate = 0.0f;             // energy peaks per second
    float rhythm_mean_interval = 0.0f;
    float rhythm_std_interval = 0.0f;
    float rhythm_max_interval = 0.0f;
    float rhythm_min_interval = 0.0f;
    float rhythm_regularity = 0.0f;
    float jitter_mean = 0.0f;
    float jitter_std = 0.0f;
    float shimmer_mean = 0.0f;
    float shimmer_std = 0.0f;
    float hnr = 0.0f;                     // dB

    // Replace NaN/Inf with the field default. Returns the number of fields fixed.
    int sanitize();
    bool all_finite() const;

    std::map<std::string, float> to_map() const;
    // Unknown names are ignored, missing names keep their default
    static FeatureVector from_map(const std::map<std::string, float>& values);

    // Positional layout of FeatureSchema::v1(), for model input and storage
    std::vector<float> to_array() const;
    static bool from_array(const std::vector<float>& values, FeatureVector& out);

    bool get(const std::string& name, float& value) const;
};

// Versioned name <-> field table. Only used where features cross a boundary
// that needs names or fixed positions.
class FeatureSchema {
public:
    using Accessor = std::function<float&(FeatureVector&)>;

    static const FeatureSchema& v1();

    int version() const { return version_; }
    size_t size() const { return names_.size(); }
    const std::string& name(size_t index) const { return names_[index]; }
    const std::vector<std::string>& names() const { return names_; }

    // -1 when the name is not part of the schema
    int index_of(const std::string& name) const;

    float get(const FeatureVector& fv, size_t index) const;
    void set(FeatureVector& fv, size_t index, float value) const;

private:
    FeatureSchema() = default;
    void add(const std::string& name, Accessor accessor);
    void add_stats4(const std::string& prefix, std::function<Stats4&(FeatureVector&)> stats);

    int version_ = kFeatureSchemaVersion;
    std::vector<std::string> names_;
    std::vector<Accessor> accessors_;
    std::unordered_map<std::string, size_t> index_;
};

// Arithmetic mean of every field. An empty list yields the default vector.
FeatureVector mean_features(const std::vector<FeatureVector>& vectors);

} // namespace vc

#endif // VC_FEATURE_VECTOR_H
