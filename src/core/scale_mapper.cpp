#include "core/scale_mapper.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace vc {

namespace {

// Clinical reference ranges for the acoustic markers
constexpr float kSpeechRateLow = 2.5f;
constexpr float kSpeechRateHigh = 4.5f;
constexpr float kPitchStdLow = 15.0f;
constexpr float kPitchStdHigh = 25.0f;
constexpr float kRmsLow = 0.3f;
constexpr float kRmsHigh = 0.7f;
constexpr float kSilenceRateLow = 0.5f;
constexpr float kSilenceRateHigh = 2.0f;
constexpr float kJitterHigh = 0.03f;
constexpr float kHnrLow = 10.0f;

int scaled(float probability, int max_score) {
    float p = std::max(0.0f, std::min(1.0f, probability));
    return std::min(max_score, static_cast<int>(std::floor(p * max_score)));
}

ScaleScore make_scale(const char* name, int score, int lo, int hi, std::string band) {
    ScaleScore s;
    s.scale = name;
    s.score = score;
    s.min_score = lo;
    s.max_score = hi;
    s.interpretation = std::move(band);
    return s;
}

} // anonymous namespace

// ============================================================
// Scale bands
// ============================================================

std::string phq9_band(int score) {
    if (score < 5) return "Minimal depression";
    if (score < 10) return "Mild depression";
    if (score < 15) return "Moderate depression";
    if (score < 20) return "Moderately severe depression";
    return "Severe depression";
}

std::string gad7_band(int score) {
    if (score < 5) return "Minimal anxiety";
    if (score < 10) return "Mild anxiety";
    if (score < 15) return "Moderate anxiety";
    return "Severe anxiety";
}

std::string pss_band(int score) {
    if (score < 14) return "Low perceived stress";
    if (score < 27) return "Moderate perceived stress";
    return "High perceived stress";
}

std::string wemwbs_band(int score) {
    if (score < 40) return "Low mental wellbeing";
    if (score < 59) return "Average mental wellbeing";
    return "High mental wellbeing";
}

std::map<std::string, std::string> ScaleScores::interpretations() const {
    std::map<std::string, std::string> out;
    for (const ScaleScore* s : all()) out[s->scale] = s->interpretation;
    return out;
}

ScaleScores map_to_scales(const ClassProbabilities& p, float mental_health_score) {
    ScaleScores out;
    int phq9 = scaled(p[static_cast<int>(MentalState::Depression)], 27);
    int gad7 = scaled(p[static_cast<int>(MentalState::Anxiety)], 21);
    int pss = scaled(p[static_cast<int>(MentalState::Stress)], 40);

    float score = std::max(0.0f, std::min(100.0f, mental_health_score));
    int wemwbs = static_cast<int>(std::floor(14.0f + score / 100.0f * 56.0f));
    wemwbs = std::max(14, std::min(70, wemwbs));

    out.phq9 = make_scale("PHQ-9", phq9, 0, 27, phq9_band(phq9));
    out.gad7 = make_scale("GAD-7", gad7, 0, 21, gad7_band(gad7));
    out.pss = make_scale("PSS", pss, 0, 40, pss_band(pss));
    out.wemwbs = make_scale("WEMWBS", wemwbs, 14, 70, wemwbs_band(wemwbs));
    return out;
}

// ============================================================
// Feature interpretations
// ============================================================

std::vector<std::string> interpret_features(const FeatureVector& f) {
    std::vector<std::string> notes;

    if (f.speech_rate < kSpeechRateLow) {
        notes.push_back(fmt::format(
            "Slow speech rate ({:.2f} peaks/sec), associated with fatigue, slowed processing or low mood.",
            f.speech_rate));
    } else if (f.speech_rate > kSpeechRateHigh) {
        notes.push_back(fmt::format(
            "Fast speech rate ({:.2f} peaks/sec), associated with heightened arousal or anxiety.",
            f.speech_rate));
    }

    if (f.pitch_std < kPitchStdLow) {
        notes.push_back(fmt::format(
            "Narrow pitch variation ({:.2f} Hz), associated with flattened affect or low mood.",
            f.pitch_std));
    } else if (f.pitch_std > kPitchStdHigh) {
        notes.push_back(fmt::format(
            "Wide pitch variation ({:.2f} Hz), associated with emotional reactivity or anxiety.",
            f.pitch_std));
    }

    if (f.rms.mean < kRmsLow) {
        notes.push_back(fmt::format(
            "Low vocal energy ({:.2f}), associated with fatigue or reduced motivation.", f.rms.mean));
    } else if (f.rms.mean > kRmsHigh) {
        notes.push_back(fmt::format(
            "High vocal energy ({:.2f}), associated with agitation or heightened arousal.", f.rms.mean));
    }

    if (f.silence_rate < kSilenceRateLow) {
        notes.push_back(fmt::format(
            "Few pauses ({:.2f} pauses/sec), associated with pressured speech or anxiety.",
            f.silence_rate));
    } else if (f.silence_rate > kSilenceRateHigh) {
        notes.push_back(fmt::format(
            "Frequent pauses ({:.2f} pauses/sec), associated with slowed thinking or low mood.",
            f.silence_rate));
    }

    if (f.jitter_mean > kJitterHigh) {
        notes.push_back(fmt::format(
            "Elevated pitch jitter ({:.4f}), associated with vocal tension or physiological stress.",
            f.jitter_mean));
    }

    if (f.hnr < kHnrLow) {
        notes.push_back(fmt::format(
            "Low harmonic-to-noise ratio ({:.2f} dB), associated with a noisier, less controlled voice.",
            f.hnr));
    }

    return notes;
}

// ============================================================
// Recommendations
// ============================================================

std::vector<std::string> recommendations(const ClassProbabilities& p, float mental_health_score,
                                         const ScaleScores& scales) {
    std::vector<std::string> out;

    out.emplace_back(
        "This screening is informational and is not a diagnosis. If you are in "
        "distress, please contact a qualified mental health professional.");

    if (mental_health_score < 40.0f) {
        out.emplace_back(
            "The analysis points to notable concerns. A consultation with a mental "
            "health professional for a full assessment is advised.");
    } else if (mental_health_score < 70.0f) {
        out.emplace_back(
            "The analysis points to some concerns. Regular self-care and tracking how "
            "you feel over the coming weeks are advised; seek professional support if "
            "things do not improve.");
    } else {
        out.emplace_back(
            "The analysis does not point to notable concerns. Keep up the habits that "
            "support your wellbeing.");
    }

    auto dominant = static_cast<MentalState>(
        std::max_element(p.begin(), p.end()) - p.begin());

    switch (dominant) {
        case MentalState::Anxiety:
            out.emplace_back(
                "Anxiety markers dominate. Slow breathing, progressive muscle "
                "relaxation and regular exercise can help.");
            if (scales.gad7.score >= 10) {
                out.emplace_back(
                    "The estimated GAD-7 score is in the moderate to severe range. "
                    "Consider a professional evaluation.");
            }
            break;
        case MentalState::Depression:
            out.emplace_back(
                "Depression markers dominate. A steady daily routine, physical activity "
                "and time with people you trust can help.");
            if (scales.phq9.score >= 10) {
                out.emplace_back(
                    "The estimated PHQ-9 score is in the moderate to severe range. "
                    "Consider a professional evaluation.");
            }
            break;
        case MentalState::Stress:
            out.emplace_back(
                "Stress markers dominate. Protecting rest time, setting limits on "
                "workload and addressing specific stressors can help.");
            if (scales.pss.score >= 27) {
                out.emplace_back(
                    "The estimated PSS score indicates high perceived stress. "
                    "Consider professional support with stress management.");
            }
            break;
        case MentalState::Normal:
        default:
            break;
    }

    return out;
}

} // namespace vc
