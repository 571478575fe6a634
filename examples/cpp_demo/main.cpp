#include <vocalysis/vocalysis_api.h>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Voiced-speech stand-in: a vibrato tone with harmonics, syllable-rate
// amplitude bursts and a little background noise.
static std::vector<float> generate_voice(float f0, float duration, unsigned seed,
                                         int sample_rate = 16000) {
    const float pi = 3.14159265f;
    int num_samples = static_cast<int>(duration * sample_rate);
    std::vector<float> samples(num_samples);
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 0.002f);

    float phase = 0.0f;
    for (int i = 0; i < num_samples; ++i) {
        float t = static_cast<float>(i) / sample_rate;
        float f = f0 * (1.0f + 0.03f * std::sin(2.0f * pi * 5.0f * t));
        phase += 2.0f * pi * f / sample_rate;
        float envelope = 0.5f + 0.5f * std::sin(2.0f * pi * 3.5f * t);
        float voiced = 0.30f * std::sin(phase) + 0.12f * std::sin(2.0f * phase) +
                       0.06f * std::sin(3.0f * phase);
        samples[i] = envelope * voiced + noise(rng);
    }
    return samples;
}

static void print_analysis(const VcAnalysisResult& r) {
    static const char* kClasses[VC_NUM_CLASSES] = {"normal", "anxiety", "depression", "stress"};
    static const char* kRisk[] = {"low", "moderate", "high"};

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Classifier: " << r.classifier_used
              << "  (segments=" << r.segments_analyzed
              << ", duration=" << r.duration_sec << "s)" << std::endl;
    for (int k = 0; k < VC_NUM_CLASSES; ++k) {
        std::cout << "  " << std::setw(11) << kClasses[k] << ": " << r.probabilities[k] << std::endl;
    }
    std::cout << "  Confidence: " << r.confidence << std::endl;
    std::cout << std::setprecision(1);
    std::cout << "  Mental health score: " << r.mental_health_score
              << "  risk: " << kRisk[r.risk_level] << std::endl;

    const VcScaleScore* scales[] = {&r.phq9, &r.gad7, &r.pss, &r.wemwbs};
    for (const VcScaleScore* s : scales) {
        std::cout << "  " << std::setw(7) << s->scale << ": " << s->score
                  << " [" << s->min_score << "-" << s->max_score << "] "
                  << s->interpretation << std::endl;
    }
    for (int i = 0; i < r.interpretation_count; ++i) {
        std::cout << "  * " << r.interpretations[i] << std::endl;
    }
    for (int i = 0; i < r.recommendation_count; ++i) {
        std::cout << "  - " << r.recommendations[i] << std::endl;
    }
}

static void print_failure(const char* what, int ret) {
    std::cerr << what << " failed (" << ret << "): " << vc_get_last_error() << std::endl;
    VcValidationInfo info;
    if (vc_get_last_validation(&info) == VC_OK && info.code != VC_OK) {
        std::cerr << "  measured=" << info.measured << " limit=" << info.limit << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::cout << "=== Vocalysis SDK " << vc_get_version() << " Demo ===" << std::endl;

    std::string model_dir = "models";
    std::string db_path;   // in-memory unless given
    std::vector<std::string> wav_files;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--models" && i + 1 < argc) {
            model_dir = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: vocalysis_demo [--models DIR] [--db FILE] [recording.wav ...]" << std::endl;
            return 0;
        } else {
            wav_files.push_back(arg);
        }
    }

    // 1. Initialize SDK
    std::cout << "\n[1] Initializing SDK..." << std::endl;
    VcConfig config;
    vc_default_config(&config);
    config.model_dir = model_dir.c_str();
    config.db_path = db_path.empty() ? nullptr : db_path.c_str();
    config.log_level = VC_LOG_LEVEL_WARN;
    int ret = vc_init_ex(&config);
    if (ret != VC_OK) {
        print_failure("Init", ret);
        return 1;
    }
    std::cout << "SDK initialized (learned models "
              << (vc_is_model_loaded() ? "loaded" : "not found, heuristic only") << ")" << std::endl;

    // 2. Analyze recordings
    VcAnalysisResult result;
    if (!wav_files.empty()) {
        for (const auto& path : wav_files) {
            std::cout << "\n[2] Analyzing " << path << std::endl;
            ret = vc_analyze_file(path.c_str(), &result);
            if (ret != VC_OK) {
                print_failure("Analysis", ret);
                continue;
            }
            print_analysis(result);
        }
    } else {
        std::cout << "\n[2] Analyzing 12s of synthetic voice..." << std::endl;
        auto audio = generate_voice(180.0f, 12.0f, 1);
        ret = vc_analyze_pcm(audio.data(), static_cast<int>(audio.size()), 16000, &result);
        if (ret != VC_OK) {
            print_failure("Analysis", ret);
        } else {
            print_analysis(result);
        }
    }

    // 3. Personal baseline
    std::cout << "\n[3] Calibrating baseline for demo_user..." << std::endl;
    VcCalibrationStatus status;
    std::memset(&status, 0, sizeof(status));
    for (unsigned s = 0; s < 9; ++s) {
        auto sample = generate_voice(175.0f + 2.0f * s, 6.0f, 100 + s);
        ret = vc_calibrate_pcm("demo_user", sample.data(), static_cast<int>(sample.size()), 16000, &status);
        if (ret != VC_OK) {
            print_failure("Calibration", ret);
            break;
        }
        std::cout << "  " << status.samples_collected << "/" << status.samples_required
                  << "  " << status.message << std::endl;
    }

    if (status.is_calibrated) {
        std::cout << "\n[4] Personalized analysis..." << std::endl;
        auto audio = generate_voice(230.0f, 12.0f, 7);
        VcPersonalizedResult personal;
        ret = vc_analyze_personalized_pcm("demo_user", audio.data(), static_cast<int>(audio.size()),
                                          16000, &personal);
        if (ret != VC_OK) {
            print_failure("Personalized analysis", ret);
        } else {
            std::cout << std::setprecision(2);
            std::cout << "  Deviation: " << personal.deviation_score << " ("
                      << personal.deviation_band << ")" << std::endl;
            for (int i = 0; i < personal.deviation_count; ++i) {
                const VcFeatureDeviation& d = personal.deviations[i];
                std::cout << "    " << std::setw(24) << d.feature << "  z=" << std::setw(7) << d.z_score
                          << "  " << d.interpretation << std::endl;
            }
            for (int i = 0; i < personal.score_deviation_count; ++i) {
                const VcScoreDeviation& d = personal.score_deviations[i];
                std::cout << "    " << std::setw(24) << d.score << "  z=" << std::setw(7) << d.z_score
                          << "  " << d.interpretation << std::endl;
            }
            for (int i = 0; i < personal.insight_count; ++i) {
                std::cout << "  * " << personal.insights[i] << std::endl;
            }
        }
    }

    vc_release();
    std::cout << "\nDone." << std::endl;
    return 0;
}
