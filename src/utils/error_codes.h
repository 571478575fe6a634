#ifndef VC_ERROR_CODES_H
#define VC_ERROR_CODES_H

#include <string>

namespace vc {

// Values mirror the VC_ERROR_* macros of the public C API.
enum class ErrorCode {
    OK = 0,
    UNKNOWN = -1,
    INVALID_PARAM = -2,
    NOT_INIT = -3,
    ALREADY_INIT = -4,
    MODEL_LOAD = -5,
    AUDIO_TOO_SHORT = -6,
    AUDIO_TOO_LONG = -7,
    AUDIO_CLIPPED = -8,
    AUDIO_TOO_NOISY = -9,
    DB_ERROR = -10,
    FILE_NOT_FOUND = -11,
    BUFFER_TOO_SMALL = -12,
    AUDIO_DECODE = -13,
    WAV_FORMAT = -14,
    INFERENCE = -15,
    MODEL_NOT_AVAILABLE = -16,
    NO_BASELINE = -17,
    NOT_CALIBRATED = -18,
    FEATURE_EXTRACTION = -19,
    BASELINE_OUTDATED = -20
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "Success";
        case ErrorCode::UNKNOWN: return "Unknown error";
        case ErrorCode::INVALID_PARAM: return "Invalid parameter";
        case ErrorCode::NOT_INIT: return "SDK not initialized";
        case ErrorCode::ALREADY_INIT: return "SDK already initialized";
        case ErrorCode::MODEL_LOAD: return "Failed to load model";
        case ErrorCode::AUDIO_TOO_SHORT: return "Audio too short";
        case ErrorCode::AUDIO_TOO_LONG: return "Audio too long";
        case ErrorCode::AUDIO_CLIPPED: return "Audio is clipped";
        case ErrorCode::AUDIO_TOO_NOISY: return "Audio too noisy";
        case ErrorCode::DB_ERROR: return "Database error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::BUFFER_TOO_SMALL: return "Output buffer too small";
        case ErrorCode::AUDIO_DECODE: return "Cannot decode audio";
        case ErrorCode::WAV_FORMAT: return "Unsupported WAV format";
        case ErrorCode::INFERENCE: return "Model inference error";
        case ErrorCode::MODEL_NOT_AVAILABLE: return "Model not available";
        case ErrorCode::NO_BASELINE: return "No baseline for user";
        case ErrorCode::NOT_CALIBRATED: return "Baseline not calibrated";
        case ErrorCode::FEATURE_EXTRACTION: return "Feature extraction failed";
        case ErrorCode::BASELINE_OUTDATED: return "Baseline uses an older feature schema";
        default: return "Unknown error code";
    }
}

// Validation failures: reported to the caller with the measured value, never retried.
inline bool is_validation_error(ErrorCode code) {
    return code == ErrorCode::AUDIO_TOO_SHORT || code == ErrorCode::AUDIO_TOO_LONG ||
           code == ErrorCode::AUDIO_CLIPPED || code == ErrorCode::AUDIO_TOO_NOISY;
}

// Detail for a failed call. measured/limit are only meaningful for validation errors.
struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    float measured = 0.0f;
    float limit = 0.0f;
    std::string message;

    void clear() {
        code = ErrorCode::OK;
        measured = 0.0f;
        limit = 0.0f;
        message.clear();
    }
};

// Fills *info (when given) and returns code, so callers can `return fail(...)`.
inline ErrorCode fail(ErrorInfo* info, ErrorCode code, const std::string& message,
                      float measured = 0.0f, float limit = 0.0f) {
    if (info) {
        info->code = code;
        info->measured = measured;
        info->limit = limit;
        info->message = message;
    }
    return code;
}

// Thread-local error message storage
inline thread_local std::string g_last_error;

inline void set_last_error(const std::string& msg) {
    g_last_error = msg;
}

inline void set_last_error(ErrorCode code) {
    g_last_error = error_code_to_string(code);
}

inline void set_last_error(ErrorCode code, const std::string& detail) {
    g_last_error = std::string(error_code_to_string(code)) + ": " + detail;
}

inline const char* get_last_error() {
    return g_last_error.c_str();
}

} // namespace vc

#endif // VC_ERROR_CODES_H
