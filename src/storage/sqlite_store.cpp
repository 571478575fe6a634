#include "storage/sqlite_store.h"
#include "utils/logger.h"
#include <sqlite3.h>
#include <algorithm>
#include <cstring>

namespace vc {

namespace {

std::vector<float> map_to_array(const std::map<std::string, float>& values) {
    const FeatureSchema& schema = FeatureSchema::v1();
    std::vector<float> out(schema.size(), 0.0f);
    for (size_t i = 0; i < schema.size(); ++i) {
        auto it = values.find(schema.name(i));
        if (it != values.end()) out[i] = it->second;
    }
    return out;
}

std::map<std::string, float> array_to_map(const std::vector<float>& values) {
    const FeatureSchema& schema = FeatureSchema::v1();
    std::map<std::string, float> out;
    for (size_t i = 0; i < schema.size() && i < values.size(); ++i) {
        out[schema.name(i)] = values[i];
    }
    return out;
}

std::vector<float> column_floats(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int blob_size = sqlite3_column_bytes(stmt, col);
    std::vector<float> out;
    if (blob && blob_size > 0) {
        out.resize(static_cast<size_t>(blob_size) / sizeof(float));
        std::memcpy(out.data(), blob, out.size() * sizeof(float));
    }
    return out;
}

// Score statistics in baseline_score_name() order; empty when not computed
std::vector<float> scores_to_array(const std::map<std::string, float>& values) {
    if (values.empty()) return {};
    std::vector<float> out(kNumBaselineScores, 0.0f);
    for (size_t i = 0; i < kNumBaselineScores; ++i) {
        auto it = values.find(baseline_score_name(i));
        if (it != values.end()) out[i] = it->second;
    }
    return out;
}

std::map<std::string, float> array_to_scores(const std::vector<float>& values) {
    std::map<std::string, float> out;
    if (values.size() != kNumBaselineScores) return out;
    for (size_t i = 0; i < kNumBaselineScores; ++i) {
        out[baseline_score_name(i)] = values[i];
    }
    return out;
}

void bind_floats(sqlite3_stmt* stmt, int col, const std::vector<float>& values) {
    sqlite3_bind_blob(stmt, col, values.data(),
                      static_cast<int>(values.size() * sizeof(float)), SQLITE_TRANSIENT);
}

} // anonymous namespace

SqliteBaselineStore::SqliteBaselineStore() = default;

// No logging here: the store may outlive the logger at process exit
SqliteBaselineStore::~SqliteBaselineStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_db();
}

bool SqliteBaselineStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = "Cannot open database: " + std::string(sqlite3_errmsg(db_));
        VC_LOG_ERROR(last_error_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode
    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        VC_LOG_WARN("Failed to enable WAL mode: {}", err_msg ? err_msg : "unknown");
        if (err_msg) sqlite3_free(err_msg);
    }

    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    VC_LOG_INFO("Baseline database opened: {}", db_path);
    return true;
}

void SqliteBaselineStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        close_db();
        VC_LOG_INFO("Baseline database closed");
    }
}

void SqliteBaselineStore::close_db() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteBaselineStore::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = std::string(err_msg ? err_msg : "unknown");
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SqliteBaselineStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS baselines (
            user_id TEXT PRIMARY KEY,
            schema_version INTEGER NOT NULL,
            total_samples INTEGER NOT NULL DEFAULT 0,
            calibrated INTEGER NOT NULL DEFAULT 0,
            samples_used INTEGER NOT NULL DEFAULT 0,
            feature_means BLOB,
            feature_stds BLOB,
            score_means BLOB,
            score_stds BLOB,
            calibrated_at INTEGER NOT NULL DEFAULT 0,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
        CREATE TABLE IF NOT EXISTS calibration_samples (
            user_id TEXT NOT NULL,
            seq INTEGER NOT NULL,
            features BLOB NOT NULL,
            PRIMARY KEY (user_id, seq)
        );
        CREATE TABLE IF NOT EXISTS calibration_scores (
            user_id TEXT NOT NULL,
            seq INTEGER NOT NULL,
            scores BLOB NOT NULL,
            PRIMARY KEY (user_id, seq)
        );
    )";

    if (!exec(sql)) {
        last_error_ = "Failed to create tables: " + last_error_;
        VC_LOG_ERROR(last_error_);
        return false;
    }
    return true;
}

void SqliteBaselineStore::rollback() {
    if (!exec("ROLLBACK;")) {
        VC_LOG_WARN("Rollback failed: {}", last_error_);
    }
}

ErrorCode SqliteBaselineStore::db_error(ErrorInfo* err, const std::string& what) {
    last_error_ = what + ": " + std::string(db_ ? sqlite3_errmsg(db_) : "database not open");
    VC_LOG_ERROR(last_error_);
    return fail(err, ErrorCode::DB_ERROR, last_error_);
}

ErrorCode SqliteBaselineStore::get(const std::string& user_id, UserBaseline& out, ErrorInfo* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return db_error(err, "Load failed");

    const char* sql = R"(
        SELECT schema_version, total_samples, calibrated, samples_used,
               feature_means, feature_stds, calibrated_at, score_means, score_stds
        FROM baselines WHERE user_id = ?;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error(err, "SQL prepare error");
    }
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return fail(err, ErrorCode::NO_BASELINE, "No baseline for user: " + user_id);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return db_error(err, "SQL exec error");
    }

    int version = sqlite3_column_int(stmt, 0);
    if (version != kFeatureSchemaVersion) {
        sqlite3_finalize(stmt);
        VC_LOG_WARN("Baseline for {} uses feature schema v{}, expected v{}",
                    user_id, version, kFeatureSchemaVersion);
        return fail(err, ErrorCode::BASELINE_OUTDATED, "Baseline schema is out of date for user: " + user_id);
    }

    UserBaseline b(user_id);
    b.schema_version = version;
    b.total_samples = sqlite3_column_int(stmt, 1);
    b.calibrated = sqlite3_column_int(stmt, 2) != 0;
    b.samples_used = sqlite3_column_int(stmt, 3);
    if (b.calibrated) {
        b.feature_means = array_to_map(column_floats(stmt, 4));
        b.feature_stds = array_to_map(column_floats(stmt, 5));
        b.score_means = array_to_scores(column_floats(stmt, 7));
        b.score_stds = array_to_scores(column_floats(stmt, 8));
    }
    b.calibrated_at = sqlite3_column_int64(stmt, 6);
    sqlite3_finalize(stmt);

    if (!load_samples(user_id, b)) {
        return db_error(err, "Loading calibration samples failed");
    }

    out = std::move(b);
    return ErrorCode::OK;
}

bool SqliteBaselineStore::load_samples(const std::string& user_id, UserBaseline& out) {
    const char* sql = "SELECT features FROM calibration_samples WHERE user_id = ? ORDER BY seq;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        FeatureVector fv;
        if (!FeatureVector::from_array(column_floats(stmt, 0), fv)) {
            VC_LOG_WARN("Skipping calibration sample of unexpected size for {}", user_id);
            continue;
        }
        out.samples.push_back(fv);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return false;

    const char* score_sql = "SELECT scores FROM calibration_scores WHERE user_id = ? ORDER BY seq;";
    if (sqlite3_prepare_v2(db_, score_sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<float> values = column_floats(stmt, 0);
        if (values.size() != kNumBaselineScores) {
            VC_LOG_WARN("Skipping calibration scores of unexpected size for {}", user_id);
            continue;
        }
        ScoreSample scores;
        std::copy(values.begin(), values.end(), scores.begin());
        out.score_samples.push_back(scores);
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

ErrorCode SqliteBaselineStore::save(const UserBaseline& baseline, ErrorInfo* err) {
    if (baseline.user_id.empty()) {
        return fail(err, ErrorCode::INVALID_PARAM, "Empty user id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return db_error(err, "Save failed");

    if (!exec("BEGIN IMMEDIATE;")) {
        return db_error(err, "Cannot begin transaction");
    }

    const char* upsert = R"(
        INSERT OR REPLACE INTO baselines
            (user_id, schema_version, total_samples, calibrated, samples_used,
             feature_means, feature_stds, calibrated_at, score_means, score_stds, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, CURRENT_TIMESTAMP);
    )";

    sqlite3_stmt* stmt = nullptr;
    bool ok = sqlite3_prepare_v2(db_, upsert, -1, &stmt, nullptr) == SQLITE_OK;
    if (ok) {
        std::vector<float> means = map_to_array(baseline.feature_means);
        std::vector<float> stds = map_to_array(baseline.feature_stds);
        sqlite3_bind_text(stmt, 1, baseline.user_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, kFeatureSchemaVersion);
        sqlite3_bind_int(stmt, 3, baseline.total_samples);
        sqlite3_bind_int(stmt, 4, baseline.calibrated ? 1 : 0);
        sqlite3_bind_int(stmt, 5, baseline.samples_used);
        bind_floats(stmt, 6, means);
        bind_floats(stmt, 7, stds);
        sqlite3_bind_int64(stmt, 8, baseline.calibrated_at);
        bind_floats(stmt, 9, scores_to_array(baseline.score_means));
        bind_floats(stmt, 10, scores_to_array(baseline.score_stds));
        ok = sqlite3_step(stmt) == SQLITE_DONE;
    }
    sqlite3_finalize(stmt);
    stmt = nullptr;

    const char* clear_rings[] = {
        "DELETE FROM calibration_samples WHERE user_id = ?;",
        "DELETE FROM calibration_scores WHERE user_id = ?;",
    };
    for (int i = 0; ok && i < 2; ++i) {
        ok = sqlite3_prepare_v2(db_, clear_rings[i], -1, &stmt, nullptr) == SQLITE_OK;
        if (ok) {
            sqlite3_bind_text(stmt, 1, baseline.user_id.c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }

    if (ok) {
        ok = sqlite3_prepare_v2(db_,
                                "INSERT INTO calibration_samples (user_id, seq, features) VALUES (?, ?, ?);",
                                -1, &stmt, nullptr) == SQLITE_OK;
        int seq = 0;
        for (auto it = baseline.samples.begin(); ok && it != baseline.samples.end(); ++it, ++seq) {
            std::vector<float> values = it->to_array();
            sqlite3_bind_text(stmt, 1, baseline.user_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, seq);
            bind_floats(stmt, 3, values);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_reset(stmt);
        }
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }

    if (ok) {
        ok = sqlite3_prepare_v2(db_,
                                "INSERT INTO calibration_scores (user_id, seq, scores) VALUES (?, ?, ?);",
                                -1, &stmt, nullptr) == SQLITE_OK;
        int seq = 0;
        for (auto it = baseline.score_samples.begin(); ok && it != baseline.score_samples.end(); ++it, ++seq) {
            std::vector<float> values(it->begin(), it->end());
            sqlite3_bind_text(stmt, 1, baseline.user_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, seq);
            bind_floats(stmt, 3, values);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_reset(stmt);
        }
        sqlite3_finalize(stmt);
    }

    if (!ok) {
        ErrorCode code = db_error(err, "Saving baseline failed");
        rollback();
        return code;
    }
    if (!exec("COMMIT;")) {
        ErrorCode code = db_error(err, "Cannot commit baseline");
        rollback();
        return code;
    }

    VC_LOG_DEBUG("Saved baseline: {} (samples={}, calibrated={})",
                 baseline.user_id, baseline.samples.size(), baseline.calibrated);
    return ErrorCode::OK;
}

ErrorCode SqliteBaselineStore::remove(const std::string& user_id, ErrorInfo* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return db_error(err, "Remove failed");

    if (!exec("BEGIN IMMEDIATE;")) {
        return db_error(err, "Cannot begin transaction");
    }

    int changes = 0;
    bool ok = true;
    const char* statements[] = {
        "DELETE FROM baselines WHERE user_id = ?;",
        "DELETE FROM calibration_samples WHERE user_id = ?;",
        "DELETE FROM calibration_scores WHERE user_id = ?;",
    };
    for (int i = 0; ok && i < 3; ++i) {
        sqlite3_stmt* stmt = nullptr;
        ok = sqlite3_prepare_v2(db_, statements[i], -1, &stmt, nullptr) == SQLITE_OK;
        if (ok) {
            sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            if (i == 0) changes = sqlite3_changes(db_);
        }
        sqlite3_finalize(stmt);
    }

    if (!ok) {
        ErrorCode code = db_error(err, "Removing baseline failed");
        rollback();
        return code;
    }
    if (!exec("COMMIT;")) {
        ErrorCode code = db_error(err, "Cannot commit removal");
        rollback();
        return code;
    }

    if (changes == 0) {
        return fail(err, ErrorCode::NO_BASELINE, "No baseline for user: " + user_id);
    }
    VC_LOG_INFO("Removed baseline: {}", user_id);
    return ErrorCode::OK;
}

int SqliteBaselineStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return -1;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM baselines;", -1, &stmt, nullptr) != SQLITE_OK)
        return -1;

    int n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

} // namespace vc
