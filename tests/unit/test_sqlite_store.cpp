#include <gtest/gtest.h>
#include "storage/sqlite_store.h"
#include "manager/baseline_manager.h"
#include <sqlite3.h>
#include <cstdio>
#include <memory>
#include <string>

using namespace vc;

namespace {

UserBaseline make_baseline(const std::string& user, int num_samples, bool calibrate) {
    UserBaseline b(user);
    for (int i = 0; i < num_samples; ++i) {
        FeatureVector fv;
        fv.pitch_mean = 120.0f + 5.0f * i;
        fv.mfcc[2].mean = -3.5f + i;
        fv.hnr = 12.0f;
        b.samples.push_back(fv);
        b.score_samples.push_back({4.0f + i, 3.0f, 12.0f, 48.0f - i, 65.0f + 2.0f * i});
    }
    b.total_samples = num_samples;
    if (calibrate) {
        BaselineManager::compute_statistics(b);
        b.calibrated = true;
        b.calibrated_at = 1700000000;
    }
    return b;
}

} // namespace

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = "test_vocalysis.db";
        std::remove(db_path_);
        ASSERT_TRUE(store_.open(db_path_));
    }

    void TearDown() override {
        store_.close();
        std::remove(db_path_);
        std::remove((std::string(db_path_) + "-wal").c_str());
        std::remove((std::string(db_path_) + "-shm").c_str());
    }

    // Rewrites the stored schema version as an older SDK would have left it
    void mark_outdated(const std::string& user) {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path_, &db), SQLITE_OK);
        std::string sql = "UPDATE baselines SET schema_version = 0 WHERE user_id = '" + user + "';";
        EXPECT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
    }

    SqliteBaselineStore store_;
    const char* db_path_;
};

TEST_F(SqliteStoreTest, SaveAndLoadCalibrated) {
    UserBaseline saved = make_baseline("alice", 9, true);
    ASSERT_EQ(store_.save(saved, nullptr), ErrorCode::OK);

    UserBaseline loaded;
    ASSERT_EQ(store_.get("alice", loaded, nullptr), ErrorCode::OK);
    EXPECT_EQ(loaded.user_id, "alice");
    EXPECT_EQ(loaded.schema_version, kFeatureSchemaVersion);
    EXPECT_TRUE(loaded.calibrated);
    EXPECT_EQ(loaded.samples_used, 9);
    EXPECT_EQ(loaded.total_samples, 9);
    EXPECT_EQ(loaded.calibrated_at, 1700000000);

    ASSERT_EQ(loaded.feature_means.size(), saved.feature_means.size());
    EXPECT_FLOAT_EQ(loaded.feature_means.at("pitch_mean"), saved.feature_means.at("pitch_mean"));
    EXPECT_FLOAT_EQ(loaded.feature_stds.at("pitch_mean"), saved.feature_stds.at("pitch_mean"));
    EXPECT_FLOAT_EQ(loaded.feature_means.at("mfcc3_mean"), 0.5f);
}

TEST_F(SqliteStoreTest, ScoreBaselineRoundTrips) {
    UserBaseline saved = make_baseline("ada", 9, true);
    ASSERT_EQ(saved.score_means.size(), kNumBaselineScores);
    ASSERT_EQ(store_.save(saved, nullptr), ErrorCode::OK);

    UserBaseline loaded;
    ASSERT_EQ(store_.get("ada", loaded, nullptr), ErrorCode::OK);
    ASSERT_EQ(loaded.score_samples.size(), 9u);
    EXPECT_FLOAT_EQ(loaded.score_samples[0][0], 4.0f);
    EXPECT_FLOAT_EQ(loaded.score_samples[8][4], 81.0f);
    EXPECT_FLOAT_EQ(loaded.score_means.at("phq9"), 8.0f);
    EXPECT_FLOAT_EQ(loaded.score_means.at("wemwbs"), 44.0f);
    EXPECT_FLOAT_EQ(loaded.score_stds.at("gad7"), 0.0f);
    EXPECT_FLOAT_EQ(loaded.score_stds.at("mental_health_score"), saved.score_stds.at("mental_health_score"));
}

TEST_F(SqliteStoreTest, UncalibratedHasNoScoreStatistics) {
    ASSERT_EQ(store_.save(make_baseline("ben", 4, false), nullptr), ErrorCode::OK);
    UserBaseline loaded;
    ASSERT_EQ(store_.get("ben", loaded, nullptr), ErrorCode::OK);
    EXPECT_EQ(loaded.score_samples.size(), 4u);
    EXPECT_TRUE(loaded.score_means.empty());
    EXPECT_TRUE(loaded.score_stds.empty());
}

TEST_F(SqliteStoreTest, SamplesKeepTheirOrder) {
    ASSERT_EQ(store_.save(make_baseline("bob", 5, false), nullptr), ErrorCode::OK);

    UserBaseline loaded;
    ASSERT_EQ(store_.get("bob", loaded, nullptr), ErrorCode::OK);
    EXPECT_FALSE(loaded.calibrated);
    EXPECT_TRUE(loaded.feature_means.empty());
    ASSERT_EQ(loaded.samples.size(), 5u);
    for (size_t i = 0; i < loaded.samples.size(); ++i) {
        EXPECT_FLOAT_EQ(loaded.samples[i].pitch_mean, 120.0f + 5.0f * i);
    }
}

TEST_F(SqliteStoreTest, SaveReplacesSampleRing) {
    ASSERT_EQ(store_.save(make_baseline("carol", 6, false), nullptr), ErrorCode::OK);

    UserBaseline smaller = make_baseline("carol", 2, false);
    smaller.total_samples = 8;
    ASSERT_EQ(store_.save(smaller, nullptr), ErrorCode::OK);

    UserBaseline loaded;
    ASSERT_EQ(store_.get("carol", loaded, nullptr), ErrorCode::OK);
    EXPECT_EQ(loaded.samples.size(), 2u);
    EXPECT_EQ(loaded.total_samples, 8);
    EXPECT_EQ(store_.count(), 1);
}

TEST_F(SqliteStoreTest, MissingUser) {
    UserBaseline loaded;
    ErrorInfo err;
    EXPECT_EQ(store_.get("nobody", loaded, &err), ErrorCode::NO_BASELINE);
    EXPECT_EQ(err.code, ErrorCode::NO_BASELINE);
}

TEST_F(SqliteStoreTest, RemoveBaseline) {
    ASSERT_EQ(store_.save(make_baseline("dave", 3, false), nullptr), ErrorCode::OK);
    ASSERT_EQ(store_.save(make_baseline("erin", 3, false), nullptr), ErrorCode::OK);
    EXPECT_EQ(store_.count(), 2);

    EXPECT_EQ(store_.remove("dave", nullptr), ErrorCode::OK);
    EXPECT_EQ(store_.count(), 1);

    UserBaseline loaded;
    EXPECT_EQ(store_.get("dave", loaded, nullptr), ErrorCode::NO_BASELINE);
    EXPECT_EQ(store_.remove("dave", nullptr), ErrorCode::NO_BASELINE);
}

TEST_F(SqliteStoreTest, EmptyUserIdRejected) {
    UserBaseline anonymous;
    EXPECT_EQ(store_.save(anonymous, nullptr), ErrorCode::INVALID_PARAM);
}

TEST_F(SqliteStoreTest, PersistsAcrossReopen) {
    ASSERT_EQ(store_.save(make_baseline("frank", 9, true), nullptr), ErrorCode::OK);
    store_.close();
    EXPECT_FALSE(store_.is_open());

    UserBaseline loaded;
    EXPECT_EQ(store_.get("frank", loaded, nullptr), ErrorCode::DB_ERROR);

    ASSERT_TRUE(store_.open(db_path_));
    ASSERT_EQ(store_.get("frank", loaded, nullptr), ErrorCode::OK);
    EXPECT_EQ(loaded.samples.size(), 9u);
    EXPECT_TRUE(loaded.calibrated);
}

TEST_F(SqliteStoreTest, OutdatedSchemaReportedDistinctly) {
    ASSERT_EQ(store_.save(make_baseline("gina", 9, true), nullptr), ErrorCode::OK);
    store_.close();
    mark_outdated("gina");

    ASSERT_TRUE(store_.open(db_path_));
    UserBaseline loaded;
    ErrorInfo err;
    EXPECT_EQ(store_.get("gina", loaded, &err), ErrorCode::BASELINE_OUTDATED);
    EXPECT_EQ(err.code, ErrorCode::BASELINE_OUTDATED);

    // Removal still works on an outdated row
    EXPECT_EQ(store_.remove("gina", nullptr), ErrorCode::OK);
    EXPECT_EQ(store_.get("gina", loaded, nullptr), ErrorCode::NO_BASELINE);
}

TEST_F(SqliteStoreTest, OutdatedBaselineIsRebuiltByCalibration) {
    ASSERT_EQ(store_.save(make_baseline("hugo", 9, true), nullptr), ErrorCode::OK);
    store_.close();
    mark_outdated("hugo");

    auto shared = std::make_shared<SqliteBaselineStore>();
    ASSERT_TRUE(shared->open(db_path_));
    EngineConfig config;
    config.heuristic.perturbation_std = 0.0f;
    AssessmentEngine engine(config);
    BaselineManager manager(engine, shared);

    CalibrationStatus status;
    ErrorInfo err;
    EXPECT_EQ(manager.recalibrate("hugo", status, &err), ErrorCode::BASELINE_OUTDATED);

    ASSERT_EQ(manager.status("hugo", status), ErrorCode::OK);
    EXPECT_EQ(status.samples_collected, 0);
    EXPECT_FALSE(status.is_calibrated);
    EXPECT_EQ(status.message, "Stored baseline is out of date; collect 9 new samples to rebuild it");

    FeatureVector fv;
    fv.pitch_mean = 150.0f;
    ASSERT_EQ(manager.add_calibration_sample("hugo", fv, status), ErrorCode::OK);
    EXPECT_EQ(status.samples_collected, 1);

    UserBaseline rebuilt;
    ASSERT_EQ(shared->get("hugo", rebuilt, nullptr), ErrorCode::OK);
    EXPECT_EQ(rebuilt.schema_version, kFeatureSchemaVersion);
    EXPECT_EQ(rebuilt.total_samples, 1);
    EXPECT_FALSE(rebuilt.calibrated);
    shared->close();
}
