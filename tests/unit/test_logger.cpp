#include <gtest/gtest.h>
#include "utils/logger.h"
#include "manager/assessment_engine.h"
#include "storage/sqlite_store.h"
#include <cstdio>
#include <string>

using namespace vc;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().shutdown(); }
    void TearDown() override { Logger::instance().shutdown(); }
};

TEST_F(LoggerTest, SecondInitKeepsFirstLevel) {
    Logger::instance().init("", spdlog::level::info);
    Logger::instance().init("", spdlog::level::err);
    EXPECT_EQ(Logger::instance().get()->level(), spdlog::level::info);
}

TEST_F(LoggerTest, SetLevelAppliesToRunningLogger) {
    Logger::instance().init("", spdlog::level::info);
    Logger::instance().set_level(spdlog::level::off);

    auto& logger = Logger::instance().get();
    EXPECT_EQ(logger->level(), spdlog::level::off);
    for (const auto& sink : logger->sinks()) {
        EXPECT_EQ(sink->level(), spdlog::level::off);
    }
}

TEST_F(LoggerTest, SetLevelInitializesWhenNeeded) {
    EXPECT_FALSE(Logger::instance().is_initialized());
    Logger::instance().set_level(spdlog::level::warn);
    EXPECT_TRUE(Logger::instance().is_initialized());
    EXPECT_EQ(Logger::instance().get()->level(), spdlog::level::warn);
}

TEST_F(LoggerTest, DestructorsDoNotLog) {
    const char* db_path = "test_logger_teardown.db";
    std::remove(db_path);
    {
        Logger::instance().init("", spdlog::level::off);
        AssessmentEngine engine;
        ASSERT_TRUE(engine.init());
        SqliteBaselineStore store;
        ASSERT_TRUE(store.open(db_path));

        // As at process exit: the logger is gone before the SDK objects
        Logger::instance().shutdown();
    }
    EXPECT_FALSE(Logger::instance().is_initialized());

    std::remove(db_path);
    std::remove((std::string(db_path) + "-wal").c_str());
    std::remove((std::string(db_path) + "-shm").c_str());
}
