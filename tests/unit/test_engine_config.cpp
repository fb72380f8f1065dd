#include <gtest/gtest.h>
#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <cstdlib>

using namespace Chromaseq;

namespace {

const char* const VARIABLES[] = {
    "CHROMASEQ_MAX_SEARCH", "CHROMASEQ_MAX_COUNT", "CHROMASEQ_TOLERANCE", "CHROMASEQ_PARALLEL_THRESHOLD",
    "CHROMASEQ_THREADS", "CHROMASEQ_LOG_LEVEL"
};

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : VARIABLES) unsetenv(name);
    }

    static ErrorKind load_error() {
        try {
            EngineConfig::load_from_env();
        } catch (const ChromaseqError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "Expected the environment to be rejected";
        return ErrorKind::MalformedColor;
    }
};

} // namespace

TEST_F(EngineConfigTest, Defaults) {
    EngineConfig config = EngineConfig::load_from_env();
    EXPECT_EQ(config.max_search, 10000u);
    EXPECT_EQ(config.max_count, 100000u);
    EXPECT_DOUBLE_EQ(config.tolerance, 0.01);
    EXPECT_EQ(config.parallel_threshold, 50000u);
    EXPECT_EQ(config.threads, 0);
    EXPECT_EQ(config.log_level, Logger::Level::Info);
}

TEST_F(EngineConfigTest, ReadsEnvironment) {
    setenv("CHROMASEQ_MAX_SEARCH", "250000", 1);
    setenv("CHROMASEQ_MAX_COUNT", "64", 1);
    setenv("CHROMASEQ_TOLERANCE", "0.005", 1);
    setenv("CHROMASEQ_PARALLEL_THRESHOLD", "1000", 1);
    setenv("CHROMASEQ_THREADS", "4", 1);
    setenv("CHROMASEQ_LOG_LEVEL", "WARN", 1);

    EngineConfig config = EngineConfig::load_from_env();
    EXPECT_EQ(config.max_search, 250000u);
    EXPECT_EQ(config.max_count, 64u);
    EXPECT_DOUBLE_EQ(config.tolerance, 0.005);
    EXPECT_EQ(config.parallel_threshold, 1000u);
    EXPECT_EQ(config.threads, 4);
    EXPECT_EQ(config.log_level, Logger::Level::Warning);
}

TEST_F(EngineConfigTest, MalformedValuesRejected) {
    setenv("CHROMASEQ_MAX_SEARCH", "-5", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
    setenv("CHROMASEQ_MAX_SEARCH", "99999999999", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
    unsetenv("CHROMASEQ_MAX_SEARCH");

    setenv("CHROMASEQ_MAX_COUNT", "many", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
    unsetenv("CHROMASEQ_MAX_COUNT");

    setenv("CHROMASEQ_TOLERANCE", "0.01abc", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
    setenv("CHROMASEQ_TOLERANCE", "-1", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
    unsetenv("CHROMASEQ_TOLERANCE");

    setenv("CHROMASEQ_THREADS", "5000", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
    unsetenv("CHROMASEQ_THREADS");

    setenv("CHROMASEQ_LOG_LEVEL", "verbose", 1);
    EXPECT_EQ(load_error(), ErrorKind::InvalidParameter);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(EngineConfig::parse_log_level("debug"), Logger::Level::Debug);
    EXPECT_EQ(EngineConfig::parse_log_level("Info"), Logger::Level::Info);
    EXPECT_EQ(EngineConfig::parse_log_level("warning"), Logger::Level::Warning);
    EXPECT_EQ(EngineConfig::parse_log_level("ERROR"), Logger::Level::Error);
    EXPECT_THROW(EngineConfig::parse_log_level(""), ChromaseqError);
}

TEST(LoggerTest, LevelFiltering) {
    const Logger::Level saved = Logger::level();
    Logger::set_level(Logger::Level::Error);
    EXPECT_EQ(Logger::level(), Logger::Level::Error);

    testing::internal::CaptureStderr();
    Logger::info("hidden");
    Logger::error("shown");
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("shown"), std::string::npos);
    Logger::set_level(saved);
}
