// tests/logging_test.cpp
// Logger level resolution from config and APNS_LOG_LEVEL.

#include <gtest/gtest.h>
#include "logging.hpp"

#include <cstdlib>

namespace apns {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("APNS_LOG_LEVEL");
        logging::initialize(LogLevel::Warn);
    }
};

TEST_F(LoggingTest, ConfigLevelApplies) {
    unsetenv("APNS_LOG_LEVEL");
    logging::initialize(LogLevel::Debug);
    EXPECT_EQ(logging::logger()->level(), spdlog::level::debug);
}

TEST_F(LoggingTest, EnvironmentOverridesConfig) {
    setenv("APNS_LOG_LEVEL", "error", 1);
    logging::initialize(LogLevel::Debug);
    EXPECT_EQ(logging::logger()->level(), spdlog::level::err);
}

TEST_F(LoggingTest, EnvironmentCanSilence) {
    setenv("APNS_LOG_LEVEL", "off", 1);
    logging::initialize(LogLevel::Info);
    EXPECT_EQ(logging::logger()->level(), spdlog::level::off);
}

TEST_F(LoggingTest, UnknownEnvironmentLevelKeepsConfig) {
    setenv("APNS_LOG_LEVEL", "verbose", 1);
    logging::initialize(LogLevel::Info);
    EXPECT_EQ(logging::logger()->level(), spdlog::level::info);
}

} // namespace
} // namespace apns
