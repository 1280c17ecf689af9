/*
 * test_log_setup.cpp - Tests for logger and sink setup
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "logging/log_setup.hpp"

using namespace firetv::logging;
namespace fs = std::filesystem;

// ============================================================================
// Level Parsing Tests
// ============================================================================

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(levelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(levelFromString("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("info"), spdlog::level::info);
    EXPECT_EQ(levelFromString("warn"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("Warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("error"), spdlog::level::err);
    EXPECT_EQ(levelFromString("critical"), spdlog::level::critical);
    EXPECT_EQ(levelFromString("off"), spdlog::level::off);
}

TEST(LogLevelTest, RejectsUnknown) {
    EXPECT_FALSE(levelFromString("verbose").has_value());
    EXPECT_FALSE(levelFromString("").has_value());
}

TEST(LogLevelTest, ToString) {
    EXPECT_EQ(levelToString(spdlog::level::debug), "debug");
    EXPECT_EQ(levelToString(spdlog::level::warn), "warning");
}

// ============================================================================
// Logger Setup Tests
// ============================================================================

class LogSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "firetv_log_test";
        fs::remove_all(dir_);
    }

    void TearDown() override {
        initialize(LoggingConfig{});
        fs::remove_all(dir_);
    }

    fs::path dir_;
};

TEST_F(LogSetupTest, InstallsDefaultLogger) {
    LoggingConfig config;
    config.level = spdlog::level::debug;
    initialize(config);

    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "firetv");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST_F(LogSetupTest, FileSinkCreatesDirectory) {
    LoggingConfig config;
    config.file_path = (dir_ / "nested" / "server.log").string();
    initialize(config);

    spdlog::info("written to file");
    spdlog::default_logger()->flush();

    ASSERT_TRUE(fs::exists(config.file_path));
    std::ifstream file(config.file_path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("written to file"), std::string::npos);
}

TEST_F(LogSetupTest, ReinitializeRebindsNamedLoggers) {
    initialize(LoggingConfig{});
    auto logger = getLogger("session.test");
    EXPECT_EQ(logger->level(), spdlog::level::info);

    LoggingConfig config;
    config.level = spdlog::level::err;
    initialize(config);
    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_EQ(getLogger("session.test"), logger);
}
