/*
 * test_logging.cpp - Tests for logger construction
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <filesystem>

#include "logging/logging.hpp"

using namespace shiori;
namespace fs = std::filesystem;

TEST(LoggingTest, LevelMapping) {
    EXPECT_EQ(logging::toSpdlogLevel(config::LogLevel::Warn),
              spdlog::level::warn);
    EXPECT_EQ(logging::toSpdlogLevel(config::LogLevel::Error),
              spdlog::level::err);
    EXPECT_EQ(logging::toSpdlogLevel(config::LogLevel::Off),
              spdlog::level::off);
}

TEST(LoggingTest, ConsoleOnlyLogger) {
    config::LoggingConfig cfg;
    cfg.level = "debug";
    cfg.consoleColor = false;

    auto logger = logging::createLogger(cfg);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(logger->sinks().size(), 1u);
}

TEST(LoggingTest, FileSinkCreatesDirectory) {
    auto dir = fs::temp_directory_path() / "shiori_logging_test";
    fs::remove_all(dir);

    config::LoggingConfig cfg;
    cfg.enableConsole = false;
    cfg.file = (dir / "nested" / "shiori.log").string();
    {
        auto logger = logging::createLogger(cfg);
        ASSERT_EQ(logger->sinks().size(), 1u);
        logger->warn("written");
    }
    EXPECT_TRUE(fs::exists(dir / "nested" / "shiori.log"));
    EXPECT_GT(fs::file_size(dir / "nested" / "shiori.log"), 0u);
    fs::remove_all(dir);
}
