/*
 * test_logger.cpp - Tests for logger construction helpers
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "logging/logger.hpp"

using namespace minerhub;
namespace fs = std::filesystem;

TEST(LoggerTest, LevelFromString_KnownAndAliasNames) {
    EXPECT_EQ(logging::levelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::levelFromString("err"), spdlog::level::err);
    EXPECT_EQ(logging::levelFromString("fatal"), spdlog::level::critical);
    EXPECT_EQ(logging::levelFromString("off"), spdlog::level::off);
}

TEST(LoggerTest, LevelFromString_UnknownDefaultsToInfo) {
    EXPECT_EQ(logging::levelFromString("verbose"), spdlog::level::info);
}

TEST(LoggerTest, LevelToString_UsesSpdlogNames) {
    EXPECT_EQ(logging::levelToString(spdlog::level::warn), "warning");
    EXPECT_EQ(logging::levelToString(spdlog::level::debug), "debug");
}

TEST(LoggerTest, NullLogger_IsOffAndUnregistered) {
    auto logger = logging::makeNullLogger("pool-null");
    EXPECT_EQ(logger->level(), spdlog::level::off);
    EXPECT_EQ(spdlog::get("pool-null"), nullptr);
}

TEST(LoggerTest, OrNullLogger_KeepsGivenLogger) {
    auto logger = logging::makeNullLogger("given");
    EXPECT_EQ(logging::orNullLogger(logger), logger);
    EXPECT_NE(logging::orNullLogger(nullptr), nullptr);
}

TEST(LoggerTest, CreateLogger_WritesToConfiguredFile) {
    auto dir = fs::temp_directory_path() / "minerhub_logger_test";
    std::error_code ec;
    fs::remove_all(dir, ec);

    config::LoggingConfig cfg;
    cfg.name = "fleet-test";
    cfg.level = "debug";
    cfg.pattern = "%l %v";
    cfg.outputFile = (dir / "sub" / "fleet.log").string();

    auto logger = logging::createLogger(cfg);
    EXPECT_EQ(logger->name(), "fleet-test");
    EXPECT_EQ(logger->level(), spdlog::level::debug);

    logger->debug("probe {}", "rig-1");
    logger->trace("hidden");
    logger->flush();

    std::ifstream in(cfg.outputFile);
    ASSERT_TRUE(in.good());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("debug probe rig-1"), std::string::npos);
    EXPECT_EQ(content.str().find("hidden"), std::string::npos);

    logger.reset();
    fs::remove_all(dir, ec);
}
