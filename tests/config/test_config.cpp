/*
 * test_config.cpp - Tests for MinerHubConfig loading and validation
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config/config.hpp"
#include "config/exception.hpp"

using namespace minerhub::config;
namespace fs = std::filesystem;

class MinerHubConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("minerhub_config_test_" +
                    std::to_string(reinterpret_cast<uintptr_t>(this)));
        fs::create_directories(testDir_);
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    static void clearEnvironment() {
        for (const char* name :
             {"MINERHUB_LOG_LEVEL", "MINERHUB_PROBE_TIMEOUT_MS",
              "MINERHUB_MAX_IDLE_CONNECTIONS", "MINERHUB_MAX_OPEN_CONNECTIONS",
              "MINERHUB_CONNECTION_TTL_MS"}) {
            unsetenv(name);
        }
    }

    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    fs::path testDir_;
};

// ========== Defaults ==========

TEST_F(MinerHubConfigTest, Defaults_MatchDocumentedValues) {
    auto cfg = MinerHubConfig::defaults();
    EXPECT_EQ(cfg.manager.probeTimeoutMs, 1200);
    EXPECT_EQ(cfg.manager.cleanupIntervalMs, 300000);
    EXPECT_TRUE(cfg.manager.autoCleanup);
    EXPECT_EQ(cfg.pool.maxIdleConnections, 5);
    EXPECT_EQ(cfg.pool.maxOpenConnections, 10);
    EXPECT_EQ(cfg.pool.connectionTtlMs, 300000);
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(MinerHubConfigTest, ToPoolLimits_ConvertsUnits) {
    PoolConfig pool;
    pool.maxIdleConnections = 2;
    pool.maxOpenConnections = 3;
    pool.connectionTtlMs = 1500;

    auto limits = pool.toPoolLimits();
    EXPECT_EQ(limits.maxIdle, 2);
    EXPECT_EQ(limits.maxOpen, 3);
    EXPECT_EQ(limits.idleTtl, std::chrono::milliseconds(1500));
}

// ========== JSON ==========

TEST_F(MinerHubConfigTest, FromJson_PartialDocumentKeepsDefaults) {
    auto cfg = MinerHubConfig::fromJson(
        json{{"pool", {{"maxOpenConnections", 4}}},
             {"logging", {{"level", "debug"}}}});

    EXPECT_EQ(cfg.pool.maxOpenConnections, 4);
    EXPECT_EQ(cfg.pool.maxIdleConnections, 5);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.manager.probeTimeoutMs, 1200);
}

TEST_F(MinerHubConfigTest, FromJson_WrongTypeThrowsParseException) {
    EXPECT_THROW(MinerHubConfig::fromJson(
                     json{{"pool", {{"maxOpenConnections", "many"}}}}),
                 ConfigParseException);
}

TEST_F(MinerHubConfigTest, FromJson_NonObjectThrowsParseException) {
    EXPECT_THROW(MinerHubConfig::fromJson(json::array({1, 2})),
                 ConfigParseException);
}

// ========== Files ==========

TEST_F(MinerHubConfigTest, LoadFromFile_MissingFileReturnsDefaults) {
    auto cfg = MinerHubConfig::loadFromFile(testDir_ / "absent.json");
    EXPECT_EQ(cfg.pool.maxOpenConnections, 10);
}

TEST_F(MinerHubConfigTest, LoadFromFile_MalformedThrowsParseException) {
    auto path = testDir_ / "broken.json";
    writeFile(path, "{\"pool\": {");
    EXPECT_THROW(MinerHubConfig::loadFromFile(path), ConfigParseException);
}

TEST_F(MinerHubConfigTest, SaveToFile_ThenLoadPreservesValues) {
    auto cfg = MinerHubConfig::defaults();
    cfg.manager.autoCleanup = false;
    cfg.pool.connectionTtlMs = 60000;
    cfg.logging.outputFile = "logs/minerhub.log";

    auto path = testDir_ / "nested" / "minerhub.json";
    cfg.saveToFile(path);
    ASSERT_TRUE(fs::exists(path));

    auto loaded = MinerHubConfig::loadFromFile(path);
    EXPECT_EQ(loaded.toJson(), cfg.toJson());
}

// ========== Environment ==========

TEST_F(MinerHubConfigTest, Load_EnvironmentOverridesFile) {
    auto path = testDir_ / "minerhub.json";
    writeFile(path, R"({"pool": {"maxOpenConnections": 4, "maxIdleConnections": 2}})");

    setenv("MINERHUB_MAX_OPEN_CONNECTIONS", "8", 1);
    setenv("MINERHUB_LOG_LEVEL", "warn", 1);

    auto cfg = MinerHubConfig::load(path);
    EXPECT_EQ(cfg.pool.maxOpenConnections, 8);
    EXPECT_EQ(cfg.pool.maxIdleConnections, 2);
    EXPECT_EQ(cfg.logging.level, "warn");
}

TEST_F(MinerHubConfigTest, ApplyEnvironment_IgnoresUnparsableValues) {
    setenv("MINERHUB_MAX_IDLE_CONNECTIONS", "lots", 1);
    setenv("MINERHUB_CONNECTION_TTL_MS", "-5", 1);
    setenv("MINERHUB_PROBE_TIMEOUT_MS", "2500", 1);

    auto cfg = MinerHubConfig::defaults();
    cfg.applyEnvironment();
    EXPECT_EQ(cfg.pool.maxIdleConnections, 5);
    EXPECT_EQ(cfg.pool.connectionTtlMs, 300000);
    EXPECT_EQ(cfg.manager.probeTimeoutMs, 2500);
}

// ========== Validation ==========

TEST_F(MinerHubConfigTest, Validate_RejectsZeroMaxOpen) {
    auto cfg = MinerHubConfig::defaults();
    cfg.pool.maxOpenConnections = 0;
    EXPECT_THROW(cfg.validate(), InvalidConfigException);
}

TEST_F(MinerHubConfigTest, Validate_AllowsZeroMaxIdle) {
    auto cfg = MinerHubConfig::defaults();
    cfg.pool.maxIdleConnections = 0;
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(MinerHubConfigTest, Validate_RejectsZeroIntervals) {
    auto cfg = MinerHubConfig::defaults();
    cfg.manager.cleanupIntervalMs = 0;
    EXPECT_THROW(cfg.validate(), BadConfigException);

    cfg = MinerHubConfig::defaults();
    cfg.pool.connectionTtlMs = 0;
    EXPECT_THROW(cfg.validate(), InvalidConfigException);
}
