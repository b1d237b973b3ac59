/*
 * config.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-11-30

Description: Runtime configuration for the miner manager, connection pool
             and logging

**************************************************/

#ifndef MINERHUB_CONFIG_CONFIG_HPP
#define MINERHUB_CONFIG_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "device/connection_pool.hpp"

namespace minerhub::config {

using json = nlohmann::json;

/**
 * @brief Device manager configuration
 */
struct ManagerConfig {
    size_t probeTimeoutMs{1200};        ///< Per-driver detection timeout
    size_t cleanupIntervalMs{300000};   ///< Idle eviction period
    bool autoCleanup{true};             ///< Start eviction task on startup

    [[nodiscard]] json toJson() const {
        return {{"probeTimeoutMs", probeTimeoutMs},
                {"cleanupIntervalMs", cleanupIntervalMs},
                {"autoCleanup", autoCleanup}};
    }

    [[nodiscard]] static ManagerConfig fromJson(const json& j) {
        ManagerConfig cfg;
        cfg.probeTimeoutMs = j.value("probeTimeoutMs", cfg.probeTimeoutMs);
        cfg.cleanupIntervalMs =
            j.value("cleanupIntervalMs", cfg.cleanupIntervalMs);
        cfg.autoCleanup = j.value("autoCleanup", cfg.autoCleanup);
        return cfg;
    }
};

/**
 * @brief Connection pool configuration
 */
struct PoolConfig {
    size_t maxIdleConnections{5};     ///< Idle sessions kept per device
    size_t maxOpenConnections{10};    ///< Checked-out sessions per device
    size_t connectionTtlMs{300000};   ///< Idle session time-to-live

    [[nodiscard]] json toJson() const {
        return {{"maxIdleConnections", maxIdleConnections},
                {"maxOpenConnections", maxOpenConnections},
                {"connectionTtlMs", connectionTtlMs}};
    }

    [[nodiscard]] static PoolConfig fromJson(const json& j) {
        PoolConfig cfg;
        cfg.maxIdleConnections =
            j.value("maxIdleConnections", cfg.maxIdleConnections);
        cfg.maxOpenConnections =
            j.value("maxOpenConnections", cfg.maxOpenConnections);
        cfg.connectionTtlMs = j.value("connectionTtlMs", cfg.connectionTtlMs);
        return cfg;
    }

    [[nodiscard]] device::PoolLimits toPoolLimits() const {
        return device::PoolLimits{maxIdleConnections, maxOpenConnections,
                                  std::chrono::milliseconds(connectionTtlMs)};
    }
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string name{"minerhub"};
    std::string level{"info"};  ///< trace, debug, info, warn, error, critical, off
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    std::string outputFile;     ///< Optional log file, empty for console only

    [[nodiscard]] json toJson() const {
        return {{"name", name},
                {"level", level},
                {"pattern", pattern},
                {"outputFile", outputFile}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.name = j.value("name", cfg.name);
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.outputFile = j.value("outputFile", cfg.outputFile);
        return cfg;
    }
};

/**
 * @brief Complete configuration document
 *
 * Loaded from a JSON file whose top-level keys are the section names
 * ("manager", "pool", "logging"). Missing keys keep their defaults.
 */
struct MinerHubConfig {
    ManagerConfig manager;
    PoolConfig pool;
    LoggingConfig logging;

    [[nodiscard]] static MinerHubConfig defaults() { return {}; }

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static MinerHubConfig fromJson(const json& j);

    /**
     * @brief Load from a JSON file
     *
     * A missing file yields the defaults.
     * @throws ConfigIOException if the file exists but cannot be read
     * @throws ConfigParseException if the document is not valid JSON
     */
    [[nodiscard]] static MinerHubConfig loadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief Load from file, then apply MINERHUB_* environment overrides
     */
    [[nodiscard]] static MinerHubConfig load(
        const std::filesystem::path& path);

    /**
     * @brief Override fields from MINERHUB_* environment variables
     *
     * Values that do not parse are ignored.
     */
    void applyEnvironment();

    /**
     * @throws ConfigIOException on write failure
     */
    void saveToFile(const std::filesystem::path& path) const;

    /**
     * @throws InvalidConfigException if a limit or interval is unusable
     */
    void validate() const;
};

}  // namespace minerhub::config

#endif  // MINERHUB_CONFIG_CONFIG_HPP
