/*
 * config.cpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

#include "exception.hpp"

namespace minerhub::config {

namespace {

auto readEnv(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto parseSize(const std::string& text) -> std::optional<size_t> {
    try {
        size_t pos = 0;
        auto value = std::stoll(text, &pos);
        if (pos != text.size() || value < 0) {
            return std::nullopt;
        }
        return static_cast<size_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void overrideSize(const char* name, size_t& target) {
    if (auto text = readEnv(name)) {
        if (auto value = parseSize(*text)) {
            target = *value;
        }
    }
}

}  // namespace

json MinerHubConfig::toJson() const {
    return {{"manager", manager.toJson()},
            {"pool", pool.toJson()},
            {"logging", logging.toJson()}};
}

MinerHubConfig MinerHubConfig::fromJson(const json& j) {
    MinerHubConfig cfg;
    if (!j.is_object()) {
        THROW_CONFIG_PARSE_EXCEPTION("Configuration root must be an object");
    }
    try {
        if (j.contains("manager")) {
            cfg.manager = ManagerConfig::fromJson(j.at("manager"));
        }
        if (j.contains("pool")) {
            cfg.pool = PoolConfig::fromJson(j.at("pool"));
        }
        if (j.contains("logging")) {
            cfg.logging = LoggingConfig::fromJson(j.at("logging"));
        }
    } catch (const json::exception& e) {
        THROW_CONFIG_PARSE_EXCEPTION(std::string("Invalid configuration: ") +
                                     e.what());
    }
    return cfg;
}

MinerHubConfig MinerHubConfig::loadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return defaults();
    }

    std::ifstream in(path);
    if (!in) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open config file: " +
                                  path.string());
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        THROW_CONFIG_PARSE_EXCEPTION("Failed to parse config file " +
                                     path.string() + ": " + e.what());
    }
    return fromJson(document);
}

MinerHubConfig MinerHubConfig::load(const std::filesystem::path& path) {
    auto cfg = loadFromFile(path);
    cfg.applyEnvironment();
    return cfg;
}

void MinerHubConfig::applyEnvironment() {
    if (auto level = readEnv("MINERHUB_LOG_LEVEL")) {
        logging.level = *level;
    }
    overrideSize("MINERHUB_PROBE_TIMEOUT_MS", manager.probeTimeoutMs);
    overrideSize("MINERHUB_MAX_IDLE_CONNECTIONS", pool.maxIdleConnections);
    overrideSize("MINERHUB_MAX_OPEN_CONNECTIONS", pool.maxOpenConnections);
    overrideSize("MINERHUB_CONNECTION_TTL_MS", pool.connectionTtlMs);
}

void MinerHubConfig::saveToFile(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        THROW_CONFIG_IO_EXCEPTION("Failed to write config file: " +
                                  path.string());
    }
    out << toJson().dump(2);
    if (!out) {
        THROW_CONFIG_IO_EXCEPTION("Failed to write config file: " +
                                  path.string());
    }
}

void MinerHubConfig::validate() const {
    if (pool.maxOpenConnections == 0) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "pool.maxOpenConnections must be at least 1");
    }
    if (pool.connectionTtlMs == 0) {
        THROW_INVALID_CONFIG_EXCEPTION("pool.connectionTtlMs must be positive");
    }
    if (manager.cleanupIntervalMs == 0) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "manager.cleanupIntervalMs must be positive");
    }
}

}  // namespace minerhub::config
