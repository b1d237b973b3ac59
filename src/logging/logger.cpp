/*
 * logger.cpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include "logger.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace minerhub::logging {

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical" || level == "fatal")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;  // Default
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

auto makeNullLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::off);
    return logger;
}

auto orNullLogger(std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<spdlog::logger> {
    if (logger) {
        return logger;
    }
    return makeNullLogger();
}

auto createLogger(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.outputFile.empty()) {
        std::filesystem::path path(config.outputFile);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            config.outputFile, false));
    }

    auto logger =
        std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(levelFromString(config.level));
    if (!config.pattern.empty()) {
        logger->set_pattern(config.pattern);
    }
    return logger;
}

}  // namespace minerhub::logging
