/*
 * logger.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-11-28

Description: spdlog logger construction for injection into core components

**************************************************/

#ifndef MINERHUB_LOGGING_LOGGER_HPP
#define MINERHUB_LOGGING_LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.hpp"

namespace minerhub::logging {

/**
 * @brief Convert string to spdlog level, defaulting to info
 */
auto levelFromString(const std::string& level) -> spdlog::level::level_enum;

auto levelToString(spdlog::level::level_enum level) -> std::string;

/**
 * @brief Logger that discards everything
 *
 * Default for components constructed without a logger. Not registered in
 * the spdlog global registry.
 */
auto makeNullLogger(const std::string& name = "null")
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Return @p logger, or a null logger if it is empty
 */
auto orNullLogger(std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Build a logger from configuration
 *
 * Always writes to a colour console sink; adds a file sink when
 * outputFile is set. The logger is returned to the caller for injection
 * and is not registered globally.
 */
auto createLogger(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace minerhub::logging

#endif  // MINERHUB_LOGGING_LOGGER_HPP
