/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Process-wide spdlog setup

**************************************************/

#ifndef SHIORI_LOGGING_LOGGING_HPP
#define SHIORI_LOGGING_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace shiori::logging {

[[nodiscard]] auto toSpdlogLevel(config::LogLevel level)
    -> spdlog::level::level_enum;

/**
 * @brief Build a logger from the configuration without installing it
 *
 * Console sink when enabled, rotating file sink when a file is set.
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
[[nodiscard]] auto createLogger(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Install the configured logger as the spdlog default
 *
 * Flushes on warnings and above.
 */
void initialize(const config::LoggingConfig& config);

/**
 * @brief Flush and drop every logger
 */
void shutdown();

}  // namespace shiori::logging

#endif  // SHIORI_LOGGING_LOGGING_HPP
