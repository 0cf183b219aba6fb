/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace shiori::logging {

auto toSpdlogLevel(config::LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case config::LogLevel::Trace: return spdlog::level::trace;
        case config::LogLevel::Debug: return spdlog::level::debug;
        case config::LogLevel::Info: return spdlog::level::info;
        case config::LogLevel::Warn: return spdlog::level::warn;
        case config::LogLevel::Error: return spdlog::level::err;
        case config::LogLevel::Critical: return spdlog::level::critical;
        case config::LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

auto createLogger(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        if (config.consoleColor) {
            sinks.push_back(
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }
    }

    if (!config.file.empty()) {
        std::filesystem::path file(config.file);
        if (file.has_parent_path()) {
            std::filesystem::create_directories(file.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.maxFileSize, config.maxFiles));
    }

    auto logger =
        std::make_shared<spdlog::logger>("shiori", sinks.begin(), sinks.end());
    logger->set_level(toSpdlogLevel(config.logLevel()));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void initialize(const config::LoggingConfig& config) {
    spdlog::set_default_logger(createLogger(config));
    spdlog::info("Logging initialized at level {}", config.level);
}

void shutdown() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

}  // namespace shiori::logging
