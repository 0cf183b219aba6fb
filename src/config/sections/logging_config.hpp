/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration

**************************************************/

#ifndef SHIORI_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define SHIORI_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <optional>
#include <string>

#include "../core/config_section.hpp"

namespace shiori::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Convert LogLevel to string
 */
[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/**
 * @brief Convert string to LogLevel, nullopt for unknown names
 */
[[nodiscard]] inline std::optional<LogLevel> logLevelFromString(
    const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    return std::nullopt;
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * "logging": {
 *   "level": "info",
 *   "enableConsole": true,
 *   "consoleColor": true,
 *   "file": "logs/shiori.log",
 *   "maxFileSize": 10485760,
 *   "maxFiles": 5
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/shiori/logging";

    std::string level{"info"};  ///< Minimum level for every sink
    bool enableConsole{true};   ///< Enable console output
    bool consoleColor{true};    ///< Enable ANSI color codes

    /// Rotating log file, empty to disable
    std::string file;
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation (10 MB)
    size_t maxFiles{5};                     ///< Max number of rotated files

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id)
    ///                        %s (source file), %# (line number), %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] LogLevel logLevel() const {
        return logLevelFromString(level).value_or(LogLevel::Info);
    }

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"enableConsole", enableConsole},
                {"consoleColor", consoleColor},
                {"file", file},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.file = j.value("file", cfg.file);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }

    void validate() const {
        if (!logLevelFromString(level)) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("logging.level '{}' is not a log level", level));
        }
        if (maxFileSize < 1024) {
            THROW_INVALID_CONFIG_EXCEPTION(std::format(
                "logging.maxFileSize {} is below 1024 bytes", maxFileSize));
        }
        if (maxFiles == 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string("logging.maxFiles must be at least 1"));
        }
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                {"level", {
                    {"type", "string"},
                    {"enum", {"trace", "debug", "info", "warn", "error", "critical", "off"}},
                    {"default", "info"}
                }},
                {"enableConsole", {{"type", "boolean"}, {"default", true}}},
                {"consoleColor", {{"type", "boolean"}, {"default", true}}},
                {"file", {{"type", "string"}, {"default", ""}}},
                {"maxFileSize", {
                    {"type", "integer"},
                    {"minimum", 1024},
                    {"maximum", 1073741824},  // 1 GB
                    {"default", 10485760}
                }},
                {"maxFiles", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"maximum", 100},
                    {"default", 5}
                }},
                {"pattern", {{"type", "string"}}}
            }}
        };
    }
};

}  // namespace shiori::config

#endif  // SHIORI_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
