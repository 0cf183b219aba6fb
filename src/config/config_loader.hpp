/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Loads the server configuration document

**************************************************/

#ifndef SHIORI_CONFIG_CONFIG_LOADER_HPP
#define SHIORI_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>

#include "sections/extension_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/server_config.hpp"

namespace shiori::config {

/// Default configuration file, relative to the working directory
inline constexpr const char* DEFAULT_CONFIG_PATH = "config/shiori.json";

/**
 * @brief Every configuration section of the server
 */
struct ShioriConfig {
    ServerConfig server;
    ExtensionConfig extensions;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Reads a JSON document laid out as {"shiori": {"server": ...}}
 *
 * Each section is located by its PATH as a JSON pointer. Missing sections
 * and missing keys keep their defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Build the configuration from a parsed document
     * @throws InvalidConfigException when a section is malformed
     */
    static auto parse(const json& document) -> ShioriConfig;

    /**
     * @brief Load and validate a configuration file
     * @param path File to read
     * @param required When false, a missing file yields the defaults
     * @throws ConfigIOException when the file cannot be read or parsed
     * @throws InvalidConfigException when a section is malformed
     */
    static auto loadFile(const std::filesystem::path& path,
                         bool required = true) -> ShioriConfig;

    /**
     * @brief JSON Schema of the whole document
     */
    static auto schema() -> json;

private:
    template <typename Section>
    static auto section(const json& document) -> Section;
};

}  // namespace shiori::config

#endif  // SHIORI_CONFIG_CONFIG_LOADER_HPP
