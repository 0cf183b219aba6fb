/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Loads the server configuration document

**************************************************/

#include "config_loader.hpp"

#include <fstream>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::config {

auto ShioriConfig::toJson() const -> json {
    json document;
    document[json::json_pointer(std::string(ServerConfig::PATH))] =
        server.toJson();
    document[json::json_pointer(std::string(ExtensionConfig::PATH))] =
        extensions.toJson();
    document[json::json_pointer(std::string(LoggingConfig::PATH))] =
        logging.toJson();
    return document;
}

template <typename Section>
auto ConfigLoader::section(const json& document) -> Section {
    json::json_pointer pointer(std::string(Section::PATH));
    if (!document.contains(pointer)) {
        return Section::defaults();
    }
    return Section::fromJson(document.at(pointer));
}

auto ConfigLoader::parse(const json& document) -> ShioriConfig {
    if (!document.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION(std::format(
            "Configuration must be an object, got {}", document.type_name()));
    }
    ShioriConfig config;
    config.server = section<ServerConfig>(document);
    config.extensions = section<ExtensionConfig>(document);
    config.logging = section<LoggingConfig>(document);
    return config;
}

auto ConfigLoader::loadFile(const std::filesystem::path& path, bool required)
    -> ShioriConfig {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            THROW_CONFIG_IO_EXCEPTION(
                std::format("Configuration file not found: {}", path.string()));
        }
        LOG_WARN("Configuration file {} not found, using defaults",
                 path.string());
        return {};
    }

    std::ifstream in(path);
    if (!in) {
        THROW_CONFIG_IO_EXCEPTION(
            std::format("Cannot open configuration file {}", path.string()));
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        THROW_CONFIG_IO_EXCEPTION(
            std::format("Configuration file {} is not valid JSON",
                        path.string()));
    }

    auto config = parse(document);
    LOG_INFO("Loaded configuration from {}", path.string());
    return config;
}

auto ConfigLoader::schema() -> json {
    json schema;
    schema["type"] = "object";
    schema[json::json_pointer("/properties/shiori/type")] = "object";
    auto& sections =
        schema[json::json_pointer("/properties/shiori/properties")];
    sections[std::string(ServerConfig::key())] = ServerConfig::schema();
    sections[std::string(ExtensionConfig::key())] = ExtensionConfig::schema();
    sections[std::string(LoggingConfig::key())] = LoggingConfig::schema();
    return schema;
}

}  // namespace shiori::config
