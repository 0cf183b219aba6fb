/*
 * server_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: HTTP server configuration

**************************************************/

#ifndef SHIORI_CONFIG_SECTIONS_SERVER_CONFIG_HPP
#define SHIORI_CONFIG_SECTIONS_SERVER_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace shiori::config {

/**
 * @brief HTTP server configuration
 *
 * @example
 * ```json
 * "server": {
 *   "host": "0.0.0.0",
 *   "port": 8080,
 *   "threads": 4
 * }
 * ```
 */
struct ServerConfig : ConfigSection<ServerConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/shiori/server";

    std::string host{"0.0.0.0"};  ///< Server bind host
    int port{8080};               ///< Server port
    size_t threads{4};            ///< Request handler threads

    [[nodiscard]] json serialize() const {
        return {{"host", host}, {"port", port}, {"threads", threads}};
    }

    [[nodiscard]] static ServerConfig deserialize(const json& j) {
        ServerConfig cfg;
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.threads = j.value("threads", cfg.threads);
        return cfg;
    }

    void validate() const {
        if (host.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string("server.host must not be empty"));
        }
        if (port < 1 || port > 65535) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("server.port {} is out of range", port));
        }
        if (threads == 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string("server.threads must be at least 1"));
        }
    }

    [[nodiscard]] static json generateSchema() {
        json schema;
        schema["type"] = "object";
        addSchemaProperty(schema, "host", "string", std::string("0.0.0.0"),
                          "Bind address");
        addSchemaProperty(schema, "port", "integer", 8080, "Listen port");
        addRange(schema, "port", 1, 65535);
        addSchemaProperty(schema, "threads", "integer", 4,
                          "Request handler threads");
        addRange(schema, "threads", 1);
        return schema;
    }
};

}  // namespace shiori::config

#endif  // SHIORI_CONFIG_SECTIONS_SERVER_CONFIG_HPP
