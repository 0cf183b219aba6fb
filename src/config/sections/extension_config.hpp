/*
 * extension_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Source extension repository and storage configuration

**************************************************/

#ifndef SHIORI_CONFIG_SECTIONS_EXTENSION_CONFIG_HPP
#define SHIORI_CONFIG_SECTIONS_EXTENSION_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace shiori::config {

/**
 * @brief Source extension configuration
 *
 * @example
 * ```json
 * "extensions": {
 *   "repository": "https://example.org/shiori-extensions",
 *   "directory": "extensions",
 *   "updateStrategy": "recreate",
 *   "fetchTimeoutSeconds": 30,
 *   "userAgent": "Shiori/0.1",
 *   "restoreOnStartup": true
 * }
 * ```
 */
struct ExtensionConfig : ConfigSection<ExtensionConfig> {
    static constexpr std::string_view PATH = "/shiori/extensions";

    std::string repository;                  ///< Repository base URL
    std::string directory{"extensions"};     ///< Installed package storage
    std::string updateStrategy{"recreate"};  ///< "recreate" or "stage-then-swap"
    int fetchTimeoutSeconds{30};
    std::string userAgent{"Shiori/0.1"};
    bool restoreOnStartup{true};             ///< Reload stored packages at start

    [[nodiscard]] json serialize() const {
        return {{"repository", repository},
                {"directory", directory},
                {"updateStrategy", updateStrategy},
                {"fetchTimeoutSeconds", fetchTimeoutSeconds},
                {"userAgent", userAgent},
                {"restoreOnStartup", restoreOnStartup}};
    }

    [[nodiscard]] static ExtensionConfig deserialize(const json& j) {
        ExtensionConfig cfg;
        cfg.repository = j.value("repository", cfg.repository);
        cfg.directory = j.value("directory", cfg.directory);
        cfg.updateStrategy = j.value("updateStrategy", cfg.updateStrategy);
        cfg.fetchTimeoutSeconds =
            j.value("fetchTimeoutSeconds", cfg.fetchTimeoutSeconds);
        cfg.userAgent = j.value("userAgent", cfg.userAgent);
        cfg.restoreOnStartup = j.value("restoreOnStartup", cfg.restoreOnStartup);
        return cfg;
    }

    void validate() const {
        if (directory.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string("extensions.directory must not be empty"));
        }
        if (updateStrategy != "recreate" &&
            updateStrategy != "stage-then-swap") {
            THROW_INVALID_CONFIG_EXCEPTION(std::format(
                "extensions.updateStrategy '{}' is not one of recreate, "
                "stage-then-swap",
                updateStrategy));
        }
        if (fetchTimeoutSeconds <= 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("extensions.fetchTimeoutSeconds {} must be positive",
                            fetchTimeoutSeconds));
        }
    }

    [[nodiscard]] static json generateSchema() {
        json schema;
        schema["type"] = "object";
        addSchemaProperty(schema, "repository", "string", std::string(),
                          "Extension repository base URL");
        addSchemaProperty(schema, "directory", "string",
                          std::string("extensions"),
                          "Directory holding installed packages");
        addSchemaProperty(schema, "updateStrategy", "string",
                          std::string("recreate"),
                          "How updates replace an installed source");
        addEnum(schema, "updateStrategy", "recreate", "stage-then-swap");
        addSchemaProperty(schema, "fetchTimeoutSeconds", "integer", 30);
        addRange(schema, "fetchTimeoutSeconds", 1);
        addSchemaProperty(schema, "userAgent", "string",
                          std::string("Shiori/0.1"));
        addSchemaProperty(schema, "restoreOnStartup", "boolean", true);
        return schema;
    }
};

}  // namespace shiori::config

#endif  // SHIORI_CONFIG_SECTIONS_EXTENSION_CONFIG_HPP
