/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef SHIORI_CONFIG_CORE_CONFIG_SECTION_HPP
#define SHIORI_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"
#include "exception.hpp"

namespace shiori::config {

using json = nlohmann::json;

/**
 * @brief Concept for types that can be serialized to/from JSON
 */
template <typename T>
concept JsonSerializable = requires(T value, json j) {
    { j = value } -> std::convertible_to<json>;
    { j.get<T>() } -> std::convertible_to<T>;
};

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
    t.validate();
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON
 * 4. Implement static generateSchema() to return JSON Schema
 * 5. Implement validate(), throwing InvalidConfigException on bad values
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/shiori/server")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Key of this section inside the configuration document
     *
     * "/shiori/server" maps to "server".
     */
    [[nodiscard]] static constexpr std::string_view key() noexcept {
        auto p = Derived::PATH;
        return p.substr(p.find_last_of('/') + 1);
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a validated configuration from JSON
     * @throws InvalidConfigException if a value has the wrong type or range
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        if (!j.is_object()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("Section {} must be an object, got {}", path(),
                            j.type_name()));
        }
        Derived config;
        try {
            config = Derived::deserialize(j);
        } catch (const json::exception& e) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("Section {}: {}", path(), e.what()));
        }
        config.validate();
        return config;
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

protected:
    /**
     * @brief Helper to add a property to a JSON Schema
     */
    template <JsonSerializable T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type, const T& defaultValue,
                                  const std::string& description = "") {
        if (!schema.contains("properties")) {
            schema["properties"] = json::object();
        }
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /**
     * @brief Helper to add enum constraint to a property
     */
    template <typename... Args>
    static void addEnum(json& schema, const std::string& name, Args&&... values) {
        if (schema.contains("properties") && schema["properties"].contains(name)) {
            schema["properties"][name]["enum"] = json::array({std::forward<Args>(values)...});
        }
    }

    /**
     * @brief Helper to add range constraint to a numeric property
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") && schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }
};

}  // namespace shiori::config

#endif  // SHIORI_CONFIG_CORE_CONFIG_SECTION_HPP
