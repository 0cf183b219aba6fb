/*
 * source_params.hpp - Request parameters of the source routes
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_SERVER_CONTROLLER_SOURCE_PARAMS_HPP
#define SHIORI_SERVER_CONTROLLER_SOURCE_PARAMS_HPP

#include <charconv>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"
#include "extension/types.hpp"

namespace shiori::server::controller {

/**
 * @brief "page" query parameter
 * @param raw Parameter value, nullptr when absent
 * @return 1 when absent, nullopt unless a positive integer
 */
[[nodiscard]] inline auto parsePage(const char* raw) -> std::optional<int> {
    if (raw == nullptr) {
        return 1;
    }
    std::string_view text(raw);
    int page = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), page);
    if (ec != std::errc{} || ptr != text.data() + text.size() || page < 1) {
        return std::nullopt;
    }
    return page;
}

/**
 * @brief "path" query parameter, required and non-empty
 */
[[nodiscard]] inline auto parsePath(const char* raw)
    -> std::optional<std::string> {
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    return std::string(raw);
}

[[nodiscard]] inline auto parseCheckUpdate(const char* raw) -> bool {
    return raw != nullptr && std::string_view(raw) == "true";
}

struct SearchRequest {
    std::optional<std::string> query;
    std::optional<extension::Filters> filters;
};

/**
 * @brief Why a search body was refused
 */
struct BodyError {
    enum class Kind { InvalidJson, InvalidField };

    Kind kind;
    std::string field;
    std::string constraint;
};

/**
 * @brief Parse the optional `{ "query": string?, "filters": any? }` body
 *
 * An empty body means neither query nor filters. Null members count as
 * absent.
 */
[[nodiscard]] inline auto parseSearchBody(const std::string& body)
    -> std::expected<SearchRequest, BodyError> {
    SearchRequest request;
    if (body.empty()) {
        return request;
    }

    auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(
            BodyError{BodyError::Kind::InvalidJson, "body", "parse error"});
    }
    if (!document.is_object()) {
        return std::unexpected(
            BodyError{BodyError::Kind::InvalidField, "body", "object"});
    }
    if (auto it = document.find("query");
        it != document.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::unexpected(
                BodyError{BodyError::Kind::InvalidField, "query", "string"});
        }
        request.query = it->get<std::string>();
    }
    if (auto it = document.find("filters");
        it != document.end() && !it->is_null()) {
        request.filters = *it;
    }
    return request;
}

}  // namespace shiori::server::controller

#endif  // SHIORI_SERVER_CONTROLLER_SOURCE_PARAMS_HPP
