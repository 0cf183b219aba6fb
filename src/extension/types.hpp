/*
 * types.hpp - Source records and catalog records shared with extensions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_TYPES_HPP
#define SHIORI_EXTENSION_TYPES_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

namespace shiori::extension {

using json = nlohmann::json;

/**
 * @brief Identity and build information of one extension package
 *
 * Used both for the package loaded in the registry and for the untrusted
 * entries of a repository manifest.
 */
struct SourceMetadata {
    int64_t id{0};                ///< Stable source identity
    std::string name;             ///< Package name
    std::string url;              ///< Origin of the package
    std::string version;          ///< Semantic version string
    std::string abiTag;           ///< Host toolchain identity it was built for
    std::string contractVersion;  ///< Extension interface version implemented
    std::string icon;             ///< Icon URL

    /**
     * @brief Manifest representation (snake_case keys)
     */
    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Decode one manifest entry
     * @return Metadata, or a description of the first offending field
     */
    static auto fromJson(const json& j)
        -> std::expected<SourceMetadata, std::string>;

    auto operator==(const SourceMetadata& other) const -> bool = default;
};

/**
 * @brief A manifest entry, never persisted
 */
using RemoteSourceDescriptor = SourceMetadata;

/**
 * @brief Source as reported to API clients
 *
 * hasUpdate is computed when the record is produced and never stored.
 */
struct Source : SourceMetadata {
    bool hasUpdate{false};

    static auto from(const SourceMetadata& metadata, bool hasUpdate = false)
        -> Source;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Manga details, normalized across sources
 */
struct MangaInfo {
    int64_t sourceId{0};
    std::string title;
    std::vector<std::string> author;
    std::vector<std::string> genre;
    std::optional<std::string> status;
    std::optional<std::string> description;
    std::string path;      ///< Stable per-source identifier
    std::string coverUrl;

    [[nodiscard]] auto toJson() const -> json;

    auto operator==(const MangaInfo& other) const -> bool = default;
};

/**
 * @brief Chapter entry of a manga, normalized across sources
 */
struct ChapterInfo {
    int64_t sourceId{0};
    std::string title;
    std::string path;
    double number{0.0};
    std::string scanlator;
    int64_t uploaded{0};  ///< Seconds since epoch, 0 when unknown

    [[nodiscard]] auto toJson() const -> json;

    auto operator==(const ChapterInfo& other) const -> bool = default;
};

/**
 * @brief Ordered page image URLs of a chapter
 */
using PageList = std::vector<std::string>;

/**
 * @brief Search filters, passed to the extension untouched
 */
using Filters = json;

/**
 * @brief Mapping between a host record and its extension-native form
 *
 * Extensions exchange camelCase JSON objects. Each record type specializes
 * this template exactly once; both directions live side by side so the
 * field list cannot drift.
 */
template <typename T>
struct NativeSchema;

template <>
struct NativeSchema<MangaInfo> {
    static auto toNative(const MangaInfo& manga) -> json;
    static auto fromNative(const json& j)
        -> std::expected<MangaInfo, std::string>;
};

template <>
struct NativeSchema<ChapterInfo> {
    static auto toNative(const ChapterInfo& chapter) -> json;
    static auto fromNative(const json& j)
        -> std::expected<ChapterInfo, std::string>;
};

template <>
struct NativeSchema<std::string> {
    static auto toNative(const std::string& page) -> json { return page; }
    static auto fromNative(const json& j)
        -> std::expected<std::string, std::string>;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_TYPES_HPP
