/*
 * types.cpp - Source records and catalog records shared with extensions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <cstdint>
#include <format>
#include <limits>

namespace shiori::extension {

namespace {

auto readString(const json& j, const char* key, std::string& out)
    -> std::expected<void, std::string> {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::unexpected(std::format("missing field '{}'", key));
    }
    if (!it->is_string()) {
        return std::unexpected(
            std::format("field '{}' is {}, expected string", key,
                        it->type_name()));
    }
    out = it->get<std::string>();
    return {};
}

auto readInteger(const json& j, const char* key, int64_t& out)
    -> std::expected<void, std::string> {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::unexpected(std::format("missing field '{}'", key));
    }
    if (!it->is_number_integer()) {
        return std::unexpected(
            std::format("field '{}' is {}, expected integer", key,
                        it->type_name()));
    }
    if (it->is_number_unsigned() &&
        it->get<uint64_t>() >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::unexpected(
            std::format("field '{}' is out of range", key));
    }
    out = it->get<int64_t>();
    return {};
}

auto readOptionalString(const json& j, const char* key,
                        std::optional<std::string>& out)
    -> std::expected<void, std::string> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(
            std::format("field '{}' is {}, expected string or null", key,
                        it->type_name()));
    }
    out = it->get<std::string>();
    return {};
}

auto readStringList(const json& j, const char* key,
                    std::vector<std::string>& out)
    -> std::expected<void, std::string> {
    out.clear();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_array()) {
        return std::unexpected(
            std::format("field '{}' is {}, expected array", key,
                        it->type_name()));
    }
    out.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::unexpected(
                std::format("field '{}' contains a non-string element", key));
        }
        out.push_back(item.get<std::string>());
    }
    return {};
}

auto requireObject(const json& j) -> std::expected<void, std::string> {
    if (!j.is_object()) {
        return std::unexpected(
            std::format("expected object, got {}", j.type_name()));
    }
    return {};
}

}  // namespace

// ============================================================================
// SourceMetadata / Source
// ============================================================================

auto SourceMetadata::toJson() const -> json {
    return {{"id", id},
            {"name", name},
            {"url", url},
            {"version", version},
            {"abi_tag", abiTag},
            {"contract_version", contractVersion},
            {"icon", icon}};
}

auto SourceMetadata::fromJson(const json& j)
    -> std::expected<SourceMetadata, std::string> {
    SourceMetadata metadata;
    auto ok = requireObject(j)
                  .and_then([&] { return readInteger(j, "id", metadata.id); })
                  .and_then([&] { return readString(j, "name", metadata.name); })
                  .and_then([&] { return readString(j, "url", metadata.url); })
                  .and_then([&] {
                      return readString(j, "version", metadata.version);
                  })
                  .and_then([&] {
                      return readString(j, "abi_tag", metadata.abiTag);
                  })
                  .and_then([&] {
                      return readString(j, "contract_version",
                                        metadata.contractVersion);
                  })
                  .and_then([&] { return readString(j, "icon", metadata.icon); });
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return metadata;
}

auto Source::from(const SourceMetadata& metadata, bool hasUpdate) -> Source {
    Source source;
    static_cast<SourceMetadata&>(source) = metadata;
    source.hasUpdate = hasUpdate;
    return source;
}

auto Source::toJson() const -> json {
    auto j = SourceMetadata::toJson();
    j["has_update"] = hasUpdate;
    return j;
}

// ============================================================================
// MangaInfo
// ============================================================================

auto MangaInfo::toJson() const -> json {
    json j = {{"source_id", sourceId}, {"title", title},
              {"author", author},      {"genre", genre},
              {"path", path},          {"cover_url", coverUrl}};
    j["status"] = status ? json(*status) : json(nullptr);
    j["description"] = description ? json(*description) : json(nullptr);
    return j;
}

auto NativeSchema<MangaInfo>::toNative(const MangaInfo& manga) -> json {
    json j = {{"sourceId", manga.sourceId}, {"title", manga.title},
              {"author", manga.author},     {"genre", manga.genre},
              {"path", manga.path},         {"coverUrl", manga.coverUrl}};
    j["status"] = manga.status ? json(*manga.status) : json(nullptr);
    j["description"] =
        manga.description ? json(*manga.description) : json(nullptr);
    return j;
}

auto NativeSchema<MangaInfo>::fromNative(const json& j)
    -> std::expected<MangaInfo, std::string> {
    MangaInfo manga;
    auto ok =
        requireObject(j)
            .and_then([&] { return readInteger(j, "sourceId", manga.sourceId); })
            .and_then([&] { return readString(j, "title", manga.title); })
            .and_then([&] { return readStringList(j, "author", manga.author); })
            .and_then([&] { return readStringList(j, "genre", manga.genre); })
            .and_then([&] { return readOptionalString(j, "status", manga.status); })
            .and_then([&] {
                return readOptionalString(j, "description", manga.description);
            })
            .and_then([&] { return readString(j, "path", manga.path); })
            .and_then([&] { return readString(j, "coverUrl", manga.coverUrl); });
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return manga;
}

// ============================================================================
// ChapterInfo
// ============================================================================

auto ChapterInfo::toJson() const -> json {
    return {{"source_id", sourceId}, {"title", title},
            {"path", path},          {"number", number},
            {"scanlator", scanlator}, {"uploaded", uploaded}};
}

auto NativeSchema<ChapterInfo>::toNative(const ChapterInfo& chapter) -> json {
    return {{"sourceId", chapter.sourceId}, {"title", chapter.title},
            {"path", chapter.path},         {"number", chapter.number},
            {"scanlator", chapter.scanlator}, {"uploaded", chapter.uploaded}};
}

auto NativeSchema<ChapterInfo>::fromNative(const json& j)
    -> std::expected<ChapterInfo, std::string> {
    ChapterInfo chapter;
    auto ok =
        requireObject(j)
            .and_then([&] { return readInteger(j, "sourceId", chapter.sourceId); })
            .and_then([&] { return readString(j, "title", chapter.title); })
            .and_then([&] { return readString(j, "path", chapter.path); })
            .and_then([&]() -> std::expected<void, std::string> {
                auto it = j.find("number");
                if (it == j.end() || !it->is_number()) {
                    return std::unexpected(
                        std::string("missing or non-numeric field 'number'"));
                }
                chapter.number = it->get<double>();
                return {};
            })
            .and_then([&]() -> std::expected<void, std::string> {
                std::optional<std::string> scanlator;
                auto read = readOptionalString(j, "scanlator", scanlator);
                chapter.scanlator = scanlator.value_or("");
                return read;
            })
            .and_then([&]() -> std::expected<void, std::string> {
                if (!j.contains("uploaded") || j["uploaded"].is_null()) {
                    return {};
                }
                return readInteger(j, "uploaded", chapter.uploaded);
            });
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return chapter;
}

// ============================================================================
// Pages
// ============================================================================

auto NativeSchema<std::string>::fromNative(const json& j)
    -> std::expected<std::string, std::string> {
    if (!j.is_string()) {
        return std::unexpected(
            std::format("page is {}, expected string", j.type_name()));
    }
    return j.get<std::string>();
}

}  // namespace shiori::extension
