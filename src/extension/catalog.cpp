/*
 * catalog.cpp - Catalog browsing across installed sources
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "catalog.hpp"

#include <format>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

namespace {

template <typename T>
auto normalizeOne(int64_t sourceId, const json& native) -> ExtensionResult<T> {
    auto record = NativeSchema<T>::fromNative(native);
    if (!record) {
        LOG_ERROR("Source {} returned an invalid record: {}", sourceId,
                  record.error());
        return makeError(ExtensionErrorCode::ProtocolError, record.error());
    }
    return std::move(*record);
}

template <typename T>
auto normalizeList(int64_t sourceId, const json& native)
    -> ExtensionResult<std::vector<T>> {
    std::vector<T> records;
    records.reserve(native.size());
    for (size_t i = 0; i < native.size(); ++i) {
        auto record = NativeSchema<T>::fromNative(native[i]);
        if (!record) {
            LOG_ERROR("Source {} returned an invalid element {}: {}", sourceId,
                      i, record.error());
            return makeError(ExtensionErrorCode::ProtocolError,
                             std::format("element {}: {}", i, record.error()));
        }
        records.push_back(std::move(*record));
    }
    return records;
}

}  // namespace

CatalogService::CatalogService(const ExtensionRegistry& registry)
    : registry_(registry) {}

auto CatalogService::popular(int64_t sourceId, int page) const
    -> ExtensionResult<std::vector<MangaInfo>> {
    return registry_.dispatchPopular(sourceId, page)
        .and_then([sourceId](const json& native) {
            return normalizeList<MangaInfo>(sourceId, native);
        });
}

auto CatalogService::latest(int64_t sourceId, int page) const
    -> ExtensionResult<std::vector<MangaInfo>> {
    return registry_.dispatchLatest(sourceId, page)
        .and_then([sourceId](const json& native) {
            return normalizeList<MangaInfo>(sourceId, native);
        });
}

auto CatalogService::search(int64_t sourceId, int page,
                            const std::optional<std::string>& query,
                            const std::optional<Filters>& filters) const
    -> ExtensionResult<std::vector<MangaInfo>> {
    return registry_.dispatchSearch(sourceId, page, query, filters)
        .and_then([sourceId](const json& native) {
            return normalizeList<MangaInfo>(sourceId, native);
        });
}

auto CatalogService::detail(int64_t sourceId, const std::string& path) const
    -> ExtensionResult<MangaInfo> {
    return registry_.dispatchDetail(sourceId, path)
        .and_then([sourceId](const json& native) {
            return normalizeOne<MangaInfo>(sourceId, native);
        });
}

auto CatalogService::chapters(int64_t sourceId, const std::string& path) const
    -> ExtensionResult<std::vector<ChapterInfo>> {
    return registry_.dispatchChapters(sourceId, path)
        .and_then([sourceId](const json& native) {
            return normalizeList<ChapterInfo>(sourceId, native);
        });
}

auto CatalogService::pages(int64_t sourceId, const std::string& path) const
    -> ExtensionResult<PageList> {
    return registry_.dispatchPages(sourceId, path)
        .and_then([sourceId](const json& native) {
            return normalizeList<std::string>(sourceId, native);
        });
}

}  // namespace shiori::extension
