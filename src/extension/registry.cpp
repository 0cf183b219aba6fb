/*
 * registry.cpp - Loaded source extensions and per-source dispatch
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "registry.hpp"

#include <format>
#include <mutex>
#include <utility>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

namespace {

enum class Shape { Array, Object };

auto checkResult(int64_t id, const char* call, RuntimeResult<json> result,
                 Shape shape) -> ExtensionResult<json> {
    if (!result) {
        LOG_ERROR("Source {} failed in {}: {}", id, call, result.error());
        return makeError(ExtensionErrorCode::ExecutionError, result.error());
    }
    bool ok = shape == Shape::Array ? result->is_array() : result->is_object();
    if (!ok) {
        LOG_ERROR("Source {} returned {} from {}", id, result->type_name(),
                  call);
        return makeError(
            ExtensionErrorCode::ProtocolError,
            std::format("{} returned {}, expected {}", call,
                        result->type_name(),
                        shape == Shape::Array ? "array" : "object"));
    }
    return std::move(*result);
}

}  // namespace

ExtensionRegistry::~ExtensionRegistry() { clear(); }

auto ExtensionRegistry::list() const -> std::vector<Source> {
    std::shared_lock lock(mutex_);
    std::vector<Source> sources;
    sources.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        sources.push_back(Source::from(entry.metadata));
    }
    return sources;
}

auto ExtensionRegistry::exists(int64_t id) const -> bool {
    std::shared_lock lock(mutex_);
    return entries_.contains(id);
}

auto ExtensionRegistry::getSourceInfo(int64_t id) const
    -> ExtensionResult<Source> {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return makeError(ExtensionErrorCode::NotFound, std::format("id {}", id));
    }
    return Source::from(it->second.metadata);
}

auto ExtensionRegistry::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

auto ExtensionRegistry::registerSource(const SourceMetadata& metadata,
                                       std::shared_ptr<IExtensionHandle> handle)
    -> ExtensionResult<void> {
    Entry entry{metadata, std::move(handle)};
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(metadata.id, std::move(entry));
    if (!inserted) {
        LOG_WARN("Source {} already registered", metadata.id);
        return makeError(ExtensionErrorCode::AlreadyInstalled,
                         std::format("id {}", metadata.id));
    }
    LOG_INFO("Registered source {} ({} {})", metadata.id, metadata.name,
             metadata.version);
    return {};
}

auto ExtensionRegistry::unregisterSource(int64_t id) -> ExtensionResult<void> {
    std::shared_ptr<IExtensionHandle> released;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return makeError(ExtensionErrorCode::NotFound,
                             std::format("id {}", id));
        }
        released = std::move(it->second.handle);
        entries_.erase(it);
    }
    // The handle is destroyed here, outside the lock, unless a caller still
    // holds it
    LOG_INFO("Unregistered source {}", id);
    return {};
}

auto ExtensionRegistry::replace(const SourceMetadata& metadata,
                                std::shared_ptr<IExtensionHandle> handle)
    -> ExtensionResult<void> {
    std::shared_ptr<IExtensionHandle> previous;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(metadata.id);
        if (it == entries_.end()) {
            return makeError(ExtensionErrorCode::NotFound,
                             std::format("id {}", metadata.id));
        }
        previous = std::exchange(it->second.handle, std::move(handle));
        it->second.metadata = metadata;
    }
    LOG_INFO("Replaced source {} with version {}", metadata.id,
             metadata.version);
    return {};
}

void ExtensionRegistry::clear() {
    std::map<int64_t, Entry> released;
    {
        std::unique_lock lock(mutex_);
        released.swap(entries_);
    }
    if (!released.empty()) {
        LOG_INFO("Released {} sources", released.size());
    }
}

auto ExtensionRegistry::resolve(int64_t id) const
    -> ExtensionResult<std::shared_ptr<IExtensionHandle>> {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return makeError(ExtensionErrorCode::NotFound, std::format("id {}", id));
    }
    return it->second.handle;
}

auto ExtensionRegistry::dispatchPopular(int64_t id, int page) const
    -> ExtensionResult<json> {
    return resolve(id).and_then([&](const auto& handle) {
        return checkResult(id, "getPopularManga",
                           handle->getPopularManga(page), Shape::Array);
    });
}

auto ExtensionRegistry::dispatchLatest(int64_t id, int page) const
    -> ExtensionResult<json> {
    return resolve(id).and_then([&](const auto& handle) {
        return checkResult(id, "getLatestManga", handle->getLatestManga(page),
                           Shape::Array);
    });
}

auto ExtensionRegistry::dispatchSearch(int64_t id, int page,
                                       const std::optional<std::string>& query,
                                       const std::optional<Filters>& filters)
    const -> ExtensionResult<json> {
    return resolve(id).and_then([&](const auto& handle) {
        return checkResult(id, "searchManga",
                           handle->searchManga(page, query, filters),
                           Shape::Array);
    });
}

auto ExtensionRegistry::dispatchDetail(int64_t id, const std::string& path)
    const -> ExtensionResult<json> {
    return resolve(id).and_then([&](const auto& handle) {
        return checkResult(id, "getMangaDetail", handle->getMangaDetail(path),
                           Shape::Object);
    });
}

auto ExtensionRegistry::dispatchChapters(int64_t id, const std::string& path)
    const -> ExtensionResult<json> {
    return resolve(id).and_then([&](const auto& handle) {
        return checkResult(id, "getChapters", handle->getChapters(path),
                           Shape::Array);
    });
}

auto ExtensionRegistry::dispatchPages(int64_t id, const std::string& path)
    const -> ExtensionResult<json> {
    return resolve(id).and_then([&](const auto& handle) {
        return checkResult(id, "getPages", handle->getPages(path),
                           Shape::Array);
    });
}

}  // namespace shiori::extension
