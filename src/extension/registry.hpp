/*
 * registry.hpp - Loaded source extensions and per-source dispatch
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_REGISTRY_HPP
#define SHIORI_EXTENSION_REGISTRY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "error.hpp"
#include "runtime.hpp"
#include "types.hpp"

namespace shiori::extension {

/**
 * @brief Map of loaded extensions keyed by source id
 *
 * Readers copy the handle under a shared lock and call into the extension
 * with no lock held, so a slow extension never blocks other sources or
 * lifecycle operations. An in-flight call keeps its handle alive after the
 * entry has been removed.
 *
 * Dispatch results are extension-native JSON. Only the top-level shape is
 * checked here; record mapping belongs to CatalogService.
 */
class ExtensionRegistry {
public:
    ExtensionRegistry() = default;
    ~ExtensionRegistry();

    ExtensionRegistry(const ExtensionRegistry&) = delete;
    ExtensionRegistry& operator=(const ExtensionRegistry&) = delete;
    ExtensionRegistry(ExtensionRegistry&&) = delete;
    ExtensionRegistry& operator=(ExtensionRegistry&&) = delete;

    /**
     * @brief Installed sources ordered by id, hasUpdate always false
     */
    [[nodiscard]] auto list() const -> std::vector<Source>;

    [[nodiscard]] auto exists(int64_t id) const -> bool;

    /**
     * @return NotFound if the id is not registered
     */
    [[nodiscard]] auto getSourceInfo(int64_t id) const
        -> ExtensionResult<Source>;

    [[nodiscard]] auto size() const -> size_t;

    /**
     * @brief Insert a new entry, never overwriting
     * @return AlreadyInstalled if the id is taken
     */
    auto registerSource(const SourceMetadata& metadata,
                        std::shared_ptr<IExtensionHandle> handle)
        -> ExtensionResult<void>;

    /**
     * @brief Remove an entry and drop the registry's reference to its handle
     * @return NotFound if the id is not registered
     */
    auto unregisterSource(int64_t id) -> ExtensionResult<void>;

    /**
     * @brief Swap an existing entry for a new one in a single step
     * @return NotFound if the id is not registered
     */
    auto replace(const SourceMetadata& metadata,
                 std::shared_ptr<IExtensionHandle> handle)
        -> ExtensionResult<void>;

    /**
     * @brief Drop every entry
     */
    void clear();

    auto dispatchPopular(int64_t id, int page) const -> ExtensionResult<json>;
    auto dispatchLatest(int64_t id, int page) const -> ExtensionResult<json>;
    auto dispatchSearch(int64_t id, int page,
                        const std::optional<std::string>& query,
                        const std::optional<Filters>& filters) const
        -> ExtensionResult<json>;
    auto dispatchDetail(int64_t id, const std::string& path) const
        -> ExtensionResult<json>;
    auto dispatchChapters(int64_t id, const std::string& path) const
        -> ExtensionResult<json>;
    auto dispatchPages(int64_t id, const std::string& path) const
        -> ExtensionResult<json>;

private:
    struct Entry {
        SourceMetadata metadata;
        std::shared_ptr<IExtensionHandle> handle;
    };

    auto resolve(int64_t id) const
        -> ExtensionResult<std::shared_ptr<IExtensionHandle>>;

    std::map<int64_t, Entry> entries_;
    mutable std::shared_mutex mutex_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_REGISTRY_HPP
