/*
 * source_service.hpp - Source operations offered to the presentation layer
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_SOURCE_SERVICE_HPP
#define SHIORI_EXTENSION_SOURCE_SERVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "lifecycle.hpp"

namespace shiori::extension {

/**
 * @brief Single entry point for source management and catalog reads
 */
class SourceService {
public:
    SourceService(LifecycleOrchestrator& lifecycle, CatalogService& catalog);

    [[nodiscard]] auto installedSources() const -> std::vector<Source>;

    /**
     * @brief Installed sources, flagging those with a newer build at repoUrl
     */
    auto installedSourcesWithUpdates(const std::string& repoUrl)
        -> ExtensionResult<std::vector<Source>>;

    auto availableSources(const std::string& repoUrl)
        -> ExtensionResult<std::vector<Source>>;

    auto getSourceById(int64_t id) const -> ExtensionResult<Source>;

    auto installSource(const std::string& repoUrl, int64_t id)
        -> ExtensionResult<Source>;
    auto updateSource(const std::string& repoUrl, int64_t id)
        -> ExtensionResult<Source>;
    auto uninstallSource(int64_t id) -> ExtensionResult<void>;

    auto getPopularManga(int64_t sourceId, int page) const
        -> ExtensionResult<std::vector<MangaInfo>>;
    auto getLatestManga(int64_t sourceId, int page) const
        -> ExtensionResult<std::vector<MangaInfo>>;
    auto searchManga(int64_t sourceId, int page,
                     const std::optional<std::string>& query,
                     const std::optional<Filters>& filters) const
        -> ExtensionResult<std::vector<MangaInfo>>;
    auto getMangaBySourcePath(int64_t sourceId, const std::string& path) const
        -> ExtensionResult<MangaInfo>;
    auto getChaptersBySourcePath(int64_t sourceId,
                                 const std::string& path) const
        -> ExtensionResult<std::vector<ChapterInfo>>;
    auto getPagesBySourcePath(int64_t sourceId, const std::string& path) const
        -> ExtensionResult<PageList>;

private:
    LifecycleOrchestrator& lifecycle_;
    CatalogService& catalog_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_SOURCE_SERVICE_HPP
