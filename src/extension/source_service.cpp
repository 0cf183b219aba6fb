/*
 * source_service.cpp - Source operations offered to the presentation layer
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "source_service.hpp"

namespace shiori::extension {

SourceService::SourceService(LifecycleOrchestrator& lifecycle,
                             CatalogService& catalog)
    : lifecycle_(lifecycle), catalog_(catalog) {}

auto SourceService::installedSources() const -> std::vector<Source> {
    return lifecycle_.installed();
}

auto SourceService::installedSourcesWithUpdates(const std::string& repoUrl)
    -> ExtensionResult<std::vector<Source>> {
    return lifecycle_.installedWithUpdates(repoUrl);
}

auto SourceService::availableSources(const std::string& repoUrl)
    -> ExtensionResult<std::vector<Source>> {
    return lifecycle_.available(repoUrl);
}

auto SourceService::getSourceById(int64_t id) const -> ExtensionResult<Source> {
    return lifecycle_.installedSource(id);
}

auto SourceService::installSource(const std::string& repoUrl, int64_t id)
    -> ExtensionResult<Source> {
    return lifecycle_.install(repoUrl, id);
}

auto SourceService::updateSource(const std::string& repoUrl, int64_t id)
    -> ExtensionResult<Source> {
    return lifecycle_.update(repoUrl, id);
}

auto SourceService::uninstallSource(int64_t id) -> ExtensionResult<void> {
    return lifecycle_.uninstall(id);
}

auto SourceService::getPopularManga(int64_t sourceId, int page) const
    -> ExtensionResult<std::vector<MangaInfo>> {
    return catalog_.popular(sourceId, page);
}

auto SourceService::getLatestManga(int64_t sourceId, int page) const
    -> ExtensionResult<std::vector<MangaInfo>> {
    return catalog_.latest(sourceId, page);
}

auto SourceService::searchManga(int64_t sourceId, int page,
                                const std::optional<std::string>& query,
                                const std::optional<Filters>& filters) const
    -> ExtensionResult<std::vector<MangaInfo>> {
    return catalog_.search(sourceId, page, query, filters);
}

auto SourceService::getMangaBySourcePath(int64_t sourceId,
                                         const std::string& path) const
    -> ExtensionResult<MangaInfo> {
    return catalog_.detail(sourceId, path);
}

auto SourceService::getChaptersBySourcePath(int64_t sourceId,
                                            const std::string& path) const
    -> ExtensionResult<std::vector<ChapterInfo>> {
    return catalog_.chapters(sourceId, path);
}

auto SourceService::getPagesBySourcePath(int64_t sourceId,
                                         const std::string& path) const
    -> ExtensionResult<PageList> {
    return catalog_.pages(sourceId, path);
}

}  // namespace shiori::extension
