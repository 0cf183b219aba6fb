/*
 * catalog.hpp - Catalog browsing across installed sources
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_CATALOG_HPP
#define SHIORI_EXTENSION_CATALOG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace shiori::extension {

/**
 * @brief Dispatches catalog requests and maps the results to host records
 *
 * Element order is preserved. The first element that does not fit its
 * record schema fails the whole call with ProtocolError.
 */
class CatalogService {
public:
    explicit CatalogService(const ExtensionRegistry& registry);

    auto popular(int64_t sourceId, int page) const
        -> ExtensionResult<std::vector<MangaInfo>>;
    auto latest(int64_t sourceId, int page) const
        -> ExtensionResult<std::vector<MangaInfo>>;
    auto search(int64_t sourceId, int page,
                const std::optional<std::string>& query,
                const std::optional<Filters>& filters) const
        -> ExtensionResult<std::vector<MangaInfo>>;
    auto detail(int64_t sourceId, const std::string& path) const
        -> ExtensionResult<MangaInfo>;
    auto chapters(int64_t sourceId, const std::string& path) const
        -> ExtensionResult<std::vector<ChapterInfo>>;
    auto pages(int64_t sourceId, const std::string& path) const
        -> ExtensionResult<PageList>;

private:
    const ExtensionRegistry& registry_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_CATALOG_HPP
