/*
 * runtime.hpp - Contract of the engine that executes extension code
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_RUNTIME_HPP
#define SHIORI_EXTENSION_RUNTIME_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace shiori::extension {

/**
 * @brief Result of a collaborator call; the error is a free-form message
 */
template <typename T>
using RuntimeResult = std::expected<T, std::string>;

/**
 * @brief One live extension instance
 *
 * Every call returns extension-native JSON (camelCase records). Calls may
 * arrive concurrently from several request threads.
 */
class IExtensionHandle {
public:
    virtual ~IExtensionHandle() = default;

    virtual auto getPopularManga(int page) -> RuntimeResult<json> = 0;
    virtual auto getLatestManga(int page) -> RuntimeResult<json> = 0;
    virtual auto searchManga(int page, const std::optional<std::string>& query,
                             const std::optional<Filters>& filters)
        -> RuntimeResult<json> = 0;
    virtual auto getMangaDetail(const std::string& path)
        -> RuntimeResult<json> = 0;
    virtual auto getChapters(const std::string& path)
        -> RuntimeResult<json> = 0;
    virtual auto getPages(const std::string& path) -> RuntimeResult<json> = 0;
};

/**
 * @brief Turns repository packages into live handles
 */
class IExtensionRuntime {
public:
    virtual ~IExtensionRuntime() = default;

    /**
     * @brief Fetch the package described by descriptor and load it
     */
    virtual auto materialize(const std::string& repoUrl,
                             const RemoteSourceDescriptor& descriptor)
        -> RuntimeResult<std::shared_ptr<IExtensionHandle>> = 0;

    /**
     * @brief Drop on-disk or cached state of a removed source
     */
    virtual void release(int64_t id) = 0;

    /**
     * @brief Descriptors of the packages the runtime holds, none loaded
     */
    virtual auto stored() -> std::vector<SourceMetadata> = 0;

    /**
     * @brief Load a package listed by stored()
     *
     * Callers run the compatibility gate on the descriptor first.
     */
    virtual auto loadStored(const SourceMetadata& metadata)
        -> RuntimeResult<std::shared_ptr<IExtensionHandle>> = 0;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_RUNTIME_HPP
