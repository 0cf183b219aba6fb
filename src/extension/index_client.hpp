/*
 * index_client.hpp - Remote extension repository manifest
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_INDEX_CLIENT_HPP
#define SHIORI_EXTENSION_INDEX_CLIENT_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "transport.hpp"
#include "types.hpp"

namespace shiori::extension {

/**
 * @brief Join a repository URL and a relative resource path
 *
 * A trailing '/' on the repository URL is tolerated.
 */
[[nodiscard]] auto repositoryResource(std::string_view repoUrl,
                                      std::string_view resource)
    -> std::string;

/**
 * @brief Reads `{repo}/index.json` and decodes it into descriptors
 *
 * One request per call. No retry and no cache.
 */
class RemoteIndexClient {
public:
    explicit RemoteIndexClient(std::shared_ptr<IIndexTransport> transport);

    /**
     * @brief Fetch and decode the manifest
     * @return RepoUnreachable on transport failure or non-2xx status,
     *         MalformedIndex when the body is not an array of descriptors
     */
    auto fetchIndex(const std::string& repoUrl) const
        -> ExtensionResult<std::vector<RemoteSourceDescriptor>>;

    /**
     * @brief Decode a manifest body
     */
    static auto decodeIndex(std::string_view body)
        -> ExtensionResult<std::vector<RemoteSourceDescriptor>>;

    /**
     * @brief First descriptor with the given id
     * @return NotFoundInIndex if absent
     */
    static auto find(const std::vector<RemoteSourceDescriptor>& index,
                     int64_t id) -> ExtensionResult<RemoteSourceDescriptor>;

private:
    std::shared_ptr<IIndexTransport> transport_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_INDEX_CLIENT_HPP
