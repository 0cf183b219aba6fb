/*
 * index_client.cpp - Remote extension repository manifest
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "index_client.hpp"

#include <algorithm>
#include <format>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

auto repositoryResource(std::string_view repoUrl, std::string_view resource)
    -> std::string {
    while (repoUrl.ends_with('/')) {
        repoUrl.remove_suffix(1);
    }
    return std::format("{}/{}", repoUrl, resource);
}

RemoteIndexClient::RemoteIndexClient(
    std::shared_ptr<IIndexTransport> transport)
    : transport_(std::move(transport)) {}

auto RemoteIndexClient::fetchIndex(const std::string& repoUrl) const
    -> ExtensionResult<std::vector<RemoteSourceDescriptor>> {
    auto url = repositoryResource(repoUrl, "index.json");
    auto body = transport_->get(url);
    if (!body) {
        LOG_ERROR("Extension repository {} unreachable: {}", repoUrl,
                  body.error());
        return makeError(ExtensionErrorCode::RepoUnreachable, body.error());
    }

    auto index = decodeIndex(*body);
    if (index) {
        LOG_DEBUG("Fetched {} descriptors from {}", index->size(), url);
    } else {
        LOG_ERROR("Malformed index at {}: {}", url, index.error().detail);
    }
    return index;
}

auto RemoteIndexClient::decodeIndex(std::string_view body)
    -> ExtensionResult<std::vector<RemoteSourceDescriptor>> {
    json document = json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        return makeError(ExtensionErrorCode::MalformedIndex,
                         "body is not valid JSON");
    }
    if (!document.is_array()) {
        return makeError(
            ExtensionErrorCode::MalformedIndex,
            std::format("expected array, got {}", document.type_name()));
    }

    std::vector<RemoteSourceDescriptor> index;
    index.reserve(document.size());
    for (size_t i = 0; i < document.size(); ++i) {
        auto descriptor = SourceMetadata::fromJson(document[i]);
        if (!descriptor) {
            return makeError(
                ExtensionErrorCode::MalformedIndex,
                std::format("entry {}: {}", i, descriptor.error()));
        }
        index.push_back(std::move(*descriptor));
    }
    return index;
}

auto RemoteIndexClient::find(const std::vector<RemoteSourceDescriptor>& index,
                             int64_t id)
    -> ExtensionResult<RemoteSourceDescriptor> {
    auto it = std::ranges::find(index, id, &RemoteSourceDescriptor::id);
    if (it == index.end()) {
        return makeError(ExtensionErrorCode::NotFoundInIndex,
                         std::format("id {}", id));
    }
    return *it;
}

}  // namespace shiori::extension
