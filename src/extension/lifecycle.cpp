/*
 * lifecycle.cpp - Install, update and uninstall of source extensions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "lifecycle.hpp"

#include <format>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

auto updateStrategyToString(UpdateStrategy strategy) -> std::string {
    switch (strategy) {
        case UpdateStrategy::Recreate:
            return "recreate";
        case UpdateStrategy::StageThenSwap:
            return "stage-then-swap";
    }
    return "recreate";
}

auto updateStrategyFromString(std::string_view value)
    -> std::optional<UpdateStrategy> {
    if (value == "recreate") {
        return UpdateStrategy::Recreate;
    }
    if (value == "stage-then-swap") {
        return UpdateStrategy::StageThenSwap;
    }
    return std::nullopt;
}

LifecycleOrchestrator::LifecycleOrchestrator(ExtensionRegistry& registry,
                                             const RemoteIndexClient& indexClient,
                                             IExtensionRuntime& runtime,
                                             HostIdentity host,
                                             UpdateStrategy strategy)
    : registry_(registry),
      indexClient_(indexClient),
      runtime_(runtime),
      host_(std::move(host)),
      strategy_(strategy) {
    LOG_INFO("Lifecycle ready: ABI '{}', contract '{}', update strategy {}",
             host_.abiTag, host_.contractVersion,
             updateStrategyToString(strategy_));
}

auto LifecycleOrchestrator::lockFor(int64_t id) -> std::mutex& {
    return idLocks_[static_cast<uint64_t>(id) % LOCK_STRIPES];
}

auto LifecycleOrchestrator::fetchDescriptor(const std::string& repoUrl,
                                            int64_t id)
    -> ExtensionResult<RemoteSourceDescriptor> {
    return indexClient_.fetchIndex(repoUrl).and_then(
        [id](const std::vector<RemoteSourceDescriptor>& index) {
            return RemoteIndexClient::find(index, id);
        });
}

auto LifecycleOrchestrator::materialize(const std::string& repoUrl,
                                        const RemoteSourceDescriptor& descriptor)
    -> ExtensionResult<std::shared_ptr<IExtensionHandle>> {
    auto handle = runtime_.materialize(repoUrl, descriptor);
    if (!handle) {
        LOG_ERROR("Runtime could not materialize source {}: {}", descriptor.id,
                  handle.error());
        return makeError(ExtensionErrorCode::ExecutionError, handle.error());
    }
    if (!*handle) {
        return makeError(ExtensionErrorCode::ExecutionError,
                         std::format("runtime returned no handle for id {}",
                                     descriptor.id));
    }
    return std::move(*handle);
}

auto LifecycleOrchestrator::install(const std::string& repoUrl, int64_t id)
    -> ExtensionResult<Source> {
    std::lock_guard idLock(lockFor(id));

    if (registry_.exists(id)) {
        LOG_WARN("Install of source {} refused: already installed", id);
        return makeError(ExtensionErrorCode::AlreadyInstalled,
                         std::format("id {}", id));
    }

    auto descriptor = fetchDescriptor(repoUrl, id);
    if (!descriptor) {
        return std::unexpected(descriptor.error());
    }

    if (!isCompatible(*descriptor, host_)) {
        LOG_WARN("Install of source {} refused: built for '{}' / '{}'", id,
                 descriptor->abiTag, descriptor->contractVersion);
        return makeError(
            ExtensionErrorCode::IncompatibleVersion,
            std::format("source {} requires ABI '{}' and contract '{}'", id,
                        descriptor->abiTag, descriptor->contractVersion));
    }

    auto handle = materialize(repoUrl, *descriptor);
    if (!handle) {
        return std::unexpected(handle.error());
    }

    if (auto registered = registry_.registerSource(*descriptor, *handle);
        !registered) {
        return std::unexpected(registered.error());
    }

    LOG_INFO("Installed source {} ({} {})", id, descriptor->name,
             descriptor->version);
    return Source::from(*descriptor);
}

auto LifecycleOrchestrator::update(const std::string& repoUrl, int64_t id)
    -> ExtensionResult<Source> {
    std::lock_guard idLock(lockFor(id));

    auto current = registry_.getSourceInfo(id);
    if (!current) {
        return std::unexpected(current.error());
    }

    auto descriptor = fetchDescriptor(repoUrl, id);
    if (!descriptor) {
        return std::unexpected(descriptor.error());
    }

    auto newer = hasNewer(current->version, descriptor->version);
    if (!newer) {
        return std::unexpected(newer.error());
    }
    if (!*newer) {
        LOG_INFO("Source {} is up to date at {} (repository has {})", id,
                 current->version, descriptor->version);
        return makeError(ExtensionErrorCode::NoNewVersion,
                         std::format("installed {}, repository {}",
                                     current->version, descriptor->version));
    }

    if (!isCompatible(*descriptor, host_)) {
        LOG_WARN("Update of source {} to {} refused: built for '{}' / '{}'",
                 id, descriptor->version, descriptor->abiTag,
                 descriptor->contractVersion);
        return makeError(
            ExtensionErrorCode::IncompatibleVersion,
            std::format("source {} {} requires ABI '{}' and contract '{}'", id,
                        descriptor->version, descriptor->abiTag,
                        descriptor->contractVersion));
    }

    LOG_INFO("Updating source {} from {} to {} ({})", id, current->version,
             descriptor->version, updateStrategyToString(strategy_));

    if (strategy_ == UpdateStrategy::StageThenSwap) {
        auto handle = materialize(repoUrl, *descriptor);
        if (!handle) {
            LOG_WARN("Source {} stays at {}", id, current->version);
            return std::unexpected(handle.error());
        }
        if (auto swapped = registry_.replace(*descriptor, *handle); !swapped) {
            return std::unexpected(swapped.error());
        }
        return Source::from(*descriptor);
    }

    if (auto removed = registry_.unregisterSource(id); !removed) {
        return std::unexpected(removed.error());
    }
    runtime_.release(id);

    auto handle = materialize(repoUrl, *descriptor);
    if (!handle) {
        LOG_ERROR("Source {} was removed and could not be reinstalled", id);
        return std::unexpected(handle.error());
    }
    if (auto registered = registry_.registerSource(*descriptor, *handle);
        !registered) {
        return std::unexpected(registered.error());
    }
    return Source::from(*descriptor);
}

auto LifecycleOrchestrator::uninstall(int64_t id) -> ExtensionResult<void> {
    std::lock_guard idLock(lockFor(id));

    if (auto removed = registry_.unregisterSource(id); !removed) {
        return removed;
    }
    runtime_.release(id);
    LOG_INFO("Uninstalled source {}", id);
    return {};
}

auto LifecycleOrchestrator::available(const std::string& repoUrl)
    -> ExtensionResult<std::vector<Source>> {
    auto index = indexClient_.fetchIndex(repoUrl);
    if (!index) {
        return std::unexpected(index.error());
    }

    std::vector<Source> sources;
    for (const auto& descriptor : *index) {
        if (!registry_.exists(descriptor.id)) {
            sources.push_back(Source::from(descriptor, false));
        }
    }
    return sources;
}

auto LifecycleOrchestrator::installed() const -> std::vector<Source> {
    return registry_.list();
}

auto LifecycleOrchestrator::installedSource(int64_t id) const
    -> ExtensionResult<Source> {
    return registry_.getSourceInfo(id);
}

auto LifecycleOrchestrator::installedWithUpdates(const std::string& repoUrl)
    -> ExtensionResult<std::vector<Source>> {
    auto index = indexClient_.fetchIndex(repoUrl);
    if (!index) {
        return std::unexpected(index.error());
    }

    auto sources = registry_.list();
    for (auto& source : sources) {
        auto remote = RemoteIndexClient::find(*index, source.id);
        if (!remote) {
            continue;
        }
        source.hasUpdate =
            hasNewer(source.version, remote->version).value_or(false);
    }
    return sources;
}

auto LifecycleOrchestrator::restore() -> size_t {
    size_t restored = 0;
    for (const auto& metadata : runtime_.stored()) {
        std::lock_guard idLock(lockFor(metadata.id));
        if (!isCompatible(metadata, host_)) {
            LOG_WARN("Not restoring source {} ({}): incompatible with host",
                     metadata.id, metadata.name);
            continue;
        }
        if (registry_.exists(metadata.id)) {
            LOG_WARN("Not restoring source {} ({}): already installed",
                     metadata.id, metadata.name);
            continue;
        }
        auto handle = runtime_.loadStored(metadata);
        if (!handle || !*handle) {
            LOG_WARN("Not restoring source {} ({}): {}", metadata.id,
                     metadata.name,
                     handle ? std::string("no handle") : handle.error());
            continue;
        }
        if (auto registered = registry_.registerSource(metadata, *handle);
            !registered) {
            LOG_WARN("Not restoring source {} ({}): {}", metadata.id,
                     metadata.name, registered.error().describe());
            continue;
        }
        ++restored;
    }
    LOG_INFO("Restored {} installed sources", restored);
    return restored;
}

}  // namespace shiori::extension
