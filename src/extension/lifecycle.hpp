/*
 * lifecycle.hpp - Install, update and uninstall of source extensions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_LIFECYCLE_HPP
#define SHIORI_EXTENSION_LIFECYCLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "compatibility.hpp"
#include "error.hpp"
#include "index_client.hpp"
#include "registry.hpp"
#include "runtime.hpp"

namespace shiori::extension {

/**
 * @brief How update() moves from the installed build to the new one
 */
enum class UpdateStrategy {
    Recreate,      ///< Unregister, then install; a failure leaves the id absent
    StageThenSwap  ///< Load the new build first, then swap it in
};

[[nodiscard]] auto updateStrategyToString(UpdateStrategy strategy)
    -> std::string;

[[nodiscard]] auto updateStrategyFromString(std::string_view value)
    -> std::optional<UpdateStrategy>;

/**
 * @brief Drives sources between Absent and Installed
 *
 * Operations on the same id are serialized. Ids are spread over a fixed set
 * of lock stripes, so operations on different ids run in parallel unless
 * they share a stripe. The registry, index client and runtime are owned by the
 * caller and must outlive the orchestrator.
 */
class LifecycleOrchestrator {
public:
    static constexpr size_t LOCK_STRIPES = 64;

    LifecycleOrchestrator(ExtensionRegistry& registry,
                          const RemoteIndexClient& indexClient,
                          IExtensionRuntime& runtime,
                          HostIdentity host = HostIdentity::current(),
                          UpdateStrategy strategy = UpdateStrategy::Recreate);

    LifecycleOrchestrator(const LifecycleOrchestrator&) = delete;
    LifecycleOrchestrator& operator=(const LifecycleOrchestrator&) = delete;

    /**
     * @brief Install source id from the repository at repoUrl
     * @return The installed source, or AlreadyInstalled, RepoUnreachable,
     *         MalformedIndex, NotFoundInIndex, IncompatibleVersion,
     *         ExecutionError
     */
    auto install(const std::string& repoUrl, int64_t id)
        -> ExtensionResult<Source>;

    /**
     * @brief Move an installed source to a strictly newer repository build
     * @return The updated source, or NotFound, RepoUnreachable,
     *         MalformedIndex, NotFoundInIndex, NoNewVersion,
     *         VersionParseError, IncompatibleVersion, ExecutionError
     */
    auto update(const std::string& repoUrl, int64_t id)
        -> ExtensionResult<Source>;

    /**
     * @return NotFound if the id is not installed
     */
    auto uninstall(int64_t id) -> ExtensionResult<void>;

    /**
     * @brief Manifest entries that are not installed, in manifest order
     */
    auto available(const std::string& repoUrl)
        -> ExtensionResult<std::vector<Source>>;

    [[nodiscard]] auto installed() const -> std::vector<Source>;

    /**
     * @return NotFound if the id is not installed
     */
    [[nodiscard]] auto installedSource(int64_t id) const
        -> ExtensionResult<Source>;

    /**
     * @brief Installed sources with hasUpdate computed against the manifest
     */
    auto installedWithUpdates(const std::string& repoUrl)
        -> ExtensionResult<std::vector<Source>>;

    /**
     * @brief Register the compatible packages the runtime already holds
     *
     * The gate runs on the stored descriptor before the package is loaded.
     * @return Number of sources restored
     */
    auto restore() -> size_t;

    [[nodiscard]] auto strategy() const -> UpdateStrategy { return strategy_; }
    [[nodiscard]] auto host() const -> const HostIdentity& { return host_; }

private:
    auto lockFor(int64_t id) -> std::mutex&;

    auto fetchDescriptor(const std::string& repoUrl, int64_t id)
        -> ExtensionResult<RemoteSourceDescriptor>;

    auto materialize(const std::string& repoUrl,
                     const RemoteSourceDescriptor& descriptor)
        -> ExtensionResult<std::shared_ptr<IExtensionHandle>>;

    ExtensionRegistry& registry_;
    const RemoteIndexClient& indexClient_;
    IExtensionRuntime& runtime_;
    HostIdentity host_;
    UpdateStrategy strategy_;

    std::array<std::mutex, LOCK_STRIPES> idLocks_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_LIFECYCLE_HPP
