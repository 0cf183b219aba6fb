/*
 * compatibility.cpp - ABI and contract gate for extension packages
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "compatibility.hpp"

#include "version.hpp"

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

auto isCompatible(const SourceMetadata& descriptor, const HostIdentity& host)
    -> bool {
    if (descriptor.abiTag != host.abiTag) {
        LOG_DEBUG("Source {} built for ABI '{}', host is '{}'", descriptor.id,
                  descriptor.abiTag, host.abiTag);
        return false;
    }
    if (descriptor.contractVersion != host.contractVersion) {
        LOG_DEBUG("Source {} implements contract '{}', host is '{}'",
                  descriptor.id, descriptor.contractVersion,
                  host.contractVersion);
        return false;
    }
    return true;
}

auto hasNewer(std::string_view installed, std::string_view remote)
    -> ExtensionResult<bool> {
    try {
        auto installedVersion = Version::parse(installed);
        auto remoteVersion = Version::parse(remote);
        return remoteVersion > installedVersion;
    } catch (const InvalidVersion& e) {
        LOG_WARN("Cannot compare versions '{}' and '{}': {}", installed,
                 remote, e.what());
        return makeError(ExtensionErrorCode::VersionParseError, e.what());
    }
}

}  // namespace shiori::extension
