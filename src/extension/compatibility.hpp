/*
 * compatibility.hpp - ABI and contract gate for extension packages
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_COMPATIBILITY_HPP
#define SHIORI_EXTENSION_COMPATIBILITY_HPP

#include <string>
#include <string_view>

#include "error.hpp"
#include "types.hpp"

#ifndef SHIORI_ABI_TAG
#define SHIORI_ABI_TAG "unknown"
#endif

#ifndef SHIORI_CONTRACT_VERSION
#define SHIORI_CONTRACT_VERSION "0.1.0"
#endif

namespace shiori::extension {

/**
 * @brief Toolchain and interface identity a package must match to be loaded
 */
struct HostIdentity {
    std::string abiTag;
    std::string contractVersion;

    /**
     * @brief Identity this binary was built with
     */
    static auto current() -> HostIdentity {
        return {SHIORI_ABI_TAG, SHIORI_CONTRACT_VERSION};
    }

    auto operator==(const HostIdentity& other) const -> bool = default;
};

/**
 * @brief True when both the ABI tag and the contract version match exactly
 */
[[nodiscard]] auto isCompatible(const SourceMetadata& descriptor,
                                const HostIdentity& host) -> bool;

/**
 * @brief Whether remote is strictly newer than installed
 *
 * Build metadata is ignored and equal versions yield false.
 * @return VersionParseError if either string is not a valid version
 */
[[nodiscard]] auto hasNewer(std::string_view installed,
                            std::string_view remote) -> ExtensionResult<bool>;

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_COMPATIBILITY_HPP
