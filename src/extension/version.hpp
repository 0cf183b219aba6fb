/*
 * version.hpp - Semantic version of an extension package
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_VERSION_HPP
#define SHIORI_EXTENSION_VERSION_HPP

#include <string>
#include <string_view>
#include <utility>

#include "atom/error/exception.hpp"

namespace shiori::extension {

/**
 * @brief Exception thrown when a version string cannot be parsed.
 */
class InvalidVersion : public atom::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_VERSION(...)                                          \
    throw shiori::extension::InvalidVersion(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                            ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Represents a semantic version following SemVer specification.
 */
struct Version {
    int major;               ///< Major version number
    int minor;               ///< Minor version number
    int patch;               ///< Patch version number
    std::string prerelease;  ///< Prerelease information (e.g., alpha, rc.1)
    std::string build;       ///< Build metadata, ignored by comparisons

    /**
     * @brief Default constructor initializing version to 0.0.0.
     */
    constexpr Version() noexcept : major(0), minor(0), patch(0) {}

    /**
     * @brief Constructs a Version object with specified values.
     * @param maj Major version number
     * @param min Minor version number
     * @param pat Patch version number
     * @param pre Prerelease information
     * @param bld Build metadata
     */
    constexpr Version(int maj, int min, int pat, std::string pre = "",
                      std::string bld = "") noexcept
        : major(maj),
          minor(min),
          patch(pat),
          prerelease(std::move(pre)),
          build(std::move(bld)) {}

    /**
     * @brief Parses "major.minor.patch[-prerelease][+build]".
     * @param versionStr The version string to parse
     * @return Parsed Version object
     * @throws InvalidVersion if the version string is invalid
     */
    static auto parse(std::string_view versionStr) -> Version;

    /**
     * @brief Converts the Version object to a string.
     * @return Version string
     */
    [[nodiscard]] auto toString() const -> std::string;

    /**
     * @brief Checks if the version is a prerelease.
     */
    [[nodiscard]] constexpr auto isPrerelease() const noexcept -> bool {
        return !prerelease.empty();
    }

    constexpr auto operator<(const Version& other) const noexcept -> bool;
    constexpr auto operator>(const Version& other) const noexcept -> bool;
    constexpr auto operator==(const Version& other) const noexcept -> bool;
    constexpr auto operator<=(const Version& other) const noexcept -> bool;
    constexpr auto operator>=(const Version& other) const noexcept -> bool;
};

constexpr auto Version::operator<(const Version& other) const noexcept -> bool {
    if (major != other.major)
        return major < other.major;
    if (minor != other.minor)
        return minor < other.minor;
    if (patch != other.patch)
        return patch < other.patch;

    // A release outranks every prerelease of the same triple
    if (prerelease.empty())
        return false;
    if (other.prerelease.empty())
        return true;

    return prerelease < other.prerelease;
}

constexpr auto Version::operator>(const Version& other) const noexcept -> bool {
    return other < *this;
}

constexpr auto Version::operator==(const Version& other) const noexcept
    -> bool {
    return major == other.major && minor == other.minor &&
           patch == other.patch && prerelease == other.prerelease;
}

constexpr auto Version::operator<=(const Version& other) const noexcept
    -> bool {
    return !(other < *this);
}

constexpr auto Version::operator>=(const Version& other) const noexcept
    -> bool {
    return !(*this < other);
}

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_VERSION_HPP
