/*
 * version.cpp - Semantic version of an extension package
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "version.hpp"

#include <charconv>
#include <format>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

namespace {

auto parseComponent(std::string_view str, std::string_view whole) -> int {
    int result = 0;
    const auto* first = str.data();
    const auto* last = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (str.empty() || ec != std::errc{} || ptr != last || result < 0) {
        THROW_INVALID_VERSION(std::format(
            "Invalid version component '{}' in '{}'", str, whole));
    }
    return result;
}

}  // namespace

auto Version::parse(std::string_view versionStr) -> Version {
    if (versionStr.empty()) {
        THROW_INVALID_VERSION(std::string("Empty version string"));
    }

    auto plusPos = versionStr.find('+');
    auto core = versionStr.substr(0, plusPos);
    std::string build;
    if (plusPos != std::string_view::npos) {
        build = std::string(versionStr.substr(plusPos + 1));
        if (build.empty()) {
            THROW_INVALID_VERSION(
                std::format("Empty build metadata in '{}'", versionStr));
        }
    }

    auto dashPos = core.find('-');
    auto numbers = core.substr(0, dashPos);
    std::string prerelease;
    if (dashPos != std::string_view::npos) {
        prerelease = std::string(core.substr(dashPos + 1));
        if (prerelease.empty()) {
            THROW_INVALID_VERSION(
                std::format("Empty prerelease in '{}'", versionStr));
        }
    }

    auto firstDot = numbers.find('.');
    if (firstDot == std::string_view::npos) {
        THROW_INVALID_VERSION(std::format(
            "Invalid version format: missing first dot in '{}'", versionStr));
    }
    auto secondDot = numbers.find('.', firstDot + 1);
    if (secondDot == std::string_view::npos) {
        THROW_INVALID_VERSION(std::format(
            "Invalid version format: missing second dot in '{}'", versionStr));
    }

    int major = parseComponent(numbers.substr(0, firstDot), versionStr);
    int minor = parseComponent(
        numbers.substr(firstDot + 1, secondDot - firstDot - 1), versionStr);
    // "1.2.3.4" leaves "3.4" here, which parseComponent rejects
    int patch = parseComponent(numbers.substr(secondDot + 1), versionStr);

    LOG_DEBUG("Parsed version: {}.{}.{}-{}+{}", major, minor, patch,
              prerelease, build);
    return {major, minor, patch, std::move(prerelease), std::move(build)};
}

auto Version::toString() const -> std::string {
    auto result = std::format("{}.{}.{}", major, minor, patch);
    if (!prerelease.empty()) {
        result += "-" + prerelease;
    }
    if (!build.empty()) {
        result += "+" + build;
    }
    return result;
}

}  // namespace shiori::extension
