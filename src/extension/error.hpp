/*
 * error.hpp - Source extension error taxonomy
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_ERROR_HPP
#define SHIORI_EXTENSION_ERROR_HPP

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace shiori::extension {

/**
 * @brief Every way a lifecycle or dispatch operation can fail
 */
enum class ExtensionErrorCode {
    RepoUnreachable,      ///< Manifest could not be retrieved
    MalformedIndex,       ///< Manifest retrieved but not decodable
    NotFoundInIndex,      ///< Requested id absent from the manifest
    NotFound,             ///< Requested id absent from the registry
    AlreadyInstalled,     ///< Id already present in the registry
    IncompatibleVersion,  ///< ABI tag or contract version mismatch
    NoNewVersion,         ///< Remote version does not exceed installed one
    VersionParseError,    ///< A version string could not be parsed
    ExecutionError,       ///< Execution collaborator reported a failure
    ProtocolError         ///< Collaborator result does not fit the schema
};

/**
 * @brief Stable identifier of an error code ("already_installed", ...)
 */
[[nodiscard]] auto extensionErrorCodeToString(ExtensionErrorCode code)
    -> std::string;

/**
 * @brief Human readable message shown to API clients
 *
 * The presentation layer passes these through verbatim.
 */
[[nodiscard]] auto extensionErrorMessage(ExtensionErrorCode code)
    -> std::string;

/**
 * @brief Error value carried by ExtensionResult
 */
struct ExtensionError {
    ExtensionErrorCode code;
    std::string detail;  ///< Diagnostic context, may be empty

    [[nodiscard]] auto message() const -> std::string {
        return extensionErrorMessage(code);
    }

    /**
     * @brief Message followed by the detail, for logs
     */
    [[nodiscard]] auto describe() const -> std::string;

    auto operator==(const ExtensionError& other) const -> bool = default;
};

/**
 * @brief Result type for lifecycle and dispatch operations
 */
template <typename T>
using ExtensionResult = std::expected<T, ExtensionError>;

/**
 * @brief Shorthand for building the unexpected side of an ExtensionResult
 */
[[nodiscard]] inline auto makeError(ExtensionErrorCode code,
                                    std::string detail = {})
    -> std::unexpected<ExtensionError> {
    return std::unexpected(ExtensionError{code, std::move(detail)});
}

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_ERROR_HPP
