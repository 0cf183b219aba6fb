/*
 * error.cpp - Source extension error taxonomy
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error.hpp"

namespace shiori::extension {

auto extensionErrorCodeToString(ExtensionErrorCode code) -> std::string {
    switch (code) {
        case ExtensionErrorCode::RepoUnreachable:
            return "repo_unreachable";
        case ExtensionErrorCode::MalformedIndex:
            return "malformed_index";
        case ExtensionErrorCode::NotFoundInIndex:
            return "not_found_in_index";
        case ExtensionErrorCode::NotFound:
            return "not_found";
        case ExtensionErrorCode::AlreadyInstalled:
            return "already_installed";
        case ExtensionErrorCode::IncompatibleVersion:
            return "incompatible_version";
        case ExtensionErrorCode::NoNewVersion:
            return "no_new_version";
        case ExtensionErrorCode::VersionParseError:
            return "version_parse_error";
        case ExtensionErrorCode::ExecutionError:
            return "execution_error";
        case ExtensionErrorCode::ProtocolError:
            return "protocol_error";
    }
    return "unknown";
}

auto extensionErrorMessage(ExtensionErrorCode code) -> std::string {
    switch (code) {
        case ExtensionErrorCode::RepoUnreachable:
            return "extension repository unreachable";
        case ExtensionErrorCode::MalformedIndex:
            return "extension repository index is malformed";
        case ExtensionErrorCode::NotFoundInIndex:
            return "source not found in repository";
        case ExtensionErrorCode::NotFound:
            return "source not found";
        case ExtensionErrorCode::AlreadyInstalled:
            return "source installed, use update to update";
        case ExtensionErrorCode::IncompatibleVersion:
            return "incompatible version, update the server";
        case ExtensionErrorCode::NoNewVersion:
            return "no new version";
        case ExtensionErrorCode::VersionParseError:
            return "invalid version string";
        case ExtensionErrorCode::ExecutionError:
            return "extension returned an error";
        case ExtensionErrorCode::ProtocolError:
            return "extension returned an invalid result";
    }
    return "unknown error";
}

auto ExtensionError::describe() const -> std::string {
    if (detail.empty()) {
        return message();
    }
    return message() + ": " + detail;
}

}  // namespace shiori::extension
