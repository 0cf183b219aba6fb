#ifndef SHIORI_SERVER_UTILS_ERROR_STATUS_HPP
#define SHIORI_SERVER_UTILS_ERROR_STATUS_HPP

#include <string>

#include "atom/type/json.hpp"
#include "extension/error.hpp"

namespace shiori::server::utils {

/**
 * @brief HTTP status reported for an extension error
 */
[[nodiscard]] constexpr auto httpStatusFor(extension::ExtensionErrorCode code)
    -> int {
    using extension::ExtensionErrorCode;
    switch (code) {
        case ExtensionErrorCode::NotFoundInIndex:
        case ExtensionErrorCode::NotFound:
            return 404;
        case ExtensionErrorCode::AlreadyInstalled:
        case ExtensionErrorCode::NoNewVersion:
            return 409;
        case ExtensionErrorCode::IncompatibleVersion:
        case ExtensionErrorCode::VersionParseError:
            return 422;
        case ExtensionErrorCode::RepoUnreachable:
        case ExtensionErrorCode::MalformedIndex:
        case ExtensionErrorCode::ExecutionError:
        case ExtensionErrorCode::ProtocolError:
            return 502;
    }
    return 500;
}

/**
 * @brief Standard error envelope
 */
[[nodiscard]] inline auto errorBody(const std::string& code,
                                    const std::string& message,
                                    const nlohmann::json& details = nullptr)
    -> nlohmann::json {
    nlohmann::json errorObj = {{"code", code}, {"message", message}};
    if (!details.is_null()) {
        errorObj["details"] = details;
    }
    return {{"status", "error"}, {"error", errorObj}};
}

/**
 * @brief Error envelope for an extension error
 *
 * The message is the fixed user-facing one; the detail stays in the logs.
 */
[[nodiscard]] inline auto errorBody(const extension::ExtensionError& error)
    -> nlohmann::json {
    return errorBody(extension::extensionErrorCodeToString(error.code),
                     error.message());
}

}  // namespace shiori::server::utils

#endif  // SHIORI_SERVER_UTILS_ERROR_STATUS_HPP
