#ifndef SHIORI_SERVER_UTILS_RESPONSE_HPP
#define SHIORI_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <string>
#include "atom/type/json.hpp"
#include "error_status.hpp"

namespace shiori::server::utils {

/**
 * @brief Utility class for creating standardized API responses
 */
class ResponseBuilder {
public:
    /**
     * @brief Create a successful JSON response
     */
    static crow::response success(const nlohmann::json& data, int code = 200) {
        nlohmann::json body = {
            {"status", "success"},
            {"data", data}
        };
        return makeJsonResponse(body, code);
    }

    /**
     * @brief Create a successful JSON response with custom message
     */
    static crow::response successWithMessage(const std::string& message,
                                             const nlohmann::json& data = nullptr,
                                             int code = 200) {
        nlohmann::json body = {
            {"status", "success"},
            {"message", message}
        };
        if (!data.is_null()) {
            body["data"] = data;
        }
        return makeJsonResponse(body, code);
    }

    /**
     * @brief Create an error response
     */
    static crow::response error(const std::string& code,
                               const std::string& message,
                               int httpCode = 400,
                               const nlohmann::json& details = nullptr) {
        return makeJsonResponse(errorBody(code, message, details), httpCode);
    }

    /**
     * @brief Liveness check body, {"status":"ok"}
     */
    static crow::response health() {
        return makeJsonResponse({{"status", "ok"}}, 200);
    }

    /**
     * @brief Error response for a failed lifecycle or catalog operation
     */
    static crow::response fromError(const extension::ExtensionError& err) {
        return makeJsonResponse(errorBody(err), httpStatusFor(err.code));
    }

    /**
     * @brief Invalid field value error (400)
     */
    static crow::response invalidFieldValue(const std::string& fieldName,
                                           const std::string& constraint = "") {
        nlohmann::json details = {{"field", fieldName}};
        if (!constraint.empty()) {
            details["constraint"] = constraint;
        }
        return error("invalid_field_value",
                    "Field '" + fieldName + "' has an invalid value.",
                    400,
                    details);
    }

    /**
     * @brief Missing required field error (400)
     */
    static crow::response missingField(const std::string& fieldName) {
        return error("missing_required_field",
                    "Required field '" + fieldName + "' is missing.",
                    400,
                    {{"field", fieldName}});
    }

    /**
     * @brief Invalid JSON error (400)
     */
    static crow::response invalidJson(const std::string& parseError) {
        return error("invalid_json",
                    "The request body is not valid JSON: " + parseError,
                    400);
    }

    /**
     * @brief Internal server error (500)
     */
    static crow::response internalError(const std::string& message = "An unexpected error occurred") {
        return error("internal_error", message, 500);
    }

private:
    static crow::response makeJsonResponse(const nlohmann::json& body, int code) {
        crow::response res(code);
        res.set_header("Content-Type", "application/json");
        res.write(body.dump());
        return res;
    }
};

}  // namespace shiori::server::utils

#endif  // SHIORI_SERVER_UTILS_RESPONSE_HPP
