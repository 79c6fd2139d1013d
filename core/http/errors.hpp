#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace greenhouse {
namespace http {

/**
 * @brief Response status classes mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - CREATED -> HTTP 201
 * - NO_CONTENT -> HTTP 204
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, CREATED, NO_CONTENT, INVALID_ARGUMENT, NOT_FOUND, INTERNAL };

/**
 * @brief Convert StatusCode to HTTP status integer
 */
inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::CREATED:
            return 201;
        case StatusCode::NO_CONTENT:
            return 204;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::INTERNAL:
            return 500;
        default:
            return 500;
    }
}

// Body of every "not found" response, for unknown ids and unmatched routes alike
constexpr const char *kPlantNotFoundMessage = "Plant not found";

/**
 * @brief Build the uniform not-found body
 *
 * {"error": "Plant not found"}
 */
inline nlohmann::json make_not_found_response() { return {{"error", kPlantNotFoundMessage}}; }

/**
 * @brief Build a failure body carrying a free-text cause
 *
 * {"errors": [message]}
 */
inline nlohmann::json make_errors_response(const std::string &message) {
    return {{"errors", nlohmann::json::array({message})}};
}

}  // namespace http
}  // namespace greenhouse
