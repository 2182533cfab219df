#pragma once

#include <string>

namespace squirrel {
namespace http {

/**
 * @brief Response status model for the squirrels resource
 *
 * - OK -> HTTP 200
 * - CREATED -> HTTP 201
 * - NO_CONTENT -> HTTP 204
 * - BAD_REQUEST -> HTTP 400 (missing/empty field, unparseable body, store rejection)
 * - NOT_FOUND -> HTTP 404 (unknown route, resource or id)
 * - METHOD_NOT_ALLOWED -> HTTP 405 (PATCH)
 *
 * There is deliberately no 5xx member: every failure is reported as a client error.
 */
enum class StatusCode { OK, CREATED, NO_CONTENT, BAD_REQUEST, NOT_FOUND, METHOD_NOT_ALLOWED };

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
        case StatusCode::BAD_REQUEST:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::METHOD_NOT_ALLOWED:
            return 405;
        default:
            return 400;
    }
}

/**
 * @brief Plain-text status line used as the body of error responses
 *
 * Success codes never carry a status-line body and fall through to the
 * default.
 */
inline std::string status_line(StatusCode code) {
    switch (code) {
        case StatusCode::BAD_REQUEST:
            return "400 Bad Request";
        case StatusCode::NOT_FOUND:
            return "404 Not Found";
        case StatusCode::METHOD_NOT_ALLOWED:
            return "405 Method Not Allowed";
        default:
            return "400 Bad Request";
    }
}

}  // namespace http
}  // namespace squirrel
