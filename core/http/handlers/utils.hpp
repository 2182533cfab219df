#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace squirrel {
namespace http {

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

// Helper: Send plain-text response; the body defaults to the status line
inline void send_text(httplib::Response &res, StatusCode code, const std::string &message = "") {
    res.status = status_code_to_http(code);
    res.set_content(message.empty() ? status_line(code) : message, "text/plain");
}

// Helper: Send status with an empty body and no Content-Type
inline void send_empty(httplib::Response &res, StatusCode code) {
    res.status = status_code_to_http(code);
    res.body.clear();
}

}  // namespace http
}  // namespace squirrel
