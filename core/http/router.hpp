#pragma once

#include <optional>
#include <string>

namespace squirrel {
namespace http {

// The only resource this server knows
inline constexpr const char *kResourceName = "squirrels";

enum class Action { INDEX, RETRIEVE, CREATE, UPDATE, DELETE, METHOD_NOT_ALLOWED, NOT_FOUND };

// Resource name and optional id extracted from a request path
struct ResourcePath {
    std::string resource;
    std::optional<std::string> id;
};

struct Route {
    Action action = Action::NOT_FOUND;
    std::string resource_id;  // set for RETRIEVE, UPDATE, DELETE
};

/**
 * @brief Split a request path into resource name and optional id
 *
 *   /squirrels        -> ("squirrels", none)
 *   /squirrels/       -> ("squirrels", none)
 *   /squirrels/12     -> ("squirrels", "12")
 *   /squirrels/12/x   -> ("squirrels", "12")
 *   /                 -> ("", none)
 *
 * The path is the raw request target: it is split on '/' only, so a query
 * string or percent-escape stays part of its segment ("/squirrels?x=1" names
 * the resource "squirrels?x=1"). A path that does not start with '/' yields
 * ("", none). The id is not validated here.
 */
ResourcePath parse_path(const std::string &path);

/**
 * @brief Map (method, path) to exactly one route
 *
 * PATCH is METHOD_NOT_ALLOWED for every path. Otherwise the resource must be
 * "squirrels":
 *   GET    -> INDEX / RETRIEVE(id)
 *   POST   -> CREATE (with id: NOT_FOUND)
 *   PUT    -> UPDATE(id) (without id: NOT_FOUND)
 *   DELETE -> DELETE(id) (without id: NOT_FOUND)
 * Any other method is NOT_FOUND. Methods are matched case-sensitively.
 */
Route route_request(const std::string &method, const std::string &path);

std::string action_to_string(Action action);

}  // namespace http
}  // namespace squirrel
