#include "router.hpp"

namespace squirrel {
namespace http {

ResourcePath parse_path(const std::string &path) {
    ResourcePath result;
    if (path.empty() || path[0] != '/') {
        return result;
    }

    const std::string clean = path.substr(1);

    const auto first_slash = clean.find('/');
    result.resource = clean.substr(0, first_slash);
    if (first_slash == std::string::npos) {
        return result;
    }

    const auto id_start = first_slash + 1;
    const auto id_end = clean.find('/', id_start);
    std::string id = clean.substr(id_start, id_end == std::string::npos ? std::string::npos : id_end - id_start);
    if (!id.empty()) {
        result.id = std::move(id);
    }
    return result;
}

Route route_request(const std::string &method, const std::string &path) {
    Route route;

    if (method == "PATCH") {
        route.action = Action::METHOD_NOT_ALLOWED;
        return route;
    }

    const ResourcePath target = parse_path(path);
    if (target.resource != kResourceName) {
        return route;
    }

    const bool has_id = target.id.has_value();
    if (has_id) {
        route.resource_id = *target.id;
    }

    if (method == "GET") {
        route.action = has_id ? Action::RETRIEVE : Action::INDEX;
    } else if (method == "POST") {
        route.action = has_id ? Action::NOT_FOUND : Action::CREATE;
    } else if (method == "PUT") {
        route.action = has_id ? Action::UPDATE : Action::NOT_FOUND;
    } else if (method == "DELETE") {
        route.action = has_id ? Action::DELETE : Action::NOT_FOUND;
    }

    if (route.action == Action::NOT_FOUND) {
        route.resource_id.clear();
    }
    return route;
}

std::string action_to_string(Action action) {
    switch (action) {
        case Action::INDEX:
            return "index";
        case Action::RETRIEVE:
            return "retrieve";
        case Action::CREATE:
            return "create";
        case Action::UPDATE:
            return "update";
        case Action::DELETE:
            return "delete";
        case Action::METHOD_NOT_ALLOWED:
            return "method_not_allowed";
        case Action::NOT_FOUND:
            return "not_found";
        default:
            return "unknown";
    }
}

}  // namespace http
}  // namespace squirrel
