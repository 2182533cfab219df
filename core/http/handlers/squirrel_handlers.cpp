#include "../form.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "logging/logger.hpp"
#include "utils.hpp"

namespace squirrel {
namespace http {

namespace {

constexpr const char *kMissingFields = "Missing or empty 'name' or 'size'";

// Both fields must be present with a non-empty value
bool read_required_fields(const httplib::Request &req, std::string &name, std::string &size) {
    const FormFields fields = parse_form_body(req.body, req.get_header_value("Content-Length"));

    auto name_it = fields.find("name");
    auto size_it = fields.find("size");
    if (name_it == fields.end() || size_it == fields.end() || name_it->second.empty() || size_it->second.empty()) {
        return false;
    }

    name = name_it->second;
    size = size_it->second;
    return true;
}

}  // namespace

std::optional<store::Record> HttpServer::find_record(const std::string &resource_id) const {
    auto id = store::parse_record_id(resource_id);
    if (!id) {
        return std::nullopt;
    }
    return store_.get(*id);
}

//=============================================================================
// GET /squirrels
//=============================================================================
void HttpServer::handle_index(httplib::Response &res) { send_json(res, StatusCode::OK, encode_records(store_.list())); }

//=============================================================================
// GET /squirrels/{id}
//=============================================================================
void HttpServer::handle_retrieve(const std::string &resource_id, httplib::Response &res) {
    auto record = find_record(resource_id);
    if (!record) {
        handle_not_found(res);
        return;
    }

    send_json(res, StatusCode::OK, encode_record(*record));
}

//=============================================================================
// POST /squirrels
//=============================================================================
void HttpServer::handle_create(const httplib::Request &req, httplib::Response &res) {
    std::string name, size;
    if (!read_required_fields(req, name, size)) {
        send_text(res, StatusCode::BAD_REQUEST, kMissingFields);
        return;
    }

    store::Record created;
    if (!store_.insert(name, size, created)) {
        LOG_WARN("[HTTP] Create failed: " << store_.last_error());
        send_text(res, StatusCode::BAD_REQUEST, "Could not create squirrel with provided data");
        return;
    }

    LOG_DEBUG("[HTTP] Created squirrel " << created.id);
    send_empty(res, StatusCode::CREATED);
}

//=============================================================================
// PUT /squirrels/{id}
//=============================================================================
void HttpServer::handle_update(const std::string &resource_id, const httplib::Request &req, httplib::Response &res) {
    // Existence is checked before the body is looked at
    auto record = find_record(resource_id);
    if (!record) {
        handle_not_found(res);
        return;
    }

    std::string name, size;
    if (!read_required_fields(req, name, size)) {
        send_text(res, StatusCode::BAD_REQUEST, kMissingFields);
        return;
    }

    if (!store_.update(record->id, name, size)) {
        LOG_WARN("[HTTP] Update of squirrel " << record->id << " failed: " << store_.last_error());
        send_text(res, StatusCode::BAD_REQUEST, "Could not update squirrel with provided data");
        return;
    }

    send_empty(res, StatusCode::NO_CONTENT);
}

//=============================================================================
// DELETE /squirrels/{id}
//=============================================================================
void HttpServer::handle_delete(const std::string &resource_id, httplib::Response &res) {
    auto record = find_record(resource_id);
    if (!record) {
        handle_not_found(res);
        return;
    }

    if (!store_.remove(record->id)) {
        LOG_WARN("[HTTP] Delete of squirrel " << record->id << " failed: " << store_.last_error());
        send_text(res, StatusCode::BAD_REQUEST, "Could not delete squirrel");
        return;
    }

    send_empty(res, StatusCode::NO_CONTENT);
}

void HttpServer::handle_method_not_allowed(httplib::Response &res) {
    send_text(res, StatusCode::METHOD_NOT_ALLOWED);
}

void HttpServer::handle_not_found(httplib::Response &res) { send_text(res, StatusCode::NOT_FOUND); }

}  // namespace http
}  // namespace squirrel
