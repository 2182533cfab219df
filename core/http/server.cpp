#include "server.hpp"

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace squirrel {
namespace http {

namespace {
constexpr int kMillisPerSecond = 1000;
constexpr size_t kWorkerThreads = 1;

// Catch-all pattern; routing decisions are made by route_request()
constexpr const char *kAnyPath = R"(/.*)";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, store::IRecordStore &store)
    : config_(config), store_(store) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(config_.read_timeout_ms / kMillisPerSecond,
                              (config_.read_timeout_ms % kMillisPerSecond) * kMillisPerSecond);
    server_->set_write_timeout(config_.write_timeout_ms / kMillisPerSecond,
                               (config_.write_timeout_ms % kMillisPerSecond) * kMillisPerSecond);

    // One worker: requests are processed strictly one after another
    server_->new_task_queue = [] { return new httplib::ThreadPool(kWorkerThreads); };

    setup_routes();

    // Library-generated errors (unparseable request line, oversized payload, ...)
    // get the same plain-text status line as handler errors.
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        LOG_DEBUG("[HTTP] " << req.method << " " << req.path << " -> " << res.status << " (library)");
        if (res.status == status_code_to_http(StatusCode::NOT_FOUND)) {
            res.set_content(status_line(StatusCode::NOT_FOUND), "text/plain");
        } else if (res.status == status_code_to_http(StatusCode::METHOD_NOT_ALLOWED)) {
            res.set_content(status_line(StatusCode::METHOD_NOT_ALLOWED), "text/plain");
        } else if (res.status == status_code_to_http(StatusCode::BAD_REQUEST)) {
            res.set_content(status_line(StatusCode::BAD_REQUEST), "text/plain");
        }
    });

    // A throwing handler must never drop the connection; report it as a client error
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            LOG_ERROR("[HTTP] Exception handling " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            LOG_ERROR("[HTTP] Unknown exception handling " << req.method << " " << req.path);
        }
        send_text(res, StatusCode::BAD_REQUEST);
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    auto handler = [this](const httplib::Request &req, httplib::Response &res) { dispatch(req, res); };

    // GET also receives HEAD requests
    server_->Get(kAnyPath, handler);
    server_->Post(kAnyPath, handler);
    server_->Put(kAnyPath, handler);
    server_->Delete(kAnyPath, handler);
    server_->Patch(kAnyPath, handler);
    server_->Options(kAnyPath, handler);

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET    /" << kResourceName);
    LOG_INFO("[HTTP]   GET    /" << kResourceName << "/{id}");
    LOG_INFO("[HTTP]   POST   /" << kResourceName);
    LOG_INFO("[HTTP]   PUT    /" << kResourceName << "/{id}");
    LOG_INFO("[HTTP]   DELETE /" << kResourceName << "/{id}");
}

void HttpServer::dispatch(const httplib::Request &req, httplib::Response &res) {
    // Route on the raw target; req.path has lost its query and been percent-decoded
    const Route route = route_request(req.method, req.target);

    switch (route.action) {
        case Action::INDEX:
            handle_index(res);
            break;
        case Action::RETRIEVE:
            handle_retrieve(route.resource_id, res);
            break;
        case Action::CREATE:
            handle_create(req, res);
            break;
        case Action::UPDATE:
            handle_update(route.resource_id, req, res);
            break;
        case Action::DELETE:
            handle_delete(route.resource_id, res);
            break;
        case Action::METHOD_NOT_ALLOWED:
            handle_method_not_allowed(res);
            break;
        case Action::NOT_FOUND:
        default:
            handle_not_found(res);
            break;
    }

    LOG_DEBUG("[HTTP] " << req.method << " " << req.target << " [" << action_to_string(route.action) << "] -> "
                        << res.status);
}

}  // namespace http
}  // namespace squirrel
