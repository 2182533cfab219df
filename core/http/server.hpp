#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "router.hpp"
#include "runtime/config.hpp"
#include "store/i_record_store.hpp"

namespace squirrel {
namespace http {

/**
 * @brief HTTP front end for the squirrels resource
 *
 * Every request, whatever its method or path, is funneled into dispatch(),
 * which asks the router for a Route and runs the matching action handler
 * against the injected record store.
 *
 * Thread model:
 * - The accept loop runs in its own thread (httplib::Server::listen_after_bind)
 * - Requests are handled by a single worker, so one request is fully
 *   processed before the next begins and the store needs no locking
 *
 * Lifecycle:
 * - start() binds to the configured address/port and spawns the server thread
 * - stop() signals shutdown and joins the server thread
 */
class HttpServer {
public:
    /**
     * @brief Construct HTTP server
     *
     * @param config HTTP configuration (bind address, port, timeouts)
     * @param store Opened record store; must outlive the server
     */
    HttpServer(const runtime::HttpConfig &config, store::IRecordStore &store);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    store::IRecordStore &store_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
    void dispatch(const httplib::Request &req, httplib::Response &res);

    // Resolve a path id to a stored record; malformed ids resolve to nullopt
    std::optional<store::Record> find_record(const std::string &resource_id) const;

    // Action handlers (implemented in handlers/squirrel_handlers.cpp)
    void handle_index(httplib::Response &res);
    void handle_retrieve(const std::string &resource_id, httplib::Response &res);
    void handle_create(const httplib::Request &req, httplib::Response &res);
    void handle_update(const std::string &resource_id, const httplib::Request &req, httplib::Response &res);
    void handle_delete(const std::string &resource_id, httplib::Response &res);
    void handle_method_not_allowed(httplib::Response &res);
    void handle_not_found(httplib::Response &res);
};

}  // namespace http
}  // namespace squirrel
