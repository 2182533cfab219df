#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "store/i_record_store.hpp"

namespace squirrel {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const ServerConfig &config);
    ~Runtime();

    // Create and open the store, then start the HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the HTTP server; the store is released with the runtime
    void shutdown();

    store::IRecordStore &get_store() { return *store_; }
    const ServerConfig &get_config() const { return config_; }

private:
    bool init_store(std::string &error);
    bool init_http(std::string &error);

    ServerConfig config_;

    std::unique_ptr<store::IRecordStore> store_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace squirrel
