#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"
#include "store/file_record_store.hpp"
#include "store/memory_record_store.hpp"

namespace squirrel {
namespace runtime {

namespace {
constexpr auto kLoopInterval = std::chrono::milliseconds(100);
}  // namespace

Runtime::Runtime(const ServerConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing squirrel server");

    if (!init_store(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_store(std::string &error) {
    switch (config_.store.backend) {
        case StoreBackend::MEMORY:
            store_ = std::make_unique<store::MemoryRecordStore>();
            break;
        case StoreBackend::FILE:
        default:
            store_ = std::make_unique<store::FileRecordStore>(config_.store.path);
            break;
    }

    std::string store_error;
    if (!store_->open(store_error)) {
        error = "Store initialization failed: " + store_error;
        return false;
    }

    LOG_INFO("[Runtime] Store ready (" << store_backend_to_string(config_.store.backend) << ", " << store_->size()
                                       << " record(s))");
    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *store_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        http_server_.reset();
        return false;
    }
    return true;
}

void Runtime::run() {
    running_ = true;
    LOG_INFO("[Runtime] Running (Ctrl+C to stop)");

    while (running_) {
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Shutdown signal received");
            running_ = false;
            break;
        }
        std::this_thread::sleep_for(kLoopInterval);
    }

    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Shutting down");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace squirrel
