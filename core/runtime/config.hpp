#pragma once

#include <string>

namespace squirrel {
namespace runtime {

enum class StoreBackend { FILE, MEMORY };

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8080;                 // HTTP port
    int read_timeout_ms = 5000;      // Per-connection read timeout
    int write_timeout_ms = 5000;     // Per-connection write timeout
};

struct StoreConfig {
    StoreBackend backend = StoreBackend::FILE;
    std::string path = "squirrel_db.json";  // Only used by the file backend
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ServerConfig {
    HttpConfig http;
    StoreConfig store;
    LoggingConfig logging;
};

// Loads configuration from a YAML file, then validates it
bool load_config(const std::string &config_path, ServerConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServerConfig &config, std::string &error);

bool parse_store_backend(const std::string &text, StoreBackend &backend);
std::string store_backend_to_string(StoreBackend backend);

}  // namespace runtime
}  // namespace squirrel
