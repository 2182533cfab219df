#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace squirrel {
namespace runtime {

bool parse_store_backend(const std::string &text, StoreBackend &backend) {
    if (text == "file") {
        backend = StoreBackend::FILE;
        return true;
    }
    if (text == "memory") {
        backend = StoreBackend::MEMORY;
        return true;
    }
    return false;
}

std::string store_backend_to_string(StoreBackend backend) {
    switch (backend) {
        case StoreBackend::FILE:
            return "file";
        case StoreBackend::MEMORY:
            return "memory";
        default:
            return "unknown";
    }
}

bool validate_config(const ServerConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.read_timeout_ms < 1 || config.http.write_timeout_ms < 1) {
        error = "HTTP read/write timeouts must be >= 1ms";
        return false;
    }

    // Validate store settings
    if (config.store.backend == StoreBackend::FILE && config.store.path.empty()) {
        error = "store.path is required for the file backend";
        return false;
    }

    // Validate logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServerConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // An empty document leaves every default in place
        if (yaml.IsNull()) {
            LOG_WARN("[Config] " << config_path << " is empty, using defaults");
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "store", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["read_timeout_ms"]) {
                config.http.read_timeout_ms = http["read_timeout_ms"].as<int>();
            }
            if (http["write_timeout_ms"]) {
                config.http.write_timeout_ms = http["write_timeout_ms"].as<int>();
            }
        }

        // Load store config
        if (yaml["store"]) {
            const auto &store = yaml["store"];
            if (store["backend"]) {
                auto backend_str = store["backend"].as<std::string>();
                if (!parse_store_backend(backend_str, config.store.backend)) {
                    error = "Invalid store.backend '" + backend_str + "': must be file or memory";
                    return false;
                }
            }
            if (store["path"]) {
                config.store.path = store["path"].as<std::string>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port);

        std::stringstream store_msg;
        store_msg << "[Config] Store: " << store_backend_to_string(config.store.backend);
        if (config.store.backend == StoreBackend::FILE) {
            store_msg << " (" << config.store.path << ")";
        }
        LOG_INFO(store_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace squirrel
