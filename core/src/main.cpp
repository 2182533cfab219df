// Squirrel Server
// Config-based entry point with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    const std::string default_config_path = "squirrel-server.yaml";
    std::string config_path = default_config_path;
    bool explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            explicit_config = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: squirrel-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: " << default_config_path << ")\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    squirrel::runtime::ServerConfig config;
    std::string error;

    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loading config: " << config_path);
        if (!squirrel::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    } else if (explicit_config) {
        // Using cerr here as logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    } else {
        LOG_INFO("No " << default_config_path << " found, using built-in defaults");
    }

    squirrel::logging::Logger::set_level(squirrel::logging::string_to_level(config.logging.level));

    squirrel::runtime::SignalHandler::install();

    squirrel::runtime::Runtime runtime(config);
    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("squirrel-server running at " << config.http.bind << ":" << config.http.port);
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
