// Greenhouse plant service
// Config-based server with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "greenhouse.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: greenhouse-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: greenhouse.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("Greenhouse plant service starting...");
    LOG_INFO("Loading config: " << config_path);

    greenhouse::runtime::RuntimeConfig config;
    std::string error;

    if (!greenhouse::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    greenhouse::logging::Logger::set_level(greenhouse::logging::string_to_level(config.logging.level));

    greenhouse::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    greenhouse::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Listening: " << config.http.bind << ":" << config.http.port);
    LOG_INFO("  Database:  " << config.database.path);
    LOG_INFO("  Log level: " << greenhouse::logging::level_to_string(greenhouse::logging::Logger::level()));

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
