#pragma once

#include <string>
#include <vector>

namespace greenhouse {
namespace runtime {

struct HttpConfig {
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 5555;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
    bool pretty_json = true;                             // Indent response bodies
};

struct DatabaseConfig {
    std::string path = "plants.db";  // SQLite file (":memory:" for a private in-memory store)
    int busy_timeout_ms = 5000;      // Wait on a locked database before failing
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    HttpConfig http;
    DatabaseConfig database;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace greenhouse
