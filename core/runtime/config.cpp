#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>

#include "../logging/logger.hpp"

namespace greenhouse {
namespace runtime {

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate Database settings
    if (config.database.path.empty()) {
        error = "database.path must not be empty";
        return false;
    }
    if (config.database.busy_timeout_ms < 0) {
        error = "database.busy_timeout_ms must be >= 0";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "database", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
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

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["pretty_json"]) {
                config.http.pretty_json = http["pretty_json"].as<bool>();
            }
        }

        // Load database config
        if (yaml["database"]) {
            const auto &database = yaml["database"];
            if (database["path"]) {
                config.database.path = database["path"].as<std::string>();
            }
            if (database["busy_timeout_ms"]) {
                config.database.busy_timeout_ms = database["busy_timeout_ms"].as<int>();
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

        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " worker threads)");
        LOG_INFO("[Config] Database: " << config.database.path);
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
}  // namespace greenhouse
