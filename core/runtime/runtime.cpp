#include "runtime.hpp"

#include <chrono>
#include <thread>
#include <vector>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace greenhouse {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing greenhouse");

    if (!init_storage(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_storage(std::string &error) {
    try {
        database_ = std::make_unique<storage::Database>(config_.database.path, config_.database.busy_timeout_ms);
        database_->ensure_schema();
    } catch (const storage::DatabaseError &e) {
        error = "Database initialization failed: " + std::string(e.what());
        database_.reset();
        return false;
    }

    plant_store_ = std::make_unique<storage::SqlitePlantStore>(*database_);
    plant_service_ = std::make_unique<plants::PlantService>(*plant_store_);

    std::vector<plants::Plant> existing;
    std::string list_error;
    if (!plant_store_->list_plants(existing, list_error)) {
        error = "Cannot read plants table: " + list_error;
        return false;
    }
    LOG_INFO("[Runtime] Database " << config_.database.path << " holds " << existing.size() << " plant(s)");
    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *plant_service_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal " << SignalHandler::last_signal() << " received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }

    plant_service_.reset();
    plant_store_.reset();

    if (database_) {
        LOG_INFO("[Runtime] Closing database");
        database_.reset();
    }
}

}  // namespace runtime
}  // namespace greenhouse
