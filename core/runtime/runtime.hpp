#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "plants/plant_service.hpp"
#include "storage/database.hpp"
#include "storage/sqlite_plant_store.hpp"

namespace greenhouse {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Open storage, wire the plant service and start HTTP
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop HTTP and close the database
    void shutdown();

    plants::PlantService &get_plant_service() { return *plant_service_; }
    const http::HttpServer *get_http_server() const { return http_server_.get(); }

private:
    bool init_storage(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    // Destroyed in reverse order: server before database
    std::unique_ptr<storage::Database> database_;
    std::unique_ptr<storage::SqlitePlantStore> plant_store_;
    std::unique_ptr<plants::PlantService> plant_service_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace greenhouse
