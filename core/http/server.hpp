#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "errors.hpp"
#include "runtime/config.hpp"

namespace greenhouse {
namespace plants {
class PlantService;
}

namespace http {

/**
 * @brief HTTP server exposing the plant collection
 *
 * Routes requests to the PlantService and shapes every response as JSON.
 * Requests that match no route get the uniform not-found body.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Handlers keep no state between requests; PlantService and the store
 *   serialize access to the database
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, CORS, pool size)
     * @param plant_service Plant operations; must outlive the server
     */
    HttpServer(const runtime::HttpConfig &config, plants::PlantService &plant_service);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    plants::PlantService &plant_service_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Collection: /plants
    void handle_get_plants(const httplib::Request &req, httplib::Response &res);
    void handle_post_plants(const httplib::Request &req, httplib::Response &res);

    // Single item: /plants/{id}
    void handle_get_plant(const httplib::Request &req, httplib::Response &res);
    void handle_patch_plant(const httplib::Request &req, httplib::Response &res);
    void handle_delete_plant(const httplib::Request &req, httplib::Response &res);

    void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) const;
    void send_not_found(httplib::Response &res) const;
};

}  // namespace http
}  // namespace greenhouse
