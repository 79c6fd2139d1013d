#include "server.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace greenhouse {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusNotFound = 404;
constexpr const char *kAllowedMethods = "GET, POST, PATCH, DELETE, OPTIONS";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, plants::PlantService &plant_service)
    : config_(config), plant_service_(plant_service) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) const {
    res.status = status_code_to_http(code);
    res.set_content(config_.pretty_json ? body.dump(2) : body.dump(), "application/json");
}

void HttpServer::send_not_found(httplib::Response &res) const {
    send_json(res, StatusCode::NOT_FOUND, make_not_found_response());
}

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string &allowed = *matched;
        const std::string response_origin = allowed == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin);
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // Unmatched routes (and any 404 without a body) share the plant not-found body.
    // Other error statuses without a body are left untouched.
    server_->set_error_handler([this](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        if (res.status == kStatusNotFound) {
            LOG_DEBUG("[HTTP] No route for " << req.method << " " << req.path);
            send_not_found(res);
        }
    });

    server_->set_exception_handler([this](const httplib::Request &req, httplib::Response &res,
                                          std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        send_json(res, StatusCode::INTERNAL, make_errors_response(msg));
    });

    if (!server_->bind_to_port(config_.bind, config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET /plants - List all plants
    server_->Get("/plants",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_plants(req, res); });

    // POST /plants - Create a plant
    server_->Post("/plants",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_plants(req, res); });

    // GET /plants/:id - Fetch one plant
    server_->Get(R"(/plants/(\d+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_plant(req, res); });

    // PATCH /plants/:id - Partial update
    server_->Patch(R"(/plants/(\d+))",
                   [this](const httplib::Request &req, httplib::Response &res) { handle_patch_plant(req, res); });

    // DELETE /plants/:id - Remove one plant
    server_->Delete(R"(/plants/(\d+))",
                    [this](const httplib::Request &req, httplib::Response &res) { handle_delete_plant(req, res); });

    // OPTIONS for CORS preflight on the collection and its items
    server_->Options(R"(/plants(/\d+)?)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET    /plants");
    LOG_INFO("[HTTP]   POST   /plants");
    LOG_INFO("[HTTP]   GET    /plants/{id}");
    LOG_INFO("[HTTP]   PATCH  /plants/{id}");
    LOG_INFO("[HTTP]   DELETE /plants/{id}");
}

}  // namespace http
}  // namespace greenhouse
