#include "../../logging/logger.hpp"
#include "../../plants/plant_service.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace greenhouse {
namespace http {

//=============================================================================
// GET /plants/{id}
//=============================================================================
void HttpServer::handle_get_plant(const httplib::Request &req, httplib::Response &res) {
    int64_t id = 0;
    if (!parse_plant_id(req, id)) {
        send_not_found(res);
        return;
    }

    auto result = plant_service_.get_plant(id);
    if (!result.success) {
        if (result.status == plants::PlantStatus::NOT_FOUND) {
            send_not_found(res);
            return;
        }
        LOG_ERROR("[HTTP] GET /plants/" << id << " failed: " << result.error_message);
        send_json(res, StatusCode::INTERNAL, make_errors_response(result.error_message));
        return;
    }

    LOG_DEBUG("[HTTP] GET /plants/" << id);
    send_json(res, StatusCode::OK, encode_plant(*result.plant));
}

//=============================================================================
// PATCH /plants/{id}
//=============================================================================
void HttpServer::handle_patch_plant(const httplib::Request &req, httplib::Response &res) {
    int64_t id = 0;
    if (!parse_plant_id(req, id)) {
        send_not_found(res);
        return;
    }

    nlohmann::json body;
    plants::PlantPatch patch;
    std::string error;

    if (!parse_json_body(req.body, body, error) || !decode_plant_patch(body, patch, error)) {
        // An unknown id wins over a bad body
        auto existing = plant_service_.get_plant(id);
        if (!existing.success && existing.status == plants::PlantStatus::NOT_FOUND) {
            send_not_found(res);
            return;
        }
        LOG_WARN("[HTTP] PATCH /plants/" << id << " rejected: " << error);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_errors_response(error));
        return;
    }

    auto result = plant_service_.update_plant(id, patch);
    if (!result.success) {
        if (result.status == plants::PlantStatus::NOT_FOUND) {
            send_not_found(res);
            return;
        }
        LOG_WARN("[HTTP] PATCH /plants/" << id << " failed (" << plants::plant_status_to_string(result.status)
                                         << "): " << result.error_message);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_errors_response(result.error_message));
        return;
    }

    LOG_DEBUG("[HTTP] PATCH /plants/" << id << " -> updated");
    send_json(res, StatusCode::OK, encode_plant(*result.plant));
}

//=============================================================================
// DELETE /plants/{id}
//=============================================================================
void HttpServer::handle_delete_plant(const httplib::Request &req, httplib::Response &res) {
    int64_t id = 0;
    if (!parse_plant_id(req, id)) {
        send_not_found(res);
        return;
    }

    auto result = plant_service_.delete_plant(id);
    if (!result.success) {
        if (result.status == plants::PlantStatus::NOT_FOUND) {
            send_not_found(res);
            return;
        }
        LOG_ERROR("[HTTP] DELETE /plants/" << id << " failed: " << result.error_message);
        send_json(res, StatusCode::INTERNAL, make_errors_response(result.error_message));
        return;
    }

    LOG_DEBUG("[HTTP] DELETE /plants/" << id << " -> deleted");
    res.status = status_code_to_http(StatusCode::NO_CONTENT);
}

}  // namespace http
}  // namespace greenhouse
