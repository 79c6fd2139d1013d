#include "../../logging/logger.hpp"
#include "../../plants/plant_service.hpp"
#include "../json.hpp"
#include "../server.hpp"

namespace greenhouse {
namespace http {

//=============================================================================
// GET /plants
//=============================================================================
void HttpServer::handle_get_plants(const httplib::Request &, httplib::Response &res) {
    auto result = plant_service_.list_plants();
    if (!result.success) {
        LOG_ERROR("[HTTP] GET /plants failed: " << result.error_message);
        send_json(res, StatusCode::INTERNAL, make_errors_response(result.error_message));
        return;
    }

    LOG_DEBUG("[HTTP] GET /plants -> " << result.plants.size() << " plant(s)");
    send_json(res, StatusCode::OK, encode_plant_list(result.plants));
}

//=============================================================================
// POST /plants
//=============================================================================
void HttpServer::handle_post_plants(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    plants::NewPlant fields;
    std::string error;

    if (!parse_json_body(req.body, body, error) || !decode_new_plant(body, fields, error)) {
        LOG_WARN("[HTTP] POST /plants rejected: " << error);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_errors_response(error));
        return;
    }

    auto result = plant_service_.create_plant(fields);
    if (!result.success) {
        // Validation and storage failures share the 400 contract
        LOG_WARN("[HTTP] POST /plants failed (" << plants::plant_status_to_string(result.status)
                                                << "): " << result.error_message);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_errors_response(result.error_message));
        return;
    }

    LOG_DEBUG("[HTTP] POST /plants -> created " << result.plant->id);
    send_json(res, StatusCode::CREATED, encode_plant(*result.plant));
}

}  // namespace http
}  // namespace greenhouse
