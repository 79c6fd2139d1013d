#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "plants/plant.hpp"

namespace greenhouse {
namespace http {

/**
 * @brief JSON encoding utilities for plant records
 *
 * The dictionary form of a plant is a flat object:
 *   {"id": int, "name": string, "image": string, "price": number, "is_in_stock": bool}
 */

nlohmann::json encode_plant(const plants::Plant &plant);
nlohmann::json encode_plant_list(const std::vector<plants::Plant> &plants);

// Decode functions for incoming requests
// Type checks only; value policy (empty name, negative price) lives in PlantService.
bool decode_new_plant(const nlohmann::json &json, plants::NewPlant &fields, std::string &error);

// Unknown keys and "id" are ignored
bool decode_plant_patch(const nlohmann::json &json, plants::PlantPatch &patch, std::string &error);

// Parse a request body; empty or malformed bodies fail with a message
bool parse_json_body(const std::string &body, nlohmann::json &json, std::string &error);

}  // namespace http
}  // namespace greenhouse
