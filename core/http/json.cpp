#include "json.hpp"

namespace greenhouse {
namespace http {

namespace {

bool read_string_field(const nlohmann::json &json, const char *key, std::string &out, std::string &error) {
    const auto &value = json.at(key);
    if (!value.is_string()) {
        error = std::string("Field '") + key + "' must be a string";
        return false;
    }
    out = value.get<std::string>();
    return true;
}

bool read_number_field(const nlohmann::json &json, const char *key, double &out, std::string &error) {
    const auto &value = json.at(key);
    if (!value.is_number()) {
        error = std::string("Field '") + key + "' must be a number";
        return false;
    }
    out = value.get<double>();
    return true;
}

bool read_bool_field(const nlohmann::json &json, const char *key, bool &out, std::string &error) {
    const auto &value = json.at(key);
    if (!value.is_boolean()) {
        error = std::string("Field '") + key + "' must be a boolean";
        return false;
    }
    out = value.get<bool>();
    return true;
}

bool require_field(const nlohmann::json &json, const char *key, std::string &error) {
    if (!json.contains(key)) {
        error = std::string("Missing required field '") + key + "'";
        return false;
    }
    return true;
}

}  // namespace

nlohmann::json encode_plant(const plants::Plant &plant) {
    return {{"id", plant.id},
            {"name", plant.name},
            {"image", plant.image},
            {"price", plant.price},
            {"is_in_stock", plant.is_in_stock}};
}

nlohmann::json encode_plant_list(const std::vector<plants::Plant> &plants) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &plant : plants) {
        list.push_back(encode_plant(plant));
    }
    return list;
}

bool parse_json_body(const std::string &body, nlohmann::json &json, std::string &error) {
    if (body.empty()) {
        error = "Request body must be a JSON object";
        return false;
    }
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception &e) {
        // parse_error, and out_of_range for numbers that overflow a double
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    return true;
}

bool decode_new_plant(const nlohmann::json &json, plants::NewPlant &fields, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!require_field(json, "name", error) || !read_string_field(json, "name", fields.name, error)) {
        return false;
    }
    if (!require_field(json, "image", error) || !read_string_field(json, "image", fields.image, error)) {
        return false;
    }
    if (!require_field(json, "price", error) || !read_number_field(json, "price", fields.price, error)) {
        return false;
    }

    fields.is_in_stock = true;
    if (json.contains("is_in_stock") && !read_bool_field(json, "is_in_stock", fields.is_in_stock, error)) {
        return false;
    }

    return true;
}

bool decode_plant_patch(const nlohmann::json &json, plants::PlantPatch &patch, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    patch = plants::PlantPatch{};

    if (json.contains("name")) {
        std::string name;
        if (!read_string_field(json, "name", name, error)) {
            return false;
        }
        patch.name = name;
    }
    if (json.contains("image")) {
        std::string image;
        if (!read_string_field(json, "image", image, error)) {
            return false;
        }
        patch.image = image;
    }
    if (json.contains("price")) {
        double price = 0.0;
        if (!read_number_field(json, "price", price, error)) {
            return false;
        }
        patch.price = price;
    }
    if (json.contains("is_in_stock")) {
        bool in_stock = true;
        if (!read_bool_field(json, "is_in_stock", in_stock, error)) {
            return false;
        }
        patch.is_in_stock = in_stock;
    }

    return true;
}

}  // namespace http
}  // namespace greenhouse
