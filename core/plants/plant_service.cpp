#include "plant_service.hpp"

#include <cmath>
#include <utility>

#include "logging/logger.hpp"

namespace greenhouse {
namespace plants {

std::string plant_status_to_string(PlantStatus status) {
    switch (status) {
        case PlantStatus::OK:
            return "OK";
        case PlantStatus::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case PlantStatus::NOT_FOUND:
            return "NOT_FOUND";
        case PlantStatus::STORAGE_FAILURE:
            return "STORAGE_FAILURE";
        default:
            return "UNKNOWN";
    }
}

PlantService::PlantService(storage::IPlantStore &store) : store_(store) {}

PlantResult PlantService::failure(PlantStatus status, const std::string &message) {
    PlantResult result;
    result.success = false;
    result.status = status;
    result.error_message = message;
    return result;
}

bool PlantService::validate_name(const std::string &name, std::string &error) const {
    if (name.empty()) {
        error = "Field 'name' must not be empty";
        return false;
    }
    return true;
}

bool PlantService::validate_price(double price, std::string &error) const {
    if (!std::isfinite(price)) {
        error = "Field 'price' must be a finite number";
        return false;
    }
    if (price < 0.0) {
        error = "Field 'price' must be >= 0";
        return false;
    }
    return true;
}

bool PlantService::validate_new_plant(const NewPlant &fields, std::string &error) const {
    return validate_name(fields.name, error) && validate_price(fields.price, error);
}

bool PlantService::validate_patch(const PlantPatch &patch, std::string &error) const {
    if (patch.name && !validate_name(*patch.name, error)) {
        return false;
    }
    if (patch.price && !validate_price(*patch.price, error)) {
        return false;
    }
    return true;
}

PlantListResult PlantService::list_plants() {
    PlantListResult result;
    std::string error;
    if (!store_.list_plants(result.plants, error)) {
        result.success = false;
        result.status = PlantStatus::STORAGE_FAILURE;
        result.error_message = error;
        return result;
    }
    result.success = true;
    return result;
}

PlantResult PlantService::get_plant(int64_t id) {
    std::optional<Plant> plant;
    std::string error;
    if (!store_.find_plant(id, plant, error)) {
        return failure(PlantStatus::STORAGE_FAILURE, error);
    }
    if (!plant) {
        return failure(PlantStatus::NOT_FOUND, "Plant not found");
    }

    PlantResult result;
    result.success = true;
    result.plant = std::move(plant);
    return result;
}

PlantResult PlantService::create_plant(const NewPlant &fields) {
    std::string error;
    if (!validate_new_plant(fields, error)) {
        LOG_WARN("[PlantService] Rejected create: " << error);
        return failure(PlantStatus::INVALID_ARGUMENT, error);
    }

    Plant created;
    if (!store_.insert_plant(fields, created, error)) {
        return failure(PlantStatus::STORAGE_FAILURE, error);
    }

    LOG_INFO("[PlantService] Created plant " << created.id << " ('" << created.name << "')");

    PlantResult result;
    result.success = true;
    result.plant = created;
    return result;
}

PlantResult PlantService::update_plant(int64_t id, const PlantPatch &patch) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::optional<Plant> plant;
    std::string error;
    if (!store_.find_plant(id, plant, error)) {
        return failure(PlantStatus::STORAGE_FAILURE, error);
    }
    if (!plant) {
        return failure(PlantStatus::NOT_FOUND, "Plant not found");
    }

    if (!validate_patch(patch, error)) {
        LOG_WARN("[PlantService] Rejected update of plant " << id << ": " << error);
        return failure(PlantStatus::INVALID_ARGUMENT, error);
    }

    apply_patch(*plant, patch);

    // Nothing to write; still a successful update of zero fields
    if (!patch.empty()) {
        bool found = false;
        if (!store_.update_plant(*plant, found, error)) {
            return failure(PlantStatus::STORAGE_FAILURE, error);
        }
        // Deleted between the read and the write by another process
        if (!found) {
            return failure(PlantStatus::NOT_FOUND, "Plant not found");
        }
        LOG_INFO("[PlantService] Updated plant " << id);
    }

    PlantResult result;
    result.success = true;
    result.plant = std::move(plant);
    return result;
}

PlantResult PlantService::delete_plant(int64_t id) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    bool found = false;
    std::string error;
    if (!store_.delete_plant(id, found, error)) {
        return failure(PlantStatus::STORAGE_FAILURE, error);
    }
    if (!found) {
        return failure(PlantStatus::NOT_FOUND, "Plant not found");
    }

    LOG_INFO("[PlantService] Deleted plant " << id);

    PlantResult result;
    result.success = true;
    return result;
}

}  // namespace plants
}  // namespace greenhouse
