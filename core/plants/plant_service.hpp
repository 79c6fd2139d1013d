#ifndef GREENHOUSE_PLANTS_PLANT_SERVICE_HPP
#define GREENHOUSE_PLANTS_PLANT_SERVICE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "plant.hpp"
#include "storage/i_plant_store.hpp"

namespace greenhouse {
namespace plants {

// Outcome classes of a plant operation
enum class PlantStatus {
    OK,
    INVALID_ARGUMENT,  // Field failed the validation policy
    NOT_FOUND,         // No plant with the requested id
    STORAGE_FAILURE    // Store reported an error (constraint, I/O, connection)
};

std::string plant_status_to_string(PlantStatus status);

// Result of a single-plant operation
struct PlantResult {
    bool success = false;
    PlantStatus status = PlantStatus::OK;
    std::string error_message;
    std::optional<Plant> plant;  // Set on success (except delete)
};

// Result of listing plants
struct PlantListResult {
    bool success = false;
    PlantStatus status = PlantStatus::OK;
    std::string error_message;
    std::vector<Plant> plants;
};

/**
 * @brief Plant operations as single units of work against an IPlantStore
 *
 * The HTTP layer decodes requests into NewPlant/PlantPatch and hands them
 * here; the service applies the validation policy and talks to the store.
 *
 * Validation policy:
 * - name must be non-empty
 * - price must be finite and >= 0
 */
class PlantService {
public:
    explicit PlantService(storage::IPlantStore &store);

    PlantListResult list_plants();
    PlantResult get_plant(int64_t id);
    PlantResult create_plant(const NewPlant &fields);

    // Read-modify-write under the service mutex
    PlantResult update_plant(int64_t id, const PlantPatch &patch);

    PlantResult delete_plant(int64_t id);

    // Validation only (no store access)
    bool validate_new_plant(const NewPlant &fields, std::string &error) const;
    bool validate_patch(const PlantPatch &patch, std::string &error) const;

private:
    bool validate_name(const std::string &name, std::string &error) const;
    bool validate_price(double price, std::string &error) const;

    static PlantResult failure(PlantStatus status, const std::string &message);

    storage::IPlantStore &store_;

    // Serializes update_plant's find + update pair
    std::mutex write_mutex_;
};

}  // namespace plants
}  // namespace greenhouse

#endif  // GREENHOUSE_PLANTS_PLANT_SERVICE_HPP
