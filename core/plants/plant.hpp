#ifndef GREENHOUSE_PLANTS_PLANT_HPP
#define GREENHOUSE_PLANTS_PLANT_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace greenhouse {
namespace plants {

// Persisted plant record. id is assigned by the store and never changes.
struct Plant {
    int64_t id = 0;
    std::string name;
    std::string image;  // URI or path
    double price = 0.0;
    bool is_in_stock = true;
};

// Fields accepted when creating a plant (POST /plants)
struct NewPlant {
    std::string name;
    std::string image;
    double price = 0.0;
    bool is_in_stock = true;  // Defaults to in stock when omitted
};

// Partial update (PATCH /plants/{id})
// Allow-list of mutable attributes; id is deliberately not representable.
struct PlantPatch {
    std::optional<std::string> name;
    std::optional<std::string> image;
    std::optional<double> price;
    std::optional<bool> is_in_stock;

    bool empty() const { return !name && !image && !price && !is_in_stock; }
};

// Materialize a stored record from creation fields and its assigned id
Plant make_plant(int64_t id, const NewPlant &fields);

// Overwrite exactly the fields present in the patch
void apply_patch(Plant &plant, const PlantPatch &patch);

bool operator==(const Plant &lhs, const Plant &rhs);
inline bool operator!=(const Plant &lhs, const Plant &rhs) { return !(lhs == rhs); }

}  // namespace plants
}  // namespace greenhouse

#endif  // GREENHOUSE_PLANTS_PLANT_HPP
