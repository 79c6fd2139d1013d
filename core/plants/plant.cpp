#include "plant.hpp"

namespace greenhouse {
namespace plants {

Plant make_plant(int64_t id, const NewPlant &fields) {
    Plant plant;
    plant.id = id;
    plant.name = fields.name;
    plant.image = fields.image;
    plant.price = fields.price;
    plant.is_in_stock = fields.is_in_stock;
    return plant;
}

void apply_patch(Plant &plant, const PlantPatch &patch) {
    if (patch.name) {
        plant.name = *patch.name;
    }
    if (patch.image) {
        plant.image = *patch.image;
    }
    if (patch.price) {
        plant.price = *patch.price;
    }
    if (patch.is_in_stock) {
        plant.is_in_stock = *patch.is_in_stock;
    }
}

bool operator==(const Plant &lhs, const Plant &rhs) {
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.image == rhs.image && lhs.price == rhs.price &&
           lhs.is_in_stock == rhs.is_in_stock;
}

}  // namespace plants
}  // namespace greenhouse
