#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "plants/plant.hpp"

namespace greenhouse {
namespace storage {

// Interface for plant persistence to enable mocking
// All methods return false and fill error on storage failure.
class IPlantStore {
public:
    virtual ~IPlantStore() = default;

    virtual bool list_plants(std::vector<plants::Plant> &out, std::string &error) = 0;

    // Succeeds with an empty optional when no plant has this id
    virtual bool find_plant(int64_t id, std::optional<plants::Plant> &out, std::string &error) = 0;

    // Persists and commits; out receives the record with its new id
    virtual bool insert_plant(const plants::NewPlant &fields, plants::Plant &out, std::string &error) = 0;

    // Writes every mutable column of plant; found is false if the row is gone
    virtual bool update_plant(const plants::Plant &plant, bool &found, std::string &error) = 0;

    virtual bool delete_plant(int64_t id, bool &found, std::string &error) = 0;
};

}  // namespace storage
}  // namespace greenhouse
