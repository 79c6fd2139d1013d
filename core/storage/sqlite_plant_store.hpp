#ifndef GREENHOUSE_STORAGE_SQLITE_PLANT_STORE_HPP
#define GREENHOUSE_STORAGE_SQLITE_PLANT_STORE_HPP

#include <mutex>

#include "database.hpp"
#include "i_plant_store.hpp"

namespace greenhouse {
namespace storage {

/**
 * @brief IPlantStore backed by the plants table of a SQLite database
 *
 * Thread Safety:
 * - Every method takes the store mutex for its whole unit of work, so
 *   statements of concurrent requests never interleave on the shared
 *   connection.
 * - Writes run in their own transaction (insert+commit, update+commit,
 *   delete+commit).
 *
 * The database must outlive the store.
 */
class SqlitePlantStore : public IPlantStore {
public:
    explicit SqlitePlantStore(Database &db);

    bool list_plants(std::vector<plants::Plant> &out, std::string &error) override;
    bool find_plant(int64_t id, std::optional<plants::Plant> &out, std::string &error) override;
    bool insert_plant(const plants::NewPlant &fields, plants::Plant &out, std::string &error) override;
    bool update_plant(const plants::Plant &plant, bool &found, std::string &error) override;
    bool delete_plant(int64_t id, bool &found, std::string &error) override;

private:
    static plants::Plant read_row(const Statement &stmt);

    Database &db_;
    std::mutex mutex_;
};

}  // namespace storage
}  // namespace greenhouse

#endif  // GREENHOUSE_STORAGE_SQLITE_PLANT_STORE_HPP
