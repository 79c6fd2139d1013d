#include "sqlite_plant_store.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace greenhouse {
namespace storage {

namespace {
constexpr const char *kSelectColumns = "SELECT id, name, image, price, is_in_stock FROM plants";
}  // namespace

SqlitePlantStore::SqlitePlantStore(Database &db) : db_(db) {}

plants::Plant SqlitePlantStore::read_row(const Statement &stmt) {
    plants::Plant plant;
    plant.id = stmt.column_int64(0);
    plant.name = stmt.column_text(1);
    plant.image = stmt.column_text(2);
    plant.price = stmt.column_double(3);
    plant.is_in_stock = stmt.column_bool(4);
    return plant;
}

bool SqlitePlantStore::list_plants(std::vector<plants::Plant> &out, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto stmt = db_.prepare(std::string(kSelectColumns) + " ORDER BY id");
        std::vector<plants::Plant> rows;
        while (stmt.step()) {
            rows.push_back(read_row(stmt));
        }
        out = std::move(rows);
        return true;
    } catch (const DatabaseError &e) {
        error = e.what();
        LOG_ERROR("[PlantStore] list failed (sqlite " << e.code() << "): " << error);
        return false;
    }
}

bool SqlitePlantStore::find_plant(int64_t id, std::optional<plants::Plant> &out, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto stmt = db_.prepare(std::string(kSelectColumns) + " WHERE id = ?");
        stmt.bind(1, id);
        if (stmt.step()) {
            out = read_row(stmt);
        } else {
            out.reset();
        }
        return true;
    } catch (const DatabaseError &e) {
        error = e.what();
        LOG_ERROR("[PlantStore] find " << id << " failed (sqlite " << e.code() << "): " << error);
        return false;
    }
}

bool SqlitePlantStore::insert_plant(const plants::NewPlant &fields, plants::Plant &out, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Transaction tx(db_);
        auto stmt = db_.prepare("INSERT INTO plants (name, image, price, is_in_stock) VALUES (?, ?, ?, ?)");
        stmt.bind(1, fields.name);
        stmt.bind(2, fields.image);
        stmt.bind(3, fields.price);
        stmt.bind_bool(4, fields.is_in_stock);
        stmt.step();

        int64_t id = db_.last_insert_rowid();
        tx.commit();

        out = plants::make_plant(id, fields);
        return true;
    } catch (const DatabaseError &e) {
        error = e.what();
        LOG_WARN("[PlantStore] insert failed (sqlite " << e.code() << "): " << error);
        return false;
    }
}

bool SqlitePlantStore::update_plant(const plants::Plant &plant, bool &found, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Transaction tx(db_);
        auto stmt = db_.prepare("UPDATE plants SET name = ?, image = ?, price = ?, is_in_stock = ? WHERE id = ?");
        stmt.bind(1, plant.name);
        stmt.bind(2, plant.image);
        stmt.bind(3, plant.price);
        stmt.bind_bool(4, plant.is_in_stock);
        stmt.bind(5, plant.id);
        stmt.step();

        found = db_.changes() > 0;
        tx.commit();
        return true;
    } catch (const DatabaseError &e) {
        error = e.what();
        LOG_WARN("[PlantStore] update " << plant.id << " failed (sqlite " << e.code() << "): " << error);
        return false;
    }
}

bool SqlitePlantStore::delete_plant(int64_t id, bool &found, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Transaction tx(db_);
        auto stmt = db_.prepare("DELETE FROM plants WHERE id = ?");
        stmt.bind(1, id);
        stmt.step();

        found = db_.changes() > 0;
        tx.commit();
        return true;
    } catch (const DatabaseError &e) {
        error = e.what();
        LOG_WARN("[PlantStore] delete " << id << " failed (sqlite " << e.code() << "): " << error);
        return false;
    }
}

}  // namespace storage
}  // namespace greenhouse
