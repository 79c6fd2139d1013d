#ifndef GREENHOUSE_STORAGE_DATABASE_HPP
#define GREENHOUSE_STORAGE_DATABASE_HPP

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace greenhouse {
namespace storage {

/**
 * @brief Error raised by the SQLite layer
 *
 * Carries sqlite's own message text and result code. Callers above the
 * store never see this type; the store converts it to an error string.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string &message, int code) : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class Database;

/**
 * @brief Prepared statement (RAII over sqlite3_stmt)
 *
 * Bind indices are 1-based, column indices 0-based, as in sqlite.
 */
class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept;
    Statement &operator=(Statement &&other) noexcept;

    void bind(int index, int64_t value);
    void bind(int index, double value);
    void bind(int index, const std::string &value);
    void bind_bool(int index, bool value);

    /**
     * @brief Advance the statement
     * @return true if a row is available, false when done
     * @throws DatabaseError on any other result code
     */
    bool step();

    int64_t column_int64(int column) const;
    double column_double(int column) const;
    std::string column_text(int column) const;
    bool column_bool(int column) const;

private:
    void check_bind(int rc, int index);

    sqlite3 *db_ = nullptr;
    sqlite3_stmt *stmt_ = nullptr;
};

/**
 * @brief SQLite connection wrapper
 *
 * Owns one connection for the lifetime of the object. The connection is
 * opened in serialized mode; callers that need multi-statement units of
 * work still serialize them themselves (see SqlitePlantStore).
 */
class Database {
public:
    /**
     * @brief Open (or create) the database at path
     *
     * ":memory:" opens a private in-memory database.
     *
     * @throws DatabaseError if the file cannot be opened
     */
    explicit Database(const std::string &path, int busy_timeout_ms = 5000);
    ~Database();

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    // Execute one or more statements that return no rows
    void execute(const std::string &sql);

    Statement prepare(const std::string &sql);

    int64_t last_insert_rowid() const;
    int changes() const;

    void begin();
    void commit();
    void rollback();

    // Create the plants table when it does not exist yet
    void ensure_schema();

    const std::string &path() const { return path_; }

private:
    std::string path_;
    sqlite3 *db_ = nullptr;
};

/**
 * @brief Scoped transaction
 *
 * Rolls back on destruction unless commit() was called.
 */
class Transaction {
public:
    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    Database &db_;
    bool done_ = false;
};

}  // namespace storage
}  // namespace greenhouse

#endif  // GREENHOUSE_STORAGE_DATABASE_HPP
