#include "database.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace greenhouse {
namespace storage {

namespace {
constexpr const char *kPlantsSchema =
    "CREATE TABLE IF NOT EXISTS plants ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  name TEXT NOT NULL,"
    "  image TEXT NOT NULL,"
    "  price REAL NOT NULL,"
    "  is_in_stock INTEGER NOT NULL DEFAULT 1"
    ")";
}  // namespace

//=============================================================================
// Statement
//=============================================================================
Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), rc);
    }
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement &&other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement &Statement::operator=(Statement &&other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void Statement::check_bind(int rc, int index) {
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db_), rc);
    }
}

void Statement::bind(int index, int64_t value) {
    check_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), index);
}

void Statement::bind(int index, double value) { check_bind(sqlite3_bind_double(stmt_, index, value), index); }

void Statement::bind(int index, const std::string &value) {
    check_bind(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
               index);
}

void Statement::bind_bool(int index, bool value) { check_bind(sqlite3_bind_int(stmt_, index, value ? 1 : 0), index); }

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError(sqlite3_errmsg(db_), rc);
}

int64_t Statement::column_int64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::column_double(int column) const { return sqlite3_column_double(stmt_, column); }

std::string Statement::column_text(int column) const {
    const unsigned char *text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char *>(text), sqlite3_column_bytes(stmt_, column));
}

bool Statement::column_bool(int column) const { return sqlite3_column_int(stmt_, column) != 0; }

//=============================================================================
// Database
//=============================================================================
Database::Database(const std::string &path, int busy_timeout_ms) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseError("Cannot open database '" + path_ + "': " + message, rc);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    execute("PRAGMA foreign_keys = ON");
    LOG_DEBUG("[Database] Opened " << path_);
}

Database::~Database() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        LOG_DEBUG("[Database] Closed " << path_);
    }
}

void Database::execute(const std::string &sql) {
    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        throw DatabaseError(message, rc);
    }
}

Statement Database::prepare(const std::string &sql) { return Statement(db_, sql); }

int64_t Database::last_insert_rowid() const { return static_cast<int64_t>(sqlite3_last_insert_rowid(db_)); }

int Database::changes() const { return sqlite3_changes(db_); }

void Database::begin() { execute("BEGIN"); }

void Database::commit() { execute("COMMIT"); }

void Database::rollback() { execute("ROLLBACK"); }

void Database::ensure_schema() {
    execute(kPlantsSchema);
    LOG_INFO("[Database] Schema ready (" << path_ << ")");
}

//=============================================================================
// Transaction
//=============================================================================
Transaction::Transaction(Database &db) : db_(db) { db_.begin(); }

Transaction::~Transaction() {
    if (done_) {
        return;
    }
    try {
        db_.rollback();
    } catch (const DatabaseError &e) {
        LOG_ERROR("[Database] Rollback failed: " << e.what());
    }
}

void Transaction::commit() {
    db_.commit();
    done_ = true;
}

}  // namespace storage
}  // namespace greenhouse
