#include "daemon/cascade_store.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <sqlite3.h>

namespace cascade {

namespace {

constexpr const char *kCreateKvTable =
    "CREATE TABLE IF NOT EXISTS kv ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

} // namespace

struct CascadeStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

CascadeStore::CascadeStore()
    : CascadeStore(defaultPath())
{
}

CascadeStore::CascadeStore(const std::filesystem::path &dbPath)
    : impl(std::make_unique<Impl>())
{
    if (dbPath != ":memory:" && dbPath.has_parent_path()) {
        std::filesystem::create_directories(dbPath.parent_path());
    }

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open cascade database " + dbPath.string()
                                 + ": " + message);
    }

    // Rule batches write from several threads; wait instead of failing
    // when another connection holds the lock.
    sqlite3_busy_timeout(impl->db, 5000);
    execOrThrow(impl->db, kCreateKvTable);
}

CascadeStore::~CascadeStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
    }
}

std::filesystem::path CascadeStore::defaultPath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/cascade";
    return basePath / "cascade.db";
}

std::optional<std::string> CascadeStore::get(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT value FROM kv WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("failed to read key '") + key + "': "
                                 + sqlite3_errmsg(impl->db));
    }
    return columnText(stmt.get(), 0);
}

void CascadeStore::set(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("failed to write key '") + key + "': "
                                 + sqlite3_errmsg(impl->db));
    }
}

std::vector<std::string> CascadeStore::keysWithPrefix(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    // substr() instead of LIKE so '%' and '_' in names match literally.
    Statement stmt(impl->db,
                   "SELECT key FROM kv WHERE substr(key, 1, length(?1)) = ?1 "
                   "ORDER BY key ASC;");
    bindText(stmt.get(), 1, prefix);

    std::vector<std::string> keys;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        keys.push_back(columnText(stmt.get(), 0));
    }
    return keys;
}

bool CascadeStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace cascade
