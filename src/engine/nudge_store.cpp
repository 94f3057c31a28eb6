#include "engine/nudge_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

namespace nudge {

namespace {

constexpr const char *kCreateBlobsTable =
    "CREATE TABLE IF NOT EXISTS blobs ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL,"
    "    updated_at INTEGER NOT NULL"
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

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t nowEpochSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

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

struct NudgeStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
};

NudgeStore::NudgeStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    impl->path = databasePath;

    const std::filesystem::path dbPath(databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
    }

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open nudge database: " + message);
    }

    execOrThrow(impl->db, kCreateBlobsTable);
}

NudgeStore::~NudgeStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::optional<std::string> NudgeStore::loadBlob(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM blobs WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("failed to read blob " + key);
    }
    return std::nullopt;
}

void NudgeStore::saveBlob(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO blobs (key, value, updated_at) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    sqlite3_bind_int64(stmt.get(), 3, nowEpochSeconds());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to write blob " + key);
    }
}

void NudgeStore::removeBlob(const std::string &key)
{
    Statement stmt(impl->db, "DELETE FROM blobs WHERE key = ?;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to delete blob " + key);
    }
}

std::vector<std::string> NudgeStore::listKeys() const
{
    Statement stmt(impl->db, "SELECT key FROM blobs ORDER BY key ASC;");

    std::vector<std::string> keys;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        keys.push_back(columnText(stmt.get(), 0));
    }
    return keys;
}

bool NudgeStore::integrityCheck(std::string *message) const
{
    try {
        Statement stmt(impl->db, "PRAGMA integrity_check;");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            if (message) {
                *message = "integrity_check returned no rows";
            }
            return false;
        }
        const std::string result = columnText(stmt.get(), 0);
        if (message) {
            *message = result;
        }
        return result == "ok";
    } catch (const std::exception &ex) {
        if (message) {
            *message = ex.what();
        }
        return false;
    }
}

const std::string &NudgeStore::path() const
{
    return impl->path;
}

} // namespace nudge
