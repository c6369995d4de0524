#include <kgview/db/settings_store.h>
#include <kgview/db/sqlite_connection.h>
#include <sqlite3.h>
#include <stdexcept>

namespace kgview {
namespace db {

namespace {
unique_sqlite_stmt_ptr prepare(sqlite3* handle, const char* sql, const char* what) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("Failed to prepare ") + what + " statement: " + sqlite3_errmsg(handle));
    }
    return unique_sqlite_stmt_ptr(stmt);
}

void bindText(sqlite3* handle, sqlite3_stmt* stmt, int index, const std::string& value, const char* what) {
    if (sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to bind parameter in ") + what + ": " + sqlite3_errmsg(handle));
    }
}
} // end anonymous namespace

SettingsStore::SettingsStore(SQLiteConnection& db_conn) : m_db_conn(db_conn) {}

void SettingsStore::saveSetting(const std::string& key, const std::string& value) {
    sqlite3* handle = m_db_conn.getDbHandle();
    auto stmt = prepare(handle, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)", "saveSetting");
    bindText(handle, stmt.get(), 1, key, "saveSetting");
    bindText(handle, stmt.get(), 2, value, "saveSetting");
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("saveSetting failed: " + std::string(sqlite3_errmsg(handle)));
    }
}

std::optional<std::string> SettingsStore::loadSetting(const std::string& key) {
    sqlite3* handle = m_db_conn.getDbHandle();
    auto stmt = prepare(handle, "SELECT value FROM settings WHERE key = ?", "loadSetting");
    bindText(handle, stmt.get(), 1, key, "loadSetting");

    int step_result = sqlite3_step(stmt.get());
    if (step_result == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        if (text) {
            return std::string(reinterpret_cast<const char*>(text));
        }
        return std::nullopt;
    }
    if (step_result != SQLITE_DONE) {
        throw std::runtime_error("loadSetting failed: " + std::string(sqlite3_errmsg(handle)));
    }
    return std::nullopt;
}

void SettingsStore::removeSetting(const std::string& key) {
    sqlite3* handle = m_db_conn.getDbHandle();
    auto stmt = prepare(handle, "DELETE FROM settings WHERE key = ?", "removeSetting");
    bindText(handle, stmt.get(), 1, key, "removeSetting");
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("removeSetting failed: " + std::string(sqlite3_errmsg(handle)));
    }
}

} // namespace db
} // namespace kgview
