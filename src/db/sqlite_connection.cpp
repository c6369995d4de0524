#include <kgview/db/sqlite_connection.h>
#include <kgview/core/config.h>
#include <kgview/core/filesystem_utils.h>
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace kgview {
namespace db {

void SQLiteStmtDeleter::operator()(sqlite3_stmt* stmt) const {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

std::string SQLiteConnection::defaultDatabasePath() {
    std::filesystem::path home = utils::get_home_directory_path();
    if (home.empty()) {
        std::cerr << "Warning: Could not determine home directory. Using current directory for database." << std::endl;
        return config::kDatabaseFileName;
    }

    try {
        std::filesystem::path app_config_dir = home / config::kAppConfigDirName;
        if (!std::filesystem::exists(app_config_dir)) {
            std::filesystem::create_directories(app_config_dir);
        }
        return (app_config_dir / config::kDatabaseFileName).string();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Filesystem error constructing database path in home directory: " << e.what()
                  << ". Using current directory as fallback." << std::endl;
        return config::kDatabaseFileName;
    }
}

SQLiteConnection::SQLiteConnection() : m_path(defaultDatabasePath()) {
    open();
}

SQLiteConnection::SQLiteConnection(const std::string& path) : m_path(path) {
    open();
}

void SQLiteConnection::open() {
    if (sqlite3_open(m_path.c_str(), &m_db) != SQLITE_OK) {
        std::string err_msg = "Database connection failed: ";
        if (m_db) {
            err_msg += sqlite3_errmsg(m_db);
            sqlite3_close(m_db);
            m_db = nullptr;
        } else {
            err_msg += "Could not allocate memory for database handle.";
        }
        throw std::runtime_error(err_msg);
    }

    try {
        exec(R"(
            CREATE TABLE IF NOT EXISTS settings (
                key TEXT PRIMARY KEY NOT NULL,
                value TEXT
            );
        )");
        if (m_path != ":memory:") {
            exec("PRAGMA journal_mode=WAL");
        }
    } catch (...) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SQLiteConnection::exec(const std::string& sql) {
    char* err_msg_ptr = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err_msg_ptr) != SQLITE_OK) {
        std::string error_message_str = "SQL error executing '" + sql + "': ";
        if (err_msg_ptr) {
            error_message_str += err_msg_ptr;
            sqlite3_free(err_msg_ptr);
        } else {
            error_message_str += "Unknown SQLite error";
        }
        throw std::runtime_error(error_message_str);
    }
}

sqlite3* SQLiteConnection::getDbHandle() {
    return m_db;
}

} // namespace db
} // namespace kgview
