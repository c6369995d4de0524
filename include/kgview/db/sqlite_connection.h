#pragma once

#include <filesystem>
#include <memory>
#include <string>

struct sqlite3;      // Forward declaration for SQLite database handle
struct sqlite3_stmt; // Forward declaration for SQLite prepared statement

namespace kgview {
namespace db {

struct SQLiteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
};
using unique_sqlite_stmt_ptr = std::unique_ptr<sqlite3_stmt, SQLiteStmtDeleter>;

/*
 * RAII wrapper around a SQLite database connection. Creates the settings
 * schema on open. Errors are reported as std::runtime_error.
 */
class SQLiteConnection {
public:
    // Opens ~/.kgview/kgview.db, falling back to the working directory.
    SQLiteConnection();
    // Opens the given path; ":memory:" gives a private in-memory database.
    explicit SQLiteConnection(const std::string& path);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Execute one or more SQL statements separated by semicolons.
    void exec(const std::string& sql);

    // Return the raw sqlite3* handle (use with care).
    sqlite3* getDbHandle();

    const std::string& getPath() const { return m_path; }

    static std::string defaultDatabasePath();

private:
    void open();

    sqlite3* m_db = nullptr;
    std::string m_path;
};

} // namespace db
} // namespace kgview
