#pragma once

#include <optional>
#include <string>

namespace kgview {
namespace db {

class SQLiteConnection;

/*
 * Key/value persistence on the `settings` table.
 */
class SettingsStore {
public:
    explicit SettingsStore(SQLiteConnection& db_conn);

    /// Inserts or replaces a setting. Throws std::runtime_error on failure.
    void saveSetting(const std::string& key, const std::string& value);

    /// Loads a setting's value by its key. Throws on SQLite errors.
    std::optional<std::string> loadSetting(const std::string& key);

    /// Removes a setting. Missing keys are not an error.
    void removeSetting(const std::string& key);

private:
    SQLiteConnection& m_db_conn;
};

} // namespace db
} // namespace kgview
