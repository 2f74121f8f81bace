#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

#include <sqlite3.h>

namespace af {

// SQLiteStore owns one connection to the attemptflow database. Opening runs
// the per-connection pragmas, creates the schema on a fresh file and brings
// it up to kCurrentSchemaVersion. Pipeline components borrow rawDb() and
// prepare their own statements; a store is used from one thread only.
class SQLiteStore {
public:
    ~SQLiteStore();

    SQLiteStore(SQLiteStore&& other) noexcept;
    SQLiteStore& operator=(SQLiteStore&& other) noexcept;
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // ":memory:" gives a private in-memory database.
    static std::optional<SQLiteStore> open(const QString& dbPath, QString* errorOut = nullptr);

    const QString& path() const { return m_path; }
    sqlite3* rawDb() const { return m_db; }

    // ── Settings table ──────────────────────────────────────

    std::optional<QString> getSetting(const QString& key) const;
    bool setSetting(const QString& key, const QString& value);

    int schemaVersion() const;

    // ── Maintenance ─────────────────────────────────────────

    // Row counts of the pipeline tables, for health reporting.
    QJsonObject tableStats() const;

    // PRAGMA wal_checkpoint(PASSIVE). No-op success for in-memory stores.
    bool checkpoint();

    bool integrityCheck() const;

private:
    SQLiteStore() = default;

    bool init(const QString& dbPath, QString* errorOut);
    bool hasSchema() const;
    void restrictPermissions() const;
    bool exec(const char* sql, QString* errorOut = nullptr);

    sqlite3* m_db = nullptr;
    QString m_path;
};

} // namespace af
