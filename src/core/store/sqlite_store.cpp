#include "core/store/sqlite_store.h"
#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <QFile>

namespace af {

namespace {

const QLatin1String kMemoryPath(":memory:");

// Tables reported by tableStats(), in display order.
constexpr const char* kStatTables[] = {
    "event_log",
    "event_log_pending",
    "dead_letters",
    "attempt_threads",
    "attempt_records",
    "bandit_arms",
    "policy_patterns",
    "memory_items",
    "safety_counters",
};

bool fail(QString* errorOut, const QString& message)
{
    LOG_ERROR(afStore, "%s", qUtf8Printable(message));
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

} // anonymous namespace

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
    }
}

SQLiteStore::SQLiteStore(SQLiteStore&& other) noexcept
    : m_db(other.m_db)
    , m_path(std::move(other.m_path))
{
    other.m_db = nullptr;
}

SQLiteStore& SQLiteStore::operator=(SQLiteStore&& other) noexcept
{
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        other.m_db = nullptr;
    }
    return *this;
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath, QString* errorOut)
{
    SQLiteStore store;
    if (!store.init(dbPath, errorOut)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath, QString* errorOut)
{
    m_path = dbPath;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr) != SQLITE_OK) {
        return fail(errorOut, QStringLiteral("cannot open %1: %2")
                                  .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(m_db))));
    }

    if (!exec(kConnectionPragmas, errorOut)) {
        return false;
    }

    if (!hasSchema()) {
        LOG_INFO(afStore, "Creating schema v1 in %s", qUtf8Printable(dbPath));
        if (!exec(kDatabasePragmas, errorOut)
            || !exec(kSchemaV1, errorOut)
            || !exec(kDefaultSettings, errorOut)) {
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        return fail(errorOut, QStringLiteral("schema migration to v%1 failed")
                                  .arg(kCurrentSchemaVersion));
    }

    restrictPermissions();
    LOG_INFO(afStore, "Opened %s (schema v%d)", qUtf8Printable(dbPath), schemaVersion());
    return true;
}

bool SQLiteStore::hasSchema() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'event_log'",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

// The log holds raw user text; keep the database and its WAL owner-only.
void SQLiteStore::restrictPermissions() const
{
    if (m_path == kMemoryPath) {
        return;
    }
    const auto ownerOnly = QFile::ReadOwner | QFile::WriteOwner;
    for (const QString& file : {m_path, m_path + QStringLiteral("-wal"), m_path + QStringLiteral("-shm")}) {
        if (QFile::exists(file) && !QFile::setPermissions(file, ownerOnly)) {
            LOG_WARN(afStore, "Could not restrict permissions on %s", qUtf8Printable(file));
        }
    }
}

bool SQLiteStore::exec(const char* sql, QString* errorOut)
{
    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown error");
        sqlite3_free(errMsg);
        return fail(errorOut, QStringLiteral("SQL error: %1").arg(message));
    }
    return true;
}

// ── Settings table ──────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key) const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT value FROM settings WHERE key = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "getSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    return value;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    static constexpr const char* kSql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "setSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valueUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valueUtf8.constData(), -1, SQLITE_STATIC);
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return ok;
}

int SQLiteStore::schemaVersion() const
{
    return currentSchemaVersion(m_db);
}

// ── Maintenance ─────────────────────────────────────────────

QJsonObject SQLiteStore::tableStats() const
{
    QJsonObject stats;
    for (const char* table : kStatTables) {
        const QByteArray sql = QByteArray("SELECT COUNT(*) FROM ") + table;
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
            continue;
        }
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stats[QLatin1String(table)] = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return stats;
}

bool SQLiteStore::checkpoint()
{
    if (m_path == kMemoryPath) {
        return true;
    }
    int logFrames = 0;
    int checkpointed = 0;
    const int rc = sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_PASSIVE,
                                             &logFrames, &checkpointed);
    if (rc != SQLITE_OK) {
        LOG_WARN(afStore, "WAL checkpoint failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    LOG_DEBUG(afStore, "WAL checkpoint: %d/%d frames", checkpointed, logFrames);
    return true;
}

bool SQLiteStore::integrityCheck() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = result && qstrcmp(result, "ok") == 0;
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace af
