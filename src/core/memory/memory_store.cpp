#include "core/memory/memory_store.h"
#include "core/shared/logging.h"

#include <QUuid>

#include <sqlite3.h>

namespace af {

namespace {

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

MemoryItem readItem(sqlite3_stmt* stmt)
{
    MemoryItem item;
    item.memoryId = columnText(stmt, 0);
    item.userId = columnText(stmt, 1);
    item.key = columnText(stmt, 2);
    item.value = columnText(stmt, 3);
    item.status = columnText(stmt, 4);
    item.supersededBy = columnText(stmt, 5);
    item.createdAtMs = sqlite3_column_int64(stmt, 6);
    item.updatedAtMs = sqlite3_column_int64(stmt, 7);
    return item;
}

constexpr const char* kItemColumns =
    "memory_id, user_id, memory_key, value, status, superseded_by, created_at_ms, updated_at_ms";

} // namespace

MemoryStore::MemoryStore(sqlite3* db)
    : m_db(db)
{
}

std::optional<QString> MemoryStore::add(const QString& userId, const QString& key,
                                        const QString& value, qint64 nowMs)
{
    static constexpr const char* kSql = R"(
        INSERT INTO memory_items (memory_id, user_id, memory_key, value, status,
                                  created_at_ms, updated_at_ms)
        VALUES (?1, ?2, ?3, ?4, 'active', ?5, ?5)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afCore, "MemoryStore::add prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QString memoryId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const QByteArray idUtf8 = memoryId.toUtf8();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valueUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, valueUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, nowMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(afCore, "MemoryStore::add step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return memoryId;
}

std::optional<MemoryItem> MemoryStore::item(const QString& memoryId) const
{
    const QByteArray sql = QByteArray("SELECT ") + kItemColumns
        + " FROM memory_items WHERE memory_id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray idUtf8 = memoryId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<MemoryItem> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readItem(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<MemoryItem> MemoryStore::items(const QString& userId, const QString& key,
                                           bool activeOnly) const
{
    std::vector<MemoryItem> out;
    const QByteArray sql = QByteArray("SELECT ") + kItemColumns + R"(
        FROM memory_items
        WHERE user_id = ?1
          AND (?2 IS NULL OR memory_key = ?2)
          AND (?3 = 0 OR status = 'active')
        ORDER BY created_at_ms DESC, rowid DESC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afCore, "MemoryStore::items prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    if (key.isEmpty()) {
        sqlite3_bind_null(stmt, 2);
    } else {
        sqlite3_bind_text(stmt, 2, keyUtf8.constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 3, activeOnly ? 1 : 0);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(readItem(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

QStringList MemoryStore::duplicatedKeys(const QString& userId) const
{
    QStringList out;
    static constexpr const char* kSql = R"(
        SELECT memory_key FROM memory_items
        WHERE user_id = ?1 AND status = 'active'
        GROUP BY memory_key HAVING COUNT(*) > 1
        ORDER BY memory_key
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return out;
}

QStringList MemoryStore::users() const
{
    QStringList out;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT DISTINCT user_id FROM memory_items ORDER BY user_id",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return out;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return out;
}

bool MemoryStore::markSuperseded(const QString& memoryId, const QString& supersededBy, qint64 nowMs)
{
    static constexpr const char* kSql = R"(
        UPDATE memory_items
        SET status = 'superseded', superseded_by = ?2, updated_at_ms = ?3
        WHERE memory_id = ?1 AND status = 'active'
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afCore, "MemoryStore::markSuperseded prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray idUtf8 = memoryId.toUtf8();
    const QByteArray byUtf8 = supersededBy.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, byUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, nowMs);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

} // namespace af
