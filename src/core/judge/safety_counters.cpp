#include "core/judge/safety_counters.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <sqlite3.h>

namespace af {

SafetyCounters::SafetyCounters(sqlite3* db, int ttlDays)
    : m_db(db)
    , m_ttlMs(static_cast<qint64>(ttlDays) * 24 * 60 * 60 * 1000)
{
}

std::optional<int> SafetyCounters::increment(const QString& userId, const QString& category)
{
    // An expired counter restarts from 1 rather than resuming its old count.
    static constexpr const char* kSql = R"(
        INSERT INTO safety_counters (user_id, category, count, expires_at_ms)
        VALUES (?1, ?2, 1, ?4)
        ON CONFLICT(user_id, category) DO UPDATE SET
            count = CASE WHEN expires_at_ms <= ?3 THEN 1 ELSE count + 1 END,
            expires_at_ms = excluded.expires_at_ms
        RETURNING count
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afJudge, "SafetyCounters::increment prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray categoryUtf8 = category.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, categoryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, now);
    sqlite3_bind_int64(stmt, 4, now + m_ttlMs);

    std::optional<int> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    } else {
        LOG_ERROR(afJudge, "SafetyCounters::increment step failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);

    if (count) {
        LOG_INFO(afJudge, "Blocked request for user %s (category=%s, count=%d)",
                 qUtf8Printable(userId), qUtf8Printable(category), *count);
    }
    return count;
}

std::map<QString, int> SafetyCounters::counts(const QString& userId) const
{
    std::map<QString, int> out;
    static constexpr const char* kSql = R"(
        SELECT category, count FROM safety_counters
        WHERE user_id = ?1 AND expires_at_ms > ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afJudge, "SafetyCounters::counts prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* category = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        out[QString::fromUtf8(category ? category : "")] = sqlite3_column_int(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return out;
}

int SafetyCounters::total(const QString& userId) const
{
    int sum = 0;
    for (const auto& [category, count] : counts(userId)) {
        Q_UNUSED(category);
        sum += count;
    }
    return sum;
}

int SafetyCounters::pruneExpired(qint64 nowMs)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM safety_counters WHERE expires_at_ms <= ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, nowMs);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE ? sqlite3_changes(m_db) : -1;
}

} // namespace af
