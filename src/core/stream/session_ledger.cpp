#include "core/stream/session_ledger.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

namespace af {

SessionLedger::SessionLedger(sqlite3* db, int eventLimit, int ttlHours)
    : m_db(db)
    , m_eventLimit(eventLimit)
    , m_ttlMs(static_cast<qint64>(ttlHours) * 60 * 60 * 1000)
{
}

bool SessionLedger::record(const CanonicalEvent& event, qint64 nowMs)
{
    static constexpr const char* kInsertSql = R"(
        INSERT INTO session_events (user_id, provider, event_id, event_type, ts_ms, expires_at_ms)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";
    static constexpr const char* kTrimSql = R"(
        DELETE FROM session_events
        WHERE user_id = ?1 AND provider = ?2 AND id NOT IN (
            SELECT id FROM session_events
            WHERE user_id = ?1 AND provider = ?2
            ORDER BY id DESC LIMIT ?3
        )
    )";
    static constexpr const char* kStateSql = R"(
        INSERT INTO session_state (user_id, last_event_ts, last_provider, last_event_type, expires_at_ms)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(user_id) DO UPDATE SET
            last_event_ts = excluded.last_event_ts,
            last_provider = excluded.last_provider,
            last_event_type = excluded.last_event_type,
            expires_at_ms = excluded.expires_at_ms
    )";

    const QByteArray userUtf8 = event.userId.toUtf8();
    const QByteArray providerUtf8 = event.provider.toUtf8();
    const QByteArray eventIdUtf8 = event.eventId.toUtf8();
    const QByteArray typeUtf8 = eventTypeToString(event.eventType).toUtf8();
    const qint64 expiresAt = nowMs + m_ttlMs;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStream, "SessionLedger::record prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, providerUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, eventIdUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, typeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, event.tsMs);
    sqlite3_bind_int64(stmt, 6, expiresAt);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!ok) {
        LOG_ERROR(afStream, "SessionLedger::record insert failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    if (sqlite3_prepare_v2(m_db, kTrimSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStream, "SessionLedger::record prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, providerUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, m_eventLimit);
    ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!ok) {
        LOG_ERROR(afStream, "SessionLedger::record trim failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    if (sqlite3_prepare_v2(m_db, kStateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStream, "SessionLedger::record prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, event.tsMs);
    sqlite3_bind_text(stmt, 3, providerUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, typeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, expiresAt);
    ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!ok) {
        LOG_ERROR(afStream, "SessionLedger::record state update failed: %s", sqlite3_errmsg(m_db));
    }
    return ok;
}

std::vector<SessionEvent> SessionLedger::recentEvents(const QString& userId,
                                                      const QString& provider,
                                                      qint64 nowMs) const
{
    std::vector<SessionEvent> out;
    static constexpr const char* kSql = R"(
        SELECT event_id, event_type, ts_ms FROM session_events
        WHERE user_id = ?1 AND provider = ?2 AND expires_at_ms > ?3
        ORDER BY id DESC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStream, "SessionLedger::recentEvents prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray providerUtf8 = provider.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, providerUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, nowMs);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionEvent event;
        event.eventId = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        event.eventType = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        event.tsMs = sqlite3_column_int64(stmt, 2);
        out.push_back(std::move(event));
    }
    sqlite3_finalize(stmt);
    return out;
}

std::optional<SessionState> SessionLedger::state(const QString& userId, qint64 nowMs) const
{
    static constexpr const char* kSql = R"(
        SELECT last_event_ts, last_provider, last_event_type FROM session_state
        WHERE user_id = ?1 AND expires_at_ms > ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStream, "SessionLedger::state prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, nowMs);

    std::optional<SessionState> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionState state;
        state.lastEventTs = sqlite3_column_int64(stmt, 0);
        state.lastProvider = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        state.lastEventType = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
        result = state;
    }
    sqlite3_finalize(stmt);
    return result;
}

int SessionLedger::pruneExpired(qint64 nowMs)
{
    int removed = 0;
    for (const char* sql : {"DELETE FROM session_events WHERE expires_at_ms <= ?1",
                            "DELETE FROM session_state WHERE expires_at_ms <= ?1"}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(afStream, "SessionLedger::pruneExpired prepare failed: %s", sqlite3_errmsg(m_db));
            return -1;
        }
        sqlite3_bind_int64(stmt, 1, nowMs);
        if (sqlite3_step(stmt) == SQLITE_DONE) {
            removed += sqlite3_changes(m_db);
        }
        sqlite3_finalize(stmt);
    }
    return removed;
}

} // namespace af
