#include "core/stream/event_log.h"
#include "core/stream/append_notifier.h"
#include "core/store/savepoint.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QTimeZone>

#include <sqlite3.h>

namespace af {

namespace {

sqlite3_stmt* prepare(sqlite3* db, const char* sql, const char* where)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStream, "%s prepare failed: %s", where, sqlite3_errmsg(db));
        return nullptr;
    }
    return stmt;
}

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

QJsonObject parseObject(const QString& json)
{
    return QJsonDocument::fromJson(json.toUtf8()).object();
}

constexpr qint64 kHourMs = 60LL * 60 * 1000;

} // anonymous namespace

QJsonObject DeadLetter::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("user_id")] = userId;
    json[QStringLiteral("original_message_id")] = originalMessageId;
    json[QStringLiteral("retry_count")] = retryCount;
    json[QStringLiteral("error")] = error;
    json[QStringLiteral("failed_at")] =
        QDateTime::fromMSecsSinceEpoch(failedAtMs, QTimeZone::UTC).toString(Qt::ISODateWithMs);
    json[QStringLiteral("event_data")] = eventData;
    return json;
}

EventLog::EventLog(sqlite3* db, Options options, std::shared_ptr<AppendNotifier> notifier)
    : m_db(db)
    , m_options(options)
    , m_notifier(std::move(notifier))
{
}

std::optional<int64_t> EventLog::append(const CanonicalEvent& event, qint64 nowMs)
{
    static constexpr const char* kSql = R"(
        INSERT INTO event_log (user_id, event_id, event_type, event_json, appended_at_ms)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";

    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::append");
    if (!stmt) {
        return std::nullopt;
    }

    const QByteArray userUtf8 = event.userId.toUtf8();
    const QByteArray eventIdUtf8 = event.eventId.toUtf8();
    const QByteArray typeUtf8 = eventTypeToString(event.eventType).toUtf8();
    const QByteArray jsonUtf8 = QJsonDocument(event.toJson()).toJson(QJsonDocument::Compact);
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, eventIdUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, typeUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, jsonUtf8.constData(), jsonUtf8.size(), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, nowMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(afStream, "EventLog::append failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const int64_t seq = sqlite3_last_insert_rowid(m_db);
    if (!trim(event.userId)) {
        LOG_WARN(afStream, "EventLog trim failed for user %s", qUtf8Printable(event.userId));
    }
    if (sqlite3_get_autocommit(m_db)) {
        notifyAppended();
    }
    return seq;
}

void EventLog::notifyAppended() const
{
    if (m_notifier) {
        m_notifier->notify();
    }
}

bool EventLog::trim(const QString& userId)
{
    if (m_options.maxLen <= 0) {
        return true;
    }

    // Approximate: only trim once the log overshoots by a tenth of its bound,
    // so steady appends do not pay for a DELETE each time.
    const int slack = m_options.maxLen / 10;
    const int len = length(userId);
    if (len <= m_options.maxLen + slack) {
        return true;
    }

    static constexpr const char* kCutoffSql = R"(
        SELECT seq FROM event_log WHERE user_id = ?1
        ORDER BY seq DESC LIMIT 1 OFFSET ?2
    )";
    sqlite3_stmt* stmt = prepare(m_db, kCutoffSql, "EventLog::trim");
    if (!stmt) {
        return false;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, m_options.maxLen - 1);
    int64_t cutoff = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cutoff = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (cutoff == 0) {
        return true;
    }

    static constexpr const char* kDeleteSql =
        "DELETE FROM event_log WHERE user_id = ?1 AND seq < ?2";
    stmt = prepare(m_db, kDeleteSql, "EventLog::trim");
    if (!stmt) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, cutoff);
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    const int removed = sqlite3_changes(m_db);
    sqlite3_finalize(stmt);

    if (ok && removed > 0) {
        LOG_DEBUG(afStream, "Trimmed %d entries from log of user %s",
                  removed, qUtf8Printable(userId));
    }
    return ok;
}

bool EventLog::ensureGroup(const QString& userId, const QString& group, qint64 nowMs)
{
    static constexpr const char* kSql = R"(
        INSERT OR IGNORE INTO event_log_groups (user_id, group_name, last_delivered_seq, created_at_ms)
        VALUES (?1, ?2, 0, ?3)
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::ensureGroup");
    if (!stmt) {
        return false;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray groupUtf8 = group.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, nowMs);
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (ok && sqlite3_changes(m_db) > 0) {
        LOG_INFO(afStream, "Created consumer group %s for user %s",
                 qUtf8Printable(group), qUtf8Printable(userId));
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::vector<LogEntry> EventLog::readGroup(const QString& userId, const QString& group,
                                          const QString& consumer, int count, qint64 nowMs)
{
    std::vector<LogEntry> entries;
    if (count <= 0) {
        return entries;
    }

    Savepoint sp(m_db, "event_log_read");
    if (!sp.isActive()) {
        return entries;
    }

    static constexpr const char* kSelectSql = R"(
        SELECT l.seq, l.event_json, l.appended_at_ms
        FROM event_log l
        JOIN event_log_groups g ON g.user_id = l.user_id AND g.group_name = ?2
        WHERE l.user_id = ?1 AND l.seq > g.last_delivered_seq
        ORDER BY l.seq ASC
        LIMIT ?3
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSelectSql, "EventLog::readGroup");
    if (!stmt) {
        return entries;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray groupUtf8 = group.toUtf8();
    const QByteArray consumerUtf8 = consumer.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, count);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        LogEntry entry;
        entry.seq = sqlite3_column_int64(stmt, 0);
        entry.userId = userId;
        entry.eventJson = parseObject(columnText(stmt, 1));
        entry.appendedAtMs = sqlite3_column_int64(stmt, 2);
        entry.deliveryCount = 1;
        entries.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);

    if (entries.empty()) {
        return entries;
    }

    static constexpr const char* kPendingSql = R"(
        INSERT OR REPLACE INTO event_log_pending
            (group_name, entry_seq, user_id, consumer, delivered_at_ms, delivery_count)
        VALUES (?1, ?2, ?3, ?4, ?5, 1)
    )";
    stmt = prepare(m_db, kPendingSql, "EventLog::readGroup");
    if (!stmt) {
        return {};
    }
    for (const LogEntry& entry : entries) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, groupUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, entry.seq);
        sqlite3_bind_text(stmt, 3, userUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, consumerUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 5, nowMs);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR(afStream, "EventLog::readGroup pending insert failed: %s",
                      sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            return {};
        }
    }
    sqlite3_finalize(stmt);

    static constexpr const char* kCursorSql = R"(
        UPDATE event_log_groups SET last_delivered_seq = ?3
        WHERE user_id = ?1 AND group_name = ?2
    )";
    stmt = prepare(m_db, kCursorSql, "EventLog::readGroup");
    if (!stmt) {
        return {};
    }
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, entries.back().seq);
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!ok || !sp.commit()) {
        LOG_ERROR(afStream, "EventLog::readGroup cursor update failed: %s", sqlite3_errmsg(m_db));
        return {};
    }
    return entries;
}

bool EventLog::ack(const QString& group, int64_t seq)
{
    static constexpr const char* kSql =
        "DELETE FROM event_log_pending WHERE group_name = ?1 AND entry_seq = ?2";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::ack");
    if (!stmt) {
        return false;
    }
    const QByteArray groupUtf8 = group.toUtf8();
    sqlite3_bind_text(stmt, 1, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, seq);
    const bool acked = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(m_db) > 0;
    sqlite3_finalize(stmt);

    if (acked) {
        static constexpr const char* kRetrySql =
            "DELETE FROM event_log_retries WHERE group_name = ?1 AND entry_seq = ?2";
        stmt = prepare(m_db, kRetrySql, "EventLog::ack");
        if (stmt) {
            sqlite3_bind_text(stmt, 1, groupUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_int64(stmt, 2, seq);
            sqlite3_step(stmt);
            sqlite3_finalize(stmt);
        }
    }
    return acked;
}

std::vector<LogEntry> EventLog::claimIdle(const QString& userId, const QString& group,
                                          const QString& consumer, int minIdleMs, int count,
                                          qint64 nowMs)
{
    std::vector<LogEntry> claimed;
    if (count <= 0) {
        return claimed;
    }

    Savepoint sp(m_db, "event_log_claim");
    if (!sp.isActive()) {
        return claimed;
    }

    // LEFT JOIN so pending rows whose log entry was trimmed away surface with
    // a NULL body and can be dropped.
    static constexpr const char* kSelectSql = R"(
        SELECT p.entry_seq, p.delivery_count, l.event_json, l.appended_at_ms
        FROM event_log_pending p
        LEFT JOIN event_log l ON l.seq = p.entry_seq
        WHERE p.user_id = ?1 AND p.group_name = ?2 AND p.delivered_at_ms <= ?3
        ORDER BY p.entry_seq ASC
        LIMIT ?4
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSelectSql, "EventLog::claimIdle");
    if (!stmt) {
        return claimed;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray groupUtf8 = group.toUtf8();
    const QByteArray consumerUtf8 = consumer.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, nowMs - minIdleMs);
    sqlite3_bind_int(stmt, 4, count);

    std::vector<int64_t> vanished;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const int64_t seq = sqlite3_column_int64(stmt, 0);
        if (sqlite3_column_type(stmt, 2) == SQLITE_NULL) {
            vanished.push_back(seq);
            continue;
        }
        LogEntry entry;
        entry.seq = seq;
        entry.userId = userId;
        entry.deliveryCount = sqlite3_column_int(stmt, 1) + 1;
        entry.eventJson = parseObject(columnText(stmt, 2));
        entry.appendedAtMs = sqlite3_column_int64(stmt, 3);
        claimed.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);

    for (int64_t seq : vanished) {
        LOG_WARN(afStream, "Dropping pending entry %lld (trimmed from log)",
                 static_cast<long long>(seq));
        ack(group, seq);
    }

    static constexpr const char* kClaimSql = R"(
        UPDATE event_log_pending
        SET consumer = ?3, delivered_at_ms = ?4, delivery_count = delivery_count + 1
        WHERE group_name = ?1 AND entry_seq = ?2
    )";
    stmt = prepare(m_db, kClaimSql, "EventLog::claimIdle");
    if (!stmt) {
        return {};
    }
    for (const LogEntry& entry : claimed) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, groupUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, entry.seq);
        sqlite3_bind_text(stmt, 3, consumerUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 4, nowMs);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR(afStream, "EventLog::claimIdle update failed: %s", sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            return {};
        }
    }
    sqlite3_finalize(stmt);

    if (!sp.commit()) {
        return {};
    }
    if (!claimed.empty()) {
        LOG_INFO(afStream, "Claimed %d idle entries for %s",
                 static_cast<int>(claimed.size()), qUtf8Printable(consumer));
    }
    return claimed;
}

std::vector<PendingEntry> EventLog::pending(const QString& userId, const QString& group) const
{
    std::vector<PendingEntry> out;
    static constexpr const char* kSql = R"(
        SELECT entry_seq, consumer, delivered_at_ms, delivery_count
        FROM event_log_pending
        WHERE user_id = ?1 AND group_name = ?2
        ORDER BY entry_seq ASC
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::pending");
    if (!stmt) {
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray groupUtf8 = group.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, groupUtf8.constData(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PendingEntry entry;
        entry.seq = sqlite3_column_int64(stmt, 0);
        entry.consumer = columnText(stmt, 1);
        entry.deliveredAtMs = sqlite3_column_int64(stmt, 2);
        entry.deliveryCount = sqlite3_column_int(stmt, 3);
        out.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);
    return out;
}

// ── Retry bookkeeping ───────────────────────────────────────

int EventLog::retryCount(const QString& group, int64_t seq, qint64 nowMs) const
{
    static constexpr const char* kSql = R"(
        SELECT retry_count FROM event_log_retries
        WHERE group_name = ?1 AND entry_seq = ?2 AND expires_at_ms > ?3
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::retryCount");
    if (!stmt) {
        return 0;
    }
    const QByteArray groupUtf8 = group.toUtf8();
    sqlite3_bind_text(stmt, 1, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, seq);
    sqlite3_bind_int64(stmt, 3, nowMs);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

std::optional<int> EventLog::incrementRetry(const QString& group, int64_t seq, qint64 nowMs)
{
    static constexpr const char* kSql = R"(
        INSERT INTO event_log_retries (group_name, entry_seq, retry_count, expires_at_ms)
        VALUES (?1, ?2, 1, ?4)
        ON CONFLICT(group_name, entry_seq) DO UPDATE SET
            retry_count = CASE WHEN expires_at_ms <= ?3 THEN 1 ELSE retry_count + 1 END,
            expires_at_ms = excluded.expires_at_ms
        RETURNING retry_count
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::incrementRetry");
    if (!stmt) {
        return std::nullopt;
    }
    const QByteArray groupUtf8 = group.toUtf8();
    sqlite3_bind_text(stmt, 1, groupUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, seq);
    sqlite3_bind_int64(stmt, 3, nowMs);
    sqlite3_bind_int64(stmt, 4, nowMs + m_options.retryTtlHours * kHourMs);

    std::optional<int> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    } else {
        LOG_ERROR(afStream, "EventLog::incrementRetry failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return count;
}

int EventLog::pruneExpiredRetries(qint64 nowMs)
{
    static constexpr const char* kSql = "DELETE FROM event_log_retries WHERE expires_at_ms <= ?1";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::pruneExpiredRetries");
    if (!stmt) {
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, nowMs);
    const int removed = sqlite3_step(stmt) == SQLITE_DONE ? sqlite3_changes(m_db) : 0;
    sqlite3_finalize(stmt);
    return removed;
}

// ── Dead letters ────────────────────────────────────────────

bool EventLog::moveToDeadLetter(const LogEntry& entry, int retryCount, const QString& error,
                                qint64 nowMs)
{
    Savepoint sp(m_db, "event_log_dlq");
    if (!sp.isActive()) {
        return false;
    }

    static constexpr const char* kInsertSql = R"(
        INSERT INTO dead_letters
            (user_id, original_message_id, retry_count, error, failed_at_ms, event_data)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";
    sqlite3_stmt* stmt = prepare(m_db, kInsertSql, "EventLog::moveToDeadLetter");
    if (!stmt) {
        return false;
    }
    const QByteArray userUtf8 = entry.userId.toUtf8();
    const QByteArray idUtf8 = entry.entryId().toUtf8();
    const QByteArray errorUtf8 = error.toUtf8();
    const QByteArray dataUtf8 = QJsonDocument(entry.eventJson).toJson(QJsonDocument::Compact);
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, retryCount);
    sqlite3_bind_text(stmt, 4, errorUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, nowMs);
    sqlite3_bind_text(stmt, 6, dataUtf8.constData(), dataUtf8.size(), SQLITE_STATIC);
    const bool inserted = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!inserted) {
        LOG_ERROR(afStream, "EventLog::moveToDeadLetter failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    static constexpr const char* kTrimSql = R"(
        DELETE FROM dead_letters
        WHERE user_id = ?1 AND id NOT IN (
            SELECT id FROM dead_letters WHERE user_id = ?1 ORDER BY id DESC LIMIT ?2
        )
    )";
    stmt = prepare(m_db, kTrimSql, "EventLog::moveToDeadLetter");
    if (!stmt) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, m_options.deadLetterMaxLen);
    const bool trimmed = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!trimmed || !sp.commit()) {
        return false;
    }

    LOG_ERROR(afStream, "Moved entry %s of user %s to dead letters after %d retries: %s",
              idUtf8.constData(), userUtf8.constData(), retryCount, errorUtf8.constData());
    return true;
}

std::vector<DeadLetter> EventLog::deadLetters(const QString& userId, int limit) const
{
    std::vector<DeadLetter> out;
    static constexpr const char* kSql = R"(
        SELECT id, original_message_id, retry_count, error, failed_at_ms, event_data
        FROM dead_letters WHERE user_id = ?1
        ORDER BY id DESC LIMIT ?2
    )";
    sqlite3_stmt* stmt = prepare(m_db, kSql, "EventLog::deadLetters");
    if (!stmt) {
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DeadLetter letter;
        letter.id = sqlite3_column_int64(stmt, 0);
        letter.userId = userId;
        letter.originalMessageId = columnText(stmt, 1);
        letter.retryCount = sqlite3_column_int(stmt, 2);
        letter.error = columnText(stmt, 3);
        letter.failedAtMs = sqlite3_column_int64(stmt, 4);
        letter.eventData = columnText(stmt, 5);
        out.push_back(std::move(letter));
    }
    sqlite3_finalize(stmt);
    return out;
}

int EventLog::deadLetterCount(const QString& userId) const
{
    sqlite3_stmt* stmt = prepare(m_db, "SELECT COUNT(*) FROM dead_letters WHERE user_id = ?1",
                                 "EventLog::deadLetterCount");
    if (!stmt) {
        return 0;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    const int count = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return count;
}

// ── Introspection ───────────────────────────────────────────

int EventLog::length(const QString& userId) const
{
    sqlite3_stmt* stmt = prepare(m_db, "SELECT COUNT(*) FROM event_log WHERE user_id = ?1",
                                 "EventLog::length");
    if (!stmt) {
        return 0;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    const int count = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return count;
}

QStringList EventLog::users() const
{
    QStringList out;
    sqlite3_stmt* stmt = prepare(m_db,
                                 "SELECT DISTINCT user_id FROM event_log ORDER BY user_id",
                                 "EventLog::users");
    if (!stmt) {
        return out;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return out;
}

} // namespace af
