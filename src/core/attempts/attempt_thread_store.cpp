#include "core/attempts/attempt_thread_store.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QUuid>

#include <limits>
#include <sqlite3.h>

namespace af {

namespace {

constexpr int kMaxCasAttempts = 3;

constexpr const char* kThreadColumns = R"(
    thread_id, user_id, fingerprint, domain, attempt_count, status,
    best_attempt_id, best_reward, best_critic_score, best_final_score,
    created_ts_ms, updated_ts_ms
)";

constexpr const char* kRecordColumns = R"(
    attempt_id, event_id, trace_id, ts_ms, payload_json, reward,
    critic_score, outcome, seq, revision
)";

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

double columnScoreOrNegInf(sqlite3_stmt* stmt, int col)
{
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return -std::numeric_limits<double>::infinity();
    }
    return sqlite3_column_double(stmt, col);
}

AttemptThread readThread(sqlite3_stmt* stmt)
{
    AttemptThread thread;
    thread.threadId = columnText(stmt, 0);
    thread.userId = columnText(stmt, 1);
    thread.fingerprint = columnText(stmt, 2);
    thread.domain = columnText(stmt, 3);
    thread.attemptCount = sqlite3_column_int(stmt, 4);
    thread.status = threadStatusFromString(columnText(stmt, 5));
    thread.bestAttemptId = columnText(stmt, 6);
    thread.bestReward = columnScoreOrNegInf(stmt, 7);
    thread.bestCriticScore = sqlite3_column_double(stmt, 8);
    thread.bestFinalScore = columnScoreOrNegInf(stmt, 9);
    thread.createdTsMs = sqlite3_column_int64(stmt, 10);
    thread.updatedTsMs = sqlite3_column_int64(stmt, 11);
    return thread;
}

AttemptRecord readRecord(sqlite3_stmt* stmt, int offset = 0)
{
    AttemptRecord record;
    record.attemptId = columnText(stmt, offset + 0);
    record.eventId = columnText(stmt, offset + 1);
    record.traceId = columnText(stmt, offset + 2);
    record.tsMs = sqlite3_column_int64(stmt, offset + 3);
    record.payload = QJsonDocument::fromJson(columnText(stmt, offset + 4).toUtf8()).object();
    record.reward = sqlite3_column_double(stmt, offset + 5);
    record.criticScore = sqlite3_column_double(stmt, offset + 6);
    record.outcome = outcomeFromString(columnText(stmt, offset + 7));
    record.seq = sqlite3_column_int(stmt, offset + 8);
    record.revision = sqlite3_column_int64(stmt, offset + 9);
    return record;
}

} // namespace

AttemptThreadStore::AttemptThreadStore(sqlite3* db, int ttlDays)
    : m_db(db)
    , m_ttlMs(static_cast<qint64>(ttlDays) * 24 * 60 * 60 * 1000)
{
}

bool AttemptThreadStore::isEligible(double reward, double criticScore, Outcome outcome)
{
    return outcome == Outcome::Success && criticScore >= kMinCriticScore && reward >= kMinReward;
}

double AttemptThreadStore::finalScore(double reward, double criticScore)
{
    return kRewardWeight * reward + kCriticWeight * criticScore;
}

qint64 AttemptThreadStore::expiryFromNow() const
{
    return QDateTime::currentMSecsSinceEpoch() + m_ttlMs;
}

// ── Threads ─────────────────────────────────────────────────

std::optional<AttemptThreadStore::ThreadHandle> AttemptThreadStore::getOrCreateThread(
    const QString& userId, const QString& fingerprint, const QString& domain, qint64 nowMs)
{
    // Expired rows still hold the UNIQUE(user, fingerprint) slot until the
    // maintenance pass runs, so clear this pair's stale thread first.
    {
        static constexpr const char* kSql = R"(
            DELETE FROM attempt_threads
            WHERE user_id = ?1 AND fingerprint = ?2 AND expires_at_ms <= ?3
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(afStore, "getOrCreateThread prepare failed: %s", sqlite3_errmsg(m_db));
            return std::nullopt;
        }
        const QByteArray userUtf8 = userId.toUtf8();
        const QByteArray fpUtf8 = fingerprint.toUtf8();
        sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, fpUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, QDateTime::currentMSecsSinceEpoch());
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(afStore, "getOrCreateThread expiry sweep failed: %s", sqlite3_errmsg(m_db));
            return std::nullopt;
        }
    }

    // Insert-or-increment in one statement so two writers racing on the same
    // fingerprint both observe a distinct attempt_count.
    static constexpr const char* kUpsertSql = R"(
        INSERT INTO attempt_threads (thread_id, user_id, fingerprint, domain, attempt_count,
                                     status, created_ts_ms, updated_ts_ms, expires_at_ms)
        VALUES (?1, ?2, ?3, ?4, 1, 'open', ?5, ?5, ?6)
        ON CONFLICT(user_id, fingerprint) DO UPDATE SET
            attempt_count = attempt_count + 1,
            updated_ts_ms = excluded.updated_ts_ms,
            expires_at_ms = excluded.expires_at_ms
        RETURNING thread_id, attempt_count
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "getOrCreateThread prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QString newThreadId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const QByteArray idUtf8 = newThreadId.toUtf8();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray fpUtf8 = fingerprint.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();

    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, fpUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, domainUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, nowMs);
    sqlite3_bind_int64(stmt, 6, expiryFromNow());

    std::optional<ThreadHandle> handle;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ThreadHandle result;
        result.threadId = columnText(stmt, 0);
        result.attemptCount = sqlite3_column_int(stmt, 1);
        result.created = (result.threadId == newThreadId);
        handle = result;
    } else {
        LOG_ERROR(afStore, "getOrCreateThread step failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);

    if (handle) {
        LOG_DEBUG(afStore, "Thread %s attempt_count=%d%s",
                  qUtf8Printable(handle->threadId), handle->attemptCount,
                  handle->created ? " (new)" : "");
    }
    return handle;
}

std::optional<AttemptThread> AttemptThreadStore::thread(const QString& threadId) const
{
    const QByteArray sql = QByteArray("SELECT ") + kThreadColumns
        + " FROM attempt_threads WHERE thread_id = ?1 AND expires_at_ms > ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "thread prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray idUtf8 = threadId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());

    std::optional<AttemptThread> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readThread(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<AttemptThread> AttemptThreadStore::threadForFingerprint(
    const QString& userId, const QString& fingerprint) const
{
    const QByteArray sql = QByteArray("SELECT ") + kThreadColumns
        + " FROM attempt_threads WHERE user_id = ?1 AND fingerprint = ?2 AND expires_at_ms > ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "threadForFingerprint prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray fpUtf8 = fingerprint.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, fpUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, QDateTime::currentMSecsSinceEpoch());

    std::optional<AttemptThread> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readThread(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<bool> AttemptThreadStore::updateBestAttempt(const QString& threadId,
                                                          const QString& attemptId,
                                                          double reward,
                                                          double criticScore,
                                                          Outcome outcome,
                                                          qint64 nowMs)
{
    if (!isEligible(reward, criticScore, outcome)) {
        return false;
    }

    const double score = finalScore(reward, criticScore);

    // NULL best_final_score is the -inf sentinel of a thread with no best yet.
    static constexpr const char* kSql = R"(
        UPDATE attempt_threads SET
            best_attempt_id = ?2,
            best_reward = ?3,
            best_critic_score = ?4,
            best_final_score = ?5,
            status = 'resolved',
            updated_ts_ms = MAX(updated_ts_ms, ?6)
        WHERE thread_id = ?1
          AND (best_final_score IS NULL OR best_final_score < ?5)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "updateBestAttempt prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray threadUtf8 = threadId.toUtf8();
    const QByteArray attemptUtf8 = attemptId.toUtf8();
    sqlite3_bind_text(stmt, 1, threadUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, attemptUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 3, reward);
    sqlite3_bind_double(stmt, 4, criticScore);
    sqlite3_bind_double(stmt, 5, score);
    sqlite3_bind_int64(stmt, 6, nowMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(afStore, "updateBestAttempt step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const bool becameBest = sqlite3_changes(m_db) > 0;
    if (becameBest) {
        LOG_INFO(afStore, "Thread %s resolved by attempt %s (final=%.3f)",
                 qUtf8Printable(threadId), qUtf8Printable(attemptId), score);
    }
    return becameBest;
}

int AttemptThreadStore::pruneExpired(qint64 nowMs)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM attempt_threads WHERE expires_at_ms <= ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "pruneExpired prepare failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, nowMs);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(afStore, "pruneExpired step failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_changes(m_db);
}

// ── Records ─────────────────────────────────────────────────

std::optional<int> AttemptThreadStore::addAttemptRecord(const QString& threadId,
                                                        const AttemptRecord& record)
{
    static constexpr const char* kSql = R"(
        INSERT INTO attempt_records (thread_id, seq, attempt_id, event_id, trace_id, ts_ms,
                                     payload_json, reward, critic_score, outcome, revision)
        VALUES (?1,
                (SELECT COALESCE(MAX(seq), 0) + 1 FROM attempt_records WHERE thread_id = ?1),
                ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, 0)
        RETURNING seq
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "addAttemptRecord prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray threadUtf8 = threadId.toUtf8();
    const QByteArray attemptUtf8 = record.attemptId.toUtf8();
    const QByteArray eventUtf8 = record.eventId.toUtf8();
    const QByteArray traceUtf8 = record.traceId.toUtf8();
    const QByteArray payloadUtf8 = QJsonDocument(record.payload).toJson(QJsonDocument::Compact);
    const QByteArray outcomeUtf8 = outcomeToString(record.outcome).toUtf8();

    sqlite3_bind_text(stmt, 1, threadUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, attemptUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, eventUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, traceUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, record.tsMs);
    sqlite3_bind_text(stmt, 6, payloadUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 7, record.reward);
    sqlite3_bind_double(stmt, 8, record.criticScore);
    sqlite3_bind_text(stmt, 9, outcomeUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<int> seq;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        seq = sqlite3_column_int(stmt, 0);
    } else {
        LOG_ERROR(afStore, "addAttemptRecord step failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return seq;
}

std::vector<AttemptRecord> AttemptThreadStore::records(const QString& threadId, int limit) const
{
    std::vector<AttemptRecord> out;
    const QByteArray sql = QByteArray("SELECT ") + kRecordColumns
        + " FROM attempt_records WHERE thread_id = ?1 ORDER BY seq DESC LIMIT ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "records prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    const QByteArray threadUtf8 = threadId.toUtf8();
    sqlite3_bind_text(stmt, 1, threadUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(readRecord(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

std::optional<AttemptRecord> AttemptThreadStore::latestRecord(const QString& threadId) const
{
    std::vector<AttemptRecord> latest = records(threadId, 1);
    if (latest.empty()) {
        return std::nullopt;
    }
    return latest.front();
}

std::optional<AttemptRecord> AttemptThreadStore::record(const QString& threadId,
                                                        const QString& attemptId) const
{
    const QByteArray sql = QByteArray("SELECT ") + kRecordColumns
        + " FROM attempt_records WHERE thread_id = ?1 AND attempt_id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "record prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray threadUtf8 = threadId.toUtf8();
    const QByteArray attemptUtf8 = attemptId.toUtf8();
    sqlite3_bind_text(stmt, 1, threadUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, attemptUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<AttemptRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readRecord(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<AttemptThreadStore::TraceMatch> AttemptThreadStore::findRecordByTrace(
    const QString& userId, const QString& traceId) const
{
    static constexpr const char* kSql = R"(
        SELECT r.thread_id, r.attempt_id, r.event_id, r.trace_id, r.ts_ms, r.payload_json,
               r.reward, r.critic_score, r.outcome, r.seq, r.revision
        FROM attempt_records r
        JOIN attempt_threads t ON t.thread_id = r.thread_id
        WHERE t.user_id = ?1 AND r.trace_id = ?2 AND t.expires_at_ms > ?3
        ORDER BY r.ts_ms DESC
        LIMIT 1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afStore, "findRecordByTrace prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray traceUtf8 = traceId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, traceUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, QDateTime::currentMSecsSinceEpoch());

    std::optional<TraceMatch> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        TraceMatch match;
        match.threadId = columnText(stmt, 0);
        match.record = readRecord(stmt, 1);
        result = match;
    }
    sqlite3_finalize(stmt);
    return result;
}

// ── Compare-and-swap rewrites ───────────────────────────────

AttemptThreadStore::WriteResult AttemptThreadStore::casRewrite(
    const QString& threadId,
    const QString& attemptId,
    std::optional<int64_t> expectedRevision,
    const char* sql,
    const std::function<void(sqlite3_stmt*, const AttemptRecord&)>& bind)
{
    const QByteArray threadUtf8 = threadId.toUtf8();
    const QByteArray attemptUtf8 = attemptId.toUtf8();

    for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
        const std::optional<AttemptRecord> current = record(threadId, attemptId);
        if (!current) {
            return WriteResult::NotFound;
        }
        if (expectedRevision && *expectedRevision != current->revision) {
            return WriteResult::Conflict;
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(afStore, "CAS rewrite prepare failed: %s", sqlite3_errmsg(m_db));
            return WriteResult::Error;
        }
        sqlite3_bind_text(stmt, 1, threadUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, attemptUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, current->revision);
        bind(stmt, *current);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(afStore, "CAS rewrite step failed: %s", sqlite3_errmsg(m_db));
            return WriteResult::Error;
        }
        if (sqlite3_changes(m_db) == 1) {
            return WriteResult::Applied;
        }
        if (expectedRevision) {
            return WriteResult::Conflict;
        }
        LOG_DEBUG(afStore, "CAS conflict on attempt %s, retrying", qUtf8Printable(attemptId));
    }
    LOG_WARN(afStore, "CAS rewrite gave up on attempt %s after %d conflicts",
             qUtf8Printable(attemptId), kMaxCasAttempts);
    return WriteResult::Conflict;
}

AttemptThreadStore::WriteResult AttemptThreadStore::updateAttemptRecordReward(
    const QString& threadId,
    const QString& attemptId,
    double reward,
    Outcome outcome,
    std::optional<int64_t> expectedRevision)
{
    static constexpr const char* kSql = R"(
        UPDATE attempt_records
        SET reward = ?4, outcome = ?5, revision = revision + 1
        WHERE thread_id = ?1 AND attempt_id = ?2 AND revision = ?3
    )";
    const QByteArray outcomeUtf8 = outcomeToString(outcome).toUtf8();
    return casRewrite(threadId, attemptId, expectedRevision, kSql,
                      [&](sqlite3_stmt* stmt, const AttemptRecord&) {
                          sqlite3_bind_double(stmt, 4, reward);
                          sqlite3_bind_text(stmt, 5, outcomeUtf8.constData(), -1, SQLITE_STATIC);
                      });
}

AttemptThreadStore::WriteResult AttemptThreadStore::stageCriticScore(
    const QString& threadId,
    const QString& attemptId,
    double criticScore,
    const QJsonObject& payloadPatch,
    std::optional<int64_t> expectedRevision)
{
    static constexpr const char* kSql = R"(
        UPDATE attempt_records
        SET critic_score = ?4, payload_json = ?5, revision = revision + 1
        WHERE thread_id = ?1 AND attempt_id = ?2 AND revision = ?3
    )";
    return casRewrite(threadId, attemptId, expectedRevision, kSql,
                      [&](sqlite3_stmt* stmt, const AttemptRecord& current) {
                          QJsonObject merged = current.payload;
                          for (auto it = payloadPatch.begin(); it != payloadPatch.end(); ++it) {
                              merged.insert(it.key(), it.value());
                          }
                          const QByteArray payloadUtf8 =
                              QJsonDocument(merged).toJson(QJsonDocument::Compact);
                          sqlite3_bind_double(stmt, 4, criticScore);
                          sqlite3_bind_text(stmt, 5, payloadUtf8.constData(), -1, SQLITE_TRANSIENT);
                      });
}

} // namespace af
