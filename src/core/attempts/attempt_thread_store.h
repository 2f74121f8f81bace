#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <functional>
#include <optional>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace af {

// AttemptThreadStore correlates repeated attempts at the same fingerprinted
// request. One thread exists per (user, fingerprint); its records are
// addressed by (thread_id, seq) and never rewritten in place without a
// revision check, so concurrent writers cannot silently clobber each other.
class AttemptThreadStore {
public:
    // Best-attempt eligibility gate and composite score weights.
    static constexpr double kMinCriticScore = 0.8;
    static constexpr double kMinReward = 0.6;
    static constexpr double kRewardWeight = 0.7;
    static constexpr double kCriticWeight = 0.3;

    enum class WriteResult {
        Applied,
        Conflict,   // revision moved underneath the caller
        NotFound,
        Error,
    };

    struct ThreadHandle {
        QString threadId;
        int attemptCount = 0;
        bool created = false;
    };

    struct TraceMatch {
        QString threadId;
        AttemptRecord record;
    };

    explicit AttemptThreadStore(sqlite3* db, int ttlDays = 30);

    // Returns the thread for (user, fingerprint), incrementing attempt_count
    // and refreshing its TTL, or creates it with attempt_count = 1.
    std::optional<ThreadHandle> getOrCreateThread(const QString& userId,
                                                  const QString& fingerprint,
                                                  const QString& domain,
                                                  qint64 nowMs);

    // Appends a record at the next seq. Returns the assigned seq.
    std::optional<int> addAttemptRecord(const QString& threadId, const AttemptRecord& record);

    // Most-recent-first. limit < 0 returns every record.
    std::vector<AttemptRecord> records(const QString& threadId, int limit = -1) const;
    std::optional<AttemptRecord> latestRecord(const QString& threadId) const;
    std::optional<AttemptRecord> record(const QString& threadId, const QString& attemptId) const;

    // Finds the user's attempt record created for traceId (the USER_MESSAGE
    // an AI_RESPONSE answers).
    std::optional<TraceMatch> findRecordByTrace(const QString& userId, const QString& traceId) const;

    // Compare-and-swap rewrite of reward/outcome. With no expectedRevision
    // the current revision is read and the swap retried a few times.
    WriteResult updateAttemptRecordReward(const QString& threadId,
                                          const QString& attemptId,
                                          double reward,
                                          Outcome outcome,
                                          std::optional<int64_t> expectedRevision = std::nullopt);

    // Stages a critic score on the record and merges payloadPatch into its
    // payload (strategy, pattern text). Same CAS rules as above.
    WriteResult stageCriticScore(const QString& threadId,
                                 const QString& attemptId,
                                 double criticScore,
                                 const QJsonObject& payloadPatch = {},
                                 std::optional<int64_t> expectedRevision = std::nullopt);

    // Set-if-greater on the thread's best final score. Only eligible attempts
    // are considered; the thread becomes resolved when a new best is set and
    // never reverts. Returns nullopt on storage error.
    std::optional<bool> updateBestAttempt(const QString& threadId,
                                          const QString& attemptId,
                                          double reward,
                                          double criticScore,
                                          Outcome outcome,
                                          qint64 nowMs);

    std::optional<AttemptThread> thread(const QString& threadId) const;
    std::optional<AttemptThread> threadForFingerprint(const QString& userId,
                                                      const QString& fingerprint) const;

    // Deletes expired threads (records cascade). Returns rows removed, -1 on error.
    int pruneExpired(qint64 nowMs);

    static bool isEligible(double reward, double criticScore, Outcome outcome);
    static double finalScore(double reward, double criticScore);

private:
    qint64 expiryFromNow() const;
    WriteResult casRewrite(const QString& threadId,
                           const QString& attemptId,
                           std::optional<int64_t> expectedRevision,
                           const char* sql,
                           const std::function<void(sqlite3_stmt*, const AttemptRecord&)>& bind);

    sqlite3* m_db = nullptr;
    qint64 m_ttlMs = 0;
};

} // namespace af
