#pragma once

#include "core/shared/canonical_event.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

struct sqlite3;

namespace af {

class AppendNotifier;

// One delivered log entry. eventJson is the stored canonical event; it is
// decoded by the handler so a corrupt entry fails (and dead-letters) like
// any other processing error.
struct LogEntry {
    int64_t seq = 0;
    QString userId;
    QJsonObject eventJson;
    qint64 appendedAtMs = 0;
    int deliveryCount = 0;

    QString entryId() const { return QString::number(seq); }
};

struct PendingEntry {
    int64_t seq = 0;
    QString consumer;
    qint64 deliveredAtMs = 0;
    int deliveryCount = 0;
};

struct DeadLetter {
    int64_t id = 0;
    QString userId;
    QString originalMessageId;
    int retryCount = 0;
    QString error;
    qint64 failedAtMs = 0;
    QString eventData;   // canonical event JSON, verbatim

    QJsonObject toJson() const;
};

// EventLog: durable, ordered, per-user append-only log with consumer
// groups, backed by SQLite.
//
// Delivery model:
//   - a group starts at the beginning of the user's log
//   - readGroup() hands out entries past the group's cursor and records
//     them as pending for the reading consumer
//   - ack() removes an entry from pending; only the first ack succeeds
//   - claimIdle() transfers entries pending longer than minIdleMs to the
//     caller, so entries of a crashed consumer are never lost
//
// Each user's log is trimmed to roughly maxLen entries on append. Retry
// counters expire after retryTtlHours; the dead-letter log keeps the newest
// deadLetterMaxLen entries per user.
class EventLog {
public:
    struct Options {
        int maxLen = 1000;
        int deadLetterMaxLen = 500;
        int retryTtlHours = 24;
    };

    EventLog(sqlite3* db, Options options, std::shared_ptr<AppendNotifier> notifier = nullptr);

    // Returns the entry seq.
    std::optional<int64_t> append(const CanonicalEvent& event, qint64 nowMs);

    bool ensureGroup(const QString& userId, const QString& group, qint64 nowMs);

    std::vector<LogEntry> readGroup(const QString& userId, const QString& group,
                                    const QString& consumer, int count, qint64 nowMs);

    bool ack(const QString& group, int64_t seq);

    std::vector<LogEntry> claimIdle(const QString& userId, const QString& group,
                                    const QString& consumer, int minIdleMs, int count,
                                    qint64 nowMs);

    std::vector<PendingEntry> pending(const QString& userId, const QString& group) const;

    // ── Retry bookkeeping ───────────────────────────────────

    int retryCount(const QString& group, int64_t seq, qint64 nowMs) const;
    std::optional<int> incrementRetry(const QString& group, int64_t seq, qint64 nowMs);

    // ── Dead letters ────────────────────────────────────────

    bool moveToDeadLetter(const LogEntry& entry, int retryCount, const QString& error, qint64 nowMs);
    std::vector<DeadLetter> deadLetters(const QString& userId, int limit = 50) const;
    int deadLetterCount(const QString& userId) const;

    // ── Introspection ───────────────────────────────────────

    int length(const QString& userId) const;
    QStringList users() const;

    // Removes expired retry counters. Returns rows removed.
    int pruneExpiredRetries(qint64 nowMs);

    // Wakes waiting consumers. append() does this itself unless it runs
    // inside an open transaction, in which case the caller notifies after
    // committing.
    void notifyAppended() const;

    sqlite3* database() const { return m_db; }
    std::shared_ptr<AppendNotifier> notifier() const { return m_notifier; }

private:
    bool trim(const QString& userId);

    sqlite3* m_db = nullptr;
    Options m_options;
    std::shared_ptr<AppendNotifier> m_notifier;
};

} // namespace af
