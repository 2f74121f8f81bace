#include "core/stream/stream_consumer.h"
#include "core/shared/logging.h"
#include "core/stream/append_notifier.h"
#include "core/stream/event_handler.h"
#include "core/stream/event_log.h"

#include <QDateTime>

#include <vector>

namespace af {

QJsonObject StreamConsumer::Stats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("processed")] = processed;
    json[QStringLiteral("failed")] = failed;
    json[QStringLiteral("deadLettered")] = deadLettered;
    json[QStringLiteral("reclaimed")] = reclaimed;
    json[QStringLiteral("cycles")] = cycles;
    return json;
}

StreamConsumer::StreamConsumer(EventLog* log, EventHandler* handler, Options options)
    : m_log(log)
    , m_handler(handler)
    , m_options(std::move(options))
    , m_wake(log->notifier())
{
    if (!m_wake) {
        m_wake = std::make_shared<AppendNotifier>();
    }
}

StreamConsumer::~StreamConsumer()
{
    stop();
}

QStringList StreamConsumer::users() const
{
    return m_options.trackedUsers.isEmpty() ? m_log->users() : m_options.trackedUsers;
}

int StreamConsumer::consumeOnce(const QString& userId, qint64 nowMs)
{
    if (!m_log->ensureGroup(userId, m_options.group, nowMs)) {
        LOG_ERROR(afStream, "Could not create group %s for user %s",
                  qUtf8Printable(m_options.group), qUtf8Printable(userId));
        return 0;
    }

    // Entries left behind by a crashed consumer go first.
    const std::vector<LogEntry> claimed = m_log->claimIdle(
        userId, m_options.group, m_options.consumer,
        m_options.reclaimIdleMs, m_options.reclaimBatchSize, nowMs);
    m_reclaimed += static_cast<int>(claimed.size());

    const std::vector<LogEntry> fresh = m_log->readGroup(
        userId, m_options.group, m_options.consumer, m_options.readBatchSize, nowMs);

    for (const LogEntry& entry : claimed) {
        processEntry(entry, nowMs);
    }
    for (const LogEntry& entry : fresh) {
        processEntry(entry, nowMs);
    }
    return static_cast<int>(claimed.size() + fresh.size());
}

void StreamConsumer::processEntry(const LogEntry& entry, qint64 nowMs)
{
    const int retries = m_log->retryCount(m_options.group, entry.seq, nowMs);
    if (retries >= m_options.maxRetries) {
        const QString error = QStringLiteral("Max retries (%1) exceeded").arg(m_options.maxRetries);
        if (m_log->moveToDeadLetter(entry, retries, error, nowMs)) {
            ackEntry(entry);
            ++m_deadLettered;
        }
        return;
    }

    QString error;
    if (m_handler->handle(entry, &error)) {
        ackEntry(entry);
        ++m_processed;
        return;
    }

    ++m_failed;
    const auto count = m_log->incrementRetry(m_options.group, entry.seq, nowMs);
    if (!count) {
        LOG_ERROR(afStream, "Entry %lld failed and its retry counter could not be updated: %s",
                  static_cast<long long>(entry.seq), qUtf8Printable(error));
        return;
    }

    if (*count >= m_options.maxRetries) {
        if (m_log->moveToDeadLetter(entry, *count, error, nowMs)) {
            ackEntry(entry);
            ++m_deadLettered;
        }
        return;
    }

    LOG_WARN(afStream, "Entry %lld failed (attempt %d/%d), left pending: %s",
             static_cast<long long>(entry.seq), *count, m_options.maxRetries,
             qUtf8Printable(error));
}

void StreamConsumer::ackEntry(const LogEntry& entry)
{
    if (!m_log->ack(m_options.group, entry.seq)) {
        LOG_WARN(afStream, "Entry %lld was no longer pending at ack",
                 static_cast<long long>(entry.seq));
    }
}

int StreamConsumer::pollAll(qint64 nowMs)
{
    const QStringList all = users();
    if (all.isEmpty()) {
        return 0;
    }

    int handled = 0;
    const int start = m_nextUser % all.size();
    for (int i = 0; i < all.size(); ++i) {
        if (m_stopping.load()) {
            break;
        }
        handled += consumeOnce(all.at((start + i) % all.size()), nowMs);
    }
    m_nextUser = start + 1;
    ++m_cycles;
    return handled;
}

// ── Lifecycle ───────────────────────────────────────────────

void StreamConsumer::start()
{
    if (m_running.load()) {
        LOG_WARN(afStream, "StreamConsumer::start() called while already running");
        return;
    }

    m_stopping.store(false);
    m_running.store(true);
    m_thread = std::thread([this] { run(); });

    LOG_INFO(afStream, "Consumer %s started (group=%s)",
             qUtf8Printable(m_options.consumer), qUtf8Printable(m_options.group));
}

void StreamConsumer::stop()
{
    if (!m_running.load() && !m_thread.joinable()) {
        return;
    }

    m_stopping.store(true);
    m_wake->notify();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running.store(false);

    LOG_INFO(afStream, "Consumer %s stopped (processed %d, dead-lettered %d)",
             qUtf8Printable(m_options.consumer), m_processed.load(), m_deadLettered.load());
}

void StreamConsumer::run()
{
    while (!m_stopping.load()) {
        const uint64_t seen = m_wake->generation();
        const int handled = pollAll(QDateTime::currentMSecsSinceEpoch());
        if (handled == 0 && !m_stopping.load()) {
            m_wake->waitForAppend(seen, m_options.readBlockMs);
        }
    }
}

StreamConsumer::Stats StreamConsumer::stats() const
{
    Stats s;
    s.processed = m_processed.load();
    s.failed = m_failed.load();
    s.deadLettered = m_deadLettered.load();
    s.reclaimed = m_reclaimed.load();
    s.cycles = m_cycles.load();
    return s;
}

} // namespace af
