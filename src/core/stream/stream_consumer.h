#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <atomic>
#include <memory>
#include <thread>

namespace af {

class AppendNotifier;
class EventHandler;
class EventLog;
struct LogEntry;

// StreamConsumer drives the per-user logs through an EventHandler under one
// consumer group.
//
// Per user per cycle: ensure the group exists, reclaim entries idle longer
// than reclaimIdleMs (processed first), then read up to readBatchSize new
// entries. An entry is acknowledged only after the handler succeeds. A
// failure bumps the entry's retry counter; at maxRetries the entry goes to
// the dead-letter log and is acknowledged.
//
// start() runs the cycle on a worker thread, round-robin over users, waiting
// up to readBlockMs for an append whenever a full pass found nothing.
// stop() lets the in-flight batch finish and joins.
class StreamConsumer {
public:
    struct Options {
        QString group = QStringLiteral("cg:processor");
        QString consumer = QStringLiteral("processor-1");
        QStringList trackedUsers;      // empty = every user with a log
        int maxRetries = 3;
        int readBatchSize = 10;
        int readBlockMs = 2000;
        int reclaimIdleMs = 60000;
        int reclaimBatchSize = 10;
    };

    struct Stats {
        int processed = 0;
        int failed = 0;
        int deadLettered = 0;
        int reclaimed = 0;
        int cycles = 0;

        QJsonObject toJson() const;
    };

    StreamConsumer(EventLog* log, EventHandler* handler, Options options);
    ~StreamConsumer();

    StreamConsumer(const StreamConsumer&) = delete;
    StreamConsumer& operator=(const StreamConsumer&) = delete;

    // One cycle for one user. Returns the number of entries handled
    // (processed, failed or dead-lettered).
    int consumeOnce(const QString& userId, qint64 nowMs);

    // One cycle over every user, starting after the user served first last
    // time. Returns entries handled.
    int pollAll(qint64 nowMs);

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    QStringList users() const;
    Stats stats() const;
    const Options& options() const { return m_options; }

private:
    void run();
    void processEntry(const LogEntry& entry, qint64 nowMs);
    void ackEntry(const LogEntry& entry);

    EventLog* m_log = nullptr;
    EventHandler* m_handler = nullptr;
    Options m_options;
    std::shared_ptr<AppendNotifier> m_wake;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    int m_nextUser = 0;

    std::atomic<int> m_processed{0};
    std::atomic<int> m_failed{0};
    std::atomic<int> m_deadLettered{0};
    std::atomic<int> m_reclaimed{0};
    std::atomic<int> m_cycles{0};
};

} // namespace af
