#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace af {

class EventLog;
class JudgementGate;
class SafetyCounters;

struct IngestResult {
    bool accepted = false;
    bool invalid = false;     // rejected by validation rather than storage
    QString error;
    int rejectedIndex = -1;   // first invalid event when !accepted
    int appended = 0;
    int blocked = 0;
    QStringList eventIds;     // appended events, batch order

    QJsonObject toJson() const;
};

// EventIngestor is the single write path into the pipeline. A batch is
// validated as a whole; if every event normalizes, USER_MESSAGEs pass the
// safety gate and everything allowed is appended to its user's log in one
// savepoint. Blocked messages leave only a safety counter behind.
//
// Allowed USER_MESSAGEs are stamped with payload.safety and
// payload.fingerprint so the consumer does not classify them again.
class EventIngestor {
public:
    static constexpr int kMaxBatchSize = 100;

    // gate may be null (no safety check); counters may be null only if gate is.
    EventIngestor(EventLog* log, const JudgementGate* gate, SafetyCounters* counters);

    IngestResult ingestBatch(const QJsonArray& rawEvents, qint64 nowMs);

private:
    EventLog* m_log = nullptr;
    const JudgementGate* m_gate = nullptr;
    SafetyCounters* m_counters = nullptr;
};

} // namespace af
