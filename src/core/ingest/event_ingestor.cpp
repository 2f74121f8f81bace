#include "core/ingest/event_ingestor.h"
#include "core/ingest/event_normalizer.h"
#include "core/ingest/fingerprint.h"
#include "core/judge/judgement_gate.h"
#include "core/judge/safety_counters.h"
#include "core/shared/logging.h"
#include "core/store/savepoint.h"
#include "core/stream/event_log.h"

#include <vector>

namespace af {

QJsonObject IngestResult::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("accepted")] = accepted;
    if (!accepted) {
        json[QStringLiteral("error")] = error;
        json[QStringLiteral("rejectedIndex")] = rejectedIndex;
    }
    json[QStringLiteral("appended")] = appended;
    json[QStringLiteral("blocked")] = blocked;
    json[QStringLiteral("eventIds")] = QJsonArray::fromStringList(eventIds);
    return json;
}

EventIngestor::EventIngestor(EventLog* log, const JudgementGate* gate, SafetyCounters* counters)
    : m_log(log)
    , m_gate(gate)
    , m_counters(counters)
{
}

IngestResult EventIngestor::ingestBatch(const QJsonArray& rawEvents, qint64 nowMs)
{
    IngestResult result;

    if (rawEvents.isEmpty() || rawEvents.size() > kMaxBatchSize) {
        result.invalid = true;
        result.error = QStringLiteral("batch must contain 1-%1 events").arg(kMaxBatchSize);
        return result;
    }

    // ── Validate the whole batch before anything is persisted ──
    std::vector<CanonicalEvent> events;
    events.reserve(static_cast<size_t>(rawEvents.size()));
    for (int i = 0; i < rawEvents.size(); ++i) {
        if (!rawEvents.at(i).isObject()) {
            result.invalid = true;
            result.error = QStringLiteral("event %1: not an object").arg(i);
            result.rejectedIndex = i;
            return result;
        }
        QString error;
        auto event = EventNormalizer::normalize(rawEvents.at(i).toObject(), nowMs, &error);
        if (!event) {
            result.invalid = true;
            result.error = QStringLiteral("event %1: %2").arg(i).arg(error);
            result.rejectedIndex = i;
            LOG_WARN(afIngest, "Rejected batch of %d: %s",
                     static_cast<int>(rawEvents.size()), qUtf8Printable(result.error));
            return result;
        }
        events.push_back(std::move(*event));
    }

    // ── Safety gate ─────────────────────────────────────────
    std::vector<bool> keep(events.size(), true);
    for (size_t i = 0; i < events.size(); ++i) {
        CanonicalEvent& event = events[i];
        if (event.eventType != EventType::UserMessage) {
            continue;
        }
        // Stamps are only ever written here; never trust one from the caller.
        event.payload.remove(QStringLiteral("safety"));

        if (m_gate) {
            const JudgementGate::SafetyDecision decision = m_gate->checkSafety(event.text());
            if (!decision.allowed) {
                keep[i] = false;
                ++result.blocked;
                if (m_counters && !m_counters->increment(event.userId, decision.category)) {
                    LOG_WARN(afIngest, "Failed to count blocked message for %s",
                             qUtf8Printable(event.userId));
                }
                continue;
            }
            QJsonObject safety;
            safety[QStringLiteral("allowed")] = true;
            safety[QStringLiteral("category")] = decision.category;
            safety[QStringLiteral("reason")] = decision.reason;
            safety[QStringLiteral("degraded")] = decision.degraded;
            event.payload[QStringLiteral("safety")] = safety;
        }
        event.payload[QStringLiteral("fingerprint")] = Fingerprinter::fingerprint(event.text());
    }

    // ── Append ──────────────────────────────────────────────
    Savepoint sp(m_log ? m_log->database() : nullptr, "ingest_batch");
    if (!sp.isActive()) {
        result.error = QStringLiteral("storage unavailable");
        return result;
    }
    QStringList appendedIds;
    for (size_t i = 0; i < events.size(); ++i) {
        if (!keep[i]) {
            continue;
        }
        if (!m_log->append(events[i], nowMs)) {
            result.error = QStringLiteral("failed to append event %1").arg(static_cast<int>(i));
            return result;
        }
        appendedIds.append(events[i].eventId);
    }
    if (!sp.commit()) {
        result.error = QStringLiteral("failed to commit batch");
        return result;
    }
    m_log->notifyAppended();

    result.accepted = true;
    result.appended = appendedIds.size();
    result.eventIds = appendedIds;
    LOG_INFO(afIngest, "Ingested batch: %d appended, %d blocked",
             result.appended, result.blocked);
    return result;
}

} // namespace af
