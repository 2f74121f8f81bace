#pragma once

#include "core/shared/canonical_event.h"
#include "core/stream/event_handler.h"

#include <QString>
#include <atomic>

struct sqlite3;

namespace af {

class AttemptThreadStore;
class BanditSelector;
class JudgementGate;
class PolicyPatternIndex;
class SafetyCounters;
class SessionLedger;

// EventProcessor runs the per-event pipeline for one log entry:
//
//   USER_MESSAGE  safety gate (unless stamped at ingestion) -> fingerprint
//                 -> thread lookup/create -> reward the previous attempt
//                 -> best-attempt check with its staged critic score
//                 -> append a new, unscored attempt record
//   AI_RESPONSE   critic score against the paired USER_MESSAGE (same trace)
//                 -> stage it on that message's attempt record
//   all           session bookkeeping
//
// Every write for one entry happens inside a single savepoint on db, so a
// failed entry leaves nothing behind and its retry starts clean.
class EventProcessor : public EventHandler {
public:
    struct Dependencies {
        sqlite3* db = nullptr;
        AttemptThreadStore* threads = nullptr;
        const JudgementGate* gate = nullptr;         // optional
        SafetyCounters* safetyCounters = nullptr;
        BanditSelector* bandit = nullptr;            // optional
        PolicyPatternIndex* patterns = nullptr;      // optional
        SessionLedger* sessions = nullptr;           // optional
    };

    static inline const QString kUnknownDomain = QStringLiteral("unknown");

    explicit EventProcessor(Dependencies deps);

    bool handle(const LogEntry& entry, QString* errorOut) override;

    int blockedCount() const { return m_blocked.load(); }
    int resolvedCount() const { return m_resolved.load(); }

private:
    bool handleUserMessage(CanonicalEvent& event, qint64 nowMs, bool* blockedOut,
                           QString* errorOut);
    bool handleAiResponse(const CanonicalEvent& event, QString* errorOut);

    // Rewards the thread's previous attempt from the new message and
    // promotes it if it became the thread's best.
    bool resolvePreviousAttempt(const QString& threadId, const CanonicalEvent& event,
                                const QString& fingerprint, qint64 nowMs, QString* errorOut);

    Dependencies m_deps;
    std::atomic<int> m_blocked{0};
    std::atomic<int> m_resolved{0};
};

} // namespace af
