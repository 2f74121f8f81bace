#include "core/stream/event_processor.h"
#include "core/attempts/attempt_thread_store.h"
#include "core/attempts/reward_resolver.h"
#include "core/ingest/fingerprint.h"
#include "core/judge/judgement_gate.h"
#include "core/judge/safety_counters.h"
#include "core/learning/bandit_selector.h"
#include "core/learning/policy_pattern_index.h"
#include "core/shared/logging.h"
#include "core/store/savepoint.h"
#include "core/stream/event_log.h"
#include "core/stream/session_ledger.h"

#include <QDateTime>
#include <QUuid>

#include <algorithm>

namespace af {

namespace {

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

QString writeResultName(AttemptThreadStore::WriteResult result)
{
    switch (result) {
    case AttemptThreadStore::WriteResult::Applied:  return QStringLiteral("applied");
    case AttemptThreadStore::WriteResult::Conflict: return QStringLiteral("revision conflict");
    case AttemptThreadStore::WriteResult::NotFound: return QStringLiteral("record not found");
    case AttemptThreadStore::WriteResult::Error:    return QStringLiteral("storage error");
    }
    return QStringLiteral("storage error");
}

const QString kSafetyKey = QStringLiteral("safety");
const QString kFingerprintKey = QStringLiteral("fingerprint");
const QString kStrategyKey = QStringLiteral("strategy");
const QString kPatternKey = QStringLiteral("pattern");
const QString kDomainKey = QStringLiteral("domain");
const QString kTextKey = QStringLiteral("text");
const QString kCriticScoreKey = QStringLiteral("critic_score");

} // anonymous namespace

EventProcessor::EventProcessor(Dependencies deps)
    : m_deps(deps)
{
}

bool EventProcessor::handle(const LogEntry& entry, QString* errorOut)
{
    QString decodeError;
    auto event = CanonicalEvent::fromJson(entry.eventJson, &decodeError);
    if (!event) {
        return fail(errorOut, QStringLiteral("malformed event: %1").arg(decodeError));
    }
    if (!m_deps.threads) {
        return fail(errorOut, QStringLiteral("attempt thread store unavailable"));
    }

    Savepoint sp(m_deps.db, "process_entry");
    if (!sp.isActive()) {
        return fail(errorOut, QStringLiteral("could not open savepoint"));
    }

    // Expiry runs on wall-clock time; rewards run on event time.
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();

    switch (event->eventType) {
    case EventType::UserMessage: {
        bool blocked = false;
        if (!handleUserMessage(*event, nowMs, &blocked, errorOut)) {
            return false;
        }
        if (blocked) {
            return sp.commit() || fail(errorOut, QStringLiteral("commit failed"));
        }
        break;
    }
    case EventType::AiResponse:
        if (!handleAiResponse(*event, errorOut)) {
            return false;
        }
        break;
    case EventType::Navigate:
    case EventType::PageExtract:
    case EventType::UserFeedback:
        break;
    }

    if (m_deps.sessions && !m_deps.sessions->record(*event, nowMs)) {
        return fail(errorOut, QStringLiteral("session bookkeeping failed"));
    }

    if (!sp.commit()) {
        return fail(errorOut, QStringLiteral("commit failed"));
    }
    return true;
}

bool EventProcessor::handleUserMessage(CanonicalEvent& event, qint64 nowMs, bool* blockedOut,
                                       QString* errorOut)
{
    const QString text = event.text();

    // Ingestion stamps allowed messages; only unstamped entries are checked here.
    if (!event.payload.value(kSafetyKey).isObject() && m_deps.gate) {
        const JudgementGate::SafetyDecision decision = m_deps.gate->checkSafety(text);
        if (!decision.allowed) {
            if (m_deps.safetyCounters
                && !m_deps.safetyCounters->increment(event.userId, decision.category)) {
                return fail(errorOut, QStringLiteral("safety counter update failed"));
            }
            ++m_blocked;
            *blockedOut = true;
            return true;
        }
    }

    const QString fingerprint = Fingerprinter::fingerprint(text);
    QString domain = event.payload.value(kDomainKey).toString().trimmed();
    if (domain.isEmpty()) {
        domain = kUnknownDomain;
    }

    const auto handle = m_deps.threads->getOrCreateThread(event.userId, fingerprint, domain, nowMs);
    if (!handle) {
        return fail(errorOut, QStringLiteral("could not open attempt thread"));
    }
    event.attemptThreadId = handle->threadId;

    if (!handle->created
        && !resolvePreviousAttempt(handle->threadId, event, fingerprint, nowMs, errorOut)) {
        return false;
    }

    AttemptRecord record;
    record.attemptId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.eventId = event.eventId;
    record.traceId = event.traceId;
    record.tsMs = event.tsMs;
    record.payload[kTextKey] = text;
    record.payload[kFingerprintKey] = fingerprint;
    record.payload[kDomainKey] = domain;
    record.payload[QStringLiteral("session_id")] = event.sessionId;
    record.payload[QStringLiteral("provider")] = event.provider;
    if (event.payload.contains(kStrategyKey)) {
        record.payload[kStrategyKey] = event.payload.value(kStrategyKey);
    }

    if (!m_deps.threads->addAttemptRecord(handle->threadId, record)) {
        return fail(errorOut, QStringLiteral("could not append attempt record"));
    }

    LOG_DEBUG(afStream, "User %s attempt %d in thread %s",
              qUtf8Printable(event.userId), handle->attemptCount,
              qUtf8Printable(handle->threadId));
    return true;
}

bool EventProcessor::resolvePreviousAttempt(const QString& threadId, const CanonicalEvent& event,
                                            const QString& fingerprint, qint64 nowMs,
                                            QString* errorOut)
{
    const auto previous = m_deps.threads->latestRecord(threadId);
    if (!previous) {
        return true;
    }

    std::optional<QString> prevFingerprint;
    const QString storedFingerprint = previous->payload.value(kFingerprintKey).toString();
    if (!storedFingerprint.isEmpty()) {
        prevFingerprint = storedFingerprint;
    }

    const RewardResult reward = RewardResolver::resolve(
        event.text(), fingerprint, prevFingerprint, previous->tsMs, event.tsMs);

    const auto written = m_deps.threads->updateAttemptRecordReward(
        threadId, previous->attemptId, reward.reward, reward.outcome);
    if (written != AttemptThreadStore::WriteResult::Applied) {
        return fail(errorOut, QStringLiteral("reward update failed: %1").arg(writeResultName(written)));
    }

    const auto becameBest = m_deps.threads->updateBestAttempt(
        threadId, previous->attemptId, reward.reward, previous->criticScore, reward.outcome, nowMs);
    if (!becameBest) {
        return fail(errorOut, QStringLiteral("best-attempt update failed"));
    }

    const auto thread = m_deps.threads->thread(threadId);
    const QString domain = thread ? thread->domain : kUnknownDomain;
    const QString strategy = previous->payload.value(kStrategyKey).toString();

    if (m_deps.bandit && !strategy.isEmpty()
        && !m_deps.bandit->recordWin(event.userId, domain, strategy, reward.outcome)) {
        LOG_WARN(afStream, "Could not record outcome for strategy %s", qUtf8Printable(strategy));
    }

    if (*becameBest) {
        ++m_resolved;
        LOG_INFO(afStream, "Thread %s resolved by attempt %s (%s)",
                 qUtf8Printable(threadId), qUtf8Printable(previous->attemptId),
                 qUtf8Printable(reward.reason));

        QString pattern = previous->payload.value(kPatternKey).toString();
        if (pattern.isEmpty() && !strategy.isEmpty()) {
            pattern = QStringLiteral("strategy:%1").arg(strategy);
        }
        if (m_deps.patterns && !pattern.isEmpty()
            && !m_deps.patterns->add(event.userId, domain, pattern, reward.reward,
                                     previous->criticScore)) {
            return fail(errorOut, QStringLiteral("pattern promotion failed"));
        }
    }
    return true;
}

bool EventProcessor::handleAiResponse(const CanonicalEvent& event, QString* errorOut)
{
    const auto match = m_deps.threads->findRecordByTrace(event.userId, event.traceId);
    if (!match) {
        LOG_DEBUG(afStream, "No user message for trace %s; response not scored",
                  qUtf8Printable(event.traceId));
        return true;
    }

    double criticScore = JudgementGate::kNeutralCriticScore;
    const QJsonValue preScored = event.payload.value(kCriticScoreKey);
    if (preScored.isDouble()) {
        criticScore = std::clamp(preScored.toDouble(), 0.0, 1.0);
    } else if (m_deps.gate) {
        QString criticError;
        const auto result = m_deps.gate->scoreResponse(
            match->record.payload.value(kTextKey).toString(), event.text(), &criticError);
        if (!result) {
            return fail(errorOut, QStringLiteral("critic unavailable: %1").arg(criticError));
        }
        criticScore = result->criticScore;
    }

    QJsonObject patch;
    for (const QString& key : {kStrategyKey, kPatternKey}) {
        if (event.payload.contains(key)) {
            patch[key] = event.payload.value(key);
        }
    }

    const auto written = m_deps.threads->stageCriticScore(
        match->threadId, match->record.attemptId, criticScore, patch);
    if (written != AttemptThreadStore::WriteResult::Applied) {
        return fail(errorOut, QStringLiteral("critic staging failed: %1").arg(writeResultName(written)));
    }
    return true;
}

} // namespace af
