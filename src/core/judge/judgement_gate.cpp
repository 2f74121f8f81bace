#include "core/judge/judgement_gate.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace af {

namespace {

// Runs call on a detached worker and waits at most timeoutMs. On timeout the
// worker is abandoned; it owns everything it touches through the captured
// shared_ptr, so finishing late is harmless.
template <typename T>
std::optional<T> callWithTimeout(std::function<std::optional<T>(QString*)> call,
                                 int timeoutMs,
                                 QString* errorOut)
{
    struct Reply {
        std::optional<T> value;
        QString error;
    };

    auto task = std::make_shared<std::packaged_task<Reply()>>([call = std::move(call)]() {
        Reply reply;
        reply.value = call(&reply.error);
        return reply;
    });
    std::future<Reply> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        if (errorOut) {
            *errorOut = QStringLiteral("timeout after %1 ms").arg(timeoutMs);
        }
        return std::nullopt;
    }

    Reply reply = future.get();
    if (!reply.value && errorOut) {
        *errorOut = reply.error.isEmpty() ? QStringLiteral("no result") : reply.error;
    }
    return reply.value;
}

} // namespace

JudgementGate::JudgementGate(std::shared_ptr<SafetyClassifier> classifier,
                             std::shared_ptr<CriticScorer> critic,
                             bool failOpen,
                             int timeoutMs)
    : m_classifier(std::move(classifier))
    , m_critic(std::move(critic))
    , m_failOpen(failOpen)
    , m_timeoutMs(timeoutMs)
{
}

JudgementGate::SafetyDecision JudgementGate::checkSafety(const QString& text) const
{
    SafetyDecision decision;
    if (!m_classifier) {
        decision.reason = QStringLiteral("classifier_disabled");
        return decision;
    }

    std::shared_ptr<SafetyClassifier> classifier = m_classifier;
    QString error;
    const std::optional<SafetyVerdict> verdict = callWithTimeout<SafetyVerdict>(
        [classifier, text](QString* err) { return classifier->classify(text, err); },
        m_timeoutMs, &error);

    if (!verdict) {
        decision.degraded = true;
        if (m_failOpen) {
            LOG_WARN(afJudge, "Safety classifier unavailable (%s), allowing",
                     qUtf8Printable(error));
            decision.reason = QStringLiteral("classifier_error_fail_open");
        } else {
            LOG_WARN(afJudge, "Safety classifier unavailable (%s), blocking",
                     qUtf8Printable(error));
            decision.allowed = false;
            decision.category = SafetyCategory::kUnavailable;
            decision.reason = QStringLiteral("classifier_error_fail_closed");
        }
        return decision;
    }

    decision.allowed = verdict->allowed;
    decision.category = verdict->allowed
        ? SafetyCategory::kNone
        : (verdict->category.isEmpty() || verdict->category == SafetyCategory::kNone
               ? SafetyCategory::kHarmful
               : verdict->category);
    decision.reason = verdict->reasonShort;
    return decision;
}

std::optional<CriticResult> JudgementGate::scoreResponse(const QString& userText,
                                                         const QString& assistantText,
                                                         QString* errorOut) const
{
    if (!m_critic) {
        CriticResult neutral;
        neutral.reasons.append(QStringLiteral("critic_disabled"));
        return neutral;
    }

    std::shared_ptr<CriticScorer> critic = m_critic;
    QString error;
    std::optional<CriticResult> result = callWithTimeout<CriticResult>(
        [critic, userText, assistantText](QString* err) {
            return critic->score(userText, assistantText, err);
        },
        m_timeoutMs, &error);

    if (!result) {
        if (!m_failOpen) {
            LOG_WARN(afJudge, "Critic unavailable (%s)", qUtf8Printable(error));
            if (errorOut) {
                *errorOut = QStringLiteral("critic unavailable: %1").arg(error);
            }
            return std::nullopt;
        }
        LOG_WARN(afJudge, "Critic unavailable (%s), using neutral score", qUtf8Printable(error));
        CriticResult neutral;
        neutral.criticScore = kNeutralCriticScore;
        neutral.reasons.append(QStringLiteral("api_error"));
        return neutral;
    }

    result->criticScore = std::clamp(result->criticScore, 0.0, 1.0);
    return result;
}

} // namespace af
