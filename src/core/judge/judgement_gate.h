#pragma once

#include "core/judge/critic_scorer.h"
#include "core/judge/safety_classifier.h"

#include <QString>
#include <memory>
#include <optional>

namespace af {

// JudgementGate wraps the external safety classifier and critic with a
// per-call timeout and the configured outage policy.
//
// failOpen = true:  classifier outage -> allowed; critic outage -> 0.5.
// failOpen = false: classifier outage -> blocked as UNAVAILABLE;
//                   critic outage -> nullopt (the caller fails the entry
//                   so it is retried and eventually dead-lettered).
//
// A missing classifier or critic means the check is disabled, not failing.
class JudgementGate {
public:
    static constexpr double kNeutralCriticScore = 0.5;

    struct SafetyDecision {
        bool allowed = true;
        QString category = SafetyCategory::kNone;
        QString reason;
        bool degraded = false;   // verdict came from the outage policy
    };

    JudgementGate(std::shared_ptr<SafetyClassifier> classifier,
                  std::shared_ptr<CriticScorer> critic,
                  bool failOpen,
                  int timeoutMs);

    SafetyDecision checkSafety(const QString& text) const;

    std::optional<CriticResult> scoreResponse(const QString& userText,
                                              const QString& assistantText,
                                              QString* errorOut = nullptr) const;

    bool failOpen() const { return m_failOpen; }
    int timeoutMs() const { return m_timeoutMs; }

private:
    std::shared_ptr<SafetyClassifier> m_classifier;
    std::shared_ptr<CriticScorer> m_critic;
    bool m_failOpen = true;
    int m_timeoutMs = 8000;
};

} // namespace af
