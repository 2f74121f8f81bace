#pragma once

#include "core/judge/critic_scorer.h"
#include "core/judge/safety_classifier.h"

#include <QJsonObject>
#include <QStringList>
#include <optional>

namespace af {

// Runs `command` (argv[0] is the program), writes one JSON document to its
// stdin, closes stdin and parses one JSON object from stdout. Non-zero exit,
// timeout or malformed output return nullopt with a reason.
std::optional<QJsonObject> runJsonCommand(const QStringList& command,
                                          const QJsonObject& request,
                                          int timeoutMs,
                                          QString* errorOut);

// Request:  {"text": "..."}
// Reply:    {"allowed": bool, "category": "...", "reason_short": "..."}
class ProcessSafetyClassifier : public SafetyClassifier {
public:
    ProcessSafetyClassifier(QStringList command, int timeoutMs);

    std::optional<SafetyVerdict> classify(const QString& text, QString* errorOut) override;

private:
    QStringList m_command;
    int m_timeoutMs;
};

// Request:  {"user_text": "...", "assistant_text": "..."}
// Reply:    {"critic_score": 0.0-1.0, "violations": [...], "reasons": [...]}
class ProcessCriticScorer : public CriticScorer {
public:
    ProcessCriticScorer(QStringList command, int timeoutMs);

    std::optional<CriticResult> score(const QString& userText,
                                      const QString& assistantText,
                                      QString* errorOut) override;

private:
    QStringList m_command;
    int m_timeoutMs;
};

} // namespace af
