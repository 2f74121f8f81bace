#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace af {

struct CriticResult {
    double criticScore = 0.5;      // [0, 1]
    QStringList violations;        // FABRICATION, POLICY_BLOCKED, NOT_SPECIFIC, TOO_LONG, MISALIGNED
    QStringList reasons;
};

// CriticScorer -- quality judgement of an assistant response against the
// user request it answers.
class CriticScorer {
public:
    virtual ~CriticScorer() = default;

    virtual std::optional<CriticResult> score(const QString& userText,
                                              const QString& assistantText,
                                              QString* errorOut) = 0;
};

} // namespace af
