#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>
#include <optional>

namespace af {

struct RewardResult {
    double reward = 0.0;
    Outcome outcome = Outcome::Unknown;
    QString reason;
};

// RewardResolver infers how the previous attempt went from the user's next
// message. Rules run in order and the first match wins:
//   1. positive keyword anywhere            -> +0.7 success
//   2. negative keyword anywhere            -> -0.7 fail
//   3. same fingerprint within 10 minutes   -> -0.5 fail
//   4. new fingerprint + next-step opener   -> +0.5 success
//   5. otherwise                            ->  0.0 unknown
// Matching is case-insensitive substring (prefix for openers).
class RewardResolver {
public:
    static constexpr qint64 kRepeatWindowMs = 10 * 60 * 1000;

    static constexpr double kPositiveReward = 0.7;
    static constexpr double kNegativeReward = -0.7;
    static constexpr double kRepeatReward = -0.5;
    static constexpr double kNextStepReward = 0.5;

    // nowMs is the timestamp of the new message; the repeat window is
    // measured from prevTimestampMs to it.
    static RewardResult resolve(const QString& newText,
                                const QString& newFingerprint,
                                const std::optional<QString>& prevFingerprint,
                                std::optional<qint64> prevTimestampMs,
                                qint64 nowMs);

    static const QStringList& positiveSignals();
    static const QStringList& negativeSignals();
    static const QStringList& nextStepStarters();
};

} // namespace af
