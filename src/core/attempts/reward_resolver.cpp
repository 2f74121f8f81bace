#include "core/attempts/reward_resolver.h"

namespace af {

const QStringList& RewardResolver::positiveSignals()
{
    static const QStringList kSignals = {
        QStringLiteral("works"),    QStringLiteral("worked"),  QStringLiteral("perfect"),
        QStringLiteral("solved"),   QStringLiteral("thanks"),  QStringLiteral("got it"),
        QStringLiteral("great"),    QStringLiteral("awesome"), QStringLiteral("excellent"),
        QStringLiteral("good"),
    };
    return kSignals;
}

const QStringList& RewardResolver::negativeSignals()
{
    static const QStringList kSignals = {
        QStringLiteral("not working"), QStringLiteral("still"),  QStringLiteral("wrong"),
        QStringLiteral("no"),          QStringLiteral("doesn't"), QStringLiteral("didn't"),
        QStringLiteral("bad"),         QStringLiteral("error"),  QStringLiteral("failed"),
        QStringLiteral("issue"),
    };
    return kSignals;
}

const QStringList& RewardResolver::nextStepStarters()
{
    static const QStringList kStarters = {
        QStringLiteral("now"),     QStringLiteral("next"),      QStringLiteral("also"),
        QStringLiteral("ok"),      QStringLiteral("great"),     QStringLiteral("can you"),
        QStringLiteral("could you"), QStringLiteral("please"),  QStringLiteral("and"),
        QStringLiteral("then"),
    };
    return kStarters;
}

RewardResult RewardResolver::resolve(const QString& newText,
                                     const QString& newFingerprint,
                                     const std::optional<QString>& prevFingerprint,
                                     std::optional<qint64> prevTimestampMs,
                                     qint64 nowMs)
{
    const QString lowered = newText.toLower();

    for (const QString& signal : positiveSignals()) {
        if (lowered.contains(signal)) {
            return {kPositiveReward, Outcome::Success,
                    QStringLiteral("positive_signal:") + signal};
        }
    }

    for (const QString& signal : negativeSignals()) {
        if (lowered.contains(signal)) {
            return {kNegativeReward, Outcome::Fail,
                    QStringLiteral("negative_signal:") + signal};
        }
    }

    const bool hasPrevious = prevFingerprint.has_value() && !prevFingerprint->isEmpty();

    if (hasPrevious && *prevFingerprint == newFingerprint && prevTimestampMs.has_value()
        && nowMs - *prevTimestampMs <= kRepeatWindowMs) {
        return {kRepeatReward, Outcome::Fail, QStringLiteral("repeat_within_10min")};
    }

    if (hasPrevious && *prevFingerprint != newFingerprint) {
        for (const QString& starter : nextStepStarters()) {
            if (lowered.startsWith(starter)) {
                return {kNextStepReward, Outcome::Success,
                        QStringLiteral("next_step:") + starter};
            }
        }
    }

    return {0.0, Outcome::Unknown, QStringLiteral("no_clear_signal")};
}

} // namespace af
