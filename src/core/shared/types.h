#pragma once

#include <QJsonObject>
#include <QString>
#include <cstdint>
#include <limits>
#include <optional>

namespace af {

// Canonical event types accepted by ingestion.
enum class EventType {
    UserMessage,
    AiResponse,
    Navigate,
    PageExtract,
    UserFeedback,
};

QString eventTypeToString(EventType type);
std::optional<EventType> eventTypeFromString(const QString& str);

// Result label attached to an attempt once the next message arrives
enum class Outcome {
    Success,
    Fail,
    Unknown,
};

QString outcomeToString(Outcome outcome);
Outcome outcomeFromString(const QString& str);

enum class ThreadStatus {
    Open,
    Resolved,
};

QString threadStatusToString(ThreadStatus status);
ThreadStatus threadStatusFromString(const QString& str);

// One thread per (user, fingerprint). bestReward/bestFinalScore hold -inf
// until an eligible attempt is recorded.
struct AttemptThread {
    QString threadId;
    QString userId;
    QString fingerprint;
    QString domain;
    int attemptCount = 0;
    ThreadStatus status = ThreadStatus::Open;
    QString bestAttemptId;
    double bestReward = -std::numeric_limits<double>::infinity();
    double bestCriticScore = 0.0;
    double bestFinalScore = -std::numeric_limits<double>::infinity();
    qint64 createdTsMs = 0;
    qint64 updatedTsMs = 0;
};

// Attempt records are addressed by (threadId, seq). seq grows with each
// attempt; revision grows with each rewrite and guards compare-and-swap.
struct AttemptRecord {
    QString attemptId;
    QString eventId;
    QString traceId;
    qint64 tsMs = 0;
    QJsonObject payload;
    double reward = 0.0;
    double criticScore = 0.0;
    Outcome outcome = Outcome::Unknown;
    int seq = 0;
    int64_t revision = 0;
};

struct BanditArmStats {
    QString userId;
    QString domain;
    QString strategy;
    int shownCount = 0;
    int winCount = 0;

    double winRate() const
    {
        return shownCount > 0 ? static_cast<double>(winCount) / shownCount : 0.0;
    }
};

struct PolicyPattern {
    QString userId;
    QString domain;
    QString patternText;
    double score = 0.0;
};

} // namespace af
