#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace af {

struct PipelineSettings {
    // Database
    QString dbPath;

    // Consumer
    QStringList trackedUsers;               // empty = discover users from the log
    QString consumerGroup = QStringLiteral("cg:processor");
    QString consumerName = QStringLiteral("processor-1");
    int maxRetries = 3;
    int streamMaxLen = 1000;
    int deadLetterMaxLen = 500;
    int readBatchSize = 10;
    int readBlockMs = 2000;
    int reclaimIdleMs = 60000;
    int reclaimBatchSize = 10;
    int retryCounterTtlHours = 24;

    // External judges
    bool failOpen = true;
    int judgeTimeoutMs = 8000;
    QStringList safetyCommand;
    QStringList criticCommand;

    // Retention
    int threadTtlDays = 30;
    int banditTtlDays = 30;
    int policyTtlDays = 90;
    int safetyCounterTtlDays = 7;
    int sessionTtlHours = 24;
    int sessionEventLimit = 50;

    // Hygiene
    int64_t hygieneIntervalMs = 3600000;
    double decayFactor = 0.8;
    int decayUnusedDays = 14;
    double patternScoreFloor = 0.01;
};

} // namespace af
