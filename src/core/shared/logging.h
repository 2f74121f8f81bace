#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(afCore)
Q_DECLARE_LOGGING_CATEGORY(afStore)
Q_DECLARE_LOGGING_CATEGORY(afIngest)
Q_DECLARE_LOGGING_CATEGORY(afStream)
Q_DECLARE_LOGGING_CATEGORY(afLearning)
Q_DECLARE_LOGGING_CATEGORY(afJudge)
Q_DECLARE_LOGGING_CATEGORY(afIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
