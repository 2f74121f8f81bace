#include "core/shared/types.h"

namespace af {

QString eventTypeToString(EventType type)
{
    switch (type) {
    case EventType::UserMessage:  return QStringLiteral("USER_MESSAGE");
    case EventType::AiResponse:   return QStringLiteral("AI_RESPONSE");
    case EventType::Navigate:     return QStringLiteral("NAVIGATE");
    case EventType::PageExtract:  return QStringLiteral("PAGE_EXTRACT");
    case EventType::UserFeedback: return QStringLiteral("USER_FEEDBACK");
    }
    return QStringLiteral("USER_MESSAGE");
}

std::optional<EventType> eventTypeFromString(const QString& str)
{
    if (str == QLatin1String("USER_MESSAGE"))  return EventType::UserMessage;
    if (str == QLatin1String("AI_RESPONSE"))   return EventType::AiResponse;
    if (str == QLatin1String("NAVIGATE"))      return EventType::Navigate;
    if (str == QLatin1String("PAGE_EXTRACT"))  return EventType::PageExtract;
    if (str == QLatin1String("USER_FEEDBACK")) return EventType::UserFeedback;
    return std::nullopt;
}

QString outcomeToString(Outcome outcome)
{
    switch (outcome) {
    case Outcome::Success: return QStringLiteral("success");
    case Outcome::Fail:    return QStringLiteral("fail");
    case Outcome::Unknown: return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

Outcome outcomeFromString(const QString& str)
{
    if (str == QLatin1String("success")) return Outcome::Success;
    if (str == QLatin1String("fail"))    return Outcome::Fail;
    return Outcome::Unknown;
}

QString threadStatusToString(ThreadStatus status)
{
    switch (status) {
    case ThreadStatus::Open:     return QStringLiteral("open");
    case ThreadStatus::Resolved: return QStringLiteral("resolved");
    }
    return QStringLiteral("open");
}

ThreadStatus threadStatusFromString(const QString& str)
{
    if (str == QLatin1String("resolved")) return ThreadStatus::Resolved;
    return ThreadStatus::Open;
}

} // namespace af
