#include "core/shared/canonical_event.h"

namespace af {

namespace {

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

} // namespace

QString CanonicalEvent::text() const
{
    return payload.value(QStringLiteral("text")).toString();
}

bool CanonicalEvent::requiresText() const
{
    return eventType == EventType::UserMessage || eventType == EventType::AiResponse;
}

QJsonObject CanonicalEvent::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("event_id")] = eventId;
    json[QStringLiteral("trace_id")] = traceId;
    json[QStringLiteral("user_id")] = userId;
    json[QStringLiteral("session_id")] = sessionId;
    json[QStringLiteral("provider")] = provider;
    json[QStringLiteral("event_type")] = eventTypeToString(eventType);
    json[QStringLiteral("ts_ms")] = tsMs;
    json[QStringLiteral("attempt_thread_id")] = attemptThreadId;
    json[QStringLiteral("payload")] = payload;
    return json;
}

std::optional<CanonicalEvent> CanonicalEvent::fromJson(const QJsonObject& json, QString* errorOut)
{
    CanonicalEvent event;
    event.eventId = json.value(QStringLiteral("event_id")).toString();
    event.traceId = json.value(QStringLiteral("trace_id")).toString();
    event.userId = json.value(QStringLiteral("user_id")).toString();
    event.sessionId = json.value(QStringLiteral("session_id")).toString();
    event.provider = json.value(QStringLiteral("provider")).toString();
    event.tsMs = json.value(QStringLiteral("ts_ms")).toInteger();
    event.attemptThreadId = json.value(QStringLiteral("attempt_thread_id")).toString();
    event.payload = json.value(QStringLiteral("payload")).toObject();

    const auto type = eventTypeFromString(json.value(QStringLiteral("event_type")).toString());
    if (!type) {
        fail(errorOut, QStringLiteral("unknown event_type"));
        return std::nullopt;
    }
    event.eventType = *type;

    if (event.eventId.isEmpty() || event.userId.isEmpty() || event.provider.isEmpty()) {
        fail(errorOut, QStringLiteral("event_id, user_id and provider are required"));
        return std::nullopt;
    }
    if (event.requiresText() && event.text().isEmpty()) {
        fail(errorOut, QStringLiteral("payload.text is required for event_type=%1")
                           .arg(eventTypeToString(event.eventType)));
        return std::nullopt;
    }
    return event;
}

} // namespace af
