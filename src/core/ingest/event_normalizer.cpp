#include "core/ingest/event_normalizer.h"

#include <QUuid>

namespace af {

namespace {

std::optional<CanonicalEvent> fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return std::nullopt;
}

QString newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

// Non-empty string field, or empty when missing / wrong type.
QString requiredString(const QJsonObject& raw, const QString& key)
{
    const QJsonValue value = raw.value(key);
    return value.isString() ? value.toString().trimmed() : QString();
}

} // anonymous namespace

std::optional<CanonicalEvent> EventNormalizer::normalize(const QJsonObject& raw,
                                                         qint64 nowMs,
                                                         QString* errorOut)
{
    CanonicalEvent event;
    event.userId = requiredString(raw, QStringLiteral("user_id"));
    event.provider = requiredString(raw, QStringLiteral("provider"));
    const QString rawType = requiredString(raw, QStringLiteral("event_type"));

    if (event.userId.isEmpty()) {
        return fail(errorOut, QStringLiteral("user_id is required"));
    }
    if (event.provider.isEmpty()) {
        return fail(errorOut, QStringLiteral("provider is required"));
    }
    if (rawType.isEmpty()) {
        return fail(errorOut, QStringLiteral("event_type is required"));
    }

    const QJsonValue payloadValue = raw.value(QStringLiteral("payload"));
    if (!payloadValue.isUndefined() && !payloadValue.isNull() && !payloadValue.isObject()) {
        return fail(errorOut, QStringLiteral("payload must be an object"));
    }
    event.payload = payloadValue.toObject();

    const bool legacyChatTurn = rawType == QLatin1String("CHAT_TURN");
    if (legacyChatTurn) {
        event.eventType = EventType::UserMessage;
        if (!event.payload.contains(QStringLiteral("text"))) {
            event.payload[QStringLiteral("text")] =
                event.payload.value(QStringLiteral("message")).toString();
        }
    } else {
        const auto type = eventTypeFromString(rawType);
        if (!type) {
            return fail(errorOut, QStringLiteral("unknown event_type: %1").arg(rawType));
        }
        event.eventType = *type;
    }

    for (const QString& key : {QStringLiteral("text"), QStringLiteral("url"), QStringLiteral("title")}) {
        if (raw.contains(key) && !event.payload.contains(key)) {
            event.payload[key] = raw.value(key);
        }
    }

    event.eventId = newId();
    event.traceId = requiredString(raw, QStringLiteral("trace_id"));
    if (event.traceId.isEmpty()) {
        event.traceId = newId();
    }
    event.sessionId = requiredString(raw, QStringLiteral("session_id"));
    if (event.sessionId.isEmpty()) {
        event.sessionId = QStringLiteral("default");
    }
    event.attemptThreadId = requiredString(raw, QStringLiteral("attempt_thread_id"));

    QJsonValue ts = raw.value(QStringLiteral("ts_ms"));
    if (ts.isUndefined() || ts.isNull()) {
        ts = raw.value(QStringLiteral("ts"));
    }
    if (ts.isUndefined() || ts.isNull()) {
        event.tsMs = nowMs;
    } else if (ts.isDouble()) {
        event.tsMs = ts.toInteger();
        if (event.tsMs < kMinTimestampMs || event.tsMs > kMaxTimestampMs) {
            return fail(errorOut, QStringLiteral("ts_ms out of range: %1").arg(event.tsMs));
        }
    } else {
        return fail(errorOut, QStringLiteral("ts_ms must be an integer"));
    }

    if (event.requiresText()) {
        const QJsonValue text = event.payload.value(QStringLiteral("text"));
        if (!text.isString() || text.toString().trimmed().isEmpty()) {
            return fail(errorOut, QStringLiteral("payload.text is required for %1")
                                      .arg(eventTypeToString(event.eventType)));
        }
    }

    return event;
}

} // namespace af
