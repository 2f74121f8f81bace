#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <optional>

namespace af {

// CanonicalEvent: the single normalized shape every inbound event is
// converted to before any business logic runs.
//
// Invariant: USER_MESSAGE and AI_RESPONSE carry a non-empty payload.text.
// attemptThreadId is empty until the consumer assigns the thread.
struct CanonicalEvent {
    QString eventId;
    QString traceId;
    QString userId;
    QString sessionId;
    QString provider;
    EventType eventType = EventType::UserMessage;
    qint64 tsMs = 0;
    QString attemptThreadId;
    QJsonObject payload;

    QString text() const;
    bool requiresText() const;

    QJsonObject toJson() const;

    // Strict decode of a stored event. Returns nullopt (with a reason) when a
    // required field is missing or the text invariant does not hold.
    static std::optional<CanonicalEvent> fromJson(const QJsonObject& json,
                                                  QString* errorOut = nullptr);
};

} // namespace af
