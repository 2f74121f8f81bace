#pragma once

#include "core/shared/canonical_event.h"

#include <QJsonObject>
#include <QString>
#include <optional>

namespace af {

// EventNormalizer maps the raw events front-end surfaces send into the
// CanonicalEvent shape.
//
// Required: user_id, provider, event_type (non-empty strings).
// Defaults: trace_id -> new uuid, session_id -> "default",
//           ts_ms (or legacy ts) -> nowMs.
// Aliases:  top-level text/url/title are hoisted into the payload when the
//           payload lacks them; CHAT_TURN becomes USER_MESSAGE with
//           payload.message as its text.
// event_id is always freshly assigned.
class EventNormalizer {
public:
    // Accepted ts_ms range: 2020-01-01 .. 2100-01-01 UTC.
    static constexpr qint64 kMinTimestampMs = 1577836800000LL;
    static constexpr qint64 kMaxTimestampMs = 4102444800000LL;

    static std::optional<CanonicalEvent> normalize(const QJsonObject& raw,
                                                   qint64 nowMs,
                                                   QString* errorOut = nullptr);
};

} // namespace af
