#pragma once

#include "core/shared/canonical_event.h"

#include <QString>
#include <optional>
#include <vector>

struct sqlite3;

namespace af {

struct SessionEvent {
    QString eventId;
    QString eventType;
    qint64 tsMs = 0;
};

struct SessionState {
    qint64 lastEventTs = 0;
    QString lastProvider;
    QString lastEventType;
};

// SessionLedger keeps a short rolling history of what each user did: the
// newest eventLimit events per (user, provider) and the user's last
// activity. Everything here expires after ttlHours.
class SessionLedger {
public:
    SessionLedger(sqlite3* db, int eventLimit = 50, int ttlHours = 24);

    bool record(const CanonicalEvent& event, qint64 nowMs);

    // Newest first.
    std::vector<SessionEvent> recentEvents(const QString& userId, const QString& provider,
                                           qint64 nowMs) const;
    std::optional<SessionState> state(const QString& userId, qint64 nowMs) const;

    int pruneExpired(qint64 nowMs);

private:
    sqlite3* m_db = nullptr;
    int m_eventLimit = 50;
    qint64 m_ttlMs = 0;
};

} // namespace af
