#pragma once

#include <QString>

#include <map>
#include <optional>

struct sqlite3;

namespace af {

// SafetyCounters -- per (user, category) count of blocked requests. This is
// the only trace a blocked message leaves. Each increment refreshes the
// counter's TTL.
class SafetyCounters {
public:
    explicit SafetyCounters(sqlite3* db, int ttlDays = 7);

    // Returns the new count, nullopt on storage error.
    std::optional<int> increment(const QString& userId, const QString& category);

    // Live (unexpired) counters for a user, keyed by category.
    std::map<QString, int> counts(const QString& userId) const;
    int total(const QString& userId) const;

    int pruneExpired(qint64 nowMs);

private:
    sqlite3* m_db = nullptr;
    qint64 m_ttlMs = 0;
};

} // namespace af
