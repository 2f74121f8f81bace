#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <functional>
#include <map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace af {

// PolicyPatternIndex -- learned behavior patterns ranked per (user, domain).
// Ranking is served by the (user_id, domain, score DESC) index, so a top-K
// read is a bounded index scan. Re-adding an existing pattern replaces its
// score.
class PolicyPatternIndex {
public:
    static constexpr int kDefaultContextLimit = 3;

    explicit PolicyPatternIndex(sqlite3* db, int ttlDays = 90);

    static double patternScore(double reward, double criticScore) { return reward * criticScore; }

    bool add(const QString& userId, const QString& domain, const QString& patternText,
             double reward, double criticScore);

    // Highest score first. When markUsed is set the returned patterns count
    // as served for unused-pattern decay.
    std::vector<PolicyPattern> top(const QString& userId, const QString& domain,
                                   int limit = kDefaultContextLimit, bool markUsed = true);

    bool remove(const QString& userId, const QString& domain, const QString& patternText);

    QStringList domains(const QString& userId) const;
    QStringList users() const;

    // Pattern count per domain.
    std::map<QString, int> stats(const QString& userId) const;

    // Multiplies every score in the domain by factor. Returns rows touched,
    // -1 on error.
    int decayDomain(const QString& userId, const QString& domain, double factor);

    // Multiplies the score of every pattern not served since unusedBeforeMs.
    // Returns per-domain counts of decayed patterns.
    std::map<QString, int> decayUnused(const QString& userId, double factor, qint64 unusedBeforeMs);

    // Removes patterns whose score fell to floor or below.
    int pruneBelow(double floor);
    int pruneExpired(qint64 nowMs);

    // "LEARNED SUCCESSFUL PATTERNS (apply these):" followed by one
    // "- [0.72] pattern" line per pattern; empty when nothing is learned.
    QString formatForContext(const QString& userId, const QString& domain,
                             int limit = kDefaultContextLimit);

private:
    int execCount(const char* sql, const std::function<void(sqlite3_stmt*)>& bind);

    sqlite3* m_db = nullptr;
    qint64 m_ttlMs = 0;
};

} // namespace af
