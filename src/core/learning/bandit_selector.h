#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>
#include <utility>
#include <vector>

struct sqlite3;

namespace af {

class StrategyCatalog;

// BanditSelector -- UCB1 over the strategy catalog, scoped per (user, domain).
//
//   score_i = +inf                                       if shown_i == 0
//           = wins_i / shown_i + sqrt(2 ln(N) / shown_i)  otherwise
//
// where N is the total shown count across arms. The arm with the highest
// score wins; ties go to the earlier arm in catalog order, so a cold start
// tries every arm once, in order, before repeating any.
class BanditSelector {
public:
    struct Selection {
        QString strategy;
        std::vector<std::pair<QString, double>> scores;   // catalog order
    };

    BanditSelector(sqlite3* db, const StrategyCatalog* catalog, int ttlDays = 30);

    // Pure selection; does not count the arm as shown. nullopt when the
    // catalog is empty.
    std::optional<Selection> selectStrategy(const QString& userId, const QString& domain);

    bool recordShown(const QString& userId, const QString& domain, const QString& strategy);

    // Counts a win only when outcome is Success. Returns false on storage
    // error or unknown strategy; a non-success outcome is a no-op success.
    bool recordWin(const QString& userId, const QString& domain, const QString& strategy,
                   Outcome outcome);

    // One entry per catalog strategy, zero-filled for untouched arms.
    std::vector<BanditArmStats> armStats(const QString& userId, const QString& domain) const;

    int pruneExpired(qint64 nowMs);

    static double ucb1Score(int shown, int wins, int totalShown);

private:
    bool bumpCounter(const QString& userId, const QString& domain, const QString& strategy,
                     bool win);
    void refreshTtl(const QString& userId, const QString& domain);

    sqlite3* m_db = nullptr;
    const StrategyCatalog* m_catalog = nullptr;
    qint64 m_ttlMs = 0;
};

} // namespace af
