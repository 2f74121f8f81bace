#include "core/learning/bandit_selector.h"
#include "core/learning/strategy_catalog.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <cmath>
#include <limits>
#include <sqlite3.h>

namespace af {

BanditSelector::BanditSelector(sqlite3* db, const StrategyCatalog* catalog, int ttlDays)
    : m_db(db)
    , m_catalog(catalog)
    , m_ttlMs(static_cast<qint64>(ttlDays) * 24 * 60 * 60 * 1000)
{
}

double BanditSelector::ucb1Score(int shown, int wins, int totalShown)
{
    if (shown == 0) {
        return std::numeric_limits<double>::infinity();
    }
    if (totalShown <= 0) {
        return 0.0;
    }
    const double exploitation = static_cast<double>(wins) / shown;
    const double exploration = std::sqrt(2.0 * std::log(static_cast<double>(totalShown)) / shown);
    return exploitation + exploration;
}

std::vector<BanditArmStats> BanditSelector::armStats(const QString& userId,
                                                     const QString& domain) const
{
    std::vector<BanditArmStats> arms;
    const QStringList strategies = m_catalog ? m_catalog->strategies() : QStringList();
    arms.reserve(static_cast<size_t>(strategies.size()));
    for (const QString& strategy : strategies) {
        BanditArmStats arm;
        arm.userId = userId;
        arm.domain = domain;
        arm.strategy = strategy;
        arms.push_back(arm);
    }

    static constexpr const char* kSql = R"(
        SELECT strategy, shown_count, win_count FROM bandit_arms
        WHERE user_id = ?1 AND domain = ?2 AND expires_at_ms > ?3
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afLearning, "armStats prepare failed: %s", sqlite3_errmsg(m_db));
        return arms;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, QDateTime::currentMSecsSinceEpoch());

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const QString strategy = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        for (BanditArmStats& arm : arms) {
            if (arm.strategy == strategy) {
                arm.shownCount = sqlite3_column_int(stmt, 1);
                arm.winCount = sqlite3_column_int(stmt, 2);
                break;
            }
        }
    }
    sqlite3_finalize(stmt);
    return arms;
}

std::optional<BanditSelector::Selection> BanditSelector::selectStrategy(const QString& userId,
                                                                        const QString& domain)
{
    const std::vector<BanditArmStats> arms = armStats(userId, domain);
    if (arms.empty()) {
        LOG_WARN(afLearning, "selectStrategy: strategy catalog is empty");
        return std::nullopt;
    }

    int totalShown = 0;
    for (const BanditArmStats& arm : arms) {
        totalShown += arm.shownCount;
    }

    Selection selection;
    double bestScore = -std::numeric_limits<double>::infinity();
    for (const BanditArmStats& arm : arms) {
        const double score = ucb1Score(arm.shownCount, arm.winCount, totalShown);
        selection.scores.emplace_back(arm.strategy, score);
        // Strict '>' keeps the earliest arm on ties (including +inf ties).
        if (selection.strategy.isEmpty() || score > bestScore) {
            bestScore = score;
            selection.strategy = arm.strategy;
        }
    }

    refreshTtl(userId, domain);

    LOG_DEBUG(afLearning, "Bandit selected %s for user=%s domain=%s (total shown=%d)",
              qUtf8Printable(selection.strategy), qUtf8Printable(userId),
              qUtf8Printable(domain), totalShown);
    return selection;
}

bool BanditSelector::recordShown(const QString& userId, const QString& domain,
                                 const QString& strategy)
{
    return bumpCounter(userId, domain, strategy, false);
}

bool BanditSelector::recordWin(const QString& userId, const QString& domain,
                               const QString& strategy, Outcome outcome)
{
    if (outcome != Outcome::Success) {
        return true;
    }
    return bumpCounter(userId, domain, strategy, true);
}

bool BanditSelector::bumpCounter(const QString& userId, const QString& domain,
                                 const QString& strategy, bool win)
{
    if (!m_catalog || !m_catalog->contains(strategy)) {
        LOG_WARN(afLearning, "Ignoring unknown strategy '%s'", qUtf8Printable(strategy));
        return false;
    }

    // Expired arms restart from zero.
    static constexpr const char* kShownSql = R"(
        INSERT INTO bandit_arms (user_id, domain, strategy, shown_count, win_count, expires_at_ms)
        VALUES (?1, ?2, ?3, 1, 0, ?5)
        ON CONFLICT(user_id, domain, strategy) DO UPDATE SET
            shown_count = CASE WHEN expires_at_ms <= ?4 THEN 1 ELSE shown_count + 1 END,
            win_count = CASE WHEN expires_at_ms <= ?4 THEN 0 ELSE win_count END,
            expires_at_ms = excluded.expires_at_ms
    )";
    static constexpr const char* kWinSql = R"(
        INSERT INTO bandit_arms (user_id, domain, strategy, shown_count, win_count, expires_at_ms)
        VALUES (?1, ?2, ?3, 0, 1, ?5)
        ON CONFLICT(user_id, domain, strategy) DO UPDATE SET
            shown_count = CASE WHEN expires_at_ms <= ?4 THEN 0 ELSE shown_count END,
            win_count = CASE WHEN expires_at_ms <= ?4 THEN 1 ELSE win_count + 1 END,
            expires_at_ms = excluded.expires_at_ms
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, win ? kWinSql : kShownSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afLearning, "bandit counter prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    const QByteArray strategyUtf8 = strategy.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, strategyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, now);
    sqlite3_bind_int64(stmt, 5, now + m_ttlMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(afLearning, "bandit counter step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    if (win) {
        LOG_INFO(afLearning, "Bandit win: %s (user=%s domain=%s)",
                 qUtf8Printable(strategy), qUtf8Printable(userId), qUtf8Printable(domain));
    }
    return true;
}

void BanditSelector::refreshTtl(const QString& userId, const QString& domain)
{
    static constexpr const char* kSql = R"(
        UPDATE bandit_arms SET expires_at_ms = ?3
        WHERE user_id = ?1 AND domain = ?2 AND expires_at_ms > ?4
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return;
    }
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, now + m_ttlMs);
    sqlite3_bind_int64(stmt, 4, now);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        LOG_WARN(afLearning, "bandit TTL refresh failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
}

int BanditSelector::pruneExpired(qint64 nowMs)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM bandit_arms WHERE expires_at_ms <= ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, nowMs);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE ? sqlite3_changes(m_db) : -1;
}

} // namespace af
