#include "core/learning/policy_pattern_index.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <algorithm>

#include <sqlite3.h>

namespace af {

namespace {

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

} // namespace

PolicyPatternIndex::PolicyPatternIndex(sqlite3* db, int ttlDays)
    : m_db(db)
    , m_ttlMs(static_cast<qint64>(ttlDays) * 24 * 60 * 60 * 1000)
{
}

int PolicyPatternIndex::execCount(const char* sql, const std::function<void(sqlite3_stmt*)>& bind)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afLearning, "PolicyPatternIndex prepare failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    bind(stmt);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(afLearning, "PolicyPatternIndex step failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_changes(m_db);
}

bool PolicyPatternIndex::add(const QString& userId, const QString& domain,
                             const QString& patternText, double reward, double criticScore)
{
    if (patternText.trimmed().isEmpty()) {
        return false;
    }

    static constexpr const char* kSql = R"(
        INSERT INTO policy_patterns (user_id, domain, pattern_text, score,
                                     created_at_ms, last_used_at_ms, expires_at_ms)
        VALUES (?1, ?2, ?3, ?4, ?5, ?5, ?6)
        ON CONFLICT(user_id, domain, pattern_text) DO UPDATE SET
            score = excluded.score,
            expires_at_ms = excluded.expires_at_ms
    )";

    const double score = patternScore(reward, criticScore);
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    const QByteArray patternUtf8 = patternText.toUtf8();

    const int changed = execCount(kSql, [&](sqlite3_stmt* stmt) {
        sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, patternUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, score);
        sqlite3_bind_int64(stmt, 5, now);
        sqlite3_bind_int64(stmt, 6, now + m_ttlMs);
    });
    if (changed < 0) {
        return false;
    }

    LOG_INFO(afLearning, "Added pattern (score=%.2f) for user=%s domain=%s: %s",
             score, qUtf8Printable(userId), qUtf8Printable(domain),
             qUtf8Printable(patternText.left(60)));
    return true;
}

std::vector<PolicyPattern> PolicyPatternIndex::top(const QString& userId, const QString& domain,
                                                   int limit, bool markUsed)
{
    std::vector<PolicyPattern> out;
    if (limit <= 0) {
        return out;
    }

    static constexpr const char* kSql = R"(
        SELECT pattern_text, score FROM policy_patterns
        WHERE user_id = ?1 AND domain = ?2 AND expires_at_ms > ?3
        ORDER BY score DESC, pattern_text DESC
        LIMIT ?4
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afLearning, "PolicyPatternIndex::top prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, now);
    sqlite3_bind_int(stmt, 4, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PolicyPattern pattern;
        pattern.userId = userId;
        pattern.domain = domain;
        pattern.patternText = columnText(stmt, 0);
        pattern.score = sqlite3_column_double(stmt, 1);
        out.push_back(pattern);
    }
    sqlite3_finalize(stmt);

    if (markUsed) {
        static constexpr const char* kTouchSql = R"(
            UPDATE policy_patterns SET last_used_at_ms = ?4
            WHERE user_id = ?1 AND domain = ?2 AND pattern_text = ?3
        )";
        for (const PolicyPattern& pattern : out) {
            const QByteArray patternUtf8 = pattern.patternText.toUtf8();
            execCount(kTouchSql, [&](sqlite3_stmt* touch) {
                sqlite3_bind_text(touch, 1, userUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_text(touch, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_text(touch, 3, patternUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_int64(touch, 4, now);
            });
        }
    }
    return out;
}

bool PolicyPatternIndex::remove(const QString& userId, const QString& domain,
                                const QString& patternText)
{
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    const QByteArray patternUtf8 = patternText.toUtf8();
    return execCount(
               "DELETE FROM policy_patterns WHERE user_id = ?1 AND domain = ?2 AND pattern_text = ?3",
               [&](sqlite3_stmt* stmt) {
                   sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
                   sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
                   sqlite3_bind_text(stmt, 3, patternUtf8.constData(), -1, SQLITE_STATIC);
               }) > 0;
}

std::map<QString, int> PolicyPatternIndex::stats(const QString& userId) const
{
    std::map<QString, int> out;
    static constexpr const char* kSql = R"(
        SELECT domain, COUNT(*) FROM policy_patterns
        WHERE user_id = ?1 AND expires_at_ms > ?2
        GROUP BY domain
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afLearning, "PolicyPatternIndex::stats prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    const QByteArray userUtf8 = userId.toUtf8();
    sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out[columnText(stmt, 0)] = sqlite3_column_int(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return out;
}

QStringList PolicyPatternIndex::domains(const QString& userId) const
{
    QStringList out;
    for (const auto& entry : stats(userId)) {
        out.append(entry.first);
    }
    return out;
}

QStringList PolicyPatternIndex::users() const
{
    QStringList out;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT DISTINCT user_id FROM policy_patterns ORDER BY user_id",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return out;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return out;
}

int PolicyPatternIndex::decayDomain(const QString& userId, const QString& domain, double factor)
{
    const QByteArray userUtf8 = userId.toUtf8();
    const QByteArray domainUtf8 = domain.toUtf8();
    const int decayed = execCount(
        "UPDATE policy_patterns SET score = score * ?3 WHERE user_id = ?1 AND domain = ?2",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_double(stmt, 3, factor);
        });
    if (decayed > 0) {
        LOG_INFO(afLearning, "Decayed %d patterns in %s (user=%s, factor=%.2f)",
                 decayed, qUtf8Printable(domain), qUtf8Printable(userId), factor);
    }
    return decayed;
}

std::map<QString, int> PolicyPatternIndex::decayUnused(const QString& userId, double factor,
                                                       qint64 unusedBeforeMs)
{
    std::map<QString, int> result;
    const QByteArray userUtf8 = userId.toUtf8();
    for (const QString& domain : domains(userId)) {
        const QByteArray domainUtf8 = domain.toUtf8();
        const int decayed = execCount(R"(
            UPDATE policy_patterns SET score = score * ?3
            WHERE user_id = ?1 AND domain = ?2 AND last_used_at_ms < ?4
        )", [&](sqlite3_stmt* stmt) {
            sqlite3_bind_text(stmt, 1, userUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, domainUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_double(stmt, 3, factor);
            sqlite3_bind_int64(stmt, 4, unusedBeforeMs);
        });
        result[domain] = std::max(decayed, 0);
    }
    return result;
}

int PolicyPatternIndex::pruneBelow(double floor)
{
    return execCount("DELETE FROM policy_patterns WHERE score <= ?1",
                     [&](sqlite3_stmt* stmt) { sqlite3_bind_double(stmt, 1, floor); });
}

int PolicyPatternIndex::pruneExpired(qint64 nowMs)
{
    return execCount("DELETE FROM policy_patterns WHERE expires_at_ms <= ?1",
                     [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, nowMs); });
}

QString PolicyPatternIndex::formatForContext(const QString& userId, const QString& domain, int limit)
{
    const std::vector<PolicyPattern> patterns = top(userId, domain, limit);
    if (patterns.empty()) {
        return QString();
    }

    QStringList lines;
    lines.append(QStringLiteral("LEARNED SUCCESSFUL PATTERNS (apply these):"));
    for (const PolicyPattern& pattern : patterns) {
        lines.append(QStringLiteral("- [%1] %2")
                         .arg(QString::number(pattern.score, 'f', 2), pattern.patternText));
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace af
