#include "core/learning/strategy_catalog.h"
#include "core/shared/logging.h"
#include "core/store/savepoint.h"

#include <QDateTime>
#include <QSet>

#include <sqlite3.h>

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

StrategyCatalog::StrategyCatalog(sqlite3* db)
    : m_db(db)
{
}

int StrategyCatalog::version() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
                           "SELECT value FROM settings WHERE key = 'strategy_catalog_version'",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<StrategyDefinition> StrategyCatalog::definitions() const
{
    std::vector<StrategyDefinition> out;
    static constexpr const char* kSql = R"(
        SELECT strategy, instruction FROM strategy_catalog
        WHERE version = ?1 AND active = 1
        ORDER BY ordinal ASC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(afLearning, "StrategyCatalog::definitions prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    sqlite3_bind_int(stmt, 1, version());

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StrategyDefinition def;
        def.strategy = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        def.instruction = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        out.push_back(def);
    }
    sqlite3_finalize(stmt);
    return out;
}

QStringList StrategyCatalog::strategies() const
{
    QStringList names;
    for (const StrategyDefinition& def : definitions()) {
        names.append(def.strategy);
    }
    return names;
}

std::optional<QString> StrategyCatalog::instruction(const QString& strategy) const
{
    for (const StrategyDefinition& def : definitions()) {
        if (def.strategy == strategy) {
            return def.instruction;
        }
    }
    return std::nullopt;
}

bool StrategyCatalog::contains(const QString& strategy) const
{
    return instruction(strategy).has_value();
}

bool StrategyCatalog::publish(const std::vector<StrategyDefinition>& definitions, QString* errorOut)
{
    if (definitions.empty()) {
        return fail(errorOut, QStringLiteral("a catalog version needs at least one strategy"));
    }
    QSet<QString> seen;
    for (const StrategyDefinition& def : definitions) {
        if (def.strategy.trimmed().isEmpty() || def.instruction.trimmed().isEmpty()) {
            return fail(errorOut, QStringLiteral("strategy name and instruction are required"));
        }
        if (seen.contains(def.strategy)) {
            return fail(errorOut, QStringLiteral("duplicate strategy: %1").arg(def.strategy));
        }
        seen.insert(def.strategy);
    }

    Savepoint savepoint(m_db, "strategy_publish");
    if (!savepoint.isActive()) {
        return fail(errorOut, QStringLiteral("failed to open savepoint"));
    }

    const int newVersion = version() + 1;
    const qint64 now = QDateTime::currentMSecsSinceEpoch();

    static constexpr const char* kInsertSql = R"(
        INSERT INTO strategy_catalog (strategy, version, ordinal, instruction, active, created_at_ms)
        VALUES (?1, ?2, ?3, ?4, 1, ?5)
    )";

    int ordinal = 1;
    for (const StrategyDefinition& def : definitions) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fail(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        }
        const QByteArray nameUtf8 = def.strategy.toUtf8();
        const QByteArray instructionUtf8 = def.instruction.toUtf8();
        sqlite3_bind_text(stmt, 1, nameUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, newVersion);
        sqlite3_bind_int(stmt, 3, ordinal++);
        sqlite3_bind_text(stmt, 4, instructionUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 5, now);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        }
    }

    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db,
                               "INSERT OR REPLACE INTO settings (key, value) VALUES ('strategy_catalog_version', ?1)",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            return fail(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        }
        const QByteArray versionUtf8 = QByteArray::number(newVersion);
        sqlite3_bind_text(stmt, 1, versionUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail(errorOut, QString::fromUtf8(sqlite3_errmsg(m_db)));
        }
    }

    if (!savepoint.commit()) {
        return fail(errorOut, QStringLiteral("failed to commit catalog version"));
    }

    LOG_INFO(afLearning, "Published strategy catalog v%d (%d strategies)",
             newVersion, static_cast<int>(definitions.size()));
    return true;
}

} // namespace af
