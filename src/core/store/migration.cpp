#include "core/store/migration.h"
#include "core/store/savepoint.h"
#include "core/shared/logging.h"

#include <QByteArray>
#include <sqlite3.h>

#include <cstdlib>

namespace af {

namespace {

// One schema step. Steps run in order; each one lands atomically together
// with the schema_version bump that records it.
struct MigrationStep {
    int toVersion;
    const char* description;
    const char* sql;
};

// v2: strategy instructions live in a versioned table so new arms can be
// served without a rebuild. The seed is catalog version 1.
constexpr const char* kMigrationV2 = R"(
CREATE TABLE IF NOT EXISTS strategy_catalog (
    strategy TEXT NOT NULL,
    version INTEGER NOT NULL,
    ordinal INTEGER NOT NULL,
    instruction TEXT NOT NULL,
    active INTEGER NOT NULL DEFAULT 1,
    created_at_ms INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (strategy, version)
);
CREATE INDEX IF NOT EXISTS idx_strategy_catalog_active
    ON strategy_catalog(active, version, ordinal);
INSERT OR IGNORE INTO strategy_catalog (strategy, version, ordinal, instruction) VALUES
('S1_CLARIFY_FIRST', 1, 1, 'STRATEGY: CLARIFY_FIRST
Before providing a solution, ask 2 clarifying questions to understand:
1. The user''s specific context and constraints
2. Their preferred level of detail or format
Then provide a tailored answer based on their responses.'),
('S2_THREE_VARIANTS', 1, 2, 'STRATEGY: THREE_VARIANTS
Provide 3 distinct approaches to solve the problem:
- Option A: [Quick/simple approach]
- Option B: [Balanced approach]
- Option C: [Comprehensive approach]
End with a recommendation based on typical use cases.'),
('S3_TEMPLATE_FIRST', 1, 3, 'STRATEGY: TEMPLATE_FIRST
Start by providing a fill-in template or framework:
1. Give the template structure with clear placeholders
2. Provide a concrete example showing it filled out
3. Explain how to adapt it to their specific case'),
('S4_STEPWISE', 1, 4, 'STRATEGY: STEPWISE
Break the solution into clear, actionable steps:
1. [Step 1 with verification checkpoint]
2. [Step 2 with verification checkpoint]
3. [Step 3 with verification checkpoint]
Include how to verify each step succeeded before moving to the next.');
INSERT OR REPLACE INTO settings (key, value) VALUES ('strategy_catalog_version', '1');
)";

constexpr MigrationStep kSteps[] = {
    {2, "strategy catalog", kMigrationV2},
};

bool runStep(sqlite3* db, const MigrationStep& step)
{
    Savepoint sp(db, "schema_migration");
    if (!sp.isActive()) {
        return false;
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db, step.sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_ERROR(afStore, "Migration to v%d (%s) failed: %s",
                  step.toVersion, step.description, errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db,
            "INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', ?1)",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, QByteArray::number(step.toVersion).constData(), -1, SQLITE_TRANSIENT);
    const bool bumped = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);

    return bumped && sp.commit();
}

} // anonymous namespace

int currentSchemaVersion(sqlite3* db)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT value FROM settings WHERE key = 'schema_version'",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        version = text ? std::atoi(text) : 0;
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    const int from = currentSchemaVersion(db);
    if (from > targetVersion) {
        LOG_ERROR(afStore, "Database schema v%d is newer than supported v%d", from, targetVersion);
        return false;
    }

    int version = from;
    for (const MigrationStep& step : kSteps) {
        if (step.toVersion <= version || step.toVersion > targetVersion) {
            continue;
        }
        LOG_INFO(afStore, "Migrating schema v%d -> v%d (%s)", version, step.toVersion, step.description);
        if (!runStep(db, step)) {
            return false;
        }
        version = step.toVersion;
    }

    if (version < targetVersion) {
        LOG_ERROR(afStore, "No migration path beyond v%d (target v%d)", version, targetVersion);
        return false;
    }
    return true;
}

} // namespace af
