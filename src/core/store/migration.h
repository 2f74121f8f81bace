#pragma once

struct sqlite3;

namespace af {

// Brings the database up to targetVersion, one savepoint per step.
// Fails on a database written by a newer build.
bool applyMigrations(sqlite3* db, int targetVersion);

// schema_version from the settings table; 0 before the schema exists.
int currentSchemaVersion(sqlite3* db);

} // namespace af
