#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <sqlite3.h>
#include "core/store/migration.h"
#include "core/store/savepoint.h"
#include "core/store/schema.h"
#include "core/store/sqlite_store.h"

namespace {

int countRows(sqlite3* db, const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool exec(sqlite3* db, const char* sql)
{
    return sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
}

} // namespace

class TestSQLiteStore : public QObject {
    Q_OBJECT

private slots:
    void testOpenCreatesDatabase();
    void testWalModeActive();
    void testSchemaVersionSet();
    void testStrategyCatalogSeeded();
    void testReopenKeepsData();
    void testSettings();
    void testOpenReportsError();
    void testSavepointRollsBackOnScopeExit();
    void testNestedSavepointCommitsIntoOuter();
    void testDowngradeRefused();
    void testTableStats();
    void testIntegrityAndCheckpoint();
};

void TestSQLiteStore::testOpenCreatesDatabase()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dbPath = dir.path() + "/test.db";

    auto store = af::SQLiteStore::open(dbPath);
    QVERIFY(store.has_value());
    QVERIFY(QFile::exists(dbPath));
    QVERIFY(!(QFile::permissions(dbPath) & (QFile::ReadGroup | QFile::ReadOther)));
}

void TestSQLiteStore::testWalModeActive()
{
    QTemporaryDir dir;
    const QString dbPath = dir.path() + "/test.db";
    auto store = af::SQLiteStore::open(dbPath);
    QVERIFY(store.has_value());

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(store->rawDb(), "PRAGMA journal_mode", -1, &stmt, nullptr), SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    const QString mode = QString::fromUtf8(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    QCOMPARE(mode, QStringLiteral("wal"));
}

void TestSQLiteStore::testSchemaVersionSet()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QCOMPARE(store->schemaVersion(), af::kCurrentSchemaVersion);
    QCOMPARE(store->getSetting(QStringLiteral("schema_version")).value_or(QString()),
             QString::number(af::kCurrentSchemaVersion));
}

void TestSQLiteStore::testStrategyCatalogSeeded()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QCOMPARE(store->getSetting(QStringLiteral("strategy_catalog_version")).value_or(QString()),
             QStringLiteral("1"));
    QCOMPARE(countRows(store->rawDb(),
                       "SELECT COUNT(*) FROM strategy_catalog WHERE version = 1 AND active = 1"),
             4);
}

void TestSQLiteStore::testReopenKeepsData()
{
    QTemporaryDir dir;
    const QString dbPath = dir.path() + "/test.db";
    {
        auto store = af::SQLiteStore::open(dbPath);
        QVERIFY(store.has_value());
        QVERIFY(store->setSetting(QStringLiteral("marker"), QStringLiteral("kept")));
    }
    auto store = af::SQLiteStore::open(dbPath);
    QVERIFY(store.has_value());
    QCOMPARE(store->getSetting(QStringLiteral("marker")).value_or(QString()), QStringLiteral("kept"));
    // Migrations do not reseed an existing catalog.
    QCOMPARE(countRows(store->rawDb(), "SELECT COUNT(*) FROM strategy_catalog"), 4);
}

void TestSQLiteStore::testSettings()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());

    QVERIFY(!store->getSetting(QStringLiteral("missing")).has_value());
    QVERIFY(store->setSetting(QStringLiteral("k"), QStringLiteral("v1")));
    QCOMPARE(store->getSetting(QStringLiteral("k")).value_or(QString()), QStringLiteral("v1"));
    QVERIFY(store->setSetting(QStringLiteral("k"), QStringLiteral("v2")));
    QCOMPARE(store->getSetting(QStringLiteral("k")).value_or(QString()), QStringLiteral("v2"));
}

void TestSQLiteStore::testOpenReportsError()
{
    QTemporaryDir dir;
    const QString dbPath = dir.path() + "/missing/dir/test.db";
    QString error;
    QVERIFY(!af::SQLiteStore::open(dbPath, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("cannot open")));
}

void TestSQLiteStore::testSavepointRollsBackOnScopeExit()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    {
        af::Savepoint sp(store->rawDb(), "sp_test");
        QVERIFY(sp.isActive());
        QVERIFY(store->setSetting(QStringLiteral("sp"), QStringLiteral("lost")));
    }
    QVERIFY(!store->getSetting(QStringLiteral("sp")).has_value());

    {
        af::Savepoint sp(store->rawDb(), "sp_test");
        QVERIFY(store->setSetting(QStringLiteral("sp"), QStringLiteral("kept")));
        QVERIFY(sp.commit());
        QVERIFY(!sp.isActive());
        QVERIFY(!sp.commit());
    }
    QCOMPARE(store->getSetting(QStringLiteral("sp")).value_or(QString()), QStringLiteral("kept"));
}

void TestSQLiteStore::testNestedSavepointCommitsIntoOuter()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    {
        af::Savepoint outer(store->rawDb(), "outer_sp");
        {
            af::Savepoint inner(store->rawDb(), "inner_sp");
            QVERIFY(store->setSetting(QStringLiteral("nested"), QStringLiteral("x")));
            QVERIFY(inner.commit());
        }
        QVERIFY(store->getSetting(QStringLiteral("nested")).has_value());
    }
    QVERIFY(!store->getSetting(QStringLiteral("nested")).has_value());
}

void TestSQLiteStore::testDowngradeRefused()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QVERIFY(exec(store->rawDb(), "UPDATE settings SET value = '99' WHERE key = 'schema_version'"));
    QVERIFY(!af::applyMigrations(store->rawDb(), af::kCurrentSchemaVersion));
    QVERIFY(af::applyMigrations(store->rawDb(), 99));
}

void TestSQLiteStore::testTableStats()
{
    auto store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());

    QJsonObject stats = store->tableStats();
    QCOMPARE(stats.value(QStringLiteral("event_log")).toInt(-1), 0);
    QCOMPARE(stats.value(QStringLiteral("memory_items")).toInt(-1), 0);
    QVERIFY(stats.contains(QStringLiteral("dead_letters")));

    QVERIFY(exec(store->rawDb(),
                 "INSERT INTO safety_counters (user_id, category, count, expires_at_ms) "
                 "VALUES ('alice', 'HARMFUL', 3, 0)"));
    stats = store->tableStats();
    QCOMPARE(stats.value(QStringLiteral("safety_counters")).toInt(), 1);
}

void TestSQLiteStore::testIntegrityAndCheckpoint()
{
    QTemporaryDir dir;
    auto store = af::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    QVERIFY(store->integrityCheck());
    QVERIFY(store->setSetting(QStringLiteral("k"), QStringLiteral("v")));
    QVERIFY(store->checkpoint());

    auto memory = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(memory->checkpoint());
}

QTEST_MAIN(TestSQLiteStore)
#include "test_sqlite_store.moc"
