#include <QtTest/QtTest>
#include "core/learning/strategy_catalog.h"
#include "core/store/sqlite_store.h"

#include <optional>

class TestStrategyCatalog : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testSeededCatalog();
    void testInstructionLookup();
    void testPublishCreatesNewVersion();
    void testPublishValidation();

private:
    std::optional<af::SQLiteStore> m_store;
};

void TestStrategyCatalog::init()
{
    m_store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
}

void TestStrategyCatalog::cleanup()
{
    m_store.reset();
}

void TestStrategyCatalog::testSeededCatalog()
{
    af::StrategyCatalog catalog(m_store->rawDb());
    QCOMPARE(catalog.version(), 1);
    QCOMPARE(catalog.strategies(),
             QStringList({QStringLiteral("S1_CLARIFY_FIRST"), QStringLiteral("S2_THREE_VARIANTS"),
                          QStringLiteral("S3_TEMPLATE_FIRST"), QStringLiteral("S4_STEPWISE")}));
    QVERIFY(catalog.contains(QStringLiteral("S4_STEPWISE")));
    QVERIFY(!catalog.contains(QStringLiteral("S9_UNKNOWN")));
}

void TestStrategyCatalog::testInstructionLookup()
{
    af::StrategyCatalog catalog(m_store->rawDb());
    const auto instruction = catalog.instruction(QStringLiteral("S2_THREE_VARIANTS"));
    QVERIFY(instruction.has_value());
    QVERIFY(instruction->startsWith(QStringLiteral("STRATEGY: THREE_VARIANTS")));
    QVERIFY(!catalog.instruction(QStringLiteral("nope")).has_value());
}

void TestStrategyCatalog::testPublishCreatesNewVersion()
{
    af::StrategyCatalog catalog(m_store->rawDb());
    QString error;
    QVERIFY2(catalog.publish({{QStringLiteral("S5_EXAMPLES"), QStringLiteral("Lead with an example.")},
                              {QStringLiteral("S1_CLARIFY_FIRST"), QStringLiteral("Ask first.")}},
                             &error),
             qPrintable(error));

    QCOMPARE(catalog.version(), 2);
    QCOMPARE(catalog.strategies(),
             QStringList({QStringLiteral("S5_EXAMPLES"), QStringLiteral("S1_CLARIFY_FIRST")}));
    QCOMPARE(catalog.instruction(QStringLiteral("S1_CLARIFY_FIRST")).value_or(QString()),
             QStringLiteral("Ask first."));
    QVERIFY(!catalog.contains(QStringLiteral("S4_STEPWISE")));

    // Another handle on the same database sees the same version.
    af::StrategyCatalog other(m_store->rawDb());
    QCOMPARE(other.version(), 2);
}

void TestStrategyCatalog::testPublishValidation()
{
    af::StrategyCatalog catalog(m_store->rawDb());
    QString error;
    QVERIFY(!catalog.publish({}, &error));
    QVERIFY(!error.isEmpty());

    QVERIFY(!catalog.publish({{QStringLiteral("A"), QStringLiteral("x")},
                              {QStringLiteral("A"), QStringLiteral("y")}},
                             &error));
    QCOMPARE(error, QStringLiteral("duplicate strategy: A"));

    QVERIFY(!catalog.publish({{QStringLiteral("B"), QStringLiteral("  ")}}, &error));
    QCOMPARE(catalog.version(), 1);
}

QTEST_MAIN(TestStrategyCatalog)
#include "test_strategy_catalog.moc"
