#include <QtTest/QtTest>
#include "core/learning/policy_pattern_index.h"
#include "core/memory/memory_hygiene.h"
#include "core/memory/memory_store.h"
#include "core/store/sqlite_store.h"

#include <QDateTime>

#include <memory>
#include <optional>

using af::MemoryHygiene;

namespace {

constexpr qint64 kDayMs = 24LL * 60 * 60 * 1000;

} // namespace

class TestMemoryHygiene : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testMemoryStoreBasics();
    void testSupersedeKeepsNewest();
    void testDecaySpecificDomain();
    void testDecayUnusedUsesAgeCutoff();
    void testRunCycle();
    void testReportJson();

private:
    std::optional<af::SQLiteStore> m_store;
    std::unique_ptr<af::MemoryStore> m_memories;
    std::unique_ptr<af::PolicyPatternIndex> m_patterns;
    qint64 m_now = 0;
};

void TestMemoryHygiene::init()
{
    m_store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    m_memories = std::make_unique<af::MemoryStore>(m_store->rawDb());
    m_patterns = std::make_unique<af::PolicyPatternIndex>(m_store->rawDb());
    m_now = QDateTime::currentMSecsSinceEpoch();
}

void TestMemoryHygiene::cleanup()
{
    m_patterns.reset();
    m_memories.reset();
    m_store.reset();
}

void TestMemoryHygiene::testMemoryStoreBasics()
{
    const auto id = m_memories->add(QStringLiteral("alice"), QStringLiteral("editor"),
                                    QStringLiteral("vim"), m_now);
    QVERIFY(id.has_value());

    const auto item = m_memories->item(*id);
    QVERIFY(item.has_value());
    QVERIFY(item->isActive());
    QCOMPARE(item->key, QStringLiteral("editor"));
    QCOMPARE(item->value, QStringLiteral("vim"));

    QCOMPARE(m_memories->items(QStringLiteral("alice")).size(), size_t(1));
    QVERIFY(m_memories->items(QStringLiteral("bob")).empty());
    QVERIFY(m_memories->duplicatedKeys(QStringLiteral("alice")).isEmpty());
}

void TestMemoryHygiene::testSupersedeKeepsNewest()
{
    MemoryHygiene hygiene(m_memories.get(), m_patterns.get(), MemoryHygiene::Options{});
    const auto oldId = m_memories->add(QStringLiteral("alice"), QStringLiteral("editor"),
                                       QStringLiteral("vim"), m_now - 1000);
    const auto newId = m_memories->add(QStringLiteral("alice"), QStringLiteral("editor"),
                                       QStringLiteral("emacs"), m_now);
    QVERIFY(oldId && newId);

    const QStringList superseded = hygiene.supersedeMemory(QStringLiteral("alice"),
                                                           QStringLiteral("editor"), *newId, m_now);
    QCOMPARE(superseded, QStringList{*oldId});

    const auto old = m_memories->item(*oldId);
    QVERIFY(old.has_value());
    QVERIFY(!old->isActive());
    QCOMPARE(old->supersededBy, *newId);

    const auto active = m_memories->items(QStringLiteral("alice"), QStringLiteral("editor"));
    QCOMPARE(active.size(), size_t(1));
    QCOMPARE(active[0].value, QStringLiteral("emacs"));
    QCOMPARE(m_memories->items(QStringLiteral("alice"), QStringLiteral("editor"), false).size(),
             size_t(2));
}

void TestMemoryHygiene::testDecaySpecificDomain()
{
    MemoryHygiene::Options options;
    options.decayFactor = 0.5;
    MemoryHygiene hygiene(m_memories.get(), m_patterns.get(), options);

    QVERIFY(m_patterns->add(QStringLiteral("alice"), QStringLiteral("coding"), QStringLiteral("p"), 1.0, 0.8));
    QVERIFY(m_patterns->add(QStringLiteral("alice"), QStringLiteral("writing"), QStringLiteral("q"), 1.0, 0.8));

    QCOMPARE(hygiene.decaySpecificDomain(QStringLiteral("alice"), QStringLiteral("coding")), 1);
    QCOMPARE(m_patterns->top(QStringLiteral("alice"), QStringLiteral("coding"), 1, false)[0].score, 0.4);
    QCOMPARE(m_patterns->top(QStringLiteral("alice"), QStringLiteral("writing"), 1, false)[0].score, 0.8);

    QCOMPARE(hygiene.decaySpecificDomain(QStringLiteral("alice"), QStringLiteral("writing"), 0.25), 1);
    QCOMPARE(m_patterns->top(QStringLiteral("alice"), QStringLiteral("writing"), 1, false)[0].score, 0.2);
}

void TestMemoryHygiene::testDecayUnusedUsesAgeCutoff()
{
    MemoryHygiene::Options options;
    options.decayFactor = 0.5;
    options.decayUnusedDays = 14;
    MemoryHygiene hygiene(m_memories.get(), m_patterns.get(), options);

    QVERIFY(m_patterns->add(QStringLiteral("alice"), QStringLiteral("coding"), QStringLiteral("p"), 1.0, 0.8));

    auto decayed = hygiene.decayUnusedPatterns(QStringLiteral("alice"), m_now);
    QCOMPARE(decayed.at(QStringLiteral("coding")), 0);

    // Fifteen days on, the pattern has gone unused past the cutoff.
    decayed = hygiene.decayUnusedPatterns(QStringLiteral("alice"), m_now + 15 * kDayMs);
    QCOMPARE(decayed.at(QStringLiteral("coding")), 1);
    QCOMPARE(m_patterns->top(QStringLiteral("alice"), QStringLiteral("coding"), 1, false)[0].score, 0.4);
}

void TestMemoryHygiene::testRunCycle()
{
    MemoryHygiene::Options options;
    options.decayFactor = 0.5;
    options.decayUnusedDays = 14;
    options.patternScoreFloor = 0.05;
    MemoryHygiene hygiene(m_memories.get(), m_patterns.get(), options);

    QVERIFY(m_memories->add(QStringLiteral("alice"), QStringLiteral("editor"), QStringLiteral("vim"), m_now - 2));
    QVERIFY(m_memories->add(QStringLiteral("alice"), QStringLiteral("editor"), QStringLiteral("nano"), m_now - 1));
    QVERIFY(m_memories->add(QStringLiteral("alice"), QStringLiteral("editor"), QStringLiteral("emacs"), m_now));
    QVERIFY(m_memories->add(QStringLiteral("alice"), QStringLiteral("shell"), QStringLiteral("zsh"), m_now));
    QVERIFY(m_patterns->add(QStringLiteral("bob"), QStringLiteral("math"), QStringLiteral("strong"), 1.0, 0.9));
    QVERIFY(m_patterns->add(QStringLiteral("bob"), QStringLiteral("math"), QStringLiteral("weak"), 1.0, 0.08));

    const MemoryHygiene::CycleReport report = hygiene.runCycle(m_now + 15 * kDayMs);
    QCOMPARE(report.usersVisited, 2);
    QCOMPARE(report.memoriesSuperseded, 2);
    QCOMPARE(report.patternsDecayed, 2);
    QCOMPARE(report.patternsPruned, 1);

    const auto editor = m_memories->items(QStringLiteral("alice"), QStringLiteral("editor"));
    QCOMPARE(editor.size(), size_t(1));
    QCOMPARE(editor[0].value, QStringLiteral("emacs"));
    QCOMPARE(m_memories->items(QStringLiteral("alice"), QStringLiteral("shell")).size(), size_t(1));

    const auto remaining = m_patterns->top(QStringLiteral("bob"), QStringLiteral("math"), 5, false);
    QCOMPARE(remaining.size(), size_t(1));
    QCOMPARE(remaining[0].patternText, QStringLiteral("strong"));
    QCOMPARE(remaining[0].score, 0.45);
}

void TestMemoryHygiene::testReportJson()
{
    MemoryHygiene::CycleReport report;
    report.usersVisited = 3;
    report.patternsPruned = 1;
    const QJsonObject json = report.toJson();
    QCOMPARE(json.value(QStringLiteral("usersVisited")).toInt(), 3);
    QCOMPARE(json.value(QStringLiteral("memoriesSuperseded")).toInt(), 0);
    QCOMPARE(json.value(QStringLiteral("patternsPruned")).toInt(), 1);
}

QTEST_MAIN(TestMemoryHygiene)
#include "test_memory_hygiene.moc"
