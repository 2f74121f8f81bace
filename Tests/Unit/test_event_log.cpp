#include <QtTest/QtTest>
#include "core/shared/canonical_event.h"
#include "core/store/savepoint.h"
#include "core/store/sqlite_store.h"
#include "core/stream/append_notifier.h"
#include "core/stream/event_log.h"

#include <memory>
#include <optional>

namespace {

constexpr qint64 kNowMs = 1700000000000;
const QString kGroup = QStringLiteral("cg:test");

af::CanonicalEvent makeEvent(const QString& user, const QString& text)
{
    af::CanonicalEvent event;
    event.eventId = QStringLiteral("evt-") + text;
    event.traceId = QStringLiteral("trace-") + text;
    event.userId = user;
    event.sessionId = QStringLiteral("default");
    event.provider = QStringLiteral("chatgpt");
    event.eventType = af::EventType::UserMessage;
    event.tsMs = kNowMs;
    event.payload[QStringLiteral("text")] = text;
    return event;
}

} // namespace

class TestEventLog : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testAppendAssignsIncreasingSeq();
    void testAppendNotifiesOutsideTransaction();
    void testReadGroupDeliversOnce();
    void testGroupsAreIndependent();
    void testAckRemovesPending();
    void testClaimIdleRespectsIdleTime();
    void testTrimKeepsNewestEntries();
    void testTrimSlackScalesWithBound();
    void testClaimDropsTrimmedEntries();
    void testRetryCounterLifecycle();
    void testDeadLettersAreBounded();
    void testUsersListsLogOwners();

private:
    af::EventLog& log() { return *m_log; }

    std::optional<af::SQLiteStore> m_store;
    std::shared_ptr<af::AppendNotifier> m_notifier;
    std::unique_ptr<af::EventLog> m_log;
};

void TestEventLog::init()
{
    m_store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    m_notifier = std::make_shared<af::AppendNotifier>();

    af::EventLog::Options options;
    options.maxLen = 10;
    options.deadLetterMaxLen = 3;
    options.retryTtlHours = 1;
    m_log = std::make_unique<af::EventLog>(m_store->rawDb(), options, m_notifier);
}

void TestEventLog::cleanup()
{
    m_log.reset();
    m_store.reset();
}

void TestEventLog::testAppendAssignsIncreasingSeq()
{
    const auto first = log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("a")), kNowMs);
    const auto second = log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("b")), kNowMs);
    QVERIFY(first.has_value());
    QVERIFY(second.has_value());
    QVERIFY(*second > *first);
    QCOMPARE(log().length(QStringLiteral("alice")), 2);
    QCOMPARE(log().length(QStringLiteral("nobody")), 0);
}

void TestEventLog::testAppendNotifiesOutsideTransaction()
{
    const uint64_t before = m_notifier->generation();
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("a")), kNowMs));
    QCOMPARE(m_notifier->generation(), before + 1);

    // Inside an open transaction the caller notifies after commit.
    {
        af::Savepoint batch(m_store->rawDb(), "append_batch");
        QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("b")), kNowMs));
        QCOMPARE(m_notifier->generation(), before + 1);
        QVERIFY(batch.commit());
    }
    log().notifyAppended();
    QCOMPARE(m_notifier->generation(), before + 2);
}

void TestEventLog::testReadGroupDeliversOnce()
{
    for (const char* text : {"a", "b", "c"}) {
        QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QString::fromLatin1(text)), kNowMs));
    }
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));

    const auto firstBatch = log().readGroup(QStringLiteral("alice"), kGroup,
                                            QStringLiteral("c1"), 2, kNowMs);
    QCOMPARE(firstBatch.size(), size_t(2));
    QCOMPARE(firstBatch[0].eventJson.value(QStringLiteral("event_id")).toString(),
             QStringLiteral("evt-a"));
    QCOMPARE(firstBatch[0].deliveryCount, 1);
    QCOMPARE(firstBatch[0].entryId(), QString::number(firstBatch[0].seq));

    const auto secondBatch = log().readGroup(QStringLiteral("alice"), kGroup,
                                             QStringLiteral("c1"), 10, kNowMs);
    QCOMPARE(secondBatch.size(), size_t(1));
    QCOMPARE(secondBatch[0].eventJson.value(QStringLiteral("event_id")).toString(),
             QStringLiteral("evt-c"));

    QVERIFY(log().readGroup(QStringLiteral("alice"), kGroup, QStringLiteral("c1"), 10, kNowMs).empty());
    QCOMPARE(log().pending(QStringLiteral("alice"), kGroup).size(), size_t(3));
}

void TestEventLog::testGroupsAreIndependent()
{
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("a")), kNowMs));
    QVERIFY(log().append(makeEvent(QStringLiteral("bob"), QStringLiteral("b")), kNowMs));
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), QStringLiteral("cg:other"), kNowMs));

    QCOMPARE(log().readGroup(QStringLiteral("alice"), kGroup, QStringLiteral("c"), 10, kNowMs).size(),
             size_t(1));
    QCOMPARE(log().readGroup(QStringLiteral("alice"), QStringLiteral("cg:other"),
                             QStringLiteral("c"), 10, kNowMs).size(),
             size_t(1));

    // Reading without a group yields nothing; bob's entry is in bob's log only.
    QVERIFY(log().readGroup(QStringLiteral("bob"), kGroup, QStringLiteral("c"), 10, kNowMs).empty());
}

void TestEventLog::testAckRemovesPending()
{
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("a")), kNowMs));
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));
    const auto entries = log().readGroup(QStringLiteral("alice"), kGroup, QStringLiteral("c"), 10, kNowMs);
    QCOMPARE(entries.size(), size_t(1));

    QVERIFY(log().ack(kGroup, entries[0].seq));
    QVERIFY(log().pending(QStringLiteral("alice"), kGroup).empty());
    QVERIFY(!log().ack(kGroup, entries[0].seq));
    QVERIFY(!log().ack(kGroup, 9999));
}

void TestEventLog::testClaimIdleRespectsIdleTime()
{
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("a")), kNowMs));
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));
    QCOMPARE(log().readGroup(QStringLiteral("alice"), kGroup, QStringLiteral("dead"), 10, kNowMs).size(),
             size_t(1));

    QVERIFY(log().claimIdle(QStringLiteral("alice"), kGroup, QStringLiteral("live"),
                            60000, 10, kNowMs + 1000).empty());

    const auto claimed = log().claimIdle(QStringLiteral("alice"), kGroup, QStringLiteral("live"),
                                         60000, 10, kNowMs + 60000);
    QCOMPARE(claimed.size(), size_t(1));
    QCOMPARE(claimed[0].deliveryCount, 2);
    QCOMPARE(claimed[0].eventJson.value(QStringLiteral("event_id")).toString(), QStringLiteral("evt-a"));

    const auto pending = log().pending(QStringLiteral("alice"), kGroup);
    QCOMPARE(pending.size(), size_t(1));
    QCOMPARE(pending[0].consumer, QStringLiteral("live"));
    QCOMPARE(pending[0].deliveredAtMs, kNowMs + 60000);
    QCOMPARE(pending[0].deliveryCount, 2);

    // Claiming resets the idle clock.
    QVERIFY(log().claimIdle(QStringLiteral("alice"), kGroup, QStringLiteral("other"),
                            60000, 10, kNowMs + 61000).empty());
}

void TestEventLog::testTrimKeepsNewestEntries()
{
    // maxLen 10 with a tenth of slack: 11 entries stay, the 12th trims to 10.
    for (int i = 0; i < 11; ++i) {
        QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QString::number(i)), kNowMs));
    }
    QCOMPARE(log().length(QStringLiteral("alice")), 11);

    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("11")), kNowMs));
    QCOMPARE(log().length(QStringLiteral("alice")), 10);

    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));
    const auto entries = log().readGroup(QStringLiteral("alice"), kGroup, QStringLiteral("c"), 1, kNowMs);
    QCOMPARE(entries.size(), size_t(1));
    QCOMPARE(entries[0].eventJson.value(QStringLiteral("event_id")).toString(), QStringLiteral("evt-2"));

    // Other users' logs are untouched.
    QVERIFY(log().append(makeEvent(QStringLiteral("bob"), QStringLiteral("x")), kNowMs));
    QCOMPARE(log().length(QStringLiteral("bob")), 1);
}

void TestEventLog::testTrimSlackScalesWithBound()
{
    af::EventLog::Options options;
    options.maxLen = 100;
    af::EventLog wide(m_store->rawDb(), options, m_notifier);

    for (int i = 0; i < 110; ++i) {
        QVERIFY(wide.append(makeEvent(QStringLiteral("carol"), QString::number(i)), kNowMs));
    }
    QCOMPARE(wide.length(QStringLiteral("carol")), 110);

    QVERIFY(wide.append(makeEvent(QStringLiteral("carol"), QStringLiteral("110")), kNowMs));
    QCOMPARE(wide.length(QStringLiteral("carol")), 100);
}

void TestEventLog::testClaimDropsTrimmedEntries()
{
    QVERIFY(log().ensureGroup(QStringLiteral("alice"), kGroup, kNowMs));
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("old")), kNowMs));
    QCOMPARE(log().readGroup(QStringLiteral("alice"), kGroup, QStringLiteral("c"), 10, kNowMs).size(),
             size_t(1));

    for (int i = 0; i < 11; ++i) {
        QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QString::number(i)), kNowMs));
    }
    QCOMPARE(log().length(QStringLiteral("alice")), 10);

    QVERIFY(log().claimIdle(QStringLiteral("alice"), kGroup, QStringLiteral("c"), 0, 10, kNowMs).empty());
    QVERIFY(log().pending(QStringLiteral("alice"), kGroup).empty());
}

void TestEventLog::testRetryCounterLifecycle()
{
    QCOMPARE(log().retryCount(kGroup, 1, kNowMs), 0);
    QCOMPARE(log().incrementRetry(kGroup, 1, kNowMs).value_or(-1), 1);
    QCOMPARE(log().incrementRetry(kGroup, 1, kNowMs + 10).value_or(-1), 2);
    QCOMPARE(log().retryCount(kGroup, 1, kNowMs + 10), 2);

    // The counter expires one hour after its last bump.
    const qint64 hourMs = 60 * 60 * 1000;
    QCOMPARE(log().retryCount(kGroup, 1, kNowMs + 10 + hourMs), 0);
    QCOMPARE(log().incrementRetry(kGroup, 1, kNowMs + 10 + hourMs).value_or(-1), 1);

    QCOMPARE(log().pruneExpiredRetries(kNowMs + 20 + 2 * hourMs), 1);
    QCOMPARE(log().retryCount(kGroup, 1, kNowMs), 0);
}

void TestEventLog::testDeadLettersAreBounded()
{
    for (int i = 0; i < 5; ++i) {
        const af::CanonicalEvent event = makeEvent(QStringLiteral("alice"), QString::number(i));
        const auto seq = log().append(event, kNowMs);
        QVERIFY(seq.has_value());

        af::LogEntry entry;
        entry.seq = *seq;
        entry.userId = QStringLiteral("alice");
        entry.eventJson = event.toJson();
        QVERIFY(log().moveToDeadLetter(entry, 3, QStringLiteral("boom %1").arg(i), kNowMs + i));
    }

    QCOMPARE(log().deadLetterCount(QStringLiteral("alice")), 3);
    const auto letters = log().deadLetters(QStringLiteral("alice"));
    QCOMPARE(letters.size(), size_t(3));
    QCOMPARE(letters[0].error, QStringLiteral("boom 4"));
    QCOMPARE(letters[2].error, QStringLiteral("boom 2"));
    QCOMPARE(letters[0].retryCount, 3);
    QCOMPARE(letters[0].failedAtMs, kNowMs + 4);
    QVERIFY(letters[0].eventData.contains(QStringLiteral("evt-4")));

    const QJsonObject json = letters[0].toJson();
    QCOMPARE(json.value(QStringLiteral("retry_count")).toInt(), 3);
    QCOMPARE(json.value(QStringLiteral("error")).toString(), QStringLiteral("boom 4"));

    QCOMPARE(log().deadLetters(QStringLiteral("alice"), 1).size(), size_t(1));
    QCOMPARE(log().deadLetterCount(QStringLiteral("bob")), 0);
}

void TestEventLog::testUsersListsLogOwners()
{
    QVERIFY(log().users().isEmpty());
    QVERIFY(log().append(makeEvent(QStringLiteral("bob"), QStringLiteral("a")), kNowMs));
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("b")), kNowMs));
    QVERIFY(log().append(makeEvent(QStringLiteral("alice"), QStringLiteral("c")), kNowMs));

    QStringList users = log().users();
    users.sort();
    QCOMPARE(users, QStringList({QStringLiteral("alice"), QStringLiteral("bob")}));
}

QTEST_MAIN(TestEventLog)
#include "test_event_log.moc"
