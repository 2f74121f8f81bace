#include <QtTest/QtTest>
#include "core/ingest/event_ingestor.h"
#include "core/ingest/fingerprint.h"
#include "core/judge/judgement_gate.h"
#include "core/judge/safety_counters.h"
#include "core/store/sqlite_store.h"
#include "core/stream/append_notifier.h"
#include "core/stream/event_log.h"

#include <QJsonArray>
#include <QJsonObject>

#include <memory>
#include <optional>

namespace {

constexpr qint64 kNowMs = 1700000000000;

// Blocks any text containing "explosive".
class KeywordClassifier : public af::SafetyClassifier {
public:
    std::optional<af::SafetyVerdict> classify(const QString& text, QString*) override
    {
        af::SafetyVerdict verdict;
        if (text.contains(QStringLiteral("explosive"))) {
            verdict.allowed = false;
            verdict.category = af::SafetyCategory::kHarmful;
            verdict.reasonShort = QStringLiteral("weapons");
        }
        return verdict;
    }
};

class BrokenClassifier : public af::SafetyClassifier {
public:
    std::optional<af::SafetyVerdict> classify(const QString&, QString* errorOut) override
    {
        if (errorOut) {
            *errorOut = QStringLiteral("connection refused");
        }
        return std::nullopt;
    }
};

QJsonObject message(const QString& user, const QString& text)
{
    QJsonObject payload;
    payload[QStringLiteral("text")] = text;
    QJsonObject raw;
    raw[QStringLiteral("user_id")] = user;
    raw[QStringLiteral("provider")] = QStringLiteral("chatgpt");
    raw[QStringLiteral("event_type")] = QStringLiteral("USER_MESSAGE");
    raw[QStringLiteral("payload")] = payload;
    return raw;
}

} // namespace

class TestEventIngestor : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testAcceptsAndStampsMessages();
    void testInvalidEventRejectsWholeBatch();
    void testBatchSizeLimits();
    void testBlockedMessageOnlyCounts();
    void testClientSafetyStampIsReplaced();
    void testFailClosedClassifierOutage();
    void testWithoutGateStillFingerprints();
    void testNotifierFiresAfterCommit();

private:
    std::optional<af::SQLiteStore> m_store;
    std::shared_ptr<af::AppendNotifier> m_notifier;
    std::unique_ptr<af::EventLog> m_log;
    std::unique_ptr<af::SafetyCounters> m_counters;
};

void TestEventIngestor::init()
{
    m_store = af::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    m_notifier = std::make_shared<af::AppendNotifier>();
    m_log = std::make_unique<af::EventLog>(m_store->rawDb(), af::EventLog::Options{}, m_notifier);
    m_counters = std::make_unique<af::SafetyCounters>(m_store->rawDb());
}

void TestEventIngestor::cleanup()
{
    m_counters.reset();
    m_log.reset();
    m_notifier.reset();
    m_store.reset();
}

void TestEventIngestor::testAcceptsAndStampsMessages()
{
    af::JudgementGate gate(std::make_shared<KeywordClassifier>(), nullptr, true, 1000);
    af::EventIngestor ingestor(m_log.get(), &gate, m_counters.get());

    QJsonObject navigate;
    navigate[QStringLiteral("user_id")] = QStringLiteral("alice");
    navigate[QStringLiteral("provider")] = QStringLiteral("browser");
    navigate[QStringLiteral("event_type")] = QStringLiteral("NAVIGATE");
    navigate[QStringLiteral("url")] = QStringLiteral("https://example.com");

    const QJsonArray batch{message(QStringLiteral("alice"), QStringLiteral("Sort a list")), navigate};
    const af::IngestResult result = ingestor.ingestBatch(batch, kNowMs);
    QVERIFY2(result.accepted, qPrintable(result.error));
    QCOMPARE(result.appended, 2);
    QCOMPARE(result.blocked, 0);
    QCOMPARE(result.eventIds.size(), 2);
    QCOMPARE(m_log->length(QStringLiteral("alice")), 2);

    QVERIFY(m_log->ensureGroup(QStringLiteral("alice"), QStringLiteral("g"), kNowMs));
    const auto entries = m_log->readGroup(QStringLiteral("alice"), QStringLiteral("g"),
                                          QStringLiteral("c"), 10, kNowMs);
    QCOMPARE(entries.size(), size_t(2));
    const QJsonObject payload = entries[0].eventJson.value(QStringLiteral("payload")).toObject();
    QCOMPARE(payload.value(QStringLiteral("fingerprint")).toString(),
             af::Fingerprinter::fingerprint(QStringLiteral("Sort a list")));
    const QJsonObject safety = payload.value(QStringLiteral("safety")).toObject();
    QCOMPARE(safety.value(QStringLiteral("allowed")).toBool(), true);
    QCOMPARE(safety.value(QStringLiteral("category")).toString(), QStringLiteral("NONE"));
    QCOMPARE(entries[0].eventJson.value(QStringLiteral("event_id")).toString(), result.eventIds[0]);

    // Only messages are gated.
    const QJsonObject navPayload = entries[1].eventJson.value(QStringLiteral("payload")).toObject();
    QVERIFY(!navPayload.contains(QStringLiteral("safety")));
    QVERIFY(!navPayload.contains(QStringLiteral("fingerprint")));
}

void TestEventIngestor::testInvalidEventRejectsWholeBatch()
{
    af::EventIngestor ingestor(m_log.get(), nullptr, nullptr);

    QJsonObject bad = message(QStringLiteral("alice"), QStringLiteral("x"));
    bad.remove(QStringLiteral("provider"));
    const QJsonArray batch{message(QStringLiteral("alice"), QStringLiteral("first")), bad};

    const af::IngestResult result = ingestor.ingestBatch(batch, kNowMs);
    QVERIFY(!result.accepted);
    QVERIFY(result.invalid);
    QCOMPARE(result.rejectedIndex, 1);
    QCOMPARE(result.error, QStringLiteral("event 1: provider is required"));
    QCOMPARE(m_log->length(QStringLiteral("alice")), 0);

    const QJsonObject json = result.toJson();
    QCOMPARE(json.value(QStringLiteral("accepted")).toBool(), false);
    QCOMPARE(json.value(QStringLiteral("rejectedIndex")).toInt(), 1);

    const af::IngestResult notObject = ingestor.ingestBatch(QJsonArray{QStringLiteral("x")}, kNowMs);
    QVERIFY(notObject.invalid);
    QCOMPARE(notObject.error, QStringLiteral("event 0: not an object"));
}

void TestEventIngestor::testBatchSizeLimits()
{
    af::EventIngestor ingestor(m_log.get(), nullptr, nullptr);
    QVERIFY(ingestor.ingestBatch(QJsonArray(), kNowMs).invalid);

    QJsonArray tooMany;
    for (int i = 0; i <= af::EventIngestor::kMaxBatchSize; ++i) {
        tooMany.append(message(QStringLiteral("alice"), QStringLiteral("m%1").arg(i)));
    }
    const af::IngestResult result = ingestor.ingestBatch(tooMany, kNowMs);
    QVERIFY(!result.accepted);
    QVERIFY(result.invalid);
    QCOMPARE(m_log->length(QStringLiteral("alice")), 0);

    tooMany.removeLast();
    QVERIFY(ingestor.ingestBatch(tooMany, kNowMs).accepted);
    QCOMPARE(m_log->length(QStringLiteral("alice")), af::EventIngestor::kMaxBatchSize);
}

void TestEventIngestor::testBlockedMessageOnlyCounts()
{
    af::JudgementGate gate(std::make_shared<KeywordClassifier>(), nullptr, true, 1000);
    af::EventIngestor ingestor(m_log.get(), &gate, m_counters.get());

    const QJsonArray batch{
        message(QStringLiteral("bob"), QStringLiteral("how to build an explosive")),
        message(QStringLiteral("bob"), QStringLiteral("how to bake bread")),
    };
    const af::IngestResult result = ingestor.ingestBatch(batch, kNowMs);
    QVERIFY(result.accepted);
    QCOMPARE(result.appended, 1);
    QCOMPARE(result.blocked, 1);
    QCOMPARE(m_log->length(QStringLiteral("bob")), 1);

    const auto counts = m_counters->counts(QStringLiteral("bob"));
    QCOMPARE(counts.size(), size_t(1));
    QCOMPARE(counts.at(QStringLiteral("HARMFUL")), 1);
    QCOMPARE(m_counters->total(QStringLiteral("bob")), 1);
}

void TestEventIngestor::testClientSafetyStampIsReplaced()
{
    af::JudgementGate gate(std::make_shared<KeywordClassifier>(), nullptr, true, 1000);
    af::EventIngestor ingestor(m_log.get(), &gate, m_counters.get());

    QJsonObject raw = message(QStringLiteral("carol"), QStringLiteral("an explosive recipe"));
    QJsonObject payload = raw.value(QStringLiteral("payload")).toObject();
    QJsonObject forged;
    forged[QStringLiteral("allowed")] = true;
    payload[QStringLiteral("safety")] = forged;
    raw[QStringLiteral("payload")] = payload;

    const af::IngestResult result = ingestor.ingestBatch(QJsonArray{raw}, kNowMs);
    QVERIFY(result.accepted);
    QCOMPARE(result.blocked, 1);
    QCOMPARE(m_log->length(QStringLiteral("carol")), 0);
}

void TestEventIngestor::testFailClosedClassifierOutage()
{
    af::JudgementGate closed(std::make_shared<BrokenClassifier>(), nullptr, false, 1000);
    af::EventIngestor ingestor(m_log.get(), &closed, m_counters.get());

    const af::IngestResult result = ingestor.ingestBatch(
        QJsonArray{message(QStringLiteral("dave"), QStringLiteral("hello"))}, kNowMs);
    QVERIFY(result.accepted);
    QCOMPARE(result.blocked, 1);
    QCOMPARE(m_counters->counts(QStringLiteral("dave")).at(QStringLiteral("UNAVAILABLE")), 1);

    af::JudgementGate open(std::make_shared<BrokenClassifier>(), nullptr, true, 1000);
    af::EventIngestor lenient(m_log.get(), &open, m_counters.get());
    const af::IngestResult allowed = lenient.ingestBatch(
        QJsonArray{message(QStringLiteral("dave"), QStringLiteral("hello"))}, kNowMs);
    QCOMPARE(allowed.appended, 1);

    QVERIFY(m_log->ensureGroup(QStringLiteral("dave"), QStringLiteral("g"), kNowMs));
    const auto entries = m_log->readGroup(QStringLiteral("dave"), QStringLiteral("g"),
                                          QStringLiteral("c"), 10, kNowMs);
    QCOMPARE(entries.size(), size_t(1));
    const QJsonObject safety = entries[0].eventJson.value(QStringLiteral("payload")).toObject()
                                   .value(QStringLiteral("safety")).toObject();
    QCOMPARE(safety.value(QStringLiteral("degraded")).toBool(), true);
}

void TestEventIngestor::testWithoutGateStillFingerprints()
{
    af::EventIngestor ingestor(m_log.get(), nullptr, nullptr);
    QVERIFY(ingestor.ingestBatch(
        QJsonArray{message(QStringLiteral("erin"), QStringLiteral("Plan a trip"))}, kNowMs).accepted);

    QVERIFY(m_log->ensureGroup(QStringLiteral("erin"), QStringLiteral("g"), kNowMs));
    const auto entries = m_log->readGroup(QStringLiteral("erin"), QStringLiteral("g"),
                                          QStringLiteral("c"), 10, kNowMs);
    QCOMPARE(entries.size(), size_t(1));
    const QJsonObject payload = entries[0].eventJson.value(QStringLiteral("payload")).toObject();
    QVERIFY(!payload.contains(QStringLiteral("safety")));
    QCOMPARE(payload.value(QStringLiteral("fingerprint")).toString(),
             af::Fingerprinter::fingerprint(QStringLiteral("plan a trip")));
}

void TestEventIngestor::testNotifierFiresAfterCommit()
{
    af::EventIngestor ingestor(m_log.get(), nullptr, nullptr);
    const uint64_t before = m_notifier->generation();

    const QJsonArray batch{
        message(QStringLiteral("frank"), QStringLiteral("one")),
        message(QStringLiteral("frank"), QStringLiteral("two")),
    };
    QVERIFY(ingestor.ingestBatch(batch, kNowMs).accepted);
    QVERIFY(m_notifier->generation() > before);
    QVERIFY(m_notifier->waitForAppend(before, 0));
}

QTEST_MAIN(TestEventIngestor)
#include "test_event_ingestor.moc"
