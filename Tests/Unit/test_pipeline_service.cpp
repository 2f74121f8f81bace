#include <QtTest/QtTest>
#include "pipeline_service.h"
#include "core/ingest/event_ingestor.h"
#include "core/ingest/fingerprint.h"
#include "core/ipc/message.h"
#include "core/judge/safety_classifier.h"
#include "core/stream/stream_consumer.h"

#include <QDateTime>
#include <QJsonArray>
#include <QTemporaryDir>

#include <memory>

namespace {

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

QJsonObject message(const QString& user, const QString& text)
{
    QJsonObject raw;
    raw[QStringLiteral("user_id")] = user;
    raw[QStringLiteral("provider")] = QStringLiteral("chatgpt");
    raw[QStringLiteral("event_type")] = QStringLiteral("USER_MESSAGE");
    raw[QStringLiteral("payload")] = QJsonObject{{QStringLiteral("text"), text}};
    return raw;
}

QJsonObject result(const QJsonObject& response)
{
    return response.value(QStringLiteral("result")).toObject();
}

QString errorCode(const QJsonObject& response)
{
    return response.value(QStringLiteral("error")).toObject()
        .value(QStringLiteral("codeString")).toString();
}

} // namespace

class TestPipelineService : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testUnavailableBeforeInitialize();
    void testIngestEvents();
    void testIngestRejectsInvalidBatch();
    void testSelectStrategyExploresCatalogInOrder();
    void testRecordStrategyOutcome();
    void testGetThreadAfterConsume();
    void testBlockedMessagesAreCounted();
    void testMemories();
    void testPolicyPatternsAndExplain();
    void testDeadLettersAndHealth();
    void testRunHygiene();
    void testMissingParamsAndUnknownMethod();

private:
    QJsonObject call(const QString& method, const QJsonObject& params = {});
    af::PipelineSettings settings() const;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<af::PipelineService> m_service;
    uint64_t m_nextId = 1;
};

void TestPipelineService::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_service = std::make_unique<af::PipelineService>(settings());
    QString error;
    QVERIFY2(m_service->initialize(&error), qPrintable(error));
}

void TestPipelineService::cleanup()
{
    m_service.reset();
    m_dir.reset();
}

af::PipelineSettings TestPipelineService::settings() const
{
    af::PipelineSettings settings;
    settings.dbPath = m_dir->filePath(QStringLiteral("af.db"));
    settings.hygieneIntervalMs = 0;
    settings.readBlockMs = 0;
    return settings;
}

QJsonObject TestPipelineService::call(const QString& method, const QJsonObject& params)
{
    return m_service->dispatch(af::IpcMessage::makeRequest(m_nextId++, method, params));
}

void TestPipelineService::testUnavailableBeforeInitialize()
{
    af::PipelineService fresh(settings());
    QVERIFY(!fresh.isInitialized());

    const QJsonObject health = fresh.dispatch(af::IpcMessage::makeRequest(1, QStringLiteral("getHealth")));
    QCOMPARE(errorCode(health), QStringLiteral("SERVICE_UNAVAILABLE"));

    const QJsonObject ping = fresh.dispatch(af::IpcMessage::makeRequest(2, QStringLiteral("ping")));
    QVERIFY(result(ping).value(QStringLiteral("pong")).toBool());
}

void TestPipelineService::testIngestEvents()
{
    const QJsonArray events{message(QStringLiteral("alice"), QStringLiteral("Sort a list in Python")),
                            message(QStringLiteral("bob"), QStringLiteral("Draft an email"))};
    const QJsonObject response = call(QStringLiteral("ingestEvents"),
                                      QJsonObject{{QStringLiteral("events"), events}});
    const QJsonObject body = result(response);
    QVERIFY(body.value(QStringLiteral("accepted")).toBool());
    QCOMPARE(body.value(QStringLiteral("appended")).toInt(), 2);
    QCOMPARE(body.value(QStringLiteral("blocked")).toInt(), 0);
    QCOMPARE(body.value(QStringLiteral("eventIds")).toArray().size(), 2);
}

void TestPipelineService::testIngestRejectsInvalidBatch()
{
    QJsonObject bad = message(QStringLiteral("alice"), QStringLiteral("hi"));
    bad.remove(QStringLiteral("provider"));
    const QJsonArray events{message(QStringLiteral("alice"), QStringLiteral("Sort a list")), bad};

    const QJsonObject response = call(QStringLiteral("ingestEvents"),
                                      QJsonObject{{QStringLiteral("events"), events}});
    QCOMPARE(errorCode(response), QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(response.value(QStringLiteral("error")).toObject().value(QStringLiteral("message")).toString(),
             QStringLiteral("event 1: provider is required"));

    const QJsonObject health = result(call(QStringLiteral("getHealth")));
    QCOMPARE(health.value(QStringLiteral("rejectedBatches")).toInt(), 1);
    QVERIFY(health.value(QStringLiteral("users")).toObject().isEmpty());
}

void TestPipelineService::testSelectStrategyExploresCatalogInOrder()
{
    const QJsonObject params{{QStringLiteral("userId"), QStringLiteral("alice")},
                             {QStringLiteral("domain"), QStringLiteral("coding")}};

    const QJsonObject first = result(call(QStringLiteral("selectStrategy"), params));
    QCOMPARE(first.value(QStringLiteral("strategy")).toString(), QStringLiteral("S1_CLARIFY_FIRST"));
    QCOMPARE(first.value(QStringLiteral("catalogVersion")).toInt(), 1);
    QVERIFY(first.value(QStringLiteral("instruction")).toString()
                .startsWith(QStringLiteral("STRATEGY: CLARIFY_FIRST")));
    // Untried arms score +inf and travel as null.
    QVERIFY(first.value(QStringLiteral("scores")).toObject()
                .value(QStringLiteral("S1_CLARIFY_FIRST")).isNull());

    const QJsonObject second = result(call(QStringLiteral("selectStrategy"), params));
    QCOMPARE(second.value(QStringLiteral("strategy")).toString(), QStringLiteral("S2_THREE_VARIANTS"));
    QVERIFY(second.value(QStringLiteral("scores")).toObject()
                .value(QStringLiteral("S1_CLARIFY_FIRST")).isDouble());
}

void TestPipelineService::testRecordStrategyOutcome()
{
    QJsonObject params{{QStringLiteral("userId"), QStringLiteral("alice")},
                       {QStringLiteral("domain"), QStringLiteral("coding")}};
    QCOMPARE(result(call(QStringLiteral("selectStrategy"), params))
                 .value(QStringLiteral("strategy")).toString(),
             QStringLiteral("S1_CLARIFY_FIRST"));

    params[QStringLiteral("strategy")] = QStringLiteral("S9_UNKNOWN");
    params[QStringLiteral("outcome")] = QStringLiteral("success");
    QCOMPARE(errorCode(call(QStringLiteral("recordStrategyOutcome"), params)),
             QStringLiteral("INVALID_PARAMS"));

    params[QStringLiteral("strategy")] = QStringLiteral("S1_CLARIFY_FIRST");
    const QJsonObject body = result(call(QStringLiteral("recordStrategyOutcome"), params));
    QVERIFY(body.value(QStringLiteral("recorded")).toBool());

    bool found = false;
    for (const QJsonValue& arm : body.value(QStringLiteral("arms")).toArray()) {
        const QJsonObject json = arm.toObject();
        if (json.value(QStringLiteral("strategy")).toString() == QLatin1String("S1_CLARIFY_FIRST")) {
            QCOMPARE(json.value(QStringLiteral("shown")).toInt(), 1);
            QCOMPARE(json.value(QStringLiteral("wins")).toInt(), 1);
            QCOMPARE(json.value(QStringLiteral("winRate")).toDouble(), 1.0);
            found = true;
        }
    }
    QVERIFY(found);
}

void TestPipelineService::testGetThreadAfterConsume()
{
    const QString text = QStringLiteral("Sort a list in Python");
    QVERIFY(result(call(QStringLiteral("ingestEvents"),
                        QJsonObject{{QStringLiteral("events"),
                                     QJsonArray{message(QStringLiteral("alice"), text)}}}))
                .value(QStringLiteral("accepted")).toBool());

    const QJsonObject params{{QStringLiteral("userId"), QStringLiteral("alice")},
                             {QStringLiteral("text"), text}};
    QCOMPARE(errorCode(call(QStringLiteral("getThread"), params)), QStringLiteral("NOT_FOUND"));

    QCOMPARE(m_service->consumer()->pollAll(QDateTime::currentMSecsSinceEpoch()), 1);

    const QJsonObject body = result(call(QStringLiteral("getThread"), params));
    const QJsonObject thread = body.value(QStringLiteral("thread")).toObject();
    QCOMPARE(thread.value(QStringLiteral("fingerprint")).toString(), af::Fingerprinter::fingerprint(text));
    QCOMPARE(thread.value(QStringLiteral("attemptCount")).toInt(), 1);
    QCOMPARE(thread.value(QStringLiteral("status")).toString(), QStringLiteral("open"));
    QCOMPARE(body.value(QStringLiteral("records")).toArray().size(), 1);
}

void TestPipelineService::testBlockedMessagesAreCounted()
{
    m_service = std::make_unique<af::PipelineService>(settings(), std::make_shared<KeywordClassifier>());
    QVERIFY(m_service->initialize());

    const QJsonArray events{message(QStringLiteral("alice"), QStringLiteral("build an explosive")),
                            message(QStringLiteral("alice"), QStringLiteral("Plan a picnic"))};
    const QJsonObject body = result(call(QStringLiteral("ingestEvents"),
                                         QJsonObject{{QStringLiteral("events"), events}}));
    QCOMPARE(body.value(QStringLiteral("appended")).toInt(), 1);
    QCOMPARE(body.value(QStringLiteral("blocked")).toInt(), 1);

    const QJsonObject counters = result(call(QStringLiteral("getSafetyCounters"),
                                             QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")}}));
    QCOMPARE(counters.value(QStringLiteral("total")).toInt(), 1);
    QCOMPARE(counters.value(QStringLiteral("counts")).toObject().value(QStringLiteral("HARMFUL")).toInt(), 1);

    QCOMPARE(result(call(QStringLiteral("getHealth"))).value(QStringLiteral("blockedAtIngest")).toInt(), 1);
}

void TestPipelineService::testMemories()
{
    QJsonObject params{{QStringLiteral("userId"), QStringLiteral("alice")},
                       {QStringLiteral("key"), QStringLiteral("editor")},
                       {QStringLiteral("value"), QStringLiteral("vim")}};
    const QJsonObject first = result(call(QStringLiteral("addMemory"), params));
    const QString firstId = first.value(QStringLiteral("memoryId")).toString();
    QVERIFY(!firstId.isEmpty());
    QVERIFY(first.value(QStringLiteral("superseded")).toArray().isEmpty());

    params[QStringLiteral("value")] = QStringLiteral("emacs");
    const QJsonObject second = result(call(QStringLiteral("addMemory"), params));
    QCOMPARE(second.value(QStringLiteral("superseded")).toArray(), QJsonArray{firstId});

    const QJsonArray active = result(call(QStringLiteral("getMemories"),
                                          QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")}}))
                                  .value(QStringLiteral("memories")).toArray();
    QCOMPARE(active.size(), 1);
    QCOMPARE(active[0].toObject().value(QStringLiteral("value")).toString(), QStringLiteral("emacs"));

    const QJsonArray all = result(call(QStringLiteral("getMemories"),
                                       QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")},
                                                   {QStringLiteral("activeOnly"), false}}))
                               .value(QStringLiteral("memories")).toArray();
    QCOMPARE(all.size(), 2);
    QCOMPARE(all[1].toObject().value(QStringLiteral("status")).toString(), QStringLiteral("superseded"));
}

void TestPipelineService::testPolicyPatternsAndExplain()
{
    const QJsonObject params{{QStringLiteral("userId"), QStringLiteral("alice")},
                             {QStringLiteral("domain"), QStringLiteral("coding")}};
    const QJsonObject patterns = result(call(QStringLiteral("getPolicyPatterns"), params));
    QVERIFY(patterns.value(QStringLiteral("patterns")).toArray().isEmpty());
    QVERIFY(patterns.value(QStringLiteral("context")).toString().isEmpty());

    QJsonObject explainParams = params;
    explainParams[QStringLiteral("text")] = QStringLiteral("Sort a list");
    const QJsonObject explain = result(call(QStringLiteral("explain"), explainParams));
    QCOMPARE(explain.value(QStringLiteral("bandit")).toObject().value(QStringLiteral("selected")).toString(),
             QStringLiteral("S1_CLARIFY_FIRST"));
    QCOMPARE(explain.value(QStringLiteral("blockedTotal")).toInt(), 0);
    QCOMPARE(explain.value(QStringLiteral("fingerprint")).toString(),
             af::Fingerprinter::fingerprint(QStringLiteral("Sort a list")));
    QVERIFY(!explain.contains(QStringLiteral("thread")));

    // explain is read-only; the next selection still starts at S1.
    QCOMPARE(result(call(QStringLiteral("selectStrategy"), params))
                 .value(QStringLiteral("strategy")).toString(),
             QStringLiteral("S1_CLARIFY_FIRST"));
}

void TestPipelineService::testDeadLettersAndHealth()
{
    QVERIFY(result(call(QStringLiteral("ingestEvents"),
                        QJsonObject{{QStringLiteral("events"),
                                     QJsonArray{message(QStringLiteral("alice"), QStringLiteral("Plan a trip"))}}}))
                .value(QStringLiteral("accepted")).toBool());

    const QJsonObject letters = result(call(QStringLiteral("getDeadLetters"),
                                            QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")}}));
    QVERIFY(letters.value(QStringLiteral("deadLetters")).toArray().isEmpty());
    QCOMPARE(letters.value(QStringLiteral("total")).toInt(), 0);

    QJsonObject health = result(call(QStringLiteral("getHealth")));
    QVERIFY(!health.value(QStringLiteral("consumerRunning")).toBool());
    QCOMPARE(health.value(QStringLiteral("catalogVersion")).toInt(), 1);
    QCOMPARE(health.value(QStringLiteral("schemaVersion")).toInt(), 2);
    QCOMPARE(health.value(QStringLiteral("tables")).toObject()
                 .value(QStringLiteral("event_log")).toInt(), 1);
    QJsonObject alice = health.value(QStringLiteral("users")).toObject()
                            .value(QStringLiteral("alice")).toObject();
    QCOMPARE(alice.value(QStringLiteral("logLength")).toInt(), 1);

    QCOMPARE(m_service->consumer()->pollAll(QDateTime::currentMSecsSinceEpoch()), 1);
    health = result(call(QStringLiteral("getHealth")));
    alice = health.value(QStringLiteral("users")).toObject().value(QStringLiteral("alice")).toObject();
    QCOMPARE(alice.value(QStringLiteral("pending")).toInt(), 0);
    QCOMPARE(health.value(QStringLiteral("consumer")).toObject()
                 .value(QStringLiteral("processed")).toInt(), 1);
}

void TestPipelineService::testRunHygiene()
{
    QVERIFY(result(call(QStringLiteral("addMemory"),
                        QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")},
                                    {QStringLiteral("key"), QStringLiteral("role")},
                                    {QStringLiteral("value"), QStringLiteral("engineer")}}))
                .contains(QStringLiteral("memoryId")));

    const QJsonObject report = result(call(QStringLiteral("runHygiene")));
    QCOMPARE(report.value(QStringLiteral("hygiene")).toObject()
                 .value(QStringLiteral("usersVisited")).toInt(), 1);
    const QJsonObject pruned = report.value(QStringLiteral("pruned")).toObject();
    QCOMPARE(pruned.value(QStringLiteral("threads")).toInt(), 0);
    QVERIFY(pruned.contains(QStringLiteral("retryCounters")));
    QVERIFY(report.value(QStringLiteral("checkpointed")).toBool());
}

void TestPipelineService::testMissingParamsAndUnknownMethod()
{
    QCOMPARE(errorCode(call(QStringLiteral("ingestEvents"))), QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(QStringLiteral("selectStrategy"),
                            QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")}})),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(QStringLiteral("getThread"),
                            QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")}})),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(QStringLiteral("addMemory"),
                            QJsonObject{{QStringLiteral("userId"), QStringLiteral("alice")},
                                        {QStringLiteral("key"), QStringLiteral("k")}})),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(QStringLiteral("searchFiles"))), QStringLiteral("NOT_FOUND"));
}

QTEST_MAIN(TestPipelineService)
#include "test_pipeline_service.moc"
