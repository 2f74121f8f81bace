#include "pipeline_service.h"
#include "core/attempts/attempt_thread_store.h"
#include "core/ingest/event_ingestor.h"
#include "core/ingest/fingerprint.h"
#include "core/ipc/message.h"
#include "core/judge/judgement_gate.h"
#include "core/judge/process_judge.h"
#include "core/judge/safety_counters.h"
#include "core/learning/bandit_selector.h"
#include "core/learning/policy_pattern_index.h"
#include "core/learning/strategy_catalog.h"
#include "core/memory/memory_hygiene.h"
#include "core/memory/memory_store.h"
#include "core/shared/logging.h"
#include "core/stream/append_notifier.h"
#include "core/stream/event_log.h"
#include "core/stream/event_processor.h"
#include "core/stream/session_ledger.h"
#include "core/stream/stream_consumer.h"

#include <QDateTime>
#include <QJsonArray>

#include <cmath>

namespace af {

namespace {

constexpr int kDefaultDeadLetterLimit = 50;
constexpr int kThreadRecordLimit = 20;

QJsonObject threadToJson(const AttemptThread& thread)
{
    QJsonObject json;
    json[QStringLiteral("threadId")] = thread.threadId;
    json[QStringLiteral("userId")] = thread.userId;
    json[QStringLiteral("fingerprint")] = thread.fingerprint;
    json[QStringLiteral("domain")] = thread.domain;
    json[QStringLiteral("attemptCount")] = thread.attemptCount;
    json[QStringLiteral("status")] = threadStatusToString(thread.status);
    json[QStringLiteral("createdTsMs")] = thread.createdTsMs;
    json[QStringLiteral("updatedTsMs")] = thread.updatedTsMs;
    if (!thread.bestAttemptId.isEmpty()) {
        json[QStringLiteral("bestAttemptId")] = thread.bestAttemptId;
        json[QStringLiteral("bestReward")] = thread.bestReward;
        json[QStringLiteral("bestCriticScore")] = thread.bestCriticScore;
        json[QStringLiteral("bestFinalScore")] = thread.bestFinalScore;
    }
    return json;
}

QJsonObject recordToJson(const AttemptRecord& record)
{
    QJsonObject json;
    json[QStringLiteral("attemptId")] = record.attemptId;
    json[QStringLiteral("eventId")] = record.eventId;
    json[QStringLiteral("traceId")] = record.traceId;
    json[QStringLiteral("tsMs")] = record.tsMs;
    json[QStringLiteral("reward")] = record.reward;
    json[QStringLiteral("criticScore")] = record.criticScore;
    json[QStringLiteral("outcome")] = outcomeToString(record.outcome);
    json[QStringLiteral("strategy")] = record.payload.value(QStringLiteral("strategy"));
    return json;
}

QJsonArray armStatsToJson(const std::vector<BanditArmStats>& arms)
{
    QJsonArray out;
    for (const BanditArmStats& arm : arms) {
        QJsonObject json;
        json[QStringLiteral("strategy")] = arm.strategy;
        json[QStringLiteral("shown")] = arm.shownCount;
        json[QStringLiteral("wins")] = arm.winCount;
        json[QStringLiteral("winRate")] = arm.winRate();
        out.append(json);
    }
    return out;
}

QJsonArray patternsToJson(const std::vector<PolicyPattern>& patterns)
{
    QJsonArray out;
    for (const PolicyPattern& pattern : patterns) {
        QJsonObject json;
        json[QStringLiteral("pattern")] = pattern.patternText;
        json[QStringLiteral("score")] = pattern.score;
        out.append(json);
    }
    return out;
}

// Untried arms score +inf, which JSON cannot carry; they are sent as null.
QJsonObject scoresToJson(const std::vector<std::pair<QString, double>>& scores)
{
    QJsonObject json;
    for (const auto& [strategy, score] : scores) {
        json[strategy] = std::isinf(score) ? QJsonValue() : QJsonValue(score);
    }
    return json;
}

template <typename Map>
QJsonObject countsToJson(const Map& counts)
{
    QJsonObject json;
    for (const auto& [key, count] : counts) {
        json[key] = count;
    }
    return json;
}

QJsonObject missingParam(uint64_t id, const char* name)
{
    return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                 QStringLiteral("Missing '%1' parameter").arg(QLatin1String(name)));
}

} // anonymous namespace

PipelineService::PipelineService(PipelineSettings settings,
                                 std::shared_ptr<SafetyClassifier> classifier,
                                 std::shared_ptr<CriticScorer> critic,
                                 QObject* parent)
    : ServiceBase(QStringLiteral("pipeline"), parent)
    , m_settings(std::move(settings))
    , m_classifier(std::move(classifier))
    , m_critic(std::move(critic))
{
    if (!m_classifier && !m_settings.safetyCommand.isEmpty()) {
        m_classifier = std::make_shared<ProcessSafetyClassifier>(m_settings.safetyCommand,
                                                                 m_settings.judgeTimeoutMs);
    }
    if (!m_critic && !m_settings.criticCommand.isEmpty()) {
        m_critic = std::make_shared<ProcessCriticScorer>(m_settings.criticCommand,
                                                         m_settings.judgeTimeoutMs);
    }

    connect(&m_maintenanceTimer, &QTimer::timeout, this, [this]() {
        runMaintenance(QDateTime::currentMSecsSinceEpoch());
    });

    LOG_INFO(afIpc, "PipelineService created");
}

PipelineService::~PipelineService()
{
    stop();
}

bool PipelineService::initialize(QString* errorOut)
{
    if (isInitialized()) {
        return true;
    }

    QString storeError;
    m_store = SQLiteStore::open(m_settings.dbPath, &storeError);
    if (m_store) {
        m_consumerStore = SQLiteStore::open(m_settings.dbPath, &storeError);
    }
    if (!m_store || !m_consumerStore) {
        const QString message = QStringLiteral("Failed to open database at %1: %2")
                                    .arg(m_settings.dbPath, storeError);
        LOG_ERROR(afCore, "%s", qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        m_store.reset();
        m_consumerStore.reset();
        return false;
    }
    if (!m_store->integrityCheck()) {
        LOG_WARN(afCore, "Quick check reported problems in %s", qUtf8Printable(m_settings.dbPath));
    }

    m_notifier = std::make_shared<AppendNotifier>();
    m_gate = std::make_unique<JudgementGate>(m_classifier, m_critic,
                                             m_settings.failOpen, m_settings.judgeTimeoutMs);

    EventLog::Options logOptions;
    logOptions.maxLen = m_settings.streamMaxLen;
    logOptions.deadLetterMaxLen = m_settings.deadLetterMaxLen;
    logOptions.retryTtlHours = m_settings.retryCounterTtlHours;

    // ── Service connection ──────────────────────────────────
    sqlite3* db = m_store->rawDb();
    m_log = std::make_unique<EventLog>(db, logOptions, m_notifier);
    m_safetyCounters = std::make_unique<SafetyCounters>(db, m_settings.safetyCounterTtlDays);
    m_threads = std::make_unique<AttemptThreadStore>(db, m_settings.threadTtlDays);
    m_catalog = std::make_unique<StrategyCatalog>(db);
    m_bandit = std::make_unique<BanditSelector>(db, m_catalog.get(), m_settings.banditTtlDays);
    m_patterns = std::make_unique<PolicyPatternIndex>(db, m_settings.policyTtlDays);
    m_memories = std::make_unique<MemoryStore>(db);
    m_sessions = std::make_unique<SessionLedger>(db, m_settings.sessionEventLimit,
                                                 m_settings.sessionTtlHours);
    MemoryHygiene::Options hygieneOptions;
    hygieneOptions.decayFactor = m_settings.decayFactor;
    hygieneOptions.decayUnusedDays = m_settings.decayUnusedDays;
    hygieneOptions.patternScoreFloor = m_settings.patternScoreFloor;
    m_hygiene = std::make_unique<MemoryHygiene>(m_memories.get(), m_patterns.get(), hygieneOptions);
    m_ingestor = std::make_unique<EventIngestor>(m_log.get(), m_gate.get(), m_safetyCounters.get());

    // ── Consumer connection ─────────────────────────────────
    sqlite3* consumerDb = m_consumerStore->rawDb();
    m_consumerLog = std::make_unique<EventLog>(consumerDb, logOptions, m_notifier);
    m_consumerSafetyCounters = std::make_unique<SafetyCounters>(consumerDb,
                                                                m_settings.safetyCounterTtlDays);
    m_consumerThreads = std::make_unique<AttemptThreadStore>(consumerDb, m_settings.threadTtlDays);
    m_consumerCatalog = std::make_unique<StrategyCatalog>(consumerDb);
    m_consumerBandit = std::make_unique<BanditSelector>(consumerDb, m_consumerCatalog.get(),
                                                        m_settings.banditTtlDays);
    m_consumerPatterns = std::make_unique<PolicyPatternIndex>(consumerDb, m_settings.policyTtlDays);
    m_consumerSessions = std::make_unique<SessionLedger>(consumerDb, m_settings.sessionEventLimit,
                                                         m_settings.sessionTtlHours);

    EventProcessor::Dependencies deps;
    deps.db = consumerDb;
    deps.threads = m_consumerThreads.get();
    deps.gate = m_gate.get();
    deps.safetyCounters = m_consumerSafetyCounters.get();
    deps.bandit = m_consumerBandit.get();
    deps.patterns = m_consumerPatterns.get();
    deps.sessions = m_consumerSessions.get();
    m_processor = std::make_unique<EventProcessor>(deps);

    StreamConsumer::Options consumerOptions;
    consumerOptions.group = m_settings.consumerGroup;
    consumerOptions.consumer = m_settings.consumerName;
    consumerOptions.trackedUsers = m_settings.trackedUsers;
    consumerOptions.maxRetries = m_settings.maxRetries;
    consumerOptions.readBatchSize = m_settings.readBatchSize;
    consumerOptions.readBlockMs = m_settings.readBlockMs;
    consumerOptions.reclaimIdleMs = m_settings.reclaimIdleMs;
    consumerOptions.reclaimBatchSize = m_settings.reclaimBatchSize;
    m_consumer = std::make_unique<StreamConsumer>(m_consumerLog.get(), m_processor.get(),
                                                  consumerOptions);

    LOG_INFO(afCore, "Pipeline initialized (db=%s, failOpen=%s, catalog v%d)",
             qUtf8Printable(m_settings.dbPath), m_settings.failOpen ? "true" : "false",
             m_catalog->version());
    return true;
}

void PipelineService::start()
{
    if (!isInitialized()) {
        LOG_WARN(afCore, "PipelineService::start() called before initialize()");
        return;
    }
    m_consumer->start();
    if (m_settings.hygieneIntervalMs > 0) {
        m_maintenanceTimer.start(static_cast<int>(m_settings.hygieneIntervalMs));
    }
}

void PipelineService::stop()
{
    m_maintenanceTimer.stop();
    if (m_consumer) {
        m_consumer->stop();
    }
}

IngestResult PipelineService::ingest(const QJsonArray& rawEvents)
{
    if (!isInitialized()) {
        IngestResult result;
        result.error = QStringLiteral("pipeline not initialized");
        return result;
    }
    IngestResult result = m_ingestor->ingestBatch(rawEvents, QDateTime::currentMSecsSinceEpoch());
    m_ingestBlocked += result.blocked;
    if (!result.accepted) {
        ++m_ingestRejected;
    }
    return result;
}

QJsonObject PipelineService::runMaintenance(qint64 nowMs)
{
    QJsonObject report;
    if (!isInitialized()) {
        return report;
    }

    report[QStringLiteral("hygiene")] = m_hygiene->runCycle(nowMs).toJson();

    QJsonObject pruned;
    pruned[QStringLiteral("threads")] = m_threads->pruneExpired(nowMs);
    pruned[QStringLiteral("banditArms")] = m_bandit->pruneExpired(nowMs);
    pruned[QStringLiteral("patterns")] = m_patterns->pruneExpired(nowMs);
    pruned[QStringLiteral("safetyCounters")] = m_safetyCounters->pruneExpired(nowMs);
    pruned[QStringLiteral("sessions")] = m_sessions->pruneExpired(nowMs);
    pruned[QStringLiteral("retryCounters")] = m_log->pruneExpiredRetries(nowMs);
    report[QStringLiteral("pruned")] = pruned;
    report[QStringLiteral("checkpointed")] = m_store->checkpoint();

    LOG_INFO(afCore, "Maintenance pass complete");
    return report;
}

QString PipelineService::fingerprintParam(const QJsonObject& params)
{
    const QString fingerprint = params.value(QStringLiteral("fingerprint")).toString();
    if (!fingerprint.isEmpty()) {
        return fingerprint;
    }
    const QString text = params.value(QStringLiteral("text")).toString();
    return text.isEmpty() ? QString() : Fingerprinter::fingerprint(text);
}

// ── Request dispatch ────────────────────────────────────────

QJsonObject PipelineService::handleRequest(const QJsonObject& request)
{
    const QString method = IpcMessage::method(request);
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = IpcMessage::params(request);

    if (method == QLatin1String("ping") || method == QLatin1String("shutdown")) {
        return ServiceBase::handleRequest(request);
    }

    if (!isInitialized()) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Pipeline is not initialized"));
    }

    if (method == QLatin1String("ingestEvents"))          return handleIngestEvents(id, params);
    if (method == QLatin1String("selectStrategy"))        return handleSelectStrategy(id, params);
    if (method == QLatin1String("recordStrategyOutcome")) return handleRecordStrategyOutcome(id, params);
    if (method == QLatin1String("getSafetyCounters"))     return handleGetSafetyCounters(id, params);
    if (method == QLatin1String("getThread"))             return handleGetThread(id, params);
    if (method == QLatin1String("getDeadLetters"))        return handleGetDeadLetters(id, params);
    if (method == QLatin1String("getPolicyPatterns"))     return handleGetPolicyPatterns(id, params);
    if (method == QLatin1String("addMemory"))             return handleAddMemory(id, params);
    if (method == QLatin1String("getMemories"))           return handleGetMemories(id, params);
    if (method == QLatin1String("explain"))               return handleExplain(id, params);
    if (method == QLatin1String("runHygiene"))            return handleRunHygiene(id, params);
    if (method == QLatin1String("getHealth"))             return handleGetHealth(id, params);

    return ServiceBase::handleRequest(request);
}

QJsonObject PipelineService::handleIngestEvents(uint64_t id, const QJsonObject& params)
{
    const QJsonValue events = params.value(QStringLiteral("events"));
    if (!events.isArray()) {
        return missingParam(id, "events");
    }

    const IngestResult result = ingest(events.toArray());
    if (!result.accepted) {
        return IpcMessage::makeError(id,
                                     result.invalid ? IpcErrorCode::InvalidParams
                                                    : IpcErrorCode::InternalError,
                                     result.error);
    }
    return IpcMessage::makeResponse(id, result.toJson());
}

QJsonObject PipelineService::handleSelectStrategy(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    const QString domain = params.value(QStringLiteral("domain")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");
    if (domain.isEmpty()) return missingParam(id, "domain");

    const auto selection = m_bandit->selectStrategy(userId, domain);
    if (!selection) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Strategy catalog is empty"));
    }
    if (!m_bandit->recordShown(userId, domain, selection->strategy)) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to record strategy impression"));
    }

    QJsonObject result;
    result[QStringLiteral("strategy")] = selection->strategy;
    result[QStringLiteral("scores")] = scoresToJson(selection->scores);
    result[QStringLiteral("instruction")] = m_catalog->instruction(selection->strategy).value_or(QString());
    result[QStringLiteral("catalogVersion")] = m_catalog->version();
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleRecordStrategyOutcome(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    const QString domain = params.value(QStringLiteral("domain")).toString();
    const QString strategy = params.value(QStringLiteral("strategy")).toString();
    const QString outcome = params.value(QStringLiteral("outcome")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");
    if (domain.isEmpty()) return missingParam(id, "domain");
    if (strategy.isEmpty()) return missingParam(id, "strategy");
    if (outcome.isEmpty()) return missingParam(id, "outcome");

    if (!m_catalog->contains(strategy)) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Unknown strategy: %1").arg(strategy));
    }
    if (!m_bandit->recordWin(userId, domain, strategy, outcomeFromString(outcome))) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to record outcome"));
    }

    QJsonObject result;
    result[QStringLiteral("recorded")] = true;
    result[QStringLiteral("arms")] = armStatsToJson(m_bandit->armStats(userId, domain));
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleGetSafetyCounters(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");

    QJsonObject result;
    result[QStringLiteral("counts")] = countsToJson(m_safetyCounters->counts(userId));
    result[QStringLiteral("total")] = m_safetyCounters->total(userId);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleGetThread(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    const QString fingerprint = fingerprintParam(params);
    if (userId.isEmpty()) return missingParam(id, "userId");
    if (fingerprint.isEmpty()) return missingParam(id, "fingerprint");

    const auto thread = m_threads->threadForFingerprint(userId, fingerprint);
    if (!thread) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("No attempt thread for fingerprint"));
    }

    QJsonArray records;
    for (const AttemptRecord& record : m_threads->records(thread->threadId, kThreadRecordLimit)) {
        records.append(recordToJson(record));
    }

    QJsonObject result;
    result[QStringLiteral("thread")] = threadToJson(*thread);
    result[QStringLiteral("records")] = records;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleGetDeadLetters(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");
    const int limit = params.value(QStringLiteral("limit")).toInt(kDefaultDeadLetterLimit);

    QJsonArray letters;
    for (const DeadLetter& letter : m_log->deadLetters(userId, limit)) {
        letters.append(letter.toJson());
    }

    QJsonObject result;
    result[QStringLiteral("deadLetters")] = letters;
    result[QStringLiteral("total")] = m_log->deadLetterCount(userId);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleGetPolicyPatterns(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    const QString domain = params.value(QStringLiteral("domain")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");
    if (domain.isEmpty()) return missingParam(id, "domain");
    const int limit = params.value(QStringLiteral("limit"))
                          .toInt(PolicyPatternIndex::kDefaultContextLimit);

    QJsonObject result;
    result[QStringLiteral("patterns")] = patternsToJson(m_patterns->top(userId, domain, limit));
    result[QStringLiteral("context")] = m_patterns->formatForContext(userId, domain, limit);
    result[QStringLiteral("domains")] = QJsonArray::fromStringList(m_patterns->domains(userId));
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleAddMemory(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    const QString key = params.value(QStringLiteral("key")).toString();
    const QString value = params.value(QStringLiteral("value")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");
    if (key.isEmpty()) return missingParam(id, "key");
    if (value.isEmpty()) return missingParam(id, "value");

    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    const auto memoryId = m_memories->add(userId, key, value, nowMs);
    if (!memoryId) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to store memory"));
    }

    QJsonObject result;
    result[QStringLiteral("memoryId")] = *memoryId;
    result[QStringLiteral("superseded")] = QJsonArray::fromStringList(
        m_hygiene->supersedeMemory(userId, key, *memoryId, nowMs));
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleGetMemories(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    if (userId.isEmpty()) return missingParam(id, "userId");
    const QString key = params.value(QStringLiteral("key")).toString();
    const bool activeOnly = params.value(QStringLiteral("activeOnly")).toBool(true);

    QJsonArray items;
    for (const MemoryItem& item : m_memories->items(userId, key, activeOnly)) {
        QJsonObject json;
        json[QStringLiteral("memoryId")] = item.memoryId;
        json[QStringLiteral("key")] = item.key;
        json[QStringLiteral("value")] = item.value;
        json[QStringLiteral("status")] = item.status;
        if (!item.supersededBy.isEmpty()) {
            json[QStringLiteral("supersededBy")] = item.supersededBy;
        }
        items.append(json);
    }

    QJsonObject result;
    result[QStringLiteral("memories")] = items;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleExplain(uint64_t id, const QJsonObject& params)
{
    const QString userId = params.value(QStringLiteral("userId")).toString();
    const QString domain = params.value(QStringLiteral("domain")).toString();
    const QString fingerprint = fingerprintParam(params);
    if (userId.isEmpty()) return missingParam(id, "userId");
    if (domain.isEmpty()) return missingParam(id, "domain");

    QJsonObject result;
    result[QStringLiteral("userId")] = userId;
    result[QStringLiteral("domain")] = domain;

    QJsonObject bandit;
    if (const auto selection = m_bandit->selectStrategy(userId, domain)) {
        bandit[QStringLiteral("selected")] = selection->strategy;
        bandit[QStringLiteral("scores")] = scoresToJson(selection->scores);
    }
    bandit[QStringLiteral("arms")] = armStatsToJson(m_bandit->armStats(userId, domain));
    result[QStringLiteral("bandit")] = bandit;

    result[QStringLiteral("topPatterns")] = patternsToJson(
        m_patterns->top(userId, domain, PolicyPatternIndex::kDefaultContextLimit, false));
    result[QStringLiteral("blockedTotal")] = m_safetyCounters->total(userId);

    if (!fingerprint.isEmpty()) {
        result[QStringLiteral("fingerprint")] = fingerprint;
        if (const auto thread = m_threads->threadForFingerprint(userId, fingerprint)) {
            result[QStringLiteral("thread")] = threadToJson(*thread);
        }
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject PipelineService::handleRunHygiene(uint64_t id, const QJsonObject& /*params*/)
{
    return IpcMessage::makeResponse(id, runMaintenance(QDateTime::currentMSecsSinceEpoch()));
}

QJsonObject PipelineService::handleGetHealth(uint64_t id, const QJsonObject& /*params*/)
{
    QJsonObject result;
    result[QStringLiteral("consumerRunning")] = m_consumer->isRunning();
    result[QStringLiteral("consumer")] = m_consumer->stats().toJson();
    result[QStringLiteral("blockedAtIngest")] = m_ingestBlocked;
    result[QStringLiteral("blockedAtConsume")] = m_processor->blockedCount();
    result[QStringLiteral("rejectedBatches")] = m_ingestRejected;
    result[QStringLiteral("resolvedThreads")] = m_processor->resolvedCount();
    result[QStringLiteral("catalogVersion")] = m_catalog->version();
    result[QStringLiteral("schemaVersion")] = m_store->schemaVersion();
    result[QStringLiteral("tables")] = m_store->tableStats();
    result[QStringLiteral("requestsServed")] = static_cast<qint64>(server()->requestsServed());

    // Read through the service connection; the consumer's belongs to its thread.
    const QStringList userIds = m_settings.trackedUsers.isEmpty() ? m_log->users()
                                                                  : m_settings.trackedUsers;
    QJsonObject users;
    for (const QString& userId : userIds) {
        QJsonObject user;
        user[QStringLiteral("logLength")] = m_log->length(userId);
        user[QStringLiteral("pending")] =
            static_cast<int>(m_log->pending(userId, m_settings.consumerGroup).size());
        user[QStringLiteral("deadLetters")] = m_log->deadLetterCount(userId);
        users[userId] = user;
    }
    result[QStringLiteral("users")] = users;
    return IpcMessage::makeResponse(id, result);
}

} // namespace af
