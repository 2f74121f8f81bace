#pragma once

#include "core/ipc/service_base.h"
#include "core/shared/settings.h"
#include "core/store/sqlite_store.h"

#include <QJsonArray>
#include <QTimer>

#include <memory>
#include <optional>

namespace af {

class AppendNotifier;
class AttemptThreadStore;
class BanditSelector;
class CriticScorer;
class EventIngestor;
class EventLog;
class EventProcessor;
class JudgementGate;
class MemoryHygiene;
class MemoryStore;
class PolicyPatternIndex;
class SafetyClassifier;
class SafetyCounters;
class SessionLedger;
class StrategyCatalog;
class StreamConsumer;
struct IngestResult;

// PipelineService hosts the whole pipeline in one process.
//
// Two connections are opened on the same database file: the service
// connection answers IPC requests, ingests and runs maintenance on the main
// thread; the consumer connection belongs to the consumer worker thread.
// Appends on one wake the consumer on the other through a shared
// AppendNotifier.
class PipelineService : public ServiceBase {
    Q_OBJECT
public:
    // Null judges fall back to the process adapters named in settings, and
    // to "disabled" when no command is configured either.
    explicit PipelineService(PipelineSettings settings,
                             std::shared_ptr<SafetyClassifier> classifier = nullptr,
                             std::shared_ptr<CriticScorer> critic = nullptr,
                             QObject* parent = nullptr);
    ~PipelineService() override;

    // Opens both connections and wires every component.
    bool initialize(QString* errorOut = nullptr);
    bool isInitialized() const { return m_consumer != nullptr; }

    // Starts the consumer thread and the maintenance timer.
    void start();
    void stop();

    IngestResult ingest(const QJsonArray& rawEvents);

    // Hygiene cycle plus TTL pruning of every store.
    QJsonObject runMaintenance(qint64 nowMs);

    StreamConsumer* consumer() const { return m_consumer.get(); }
    const PipelineSettings& settings() const { return m_settings; }

    // Exposed so tests can drive the service without a socket.
    QJsonObject dispatch(const QJsonObject& request) { return handleRequest(request); }

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;

private:
    QJsonObject handleIngestEvents(uint64_t id, const QJsonObject& params);
    QJsonObject handleSelectStrategy(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordStrategyOutcome(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetSafetyCounters(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetThread(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetDeadLetters(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetPolicyPatterns(uint64_t id, const QJsonObject& params);
    QJsonObject handleAddMemory(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetMemories(uint64_t id, const QJsonObject& params);
    QJsonObject handleExplain(uint64_t id, const QJsonObject& params);
    QJsonObject handleRunHygiene(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetHealth(uint64_t id, const QJsonObject& params);

    // fingerprint param, or the fingerprint of the text param.
    static QString fingerprintParam(const QJsonObject& params);

    PipelineSettings m_settings;
    std::shared_ptr<SafetyClassifier> m_classifier;
    std::shared_ptr<CriticScorer> m_critic;

    std::optional<SQLiteStore> m_store;
    std::optional<SQLiteStore> m_consumerStore;
    std::shared_ptr<AppendNotifier> m_notifier;
    std::unique_ptr<JudgementGate> m_gate;

    // Service connection
    std::unique_ptr<EventLog> m_log;
    std::unique_ptr<SafetyCounters> m_safetyCounters;
    std::unique_ptr<AttemptThreadStore> m_threads;
    std::unique_ptr<StrategyCatalog> m_catalog;
    std::unique_ptr<BanditSelector> m_bandit;
    std::unique_ptr<PolicyPatternIndex> m_patterns;
    std::unique_ptr<MemoryStore> m_memories;
    std::unique_ptr<MemoryHygiene> m_hygiene;
    std::unique_ptr<SessionLedger> m_sessions;
    std::unique_ptr<EventIngestor> m_ingestor;

    // Consumer connection
    std::unique_ptr<EventLog> m_consumerLog;
    std::unique_ptr<SafetyCounters> m_consumerSafetyCounters;
    std::unique_ptr<AttemptThreadStore> m_consumerThreads;
    std::unique_ptr<StrategyCatalog> m_consumerCatalog;
    std::unique_ptr<BanditSelector> m_consumerBandit;
    std::unique_ptr<PolicyPatternIndex> m_consumerPatterns;
    std::unique_ptr<SessionLedger> m_consumerSessions;
    std::unique_ptr<EventProcessor> m_processor;
    std::unique_ptr<StreamConsumer> m_consumer;

    QTimer m_maintenanceTimer;
    int m_ingestBlocked = 0;
    int m_ingestRejected = 0;
};

} // namespace af
