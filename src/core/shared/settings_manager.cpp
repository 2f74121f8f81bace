#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace af {

namespace {

QString dataRoot()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/attemptflow");
}

QStringList toStringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    out.reserve(array.size());
    for (const QJsonValue& item : array) {
        out.append(item.toString());
    }
    return out;
}

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toDouble(fallback) : fallback;
}

} // namespace

std::optional<PipelineSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(afCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(afCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const PipelineSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(afCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(afCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(afCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("ATTEMPTFLOW_SETTINGS").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    return dataRoot() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDbPath()
{
    return dataRoot() + QStringLiteral("/attemptflow.db");
}

QJsonObject SettingsManager::toJson(const PipelineSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("trackedUsers"), QJsonArray::fromStringList(settings.trackedUsers));
    json.insert(QStringLiteral("consumerGroup"), settings.consumerGroup);
    json.insert(QStringLiteral("consumerName"), settings.consumerName);
    json.insert(QStringLiteral("maxRetries"), settings.maxRetries);
    json.insert(QStringLiteral("streamMaxLen"), settings.streamMaxLen);
    json.insert(QStringLiteral("deadLetterMaxLen"), settings.deadLetterMaxLen);
    json.insert(QStringLiteral("readBatchSize"), settings.readBatchSize);
    json.insert(QStringLiteral("readBlockMs"), settings.readBlockMs);
    json.insert(QStringLiteral("reclaimIdleMs"), settings.reclaimIdleMs);
    json.insert(QStringLiteral("reclaimBatchSize"), settings.reclaimBatchSize);
    json.insert(QStringLiteral("retryCounterTtlHours"), settings.retryCounterTtlHours);
    json.insert(QStringLiteral("failOpen"), settings.failOpen);
    json.insert(QStringLiteral("judgeTimeoutMs"), settings.judgeTimeoutMs);
    json.insert(QStringLiteral("safetyCommand"), QJsonArray::fromStringList(settings.safetyCommand));
    json.insert(QStringLiteral("criticCommand"), QJsonArray::fromStringList(settings.criticCommand));
    json.insert(QStringLiteral("threadTtlDays"), settings.threadTtlDays);
    json.insert(QStringLiteral("banditTtlDays"), settings.banditTtlDays);
    json.insert(QStringLiteral("policyTtlDays"), settings.policyTtlDays);
    json.insert(QStringLiteral("safetyCounterTtlDays"), settings.safetyCounterTtlDays);
    json.insert(QStringLiteral("sessionTtlHours"), settings.sessionTtlHours);
    json.insert(QStringLiteral("sessionEventLimit"), settings.sessionEventLimit);
    json.insert(QStringLiteral("hygieneIntervalMs"), static_cast<qint64>(settings.hygieneIntervalMs));
    json.insert(QStringLiteral("decayFactor"), settings.decayFactor);
    json.insert(QStringLiteral("decayUnusedDays"), settings.decayUnusedDays);
    json.insert(QStringLiteral("patternScoreFloor"), settings.patternScoreFloor);
    return json;
}

PipelineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    PipelineSettings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString();
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }

    settings.trackedUsers = toStringList(json.value(QStringLiteral("trackedUsers")));
    settings.consumerGroup = json.value(QStringLiteral("consumerGroup")).toString(settings.consumerGroup);
    settings.consumerName = json.value(QStringLiteral("consumerName")).toString(settings.consumerName);
    settings.maxRetries = std::max(1, readInt(json, "maxRetries", settings.maxRetries));
    settings.streamMaxLen = std::max(1, readInt(json, "streamMaxLen", settings.streamMaxLen));
    settings.deadLetterMaxLen = std::max(1, readInt(json, "deadLetterMaxLen", settings.deadLetterMaxLen));
    settings.readBatchSize = std::max(1, readInt(json, "readBatchSize", settings.readBatchSize));
    settings.readBlockMs = std::max(0, readInt(json, "readBlockMs", settings.readBlockMs));
    settings.reclaimIdleMs = std::max(0, readInt(json, "reclaimIdleMs", settings.reclaimIdleMs));
    settings.reclaimBatchSize = std::max(1, readInt(json, "reclaimBatchSize", settings.reclaimBatchSize));
    settings.retryCounterTtlHours = readInt(json, "retryCounterTtlHours", settings.retryCounterTtlHours);

    settings.failOpen = json.value(QStringLiteral("failOpen")).toBool(settings.failOpen);
    settings.judgeTimeoutMs = std::max(1, readInt(json, "judgeTimeoutMs", settings.judgeTimeoutMs));
    settings.safetyCommand = toStringList(json.value(QStringLiteral("safetyCommand")));
    settings.criticCommand = toStringList(json.value(QStringLiteral("criticCommand")));

    settings.threadTtlDays = readInt(json, "threadTtlDays", settings.threadTtlDays);
    settings.banditTtlDays = readInt(json, "banditTtlDays", settings.banditTtlDays);
    settings.policyTtlDays = readInt(json, "policyTtlDays", settings.policyTtlDays);
    settings.safetyCounterTtlDays = readInt(json, "safetyCounterTtlDays", settings.safetyCounterTtlDays);
    settings.sessionTtlHours = readInt(json, "sessionTtlHours", settings.sessionTtlHours);
    settings.sessionEventLimit = std::max(1, readInt(json, "sessionEventLimit", settings.sessionEventLimit));

    if (json.contains(QStringLiteral("hygieneIntervalMs"))) {
        settings.hygieneIntervalMs = static_cast<int64_t>(
            json.value(QStringLiteral("hygieneIntervalMs")).toVariant().toLongLong());
    }
    settings.decayFactor = std::clamp(readDouble(json, "decayFactor", settings.decayFactor), 0.0, 1.0);
    settings.decayUnusedDays = readInt(json, "decayUnusedDays", settings.decayUnusedDays);
    settings.patternScoreFloor = readDouble(json, "patternScoreFloor", settings.patternScoreFloor);

    return settings;
}

} // namespace af
