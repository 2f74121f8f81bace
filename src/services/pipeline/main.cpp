#include "pipeline_service.h"
#include "core/ingest/event_ingestor.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>

#include <cstdio>
#include <optional>

namespace {

// --ingest accepts either a bare array or {"events": [...]}.
std::optional<QJsonArray> readBatch(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorOut = QStringLiteral("cannot open %1").arg(path);
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *errorOut = parseError.errorString();
        return std::nullopt;
    }
    if (doc.isArray()) {
        return doc.array();
    }
    const QJsonValue events = doc.object().value(QStringLiteral("events"));
    if (!events.isArray()) {
        *errorOut = QStringLiteral("expected an array of events");
        return std::nullopt;
    }
    return events.toArray();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("attemptflow-pipeline"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("attemptflow event pipeline service"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOption(
        QStringLiteral("settings"), QStringLiteral("Settings JSON file."), QStringLiteral("path"));
    const QCommandLineOption ingestOption(
        QStringLiteral("ingest"), QStringLiteral("Ingest one JSON batch and exit."),
        QStringLiteral("file"));
    parser.addOption(settingsOption);
    parser.addOption(ingestOption);
    parser.process(app);

    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : af::SettingsManager::settingsFilePath();
    af::PipelineSettings settings = af::SettingsManager::load(settingsPath)
        .value_or(af::SettingsManager::fromJson(QJsonObject()));

    af::PipelineService service(settings);
    QString error;
    if (!service.initialize(&error)) {
        fprintf(stderr, "%s\n", qUtf8Printable(error));
        return 1;
    }

    if (parser.isSet(ingestOption)) {
        const auto batch = readBatch(parser.value(ingestOption), &error);
        if (!batch) {
            fprintf(stderr, "%s\n", qUtf8Printable(error));
            return 2;
        }
        const af::IngestResult result = service.ingest(*batch);
        fprintf(stdout, "%s\n",
                QJsonDocument(result.toJson()).toJson(QJsonDocument::Compact).constData());
        if (!result.accepted) {
            fprintf(stderr, "%s\n", qUtf8Printable(result.error));
            return 2;
        }
        return 0;
    }

    service.start();
    const int rc = service.run();
    service.stop();
    return rc;
}
