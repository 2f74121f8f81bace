#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace af {

// SettingsManager -- JSON save/load for pipeline settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/attemptflow/settings.json
// unless ATTEMPTFLOW_SETTINGS names another file.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<PipelineSettings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const PipelineSettings& settings,
                     const QString& filePath = settingsFilePath());

    static QString settingsFilePath();
    static QString defaultDbPath();

    // Missing keys keep their defaults; dbPath falls back to defaultDbPath().
    static QJsonObject toJson(const PipelineSettings& settings);
    static PipelineSettings fromJson(const QJsonObject& json);
};

} // namespace af
