#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rp {

// SettingsManager -- JSON save/load for the recommendation settings.
//
// The default location is:
//   <GenericDataLocation>/reelpick/settings.json
// Keys missing from the file keep their compiled defaults.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<RecommendationSettings> load();
    static std::optional<RecommendationSettings> load(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const RecommendationSettings& settings);
    static bool save(const RecommendationSettings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const RecommendationSettings& settings);
    static RecommendationSettings fromJson(const QJsonObject& json);

    // Returns an empty string when the settings are usable, otherwise a
    // human-readable description of the first problem found.
    static QString validate(const RecommendationSettings& settings);
};

} // namespace rp
