#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <cmath>

namespace rp {

namespace {

QJsonObject scoringToJson(const ScoringConfig& scoring)
{
    QJsonObject json;
    json.insert(QStringLiteral("similarityWeight"), scoring.similarityWeight);
    json.insert(QStringLiteral("ratingWeight"), scoring.ratingWeight);
    json.insert(QStringLiteral("noveltyWeight"), scoring.noveltyWeight);
    json.insert(QStringLiteral("ratingScale"), scoring.ratingScale);
    json.insert(QStringLiteral("neutralRatingScore"), scoring.neutralRatingScore);
    json.insert(QStringLiteral("neutralFromUserMean"), scoring.neutralFromUserMean);
    json.insert(QStringLiteral("ratingCurve"), ratingCurveToString(scoring.ratingCurve));
    return json;
}

ScoringConfig scoringFromJson(const QJsonObject& json, ScoringConfig scoring)
{
    scoring.similarityWeight = json.value(QStringLiteral("similarityWeight"))
                                   .toDouble(scoring.similarityWeight);
    scoring.ratingWeight = json.value(QStringLiteral("ratingWeight")).toDouble(scoring.ratingWeight);
    scoring.noveltyWeight = json.value(QStringLiteral("noveltyWeight")).toDouble(scoring.noveltyWeight);
    scoring.ratingScale = json.value(QStringLiteral("ratingScale")).toDouble(scoring.ratingScale);
    scoring.neutralRatingScore = json.value(QStringLiteral("neutralRatingScore"))
                                     .toDouble(scoring.neutralRatingScore);
    scoring.neutralFromUserMean = json.value(QStringLiteral("neutralFromUserMean"))
                                      .toBool(scoring.neutralFromUserMean);
    if (json.contains(QStringLiteral("ratingCurve"))) {
        scoring.ratingCurve = ratingCurveFromString(
            json.value(QStringLiteral("ratingCurve")).toString());
    }
    return scoring;
}

QJsonObject mediaTypeConfigToJson(const MediaTypeConfig& config)
{
    QJsonObject json;
    json.insert(QStringLiteral("selectedCount"), config.selectedCount);
    json.insert(QStringLiteral("maxCandidates"), config.maxCandidates);
    json.insert(QStringLiteral("recentWatchLimit"), config.recentWatchLimit);
    json.insert(QStringLiteral("diversityLambda"), config.diversityLambda);
    json.insert(QStringLiteral("networkDiversityWeight"), config.networkDiversityWeight);
    json.insert(QStringLiteral("scoring"), scoringToJson(config.scoring));
    return json;
}

MediaTypeConfig mediaTypeConfigFromJson(const QJsonObject& json, MediaTypeConfig config)
{
    config.selectedCount = json.value(QStringLiteral("selectedCount")).toInt(config.selectedCount);
    config.maxCandidates = json.value(QStringLiteral("maxCandidates")).toInt(config.maxCandidates);
    config.recentWatchLimit = json.value(QStringLiteral("recentWatchLimit"))
                                  .toInt(config.recentWatchLimit);
    config.diversityLambda = json.value(QStringLiteral("diversityLambda"))
                                 .toDouble(config.diversityLambda);
    config.networkDiversityWeight = json.value(QStringLiteral("networkDiversityWeight"))
                                        .toDouble(config.networkDiversityWeight);
    config.scoring = scoringFromJson(json.value(QStringLiteral("scoring")).toObject(),
                                     config.scoring);
    return config;
}

QString validateMediaTypeConfig(const QString& name, const MediaTypeConfig& config)
{
    const ScoringConfig& s = config.scoring;
    const double weights[] = {s.similarityWeight, s.ratingWeight, s.noveltyWeight};
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            return QStringLiteral("%1: scoring weights must be finite and non-negative").arg(name);
        }
    }
    if (!(s.ratingScale > 0.0)) {
        return QStringLiteral("%1: ratingScale must be positive").arg(name);
    }
    if (s.neutralRatingScore < 0.0 || s.neutralRatingScore > 1.0) {
        return QStringLiteral("%1: neutralRatingScore must be within [0, 1]").arg(name);
    }
    if (!(config.diversityLambda >= 0.0 && config.diversityLambda <= 1.0)) {
        return QStringLiteral("%1: diversityLambda must be within [0, 1]").arg(name);
    }
    if (!(config.networkDiversityWeight >= 0.0 && config.networkDiversityWeight <= 1.0)) {
        return QStringLiteral("%1: networkDiversityWeight must be within [0, 1]").arg(name);
    }
    if (config.selectedCount < 0 || config.maxCandidates <= 0 || config.recentWatchLimit <= 0) {
        return QStringLiteral("%1: counts must be positive").arg(name);
    }
    return {};
}

} // namespace

std::optional<RecommendationSettings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<RecommendationSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rpCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rpCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const RecommendationSettings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const RecommendationSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rpCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rpCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rpCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/reelpick/settings.json");
}

QJsonObject SettingsManager::toJson(const RecommendationSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("indexDir"), settings.indexDir);
    json.insert(QStringLiteral("embeddingModelId"), settings.embeddingModelId);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("movies"), mediaTypeConfigToJson(settings.movies));
    json.insert(QStringLiteral("series"), mediaTypeConfigToJson(settings.series));

    QJsonObject aggregator;
    aggregator.insert(QStringLiteral("recencyMode"),
                      recencyModeToString(settings.aggregator.recencyMode));
    aggregator.insert(QStringLiteral("recencyHalfLifeDays"), settings.aggregator.recencyHalfLifeDays);
    aggregator.insert(QStringLiteral("linearWindowDays"), settings.aggregator.linearWindowDays);
    aggregator.insert(QStringLiteral("minRecencyWeight"), settings.aggregator.minRecencyWeight);
    aggregator.insert(QStringLiteral("favoriteMultiplier"), settings.aggregator.favoriteMultiplier);
    aggregator.insert(QStringLiteral("customInterestWeight"),
                      settings.aggregator.customInterestWeight);
    json.insert(QStringLiteral("aggregator"), aggregator);

    json.insert(QStringLiteral("evidenceTopN"), settings.evidenceTopN);
    json.insert(QStringLiteral("storedCandidateLimit"), settings.storedCandidateLimit);
    json.insert(QStringLiteral("pushDownWatchedExclusion"), settings.pushDownWatchedExclusion);
    json.insert(QStringLiteral("preferenceDecayHalfLifeDays"), settings.preferenceDecayHalfLifeDays);
    json.insert(QStringLiteral("minWatchedItems"), settings.minWatchedItems);
    json.insert(QStringLiteral("maxConcurrentRuns"), settings.maxConcurrentRuns);
    json.insert(QStringLiteral("runConflictPolicy"),
                runConflictPolicyToString(settings.runConflictPolicy));
    json.insert(QStringLiteral("runWaitTimeoutMs"), static_cast<int>(settings.runWaitTimeoutMs));
    json.insert(QStringLiteral("regeneratePolicy"),
                regeneratePolicyToString(settings.regeneratePolicy));
    json.insert(QStringLiteral("abandonedRunTimeoutSec"), settings.abandonedRunTimeoutSec);
    json.insert(QStringLiteral("providerTimeoutMs"), static_cast<int>(settings.providerTimeoutMs));
    json.insert(QStringLiteral("providerMaxAttempts"), settings.providerMaxAttempts);
    json.insert(QStringLiteral("providerBackoffBaseMs"),
                static_cast<int>(settings.providerBackoffBaseMs));
    json.insert(QStringLiteral("providerBackoffMaxMs"),
                static_cast<int>(settings.providerBackoffMaxMs));
    return json;
}

RecommendationSettings SettingsManager::fromJson(const QJsonObject& json)
{
    RecommendationSettings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.indexDir = json.value(QStringLiteral("indexDir")).toString(settings.indexDir);
    settings.embeddingModelId = json.value(QStringLiteral("embeddingModelId"))
                                    .toString(settings.embeddingModelId);
    settings.embeddingDimensions = json.value(QStringLiteral("embeddingDimensions"))
                                       .toInt(settings.embeddingDimensions);

    settings.movies = mediaTypeConfigFromJson(json.value(QStringLiteral("movies")).toObject(),
                                              settings.movies);
    settings.series = mediaTypeConfigFromJson(json.value(QStringLiteral("series")).toObject(),
                                              settings.series);

    const QJsonObject aggregator = json.value(QStringLiteral("aggregator")).toObject();
    if (aggregator.contains(QStringLiteral("recencyMode"))) {
        settings.aggregator.recencyMode = recencyModeFromString(
            aggregator.value(QStringLiteral("recencyMode")).toString());
    }
    settings.aggregator.recencyHalfLifeDays = aggregator.value(QStringLiteral("recencyHalfLifeDays"))
                                                  .toDouble(settings.aggregator.recencyHalfLifeDays);
    settings.aggregator.linearWindowDays = aggregator.value(QStringLiteral("linearWindowDays"))
                                               .toDouble(settings.aggregator.linearWindowDays);
    settings.aggregator.minRecencyWeight = aggregator.value(QStringLiteral("minRecencyWeight"))
                                               .toDouble(settings.aggregator.minRecencyWeight);
    settings.aggregator.favoriteMultiplier = aggregator.value(QStringLiteral("favoriteMultiplier"))
                                                 .toDouble(settings.aggregator.favoriteMultiplier);
    settings.aggregator.customInterestWeight =
        aggregator.value(QStringLiteral("customInterestWeight"))
            .toDouble(settings.aggregator.customInterestWeight);

    settings.evidenceTopN = json.value(QStringLiteral("evidenceTopN")).toInt(settings.evidenceTopN);
    settings.storedCandidateLimit = json.value(QStringLiteral("storedCandidateLimit"))
                                        .toInt(settings.storedCandidateLimit);
    settings.pushDownWatchedExclusion = json.value(QStringLiteral("pushDownWatchedExclusion"))
                                            .toBool(settings.pushDownWatchedExclusion);
    settings.preferenceDecayHalfLifeDays = json.value(QStringLiteral("preferenceDecayHalfLifeDays"))
                                               .toDouble(settings.preferenceDecayHalfLifeDays);
    settings.minWatchedItems = json.value(QStringLiteral("minWatchedItems"))
                                   .toInt(settings.minWatchedItems);
    settings.maxConcurrentRuns = json.value(QStringLiteral("maxConcurrentRuns"))
                                     .toInt(settings.maxConcurrentRuns);

    if (json.contains(QStringLiteral("runConflictPolicy"))) {
        settings.runConflictPolicy = runConflictPolicyFromString(
            json.value(QStringLiteral("runConflictPolicy")).toString());
    }
    if (json.contains(QStringLiteral("runWaitTimeoutMs"))) {
        settings.runWaitTimeoutMs = json.value(QStringLiteral("runWaitTimeoutMs"))
                                        .toVariant()
                                        .toUInt();
    }
    if (json.contains(QStringLiteral("regeneratePolicy"))) {
        settings.regeneratePolicy = regeneratePolicyFromString(
            json.value(QStringLiteral("regeneratePolicy")).toString());
    }
    settings.abandonedRunTimeoutSec = json.value(QStringLiteral("abandonedRunTimeoutSec"))
                                          .toInt(settings.abandonedRunTimeoutSec);

    if (json.contains(QStringLiteral("providerTimeoutMs"))) {
        settings.providerTimeoutMs = json.value(QStringLiteral("providerTimeoutMs"))
                                         .toVariant()
                                         .toUInt();
    }
    settings.providerMaxAttempts = json.value(QStringLiteral("providerMaxAttempts"))
                                       .toInt(settings.providerMaxAttempts);
    if (json.contains(QStringLiteral("providerBackoffBaseMs"))) {
        settings.providerBackoffBaseMs = json.value(QStringLiteral("providerBackoffBaseMs"))
                                             .toVariant()
                                             .toUInt();
    }
    if (json.contains(QStringLiteral("providerBackoffMaxMs"))) {
        settings.providerBackoffMaxMs = json.value(QStringLiteral("providerBackoffMaxMs"))
                                            .toVariant()
                                            .toUInt();
    }

    return settings;
}

QString SettingsManager::validate(const RecommendationSettings& settings)
{
    if (settings.embeddingModelId.isEmpty()) {
        return QStringLiteral("embeddingModelId must not be empty");
    }
    if (settings.embeddingDimensions <= 0) {
        return QStringLiteral("embeddingDimensions must be positive");
    }

    QString problem = validateMediaTypeConfig(QStringLiteral("movies"), settings.movies);
    if (!problem.isEmpty()) {
        return problem;
    }
    problem = validateMediaTypeConfig(QStringLiteral("series"), settings.series);
    if (!problem.isEmpty()) {
        return problem;
    }

    const AggregatorSettings& agg = settings.aggregator;
    if (!(agg.recencyHalfLifeDays > 0.0) || !(agg.linearWindowDays > 0.0)) {
        return QStringLiteral("aggregator: recency windows must be positive");
    }
    if (agg.minRecencyWeight < 0.0 || agg.minRecencyWeight > 1.0) {
        return QStringLiteral("aggregator: minRecencyWeight must be within [0, 1]");
    }
    if (agg.customInterestWeight < 0.0 || agg.favoriteMultiplier < 0.0) {
        return QStringLiteral("aggregator: weights must be non-negative");
    }

    if (settings.evidenceTopN < 0 || settings.storedCandidateLimit < 0) {
        return QStringLiteral("evidenceTopN and storedCandidateLimit must be non-negative");
    }
    if (settings.maxConcurrentRuns <= 0) {
        return QStringLiteral("maxConcurrentRuns must be positive");
    }
    if (settings.abandonedRunTimeoutSec <= 0) {
        return QStringLiteral("abandonedRunTimeoutSec must be positive");
    }
    if (settings.providerMaxAttempts <= 0 || settings.providerTimeoutMs == 0) {
        return QStringLiteral("provider retry and timeout settings must be positive");
    }
    if (!(settings.preferenceDecayHalfLifeDays > 0.0)) {
        return QStringLiteral("preferenceDecayHalfLifeDays must be positive");
    }
    return {};
}

} // namespace rp
