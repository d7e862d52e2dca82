#include "recommender_service.h"

#include "core/runs/recommendation_orchestrator.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/hnsw_item_index.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>

#include <cstdio>

namespace rp {

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitRunFailed = 1,
    kExitUsage = 2,
    kExitSetup = 3,
};

QString defaultDataDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/reelpick");
}

} // namespace

RecommenderService::RecommenderService(QObject* parent)
    : QObject(parent)
{
}

RecommenderService::~RecommenderService() = default;

void RecommenderService::printJson(const QJsonObject& json)
{
    const QByteArray bytes = QJsonDocument(json).toJson(QJsonDocument::Indented);
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stdout);
    std::fflush(stdout);
}

QJsonObject RecommenderService::runToJson(const RecommendationRun& run)
{
    QJsonObject json;
    json[QStringLiteral("runId")] = static_cast<qint64>(run.id);
    json[QStringLiteral("userId")] = run.userId;
    json[QStringLiteral("mediaType")] = mediaTypeToString(run.mediaType);
    json[QStringLiteral("runType")] = runTypeToString(run.runType);
    json[QStringLiteral("status")] = runStatusToString(run.status);
    json[QStringLiteral("candidateCount")] = run.candidateCount;
    json[QStringLiteral("selectedCount")] = run.selectedCount;
    json[QStringLiteral("durationMs")] = static_cast<qint64>(run.durationMs);
    if (run.errorCode != RecErrorCode::None) {
        json[QStringLiteral("errorCode")] = recErrorCodeToString(run.errorCode);
        json[QStringLiteral("errorMessage")] = run.errorMessage;
    }
    return json;
}

QJsonObject RecommenderService::summaryToJson(const BulkRunSummary& summary)
{
    QJsonArray runs;
    for (const RecommendationRun& run : summary.runs) {
        runs.append(runToJson(run));
    }
    QJsonObject json;
    json[QStringLiteral("total")] = summary.total;
    json[QStringLiteral("succeeded")] = summary.succeeded;
    json[QStringLiteral("failed")] = summary.failed;
    json[QStringLiteral("cancelled")] = summary.cancelled;
    json[QStringLiteral("totalRecommendations")] = summary.totalRecommendations;
    json[QStringLiteral("runs")] = runs;
    return json;
}

int RecommenderService::run(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Generate per-user recommendations"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Settings JSON file."),
                                            QStringLiteral("path"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("SQLite database path."),
                                      QStringLiteral("path"));
    const QCommandLineOption userOption(QStringLiteral("user"),
                                        QStringLiteral("Run for one user."),
                                        QStringLiteral("id"));
    const QCommandLineOption mediaOption(QStringLiteral("media-type"),
                                         QStringLiteral("movie or series (default movie)."),
                                         QStringLiteral("type"), QStringLiteral("movie"));
    const QCommandLineOption channelOption(QStringLiteral("channel"),
                                           QStringLiteral("Channel the run feeds."),
                                           QStringLiteral("id"));
    const QCommandLineOption allOption(QStringLiteral("all"),
                                       QStringLiteral("Run for every eligible user."));
    const QCommandLineOption regenerateOption(QStringLiteral("regenerate"),
                                              QStringLiteral("Clear and regenerate --user."));
    const QCommandLineOption rebuildAllOption(QStringLiteral("rebuild-all"),
                                              QStringLiteral("Clear all runs, then run for everyone."));
    const QCommandLineOption forceOption(QStringLiteral("force-profile"),
                                         QStringLiteral("Rebuild the taste profile even if locked."));
    const QCommandLineOption rebuildIndexOption(QStringLiteral("rebuild-index"),
                                                QStringLiteral("Rebuild the item index from the database."));
    parser.addOptions({settingsOption, dbOption, userOption, mediaOption, channelOption,
                       allOption, regenerateOption, rebuildAllOption, forceOption,
                       rebuildIndexOption});
    parser.process(arguments);

    RecommendationSettings settings;
    if (parser.isSet(settingsOption)) {
        std::optional<RecommendationSettings> loaded =
            SettingsManager::load(parser.value(settingsOption));
        if (!loaded) {
            LOG_ERROR(rpCore, "Cannot read settings from %s",
                      qUtf8Printable(parser.value(settingsOption)));
            return kExitSetup;
        }
        settings = *loaded;
    } else if (std::optional<RecommendationSettings> loaded = SettingsManager::load()) {
        settings = *loaded;
    }
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDataDir() + QStringLiteral("/reelpick.db");
    }
    if (settings.indexDir.isEmpty()) {
        settings.indexDir = defaultDataDir() + QStringLiteral("/index");
    }

    const QString problem = SettingsManager::validate(settings);
    if (!problem.isEmpty()) {
        LOG_ERROR(rpCore, "Invalid settings: %s", qUtf8Printable(problem));
        return kExitSetup;
    }

    const std::optional<MediaType> mediaType =
        mediaTypeFromString(parser.value(mediaOption).trimmed().toLower());
    if (!mediaType) {
        LOG_ERROR(rpCore, "Unknown media type: %s", qUtf8Printable(parser.value(mediaOption)));
        return kExitUsage;
    }

    const bool bulk = parser.isSet(allOption) || parser.isSet(rebuildAllOption);
    if (!bulk && !parser.isSet(userOption) && !parser.isSet(rebuildIndexOption)) {
        parser.showHelp(kExitUsage);
    }

    QDir().mkpath(QFileInfo(settings.dbPath).absolutePath());

    HnswItemIndex index(settings.embeddingModelId.toStdString(), settings.embeddingDimensions);
    if (!index.open(settings.dbPath)) {
        return kExitSetup;
    }
    const bool indexReady = parser.isSet(rebuildIndexOption)
        ? index.rebuildFromStore() && index.save(settings.indexDir)
        : index.loadOrRebuild(settings.indexDir);
    if (!indexReady) {
        LOG_ERROR(rpCore, "Item index unavailable");
        return kExitSetup;
    }
    if (!bulk && !parser.isSet(userOption)) {
        QJsonObject json;
        json[QStringLiteral("indexedVectors")] = index.vectorCount();
        printJson(json);
        return kExitOk;
    }

    // No provider is wired into the CLI; runs needing fresh text embeddings
    // fail with a validation error instead of hanging.
    RecommendationOrchestrator orchestrator(settings, &index, nullptr);
    orchestrator.recoverAbandonedRuns();

    if (bulk) {
        const BulkRunSummary summary = parser.isSet(rebuildAllOption)
            ? orchestrator.clearAndRebuildAll(*mediaType)
            : orchestrator.runForAllUsers(*mediaType);
        printJson(summaryToJson(summary));
        return summary.failed == 0 ? kExitOk : kExitRunFailed;
    }

    const QString userId = parser.value(userOption);
    const RecommendationRun result = parser.isSet(regenerateOption)
        ? orchestrator.regenerate(userId, *mediaType)
        : orchestrator.runForUser(userId, *mediaType, RunType::Manual,
                                  parser.value(channelOption), parser.isSet(forceOption));
    printJson(runToJson(result));
    return result.succeeded() ? kExitOk : kExitRunFailed;
}

} // namespace rp
