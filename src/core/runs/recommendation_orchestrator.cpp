#include "core/runs/recommendation_orchestrator.h"
#include "core/embedding/embedding_client.h"
#include "core/embedding/embedding_provider.h"
#include "core/index/sqlite_store.h"
#include "core/ranking/diversity_selector.h"
#include "core/ranking/scorer.h"
#include "core/runs/evidence_builder.h"
#include "core/runs/run_store.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/taste/taste_profile_service.h"
#include "core/taste/taste_store.h"
#include "core/vector/candidate_retriever.h"
#include "core/vector/item_index.h"

#include <QCoreApplication>
#include <QDateTime>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <unordered_map>
#include <utility>

namespace rp {

namespace {

constexpr int kPipelineSteps = 6;

EmbeddingClient::Options clientOptions(const RecommendationSettings& settings)
{
    EmbeddingClient::Options options;
    options.timeoutMs = settings.providerTimeoutMs;
    options.maxAttempts = settings.providerMaxAttempts;
    options.backoffBaseMs = settings.providerBackoffBaseMs;
    options.backoffMaxMs = settings.providerBackoffMaxMs;
    return options;
}

RecError cancelledError()
{
    return RecError::make(RecErrorCode::Cancelled, QStringLiteral("cancelled"));
}

// Mean user rating of the recent history, rescaled to the scoring scale.
std::optional<double> userMeanRating(const std::vector<WatchedItem>& watched, double scale)
{
    double sum = 0.0;
    int count = 0;
    for (const WatchedItem& item : watched) {
        if (item.userRating.has_value()) {
            sum += std::clamp(*item.userRating, 0.0, 10.0);
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return (sum / count) * scale / 10.0;
}

// Selected rows first, then the best-scoring rejects up to the limit.
std::vector<Candidate> rowsToStore(SelectionResult& selection, int limit)
{
    std::vector<Candidate> rows = std::move(selection.selected);
    std::stable_sort(selection.rejected.begin(), selection.rejected.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.score.base > b.score.base;
                     });
    size_t keep = selection.rejected.size();
    if (limit > 0) {
        keep = rows.size() >= static_cast<size_t>(limit)
            ? 0
            : std::min(keep, static_cast<size_t>(limit) - rows.size());
    }
    rows.reserve(rows.size() + keep);
    for (size_t i = 0; i < keep; ++i) {
        rows.push_back(std::move(selection.rejected[i]));
    }
    return rows;
}

} // namespace

RecommendationOrchestrator::RecommendationOrchestrator(const RecommendationSettings& settings,
                                                       ItemIndex* index,
                                                       std::shared_ptr<EmbeddingProvider> provider,
                                                       QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_index(index)
{
    if (!provider) {
        provider = std::make_shared<DisabledEmbeddingProvider>(
            m_settings.embeddingModelId.toStdString(), m_settings.embeddingDimensions);
    }
    m_embeddingClient = std::make_unique<EmbeddingClient>(std::move(provider),
                                                          clientOptions(m_settings));
}

RecommendationOrchestrator::~RecommendationOrchestrator() = default;

void RecommendationOrchestrator::setClock(std::function<double()> clock)
{
    m_clock = std::move(clock);
}

double RecommendationOrchestrator::now() const
{
    if (m_clock) {
        return m_clock();
    }
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

void RecommendationOrchestrator::reportStep(RunStore& runs, const RecommendationRun& run,
                                            const QString& step, int index)
{
    LOG_DEBUG(rpRun, "%s: %s", qUtf8Printable(run.userId), qUtf8Printable(step));
    if (!runs.touchRun(run.id, now())) {
        LOG_WARN(rpRun, "Heartbeat of run %lld not recorded", static_cast<long long>(run.id));
    }
    emit stepChanged(run.userId, step);
    emit progressUpdated(run.userId, index, kPipelineSteps);
}

RecommendationRun RecommendationOrchestrator::rejectedRun(const QString& userId, MediaType type,
                                                          RunType runType,
                                                          const RecError& error) const
{
    RecommendationRun run;
    run.userId = userId;
    run.mediaType = type;
    run.runType = runType;
    run.status = RunStatus::Failed;
    run.errorCode = error.code;
    run.errorMessage = error.message;
    run.createdAt = now();
    run.completedAt = run.createdAt;
    return run;
}

std::optional<RunSlot> RecommendationOrchestrator::acquireSlot(const QString& userId,
                                                               MediaType type)
{
    if (m_settings.runConflictPolicy == RunConflictPolicy::Wait) {
        return m_registry.acquire(userId, type, m_settings.runWaitTimeoutMs);
    }
    return m_registry.tryAcquire(userId, type);
}

bool RecommendationOrchestrator::cancel(const QString& userId, MediaType type)
{
    const bool requested = m_registry.requestCancel(userId, type);
    if (requested) {
        LOG_INFO(rpRun, "Cancellation requested for %s (%s)", qUtf8Printable(userId),
                 qUtf8Printable(mediaTypeToString(type)));
    }
    return requested;
}

RecommendationRun RecommendationOrchestrator::runForUser(const QString& userId, MediaType type,
                                                         RunType runType,
                                                         const QString& channelId,
                                                         bool forceProfile)
{
    ExecuteOptions options;
    options.runType = runType;
    options.channelId = channelId;
    options.forceProfile = forceProfile;
    return execute(userId, type, options);
}

RecommendationRun RecommendationOrchestrator::regenerate(const QString& userId, MediaType type)
{
    ExecuteOptions options;
    options.runType = RunType::Regenerate;
    options.refreshProfile = true;
    options.clearPolicy = m_settings.regeneratePolicy;
    return execute(userId, type, options);
}

RecommendationRun RecommendationOrchestrator::execute(const QString& userId, MediaType type,
                                                      const ExecuteOptions& options)
{
    std::optional<RunSlot> slot = acquireSlot(userId, type);
    if (!slot) {
        LOG_INFO(rpRun, "Run for %s (%s) rejected: another run is in progress",
                 qUtf8Printable(userId), qUtf8Printable(mediaTypeToString(type)));
        RecommendationRun run = rejectedRun(
            userId, type, options.runType,
            RecError::make(RecErrorCode::RunInProgress,
                           QStringLiteral("a run is already in progress")));
        emit runFinished(run.id, runStatusToString(run.status));
        return run;
    }
    return executeHoldingSlot(userId, type, options, *slot);
}

RecommendationRun RecommendationOrchestrator::executeHoldingSlot(const QString& userId,
                                                                 MediaType type,
                                                                 const ExecuteOptions& options,
                                                                 const RunSlot& slot)
{
    QElapsedTimer timer;
    timer.start();

    std::optional<SQLiteStore> store = SQLiteStore::open(m_settings.dbPath);
    if (!store) {
        RecommendationRun run = rejectedRun(
            userId, type, options.runType,
            RecError::make(RecErrorCode::StorageFailure,
                           QStringLiteral("cannot open %1").arg(m_settings.dbPath)));
        emit runFinished(run.id, runStatusToString(run.status));
        return run;
    }

    // The in-process slot only covers this orchestrator. The database check
    // covers every process sharing the file.
    RunStore runs(store->rawDb());
    RecommendationRun run;
    const RecError begun = runs.beginRun(userId, type, options.runType, options.channelId,
                                         QCoreApplication::applicationPid(), now(), run);
    if (begun.isError()) {
        RecommendationRun rejected = rejectedRun(userId, type, options.runType, begun);
        emit runFinished(rejected.id, runStatusToString(rejected.status));
        return rejected;
    }

    if (options.clearPolicy.has_value()) {
        const int removed = runs.clearForUser(userId, type, *options.clearPolicy);
        LOG_INFO(rpRun, "Cleared %d rows for %s (%s)", removed, qUtf8Printable(userId),
                 qUtf8Printable(regeneratePolicyToString(*options.clearPolicy)));
    }

    if (!runs.markRunning(run.id)) {
        const RecError error = RecError::make(RecErrorCode::StorageFailure,
                                              QStringLiteral("cannot record run"));
        runs.failRun(run.id, error, timer.elapsed(), now());
        run.status = RunStatus::Failed;
        run.errorCode = error.code;
        run.errorMessage = error.message;
        emit runFinished(run.id, runStatusToString(run.status));
        return run;
    }
    run.status = RunStatus::Running;

    RecError error;
    try {
        error = runPipeline(*store, runs, run, options, slot, timer);
    } catch (const std::exception& e) {
        LOG_ERROR(rpRun, "Run %lld threw: %s", static_cast<long long>(run.id), e.what());
        error = RecError::make(RecErrorCode::StorageFailure, QString::fromUtf8(e.what()));
    }

    if (error.isError()) {
        run.durationMs = timer.elapsed();
        run.completedAt = now();
        run.errorCode = error.code;
        run.errorMessage = error.message;
        if (error.code == RecErrorCode::Cancelled) {
            run.status = RunStatus::Cancelled;
            runs.cancelRun(run.id, run.durationMs, run.completedAt);
            LOG_INFO(rpRun, "Run %lld cancelled", static_cast<long long>(run.id));
        } else {
            run.status = RunStatus::Failed;
            if (!runs.failRun(run.id, error, run.durationMs, run.completedAt)) {
                LOG_ERROR(rpRun, "Could not record failure of run %lld",
                          static_cast<long long>(run.id));
            }
            LOG_WARN(rpRun, "Run %lld failed: %s (%s)", static_cast<long long>(run.id),
                     qUtf8Printable(recErrorCodeToString(error.code)),
                     qUtf8Printable(error.message));
        }
    }

    emit runFinished(run.id, runStatusToString(run.status));
    return run;
}

RecError RecommendationOrchestrator::runPipeline(SQLiteStore& store, RunStore& runs,
                                                 RecommendationRun& run,
                                                 const ExecuteOptions& options,
                                                 const RunSlot& slot,
                                                 const QElapsedTimer& timer)
{
    const QString problem = SettingsManager::validate(m_settings);
    if (!problem.isEmpty()) {
        return RecError::make(RecErrorCode::InvalidConfig, problem);
    }
    if (!m_index) {
        return RecError::make(RecErrorCode::InvalidConfig, QStringLiteral("no item index"));
    }

    const QString& userId = run.userId;
    const MediaType type = run.mediaType;
    const MediaTypeConfig& config = m_settings.forMediaType(type);

    const std::optional<UserRecord> user = store.getUser(userId);
    if (!user) {
        return RecError::make(RecErrorCode::InsufficientData,
                              QStringLiteral("unknown user %1").arg(userId));
    }

    // ── Taste profile ───────────────────────────────────────
    reportStep(runs, run, QStringLiteral("profile"), 1);
    TasteStore tasteStore(store.rawDb());
    bool force = options.forceProfile;
    if (options.refreshProfile && !force) {
        const std::optional<TasteProfile> stored = tasteStore.getProfile(userId, type);
        force = !(stored && stored->isLocked);
    }
    TasteProfileService profiles(store, tasteStore, m_embeddingClient.get(), m_settings);
    TasteSnapshot snapshot;
    RecError error = profiles.ensureProfile(userId, type, force, now(), snapshot);
    if (error.isError()) {
        return error;
    }
    if (slot.cancelRequested()) {
        return cancelledError();
    }

    // ── Retrieval ───────────────────────────────────────────
    reportStep(runs, run, QStringLiteral("retrieving"), 2);
    RetrievalRequest request;
    request.taste = snapshot.profile.embedding;
    request.mediaType = type;
    for (int64_t id : store.watchedItemIds(userId, type)) {
        request.watchedIds.insert(id);
    }
    request.limit = config.maxCandidates;
    request.maxParentalRating = user->maxParentalRating;
    // An unreadable library configuration must not widen the run to the
    // whole catalog.
    if (!store.libraryScope(type, request.libraryScope)) {
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("cannot read library configuration"));
    }
    request.pushDownExclusion = m_settings.pushDownWatchedExclusion;

    CandidateRetriever retriever(*m_index, store);
    RetrievalResult retrieved = retriever.retrieve(request);
    if (retrieved.error.isError()) {
        return retrieved.error;
    }
    if (slot.cancelRequested()) {
        return cancelledError();
    }

    // ── Scoring ─────────────────────────────────────────────
    reportStep(runs, run, QStringLiteral("scoring"), 3);
    ScoringContext context;
    context.maxPopularity = store.maxPopularity(type);
    context.userMeanRating = userMeanRating(snapshot.recentWatched, config.scoring.ratingScale);
    const Scorer scorer(config.scoring);
    std::vector<Candidate> candidates = std::move(retrieved.candidates);
    error = scorer.scoreAll(candidates, context);
    if (error.isError()) {
        return error;
    }
    if (slot.cancelRequested()) {
        return cancelledError();
    }

    // ── Selection ───────────────────────────────────────────
    reportStep(runs, run, QStringLiteral("selecting"), 4);
    const DiversitySelector selector(config.diversityLambda, config.networkDiversityWeight);
    SelectionResult selection = selector.select(std::move(candidates), config.selectedCount);

    // ── Evidence ────────────────────────────────────────────
    reportStep(runs, run, QStringLiteral("evidence"), 5);
    std::vector<int64_t> selectedIds;
    selectedIds.reserve(selection.selected.size());
    for (const Candidate& candidate : selection.selected) {
        selectedIds.push_back(candidate.itemId);
    }
    const std::unordered_map<int64_t, EmbeddingVector> selectedEmbeddings =
        store.getItemEmbeddings(selectedIds, m_settings.embeddingModelId.toStdString());

    const EvidenceBuilder evidenceBuilder(m_settings.evidenceTopN);
    std::unordered_map<int64_t, std::vector<Evidence>> evidence;
    for (const Candidate& candidate : selection.selected) {
        auto it = selectedEmbeddings.find(candidate.itemId);
        if (it == selectedEmbeddings.end()) {
            continue;
        }
        std::vector<Evidence> entries = evidenceBuilder.build(
            it->second, snapshot.recentWatched, snapshot.watchedEmbeddings);
        if (!entries.empty()) {
            evidence.emplace(candidate.itemId, std::move(entries));
        }
    }

    // ── Persist ─────────────────────────────────────────────
    reportStep(runs, run, QStringLiteral("saving"), 6);
    const int selectedCount = static_cast<int>(selection.selected.size());
    const std::vector<Candidate> rows = rowsToStore(selection, m_settings.storedCandidateLimit);
    const int64_t durationMs = timer.elapsed();
    const double completedAt = now();
    if (!runs.completeRun(run.id, rows, evidence, durationMs, completedAt)) {
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("failed to store run results"));
    }

    run.status = RunStatus::Completed;
    run.candidateCount = static_cast<int>(rows.size());
    run.selectedCount = selectedCount;
    run.durationMs = durationMs;
    run.completedAt = completedAt;
    LOG_INFO(rpRun, "Run %lld for %s: %d selected of %d candidates in %lld ms",
             static_cast<long long>(run.id), qUtf8Printable(userId), selectedCount,
             run.candidateCount, static_cast<long long>(durationMs));
    return RecError::none();
}

BulkRunSummary RecommendationOrchestrator::runForAllUsers(MediaType type)
{
    BulkRunSummary summary;

    std::vector<UserRecord> users;
    {
        std::optional<SQLiteStore> store = SQLiteStore::open(m_settings.dbPath);
        if (!store) {
            LOG_ERROR(rpRun, "Bulk run aborted: cannot open %s", qUtf8Printable(m_settings.dbPath));
            return summary;
        }
        users = store->listEligibleUsers(type, m_settings.minWatchedItems);
    }

    const size_t total = users.size();
    summary.total = static_cast<int>(total);
    summary.runs.resize(total);
    if (total == 0) {
        emit bulkProgress(0, 0);
        return summary;
    }

    LOG_INFO(rpRun, "Bulk %s run for %d users", qUtf8Printable(mediaTypeToString(type)),
             summary.total);

    std::atomic<size_t> next{0};
    std::atomic<int> processed{0};
    auto worker = [&]() {
        for (;;) {
            const size_t index = next.fetch_add(1);
            if (index >= total) {
                return;
            }
            const UserRecord& user = users[index];
            RecommendationRun run;
            try {
                ExecuteOptions options;
                options.runType = RunType::Bulk;
                run = execute(user.id, type, options);
            } catch (const std::exception& e) {
                LOG_ERROR(rpRun, "Bulk run for %s threw: %s", qUtf8Printable(user.id), e.what());
                run = rejectedRun(user.id, type, RunType::Bulk,
                                  RecError::make(RecErrorCode::StorageFailure,
                                                 QString::fromUtf8(e.what())));
            }
            summary.runs[index] = std::move(run);
            emit bulkProgress(processed.fetch_add(1) + 1, static_cast<int>(total));
        }
    };

    const size_t workerCount =
        std::min(total, static_cast<size_t>(std::max(m_settings.maxConcurrentRuns, 1)));
    std::vector<std::thread> threads;
    threads.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        threads.emplace_back(worker);
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    for (const RecommendationRun& run : summary.runs) {
        switch (run.status) {
        case RunStatus::Completed:
            ++summary.succeeded;
            summary.totalRecommendations += run.selectedCount;
            break;
        case RunStatus::Cancelled:
            ++summary.cancelled;
            break;
        default:
            ++summary.failed;
            break;
        }
    }

    LOG_INFO(rpRun, "Bulk run finished: %d succeeded, %d failed, %d recommendations",
             summary.succeeded, summary.failed, summary.totalRecommendations);
    return summary;
}

BulkRunSummary RecommendationOrchestrator::clearAndRebuildAll(MediaType type)
{
    {
        std::optional<SQLiteStore> store = SQLiteStore::open(m_settings.dbPath);
        if (!store) {
            LOG_ERROR(rpRun, "Rebuild aborted: cannot open %s", qUtf8Printable(m_settings.dbPath));
            return {};
        }
        RunStore runs(store->rawDb());
        const int removed = runs.clearAll(type);
        LOG_INFO(rpRun, "Cleared %d %s runs before rebuild", removed,
                 qUtf8Printable(mediaTypeToString(type)));
    }
    return runForAllUsers(type);
}

int RecommendationOrchestrator::recoverAbandonedRuns()
{
    std::optional<SQLiteStore> store = SQLiteStore::open(m_settings.dbPath);
    if (!store) {
        return 0;
    }
    RunStore runs(store->rawDb());
    return runs.recoverAbandonedRuns(now(), m_settings.abandonedRunTimeoutSec);
}

} // namespace rp
