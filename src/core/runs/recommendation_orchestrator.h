#pragma once

#include "core/runs/run_registry.h"
#include "core/runs/run_types.h"
#include "core/shared/settings.h"

#include <QElapsedTimer>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

namespace rp {

class EmbeddingClient;
class EmbeddingProvider;
class ItemIndex;
class SQLiteStore;
class RunStore;

// RecommendationOrchestrator runs the per-user pipeline
//   taste profile -> retrieve -> score -> select -> evidence -> persist
// and records every outcome as a RecommendationRun.
//
// Every public entry point returns a run (or a summary of runs); failures
// are recorded on the run rather than thrown. Each execution opens its own
// SQLite connection, so calls may come from several threads at once. The
// ItemIndex is shared and must outlive the orchestrator.
class RecommendationOrchestrator : public QObject {
    Q_OBJECT

public:
    RecommendationOrchestrator(const RecommendationSettings& settings, ItemIndex* index,
                               std::shared_ptr<EmbeddingProvider> provider,
                               QObject* parent = nullptr);
    ~RecommendationOrchestrator() override;

    RecommendationOrchestrator(const RecommendationOrchestrator&) = delete;
    RecommendationOrchestrator& operator=(const RecommendationOrchestrator&) = delete;

    RecommendationRun runForUser(const QString& userId, MediaType type,
                                 RunType runType = RunType::Manual,
                                 const QString& channelId = QString(),
                                 bool forceProfile = false);

    // Clears prior results per the configured policy, rebuilds the taste
    // profile (unless locked) and runs again, all under one in-flight slot.
    RecommendationRun regenerate(const QString& userId, MediaType type);

    BulkRunSummary runForAllUsers(MediaType type);

    // Drops every finished run for the media type, then bulk-runs.
    BulkRunSummary clearAndRebuildAll(MediaType type);

    // Returns false when no run is in flight for (user, type).
    bool cancel(const QString& userId, MediaType type);

    // Marks runs whose heartbeat is older than abandonedRunTimeoutSec as
    // failed. Runs still heartbeating in another process are left alone.
    int recoverAbandonedRuns();

    const RecommendationSettings& settings() const { return m_settings; }
    RunRegistry& registry() { return m_registry; }

    // Seconds since epoch; replaceable for tests.
    void setClock(std::function<double()> clock);

signals:
    void stepChanged(const QString& userId, const QString& step);
    void progressUpdated(const QString& userId, int processed, int total);
    void runFinished(qint64 runId, const QString& status);
    void bulkProgress(int processed, int total);

private:
    struct ExecuteOptions {
        RunType runType = RunType::Manual;
        QString channelId;
        bool forceProfile = false;
        bool refreshProfile = false;  // rebuild unless the profile is locked
        std::optional<RegeneratePolicy> clearPolicy;
    };

    std::optional<RunSlot> acquireSlot(const QString& userId, MediaType type);
    RecommendationRun execute(const QString& userId, MediaType type, const ExecuteOptions& options);
    RecommendationRun executeHoldingSlot(const QString& userId, MediaType type,
                                         const ExecuteOptions& options, const RunSlot& slot);
    RecError runPipeline(SQLiteStore& store, RunStore& runs, RecommendationRun& run,
                         const ExecuteOptions& options, const RunSlot& slot,
                         const QElapsedTimer& timer);

    RecommendationRun rejectedRun(const QString& userId, MediaType type, RunType runType,
                                  const RecError& error) const;
    // Emits progress and refreshes the run's heartbeat.
    void reportStep(RunStore& runs, const RecommendationRun& run, const QString& step, int index);
    double now() const;

    RecommendationSettings m_settings;
    ItemIndex* m_index = nullptr;
    std::unique_ptr<EmbeddingClient> m_embeddingClient;
    RunRegistry m_registry;
    std::function<double()> m_clock;
};

} // namespace rp
