#pragma once

#include "core/runs/run_types.h"
#include "core/shared/candidate.h"

#include <QString>

#include <optional>
#include <unordered_map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace rp {

// Persistence for recommendation runs, their candidate rows and evidence.
// Status transitions only ever move a non-terminal row forward, so a
// completed, failed or cancelled run is never rewritten.
class RunStore {
public:
    explicit RunStore(sqlite3* db);

    RunStore(const RunStore&) = delete;
    RunStore& operator=(const RunStore&) = delete;

    std::optional<RecommendationRun> createRun(const QString& userId, MediaType type,
                                               RunType runType, const QString& channelId,
                                               double nowEpoch, int64_t ownerPid = 0);

    // Checks for an active run of (userId, type) and inserts the pending row
    // inside one BEGIN IMMEDIATE transaction, so two processes sharing the
    // database cannot both start a run. Returns RunInProgress, writing
    // nothing, when another run is active.
    RecError beginRun(const QString& userId, MediaType type, RunType runType,
                      const QString& channelId, int64_t ownerPid, double nowEpoch,
                      RecommendationRun& out);

    // Refreshes the heartbeat of a pending or running row.
    bool touchRun(int64_t runId, double nowEpoch);

    bool markRunning(int64_t runId);

    // Writes every candidate row (keyed evidence by item id) and moves the
    // run to completed in one transaction. Returns false, writing nothing,
    // when the run is no longer running.
    bool completeRun(int64_t runId, const std::vector<Candidate>& candidates,
                     const std::unordered_map<int64_t, std::vector<Evidence>>& evidence,
                     int64_t durationMs, double nowEpoch);

    bool failRun(int64_t runId, const RecError& error, int64_t durationMs, double nowEpoch);
    bool cancelRun(int64_t runId, int64_t durationMs, double nowEpoch);

    std::optional<RecommendationRun> getRun(int64_t runId);

    // Newest first. limit <= 0 returns everything.
    std::vector<RecommendationRun> listRuns(const QString& userId, MediaType type, int limit = 0);
    std::optional<RecommendationRun> latestCompletedRun(const QString& userId, MediaType type);
    bool hasActiveRun(const QString& userId, MediaType type);

    // Selected rows in rank order, then unselected rows by base score.
    std::vector<StoredCandidate> candidatesForRun(int64_t runId, bool selectedOnly = false);
    std::vector<Evidence> evidenceForCandidate(int64_t candidateRowId);

    // Returns the number of rows removed (runs or candidate rows,
    // depending on policy). Only terminal runs are touched.
    int clearForUser(const QString& userId, MediaType type, RegeneratePolicy policy);
    int clearAll(MediaType type);

    // Marks pending or running rows whose heartbeat is older than
    // staleAfterSec as failed. Rows with a fresh heartbeat belong to a live
    // process and are left alone.
    int recoverAbandonedRuns(double nowEpoch, int staleAfterSec);

private:
    bool exec(const char* sql);
    bool finishRun(int64_t runId, RunStatus status, const RecError& error,
                   int64_t durationMs, double nowEpoch);
    bool insertCandidates(int64_t runId, const std::vector<Candidate>& candidates,
                          const std::unordered_map<int64_t, std::vector<Evidence>>& evidence);
    std::vector<RecommendationRun> queryRuns(const char* where, const QString& userId,
                                             MediaType type, int limit);
    RecommendationRun readRunRow(sqlite3_stmt* stmt) const;

    sqlite3* m_db = nullptr;
};

} // namespace rp
