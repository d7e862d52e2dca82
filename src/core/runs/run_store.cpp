#include "core/runs/run_store.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

namespace rp {

namespace {

constexpr const char* kRunColumns = R"(
    id, user_id, media_type, run_type, channel_id, status, candidate_count, selected_count,
    duration_ms, error_code, error_message, created_at, completed_at
)";

constexpr const char* kInsertCandidateSql = R"(
    INSERT INTO recommendation_candidates (run_id, item_id, rank, is_selected, similarity,
                                           novelty, rating_score, diversity_penalty,
                                           diversity_score, base_score, final_score)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
)";

constexpr const char* kInsertEvidenceSql = R"(
    INSERT INTO recommendation_evidence (candidate_id, similar_item_id, similarity, evidence_type)
    VALUES (?1, ?2, ?3, ?4)
)";

constexpr const char* kActiveStatuses = "('pending', 'running')";

void bindString(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

QString columnString(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

} // namespace

RunStore::RunStore(sqlite3* db)
    : m_db(db)
{
}

bool RunStore::exec(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        qWarning() << "RunStore SQL failed:" << (errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

RecommendationRun RunStore::readRunRow(sqlite3_stmt* stmt) const
{
    RecommendationRun run;
    run.id = sqlite3_column_int64(stmt, 0);
    run.userId = columnString(stmt, 1);
    run.mediaType = mediaTypeFromString(columnString(stmt, 2)).value_or(MediaType::Movie);
    run.runType = runTypeFromString(columnString(stmt, 3));
    run.channelId = columnString(stmt, 4);
    run.status = runStatusFromString(columnString(stmt, 5));
    run.candidateCount = sqlite3_column_int(stmt, 6);
    run.selectedCount = sqlite3_column_int(stmt, 7);
    run.durationMs = sqlite3_column_int64(stmt, 8);
    run.errorCode = recErrorCodeFromString(columnString(stmt, 9));
    run.errorMessage = columnString(stmt, 10);
    run.createdAt = sqlite3_column_double(stmt, 11);
    run.completedAt = sqlite3_column_double(stmt, 12);
    return run;
}

std::optional<RecommendationRun> RunStore::createRun(const QString& userId, MediaType type,
                                                     RunType runType, const QString& channelId,
                                                     double nowEpoch, int64_t ownerPid)
{
    if (!m_db) {
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO recommendation_runs (user_id, media_type, run_type, channel_id, status,
                                         created_at, heartbeat_at, owner_pid)
        VALUES (?1, ?2, ?3, ?4, 'pending', ?5, ?5, ?6)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::createRun prepare failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }
    bindString(stmt, 1, userId);
    bindString(stmt, 2, mediaTypeToString(type));
    bindString(stmt, 3, runTypeToString(runType));
    if (channelId.isEmpty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        bindString(stmt, 4, channelId);
    }
    sqlite3_bind_double(stmt, 5, nowEpoch);
    if (ownerPid > 0) {
        sqlite3_bind_int64(stmt, 6, ownerPid);
    } else {
        sqlite3_bind_null(stmt, 6);
    }

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        qWarning() << "RunStore::createRun failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }

    RecommendationRun run;
    run.id = sqlite3_last_insert_rowid(m_db);
    run.userId = userId;
    run.mediaType = type;
    run.runType = runType;
    run.channelId = channelId;
    run.status = RunStatus::Pending;
    run.createdAt = nowEpoch;
    return run;
}

RecError RunStore::beginRun(const QString& userId, MediaType type, RunType runType,
                           const QString& channelId, int64_t ownerPid, double nowEpoch,
                           RecommendationRun& out)
{
    if (!m_db) {
        return RecError::make(RecErrorCode::StorageFailure, QStringLiteral("store not open"));
    }

    // IMMEDIATE takes the write lock up front, so the check below cannot be
    // interleaved with another connection's insert.
    if (!exec("BEGIN IMMEDIATE")) {
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("could not lock run table: %1")
                                  .arg(QString::fromUtf8(sqlite3_errmsg(m_db))));
    }

    if (hasActiveRun(userId, type)) {
        exec("ROLLBACK");
        LOG_INFO(rpRun, "Run for %s/%s already active in another session",
                 qUtf8Printable(userId), qUtf8Printable(mediaTypeToString(type)));
        return RecError::make(RecErrorCode::RunInProgress,
                              QStringLiteral("a run for %1 (%2) is already in progress")
                                  .arg(userId, mediaTypeToString(type)));
    }

    std::optional<RecommendationRun> run =
        createRun(userId, type, runType, channelId, nowEpoch, ownerPid);
    if (!run) {
        exec("ROLLBACK");
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("could not create run row"));
    }
    if (!exec("COMMIT")) {
        exec("ROLLBACK");
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("could not commit run row"));
    }

    out = *run;
    return RecError::none();
}

bool RunStore::touchRun(int64_t runId, double nowEpoch)
{
    if (!m_db) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        UPDATE recommendation_runs SET heartbeat_at = ?1
        WHERE id = ?2 AND status IN ('pending', 'running')
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::touchRun prepare failed:" << sqlite3_errmsg(m_db);
        return false;
    }
    sqlite3_bind_double(stmt, 1, nowEpoch);
    sqlite3_bind_int64(stmt, 2, runId);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

bool RunStore::markRunning(int64_t runId)
{
    if (!m_db) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "UPDATE recommendation_runs SET status = 'running' WHERE id = ?1 AND status = 'pending'";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, runId);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

bool RunStore::finishRun(int64_t runId, RunStatus status, const RecError& error,
                         int64_t durationMs, double nowEpoch)
{
    if (!m_db) {
        return false;
    }

    const char* sql = R"(
        UPDATE recommendation_runs
        SET status = ?1, error_code = ?2, error_message = ?3, duration_ms = ?4, completed_at = ?5
        WHERE id = ?6 AND status IN ('pending', 'running')
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::finishRun prepare failed:" << sqlite3_errmsg(m_db);
        return false;
    }
    bindString(stmt, 1, runStatusToString(status));
    if (error.isError()) {
        bindString(stmt, 2, recErrorCodeToString(error.code));
        bindString(stmt, 3, error.message);
    } else {
        sqlite3_bind_null(stmt, 2);
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_int64(stmt, 4, durationMs);
    sqlite3_bind_double(stmt, 5, nowEpoch);
    sqlite3_bind_int64(stmt, 6, runId);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        qWarning() << "RunStore::finishRun failed:" << sqlite3_errmsg(m_db);
        return false;
    }
    return sqlite3_changes(m_db) == 1;
}

bool RunStore::failRun(int64_t runId, const RecError& error, int64_t durationMs,
                       double nowEpoch)
{
    return finishRun(runId, RunStatus::Failed, error, durationMs, nowEpoch);
}

bool RunStore::cancelRun(int64_t runId, int64_t durationMs, double nowEpoch)
{
    return finishRun(runId, RunStatus::Cancelled,
                     RecError::make(RecErrorCode::Cancelled, QStringLiteral("cancelled")),
                     durationMs, nowEpoch);
}

bool RunStore::insertCandidates(int64_t runId, const std::vector<Candidate>& candidates,
                                const std::unordered_map<int64_t, std::vector<Evidence>>& evidence)
{
    sqlite3_stmt* candidateStmt = nullptr;
    sqlite3_stmt* evidenceStmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kInsertCandidateSql, -1, &candidateStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, kInsertEvidenceSql, -1, &evidenceStmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::insertCandidates prepare failed:" << sqlite3_errmsg(m_db);
        sqlite3_finalize(candidateStmt);
        sqlite3_finalize(evidenceStmt);
        return false;
    }

    bool ok = true;
    for (const Candidate& candidate : candidates) {
        sqlite3_bind_int64(candidateStmt, 1, runId);
        sqlite3_bind_int64(candidateStmt, 2, candidate.itemId);
        sqlite3_bind_int(candidateStmt, 3, candidate.isSelected ? candidate.rank : 0);
        sqlite3_bind_int(candidateStmt, 4, candidate.isSelected ? 1 : 0);
        sqlite3_bind_double(candidateStmt, 5, candidate.score.similarity);
        sqlite3_bind_double(candidateStmt, 6, candidate.score.novelty);
        sqlite3_bind_double(candidateStmt, 7, candidate.score.rating);
        sqlite3_bind_double(candidateStmt, 8, candidate.score.diversityPenalty);
        sqlite3_bind_double(candidateStmt, 9, candidate.diversityScore);
        sqlite3_bind_double(candidateStmt, 10, candidate.score.base);
        sqlite3_bind_double(candidateStmt, 11, candidate.score.final);

        if (stepWithRetry(candidateStmt) != SQLITE_DONE) {
            qWarning() << "RunStore: candidate insert failed:" << sqlite3_errmsg(m_db);
            ok = false;
            break;
        }
        sqlite3_reset(candidateStmt);
        sqlite3_clear_bindings(candidateStmt);
        const int64_t candidateRowId = sqlite3_last_insert_rowid(m_db);

        auto it = evidence.find(candidate.itemId);
        if (it == evidence.end()) {
            continue;
        }
        for (const Evidence& entry : it->second) {
            sqlite3_bind_int64(evidenceStmt, 1, candidateRowId);
            sqlite3_bind_int64(evidenceStmt, 2, entry.similarItemId);
            sqlite3_bind_double(evidenceStmt, 3, entry.similarity);
            bindString(evidenceStmt, 4, evidenceTypeToString(entry.type));
            if (stepWithRetry(evidenceStmt) != SQLITE_DONE) {
                qWarning() << "RunStore: evidence insert failed:" << sqlite3_errmsg(m_db);
                ok = false;
                break;
            }
            sqlite3_reset(evidenceStmt);
            sqlite3_clear_bindings(evidenceStmt);
        }
        if (!ok) {
            break;
        }
    }

    sqlite3_finalize(candidateStmt);
    sqlite3_finalize(evidenceStmt);
    return ok;
}

bool RunStore::completeRun(int64_t runId, const std::vector<Candidate>& candidates,
                           const std::unordered_map<int64_t, std::vector<Evidence>>& evidence,
                           int64_t durationMs, double nowEpoch)
{
    if (!m_db) {
        return false;
    }

    int selected = 0;
    for (const Candidate& candidate : candidates) {
        if (candidate.isSelected) {
            ++selected;
        }
    }

    if (!exec("SAVEPOINT complete_run")) {
        return false;
    }

    // The status guard goes first so a run cancelled or failed in the
    // meantime gets no rows at all.
    const char* sql = R"(
        UPDATE recommendation_runs
        SET status = 'completed', candidate_count = ?1, selected_count = ?2, duration_ms = ?3,
            completed_at = ?4, error_code = NULL, error_message = NULL
        WHERE id = ?5 AND status = 'running'
    )";
    sqlite3_stmt* stmt = nullptr;
    bool ok = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK;
    if (ok) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(candidates.size()));
        sqlite3_bind_int(stmt, 2, selected);
        sqlite3_bind_int64(stmt, 3, durationMs);
        sqlite3_bind_double(stmt, 4, nowEpoch);
        sqlite3_bind_int64(stmt, 5, runId);
        ok = stepWithRetry(stmt) == SQLITE_DONE && sqlite3_changes(m_db) == 1;
    }
    sqlite3_finalize(stmt);

    if (ok) {
        ok = insertCandidates(runId, candidates, evidence);
    }

    if (!ok) {
        exec("ROLLBACK TO SAVEPOINT complete_run");
        exec("RELEASE SAVEPOINT complete_run");
        LOG_WARN(rpStore, "Run %lld not completed; no rows written", static_cast<long long>(runId));
        return false;
    }
    return exec("RELEASE SAVEPOINT complete_run");
}

std::optional<RecommendationRun> RunStore::getRun(int64_t runId)
{
    if (!m_db) {
        return std::nullopt;
    }
    const QByteArray sql = QByteArray("SELECT ") + kRunColumns
        + " FROM recommendation_runs WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::getRun prepare failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, runId);
    std::optional<RecommendationRun> run;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        run = readRunRow(stmt);
    }
    sqlite3_finalize(stmt);
    return run;
}

std::vector<RecommendationRun> RunStore::queryRuns(const char* where, const QString& userId,
                                                   MediaType type, int limit)
{
    std::vector<RecommendationRun> runs;
    if (!m_db) {
        return runs;
    }

    QByteArray sql = QByteArray("SELECT ") + kRunColumns
        + " FROM recommendation_runs WHERE user_id = ?1 AND media_type = ?2" + where
        + " ORDER BY created_at DESC, id DESC";
    if (limit > 0) {
        sql += " LIMIT " + QByteArray::number(limit);
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::queryRuns prepare failed:" << sqlite3_errmsg(m_db);
        return runs;
    }
    bindString(stmt, 1, userId);
    bindString(stmt, 2, mediaTypeToString(type));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        runs.push_back(readRunRow(stmt));
    }
    sqlite3_finalize(stmt);
    return runs;
}

std::vector<RecommendationRun> RunStore::listRuns(const QString& userId, MediaType type,
                                                  int limit)
{
    return queryRuns("", userId, type, limit);
}

std::optional<RecommendationRun> RunStore::latestCompletedRun(const QString& userId,
                                                              MediaType type)
{
    std::vector<RecommendationRun> runs =
        queryRuns(" AND status = 'completed'", userId, type, 1);
    if (runs.empty()) {
        return std::nullopt;
    }
    return runs.front();
}

bool RunStore::hasActiveRun(const QString& userId, MediaType type)
{
    const QByteArray where = QByteArray(" AND status IN ") + kActiveStatuses;
    return !queryRuns(where.constData(), userId, type, 1).empty();
}

std::vector<StoredCandidate> RunStore::candidatesForRun(int64_t runId, bool selectedOnly)
{
    std::vector<StoredCandidate> rows;
    if (!m_db) {
        return rows;
    }

    QByteArray sql = R"(
        SELECT id, run_id, item_id, rank, is_selected, similarity, novelty, rating_score,
               diversity_penalty, diversity_score, base_score, final_score
        FROM recommendation_candidates
        WHERE run_id = ?1)";
    if (selectedOnly) {
        sql += " AND is_selected = 1";
    }
    sql += " ORDER BY is_selected DESC, rank ASC, base_score DESC, item_id ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::candidatesForRun prepare failed:" << sqlite3_errmsg(m_db);
        return rows;
    }
    sqlite3_bind_int64(stmt, 1, runId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StoredCandidate row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.runId = sqlite3_column_int64(stmt, 1);
        row.itemId = sqlite3_column_int64(stmt, 2);
        row.rank = sqlite3_column_int(stmt, 3);
        row.isSelected = sqlite3_column_int(stmt, 4) != 0;
        row.score.similarity = sqlite3_column_double(stmt, 5);
        row.score.novelty = sqlite3_column_double(stmt, 6);
        row.score.rating = sqlite3_column_double(stmt, 7);
        row.score.diversityPenalty = sqlite3_column_double(stmt, 8);
        row.diversityScore = sqlite3_column_double(stmt, 9);
        row.score.base = sqlite3_column_double(stmt, 10);
        row.score.final = sqlite3_column_double(stmt, 11);
        rows.push_back(row);
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::vector<Evidence> RunStore::evidenceForCandidate(int64_t candidateRowId)
{
    std::vector<Evidence> entries;
    if (!m_db) {
        return entries;
    }
    const char* sql = R"(
        SELECT similar_item_id, similarity, evidence_type FROM recommendation_evidence
        WHERE candidate_id = ?1
        ORDER BY similarity DESC, similar_item_id ASC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return entries;
    }
    sqlite3_bind_int64(stmt, 1, candidateRowId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Evidence entry;
        entry.similarItemId = sqlite3_column_int64(stmt, 0);
        entry.similarity = sqlite3_column_double(stmt, 1);
        entry.type = evidenceTypeFromString(columnString(stmt, 2));
        entries.push_back(entry);
    }
    sqlite3_finalize(stmt);
    return entries;
}

int RunStore::clearForUser(const QString& userId, MediaType type, RegeneratePolicy policy)
{
    if (!m_db) {
        return 0;
    }

    const char* clearAllSql = R"(
        DELETE FROM recommendation_runs
        WHERE user_id = ?1 AND media_type = ?2 AND status NOT IN ('pending', 'running')
    )";
    const char* keepHistorySql = R"(
        DELETE FROM recommendation_candidates
        WHERE is_selected = 0 AND run_id IN (
            SELECT id FROM recommendation_runs
            WHERE user_id = ?1 AND media_type = ?2 AND status NOT IN ('pending', 'running'))
    )";

    // Trimmed runs keep candidate_count in step with the rows they still own.
    const char* recountSql = R"(
        UPDATE recommendation_runs
        SET candidate_count = (SELECT COUNT(*) FROM recommendation_candidates
                               WHERE run_id = recommendation_runs.id)
        WHERE user_id = ?1 AND media_type = ?2 AND status NOT IN ('pending', 'running')
    )";

    auto runStatement = [&](const char* sql, int* changes) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            qWarning() << "RunStore::clearForUser prepare failed:" << sqlite3_errmsg(m_db);
            return false;
        }
        bindString(stmt, 1, userId);
        bindString(stmt, 2, mediaTypeToString(type));
        const int rc = stepWithRetry(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            qWarning() << "RunStore::clearForUser failed:" << sqlite3_errmsg(m_db);
            return false;
        }
        if (changes) {
            *changes = sqlite3_changes(m_db);
        }
        return true;
    };

    int removed = 0;
    if (policy != RegeneratePolicy::KeepHistory) {
        return runStatement(clearAllSql, &removed) ? removed : 0;
    }

    if (!exec("SAVEPOINT clear_history")) {
        return 0;
    }
    if (!runStatement(keepHistorySql, &removed) || !runStatement(recountSql, nullptr)) {
        exec("ROLLBACK TO SAVEPOINT clear_history");
        exec("RELEASE SAVEPOINT clear_history");
        return 0;
    }
    if (!exec("RELEASE SAVEPOINT clear_history")) {
        return 0;
    }
    return removed;
}

int RunStore::clearAll(MediaType type)
{
    if (!m_db) {
        return 0;
    }
    const char* sql = R"(
        DELETE FROM recommendation_runs
        WHERE media_type = ?1 AND status NOT IN ('pending', 'running')
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    bindString(stmt, 1, mediaTypeToString(type));
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE ? sqlite3_changes(m_db) : 0;
}

int RunStore::recoverAbandonedRuns(double nowEpoch, int staleAfterSec)
{
    if (!m_db) {
        return 0;
    }
    const char* sql = R"(
        UPDATE recommendation_runs
        SET status = 'failed', error_code = 'STORAGE_FAILURE',
            error_message = 'abandoned', completed_at = ?1
        WHERE status IN ('pending', 'running')
          AND COALESCE(heartbeat_at, created_at) < ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "RunStore::recoverAbandonedRuns prepare failed:" << sqlite3_errmsg(m_db);
        return 0;
    }
    sqlite3_bind_double(stmt, 1, nowEpoch);
    sqlite3_bind_double(stmt, 2, nowEpoch - staleAfterSec);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    const int recovered = rc == SQLITE_DONE ? sqlite3_changes(m_db) : 0;
    if (recovered > 0) {
        LOG_WARN(rpStore, "Marked %d abandoned runs as failed", recovered);
    }
    return recovered;
}

} // namespace rp
