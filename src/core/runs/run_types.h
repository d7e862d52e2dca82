#pragma once

#include "core/shared/errors.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <vector>

namespace rp {

struct RecommendationRun {
    int64_t id = 0;  // 0 when the run was rejected before being stored
    QString userId;
    MediaType mediaType = MediaType::Movie;
    RunType runType = RunType::Manual;
    QString channelId;
    RunStatus status = RunStatus::Pending;
    int candidateCount = 0;
    int selectedCount = 0;
    int64_t durationMs = 0;
    RecErrorCode errorCode = RecErrorCode::None;
    QString errorMessage;
    double createdAt = 0.0;
    double completedAt = 0.0;

    bool succeeded() const { return status == RunStatus::Completed; }
};

struct Evidence {
    int64_t similarItemId = 0;
    double similarity = 0.0;
    EvidenceType type = EvidenceType::Watched;
};

// A candidate row as persisted under its run.
struct StoredCandidate {
    int64_t id = 0;
    int64_t runId = 0;
    int64_t itemId = 0;
    int rank = 0;
    bool isSelected = false;
    ScoreBreakdown score;
    double diversityScore = 1.0;
};

struct BulkRunSummary {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    int cancelled = 0;
    int totalRecommendations = 0;
    std::vector<RecommendationRun> runs;
};

} // namespace rp
