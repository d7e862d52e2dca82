#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QString>
#include <cstdint>

namespace rp {

// Per media type knobs. Defaults are the movie values; see defaultsFor().
struct MediaTypeConfig {
    int selectedCount = 50;
    int maxCandidates = 50000;
    int recentWatchLimit = 50;
    double diversityLambda = 0.2;
    double networkDiversityWeight = 0.0;  // share of the overlap taken by network, series only
    ScoringConfig scoring;
};

struct AggregatorSettings {
    RecencyMode recencyMode = RecencyMode::Exponential;
    double recencyHalfLifeDays = 180.0;
    double linearWindowDays = 365.0;
    double minRecencyWeight = 0.25;
    double favoriteMultiplier = 1.5;
    double customInterestWeight = 0.5;
};

struct RecommendationSettings {
    // Storage
    QString dbPath;
    QString indexDir;

    // Active embedding model; threaded into every run explicitly
    QString embeddingModelId = QStringLiteral("text-embedding-3-small");
    int embeddingDimensions = 1536;

    MediaTypeConfig movies;
    MediaTypeConfig series = seriesDefaults();
    AggregatorSettings aggregator;

    // Evidence and persistence
    int evidenceTopN = 3;
    int storedCandidateLimit = 0;         // 0 = persist every candidate
    bool pushDownWatchedExclusion = false;

    // Preference learning
    double preferenceDecayHalfLifeDays = 365.0;
    int minWatchedItems = 1;              // bulk eligibility

    // Concurrency
    int maxConcurrentRuns = 2;
    RunConflictPolicy runConflictPolicy = RunConflictPolicy::Reject;
    uint32_t runWaitTimeoutMs = 60000;
    RegeneratePolicy regeneratePolicy = RegeneratePolicy::ClearAll;
    // A pending or running row whose heartbeat is older than this belongs
    // to a dead process and may be marked failed.
    int abandonedRunTimeoutSec = 1800;

    // Embedding provider
    uint32_t providerTimeoutMs = 30000;
    int providerMaxAttempts = 4;
    uint32_t providerBackoffBaseMs = 500;
    uint32_t providerBackoffMaxMs = 8000;

    const MediaTypeConfig& forMediaType(MediaType type) const
    {
        return type == MediaType::Series ? series : movies;
    }

    static MediaTypeConfig seriesDefaults()
    {
        MediaTypeConfig config;
        config.selectedCount = 12;
        config.recentWatchLimit = 100;
        config.networkDiversityWeight = 0.4;
        return config;
    }
};

} // namespace rp
