#pragma once

#include <QString>

#include <optional>

namespace rp {

// Catalog partition a taste profile and a run are scoped to.
enum class MediaType {
    Movie,
    Series,
};

QString mediaTypeToString(MediaType type);
std::optional<MediaType> mediaTypeFromString(const QString& str);

// Run lifecycle: Pending -> Running -> {Completed | Failed | Cancelled}
enum class RunStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
};

QString runStatusToString(RunStatus status);
RunStatus runStatusFromString(const QString& str);
bool isTerminal(RunStatus status);

enum class RunType {
    Scheduled,
    Manual,
    Regenerate,
    Bulk,
};

QString runTypeToString(RunType type);
RunType runTypeFromString(const QString& str);

enum class EvidenceType {
    Favorite,
    HighlyRated,
    Watched,
};

QString evidenceTypeToString(EvidenceType type);
EvidenceType evidenceTypeFromString(const QString& str);

enum class RecencyMode {
    Linear,
    Exponential,
};

QString recencyModeToString(RecencyMode mode);
RecencyMode recencyModeFromString(const QString& str);

enum class RatingCurve {
    Linear,
    Tiered,
};

QString ratingCurveToString(RatingCurve curve);
RatingCurve ratingCurveFromString(const QString& str);

// What regenerate() removes before starting a fresh run.
enum class RegeneratePolicy {
    ClearAll,     // delete every prior terminal run for (user, mediaType)
    KeepHistory,  // keep prior runs and their selected rows, drop unselected rows
};

QString regeneratePolicyToString(RegeneratePolicy policy);
RegeneratePolicy regeneratePolicyFromString(const QString& str);

// How a run request behaves when (user, mediaType) already has a run in flight.
enum class RunConflictPolicy {
    Reject,
    Wait,
};

QString runConflictPolicyToString(RunConflictPolicy policy);
RunConflictPolicy runConflictPolicyFromString(const QString& str);

} // namespace rp
