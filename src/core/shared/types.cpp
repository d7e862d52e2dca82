#include "core/shared/types.h"

namespace rp {

QString mediaTypeToString(MediaType type)
{
    switch (type) {
    case MediaType::Movie:  return QStringLiteral("movie");
    case MediaType::Series: return QStringLiteral("series");
    }
    return QStringLiteral("movie");
}

std::optional<MediaType> mediaTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("movie") || lower == QLatin1String("movies")) {
        return MediaType::Movie;
    }
    if (lower == QLatin1String("series") || lower == QLatin1String("tv")) {
        return MediaType::Series;
    }
    return std::nullopt;
}

QString runStatusToString(RunStatus status)
{
    switch (status) {
    case RunStatus::Pending:   return QStringLiteral("pending");
    case RunStatus::Running:   return QStringLiteral("running");
    case RunStatus::Completed: return QStringLiteral("completed");
    case RunStatus::Failed:    return QStringLiteral("failed");
    case RunStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("failed");
}

RunStatus runStatusFromString(const QString& str)
{
    if (str == QLatin1String("pending"))   return RunStatus::Pending;
    if (str == QLatin1String("running"))   return RunStatus::Running;
    if (str == QLatin1String("completed")) return RunStatus::Completed;
    if (str == QLatin1String("cancelled")) return RunStatus::Cancelled;
    return RunStatus::Failed;
}

bool isTerminal(RunStatus status)
{
    return status == RunStatus::Completed
        || status == RunStatus::Failed
        || status == RunStatus::Cancelled;
}

QString runTypeToString(RunType type)
{
    switch (type) {
    case RunType::Scheduled:  return QStringLiteral("scheduled");
    case RunType::Manual:     return QStringLiteral("manual");
    case RunType::Regenerate: return QStringLiteral("regenerate");
    case RunType::Bulk:       return QStringLiteral("bulk");
    }
    return QStringLiteral("manual");
}

RunType runTypeFromString(const QString& str)
{
    if (str == QLatin1String("scheduled"))  return RunType::Scheduled;
    if (str == QLatin1String("regenerate")) return RunType::Regenerate;
    if (str == QLatin1String("bulk"))       return RunType::Bulk;
    return RunType::Manual;
}

QString evidenceTypeToString(EvidenceType type)
{
    switch (type) {
    case EvidenceType::Favorite:    return QStringLiteral("favorite");
    case EvidenceType::HighlyRated: return QStringLiteral("highly_rated");
    case EvidenceType::Watched:     return QStringLiteral("watched");
    }
    return QStringLiteral("watched");
}

EvidenceType evidenceTypeFromString(const QString& str)
{
    if (str == QLatin1String("favorite"))     return EvidenceType::Favorite;
    if (str == QLatin1String("highly_rated")) return EvidenceType::HighlyRated;
    return EvidenceType::Watched;
}

QString recencyModeToString(RecencyMode mode)
{
    switch (mode) {
    case RecencyMode::Linear:      return QStringLiteral("linear");
    case RecencyMode::Exponential: return QStringLiteral("exponential");
    }
    return QStringLiteral("exponential");
}

RecencyMode recencyModeFromString(const QString& str)
{
    if (str == QLatin1String("linear")) return RecencyMode::Linear;
    return RecencyMode::Exponential;
}

QString ratingCurveToString(RatingCurve curve)
{
    switch (curve) {
    case RatingCurve::Linear: return QStringLiteral("linear");
    case RatingCurve::Tiered: return QStringLiteral("tiered");
    }
    return QStringLiteral("linear");
}

RatingCurve ratingCurveFromString(const QString& str)
{
    if (str == QLatin1String("tiered")) return RatingCurve::Tiered;
    return RatingCurve::Linear;
}

QString regeneratePolicyToString(RegeneratePolicy policy)
{
    switch (policy) {
    case RegeneratePolicy::ClearAll:    return QStringLiteral("clear_all");
    case RegeneratePolicy::KeepHistory: return QStringLiteral("keep_history");
    }
    return QStringLiteral("clear_all");
}

RegeneratePolicy regeneratePolicyFromString(const QString& str)
{
    if (str == QLatin1String("keep_history")) return RegeneratePolicy::KeepHistory;
    return RegeneratePolicy::ClearAll;
}

QString runConflictPolicyToString(RunConflictPolicy policy)
{
    switch (policy) {
    case RunConflictPolicy::Reject: return QStringLiteral("reject");
    case RunConflictPolicy::Wait:   return QStringLiteral("wait");
    }
    return QStringLiteral("reject");
}

RunConflictPolicy runConflictPolicyFromString(const QString& str)
{
    if (str == QLatin1String("wait")) return RunConflictPolicy::Wait;
    return RunConflictPolicy::Reject;
}

} // namespace rp
