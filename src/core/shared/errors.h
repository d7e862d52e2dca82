#pragma once

#include <QString>

namespace rp {

// Pipeline error codes. Stored verbatim (as strings) on failed runs.
enum class RecErrorCode : int {
    None               = 0,
    InsufficientData   = 1,
    InvalidConfig      = 2,
    RunInProgress      = 3,
    ProviderRateLimit  = 4,
    ProviderAuth       = 5,
    ProviderValidation = 6,
    ProviderOutage     = 7,
    ProfileStale       = 8,
    StorageFailure     = 9,
    Cancelled          = 10,
};

QString recErrorCodeToString(RecErrorCode code);
RecErrorCode recErrorCodeFromString(const QString& str);

struct RecError {
    RecErrorCode code = RecErrorCode::None;
    QString message;

    bool isError() const { return code != RecErrorCode::None; }

    static RecError none() { return {}; }
    static RecError make(RecErrorCode code, const QString& message) { return {code, message}; }
};

inline QString recErrorCodeToString(RecErrorCode code)
{
    switch (code) {
    case RecErrorCode::None:               return QStringLiteral("NONE");
    case RecErrorCode::InsufficientData:   return QStringLiteral("INSUFFICIENT_DATA");
    case RecErrorCode::InvalidConfig:      return QStringLiteral("INVALID_CONFIG");
    case RecErrorCode::RunInProgress:      return QStringLiteral("RUN_IN_PROGRESS");
    case RecErrorCode::ProviderRateLimit:  return QStringLiteral("PROVIDER_RATE_LIMIT");
    case RecErrorCode::ProviderAuth:       return QStringLiteral("PROVIDER_AUTH");
    case RecErrorCode::ProviderValidation: return QStringLiteral("PROVIDER_VALIDATION");
    case RecErrorCode::ProviderOutage:     return QStringLiteral("PROVIDER_OUTAGE");
    case RecErrorCode::ProfileStale:       return QStringLiteral("PROFILE_STALE");
    case RecErrorCode::StorageFailure:     return QStringLiteral("STORAGE_FAILURE");
    case RecErrorCode::Cancelled:          return QStringLiteral("CANCELLED");
    }
    return QStringLiteral("UNKNOWN");
}

inline RecErrorCode recErrorCodeFromString(const QString& str)
{
    if (str == QLatin1String("INSUFFICIENT_DATA"))   return RecErrorCode::InsufficientData;
    if (str == QLatin1String("INVALID_CONFIG"))      return RecErrorCode::InvalidConfig;
    if (str == QLatin1String("RUN_IN_PROGRESS"))     return RecErrorCode::RunInProgress;
    if (str == QLatin1String("PROVIDER_RATE_LIMIT")) return RecErrorCode::ProviderRateLimit;
    if (str == QLatin1String("PROVIDER_AUTH"))       return RecErrorCode::ProviderAuth;
    if (str == QLatin1String("PROVIDER_VALIDATION")) return RecErrorCode::ProviderValidation;
    if (str == QLatin1String("PROVIDER_OUTAGE"))     return RecErrorCode::ProviderOutage;
    if (str == QLatin1String("PROFILE_STALE"))       return RecErrorCode::ProfileStale;
    if (str == QLatin1String("STORAGE_FAILURE"))     return RecErrorCode::StorageFailure;
    if (str == QLatin1String("CANCELLED"))           return RecErrorCode::Cancelled;
    return RecErrorCode::None;
}

} // namespace rp
