#include "core/taste/taste_types.h"

namespace rp {

QString profileStateToString(ProfileState state)
{
    switch (state) {
    case ProfileState::Missing: return QStringLiteral("missing");
    case ProfileState::Fresh:   return QStringLiteral("fresh");
    case ProfileState::Expired: return QStringLiteral("expired");
    case ProfileState::Stale:   return QStringLiteral("stale");
    }
    return QStringLiteral("missing");
}

ProfileState TasteProfile::state(const std::string& activeModel, int activeDims,
                                 double nowEpoch) const
{
    if (!embedding.isValid()) {
        return ProfileState::Missing;
    }
    if (!embedding.matchesModel(activeModel, activeDims)) {
        return ProfileState::Stale;
    }
    if (autoUpdatedAt <= 0.0) {
        return ProfileState::Expired;
    }
    const double ageDays = (nowEpoch - autoUpdatedAt) / 86400.0;
    if (refreshIntervalDays > 0 && ageDays >= static_cast<double>(refreshIntervalDays)) {
        return ProfileState::Expired;
    }
    return ProfileState::Fresh;
}

} // namespace rp
