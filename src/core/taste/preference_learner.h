#pragma once

#include "core/taste/taste_types.h"

#include <QHash>
#include <QString>

#include <vector>

namespace rp {

// Derives franchise preferences and genre weights from watch history.
// Pure computation; TasteStore persists the result without touching
// user-set rows.
class PreferenceLearner {
public:
    struct Options {
        int minFranchiseItems = 2;
        int minFranchiseSize = 2;
        double decayHalfLifeDays = 365.0;
    };

    struct Result {
        std::vector<FranchisePreference> franchises;
        std::vector<GenreWeight> genres;
    };

    explicit PreferenceLearner(const Options& options);

    // franchiseSizes maps franchise name to its catalog item count.
    Result learn(const QString& userId, MediaType type,
                 const std::vector<WatchedItem>& watched,
                 const QHash<QString, int>& franchiseSizes,
                 double nowEpoch) const;

    // 0.5^(days / halfLife); 1.0 for future or unknown timestamps.
    double ageFactor(double lastPlayedAt, double nowEpoch) const;

private:
    std::vector<FranchisePreference> learnFranchises(const QString& userId, MediaType type,
                                                     const std::vector<WatchedItem>& watched,
                                                     const QHash<QString, int>& franchiseSizes,
                                                     double nowEpoch) const;
    std::vector<GenreWeight> learnGenres(const QString& userId,
                                         const std::vector<WatchedItem>& watched,
                                         double nowEpoch) const;

    Options m_options;
};

} // namespace rp
