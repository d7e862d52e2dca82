#include "core/taste/preference_learner.h"
#include "core/shared/logging.h"

#include <QMap>

#include <algorithm>
#include <cmath>

namespace rp {

namespace {

constexpr double kSecondsPerDay = 86400.0;

// Franchise score components
constexpr double kCompletionWeight = 0.4;
constexpr double kHighEngagementBonus = 0.3;
constexpr double kLowEngagementBonus = 0.15;
constexpr double kRepeatPlayThreshold = 2.0;
constexpr double kRatingWeight = 0.6;

// Genre weight components
constexpr double kGenreBase = 0.8;
constexpr double kGenreFrequencySpan = 0.4;
constexpr double kFavoriteGenreBonus = 0.2;

struct RatingAccumulator {
    double sum = 0.0;
    int count = 0;

    void add(const std::optional<double>& rating)
    {
        if (rating.has_value()) {
            sum += std::clamp(*rating, 0.0, 10.0);
            ++count;
        }
    }

    // (mean/10 - 0.5) * 0.6, or 0 with no ratings
    double adjustment() const
    {
        if (count == 0) {
            return 0.0;
        }
        return ((sum / count) / 10.0 - 0.5) * kRatingWeight;
    }
};

} // namespace

PreferenceLearner::PreferenceLearner(const Options& options)
    : m_options(options)
{
}

double PreferenceLearner::ageFactor(double lastPlayedAt, double nowEpoch) const
{
    if (lastPlayedAt <= 0.0 || m_options.decayHalfLifeDays <= 0.0) {
        return 1.0;
    }
    const double days = (nowEpoch - lastPlayedAt) / kSecondsPerDay;
    if (days <= 0.0) {
        return 1.0;
    }
    return std::pow(0.5, days / m_options.decayHalfLifeDays);
}

PreferenceLearner::Result PreferenceLearner::learn(const QString& userId, MediaType type,
                                                   const std::vector<WatchedItem>& watched,
                                                   const QHash<QString, int>& franchiseSizes,
                                                   double nowEpoch) const
{
    Result result;
    result.franchises = learnFranchises(userId, type, watched, franchiseSizes, nowEpoch);
    result.genres = learnGenres(userId, watched, nowEpoch);
    LOG_DEBUG(rpTaste, "Learned %d franchise preferences and %d genre weights for %s",
              static_cast<int>(result.franchises.size()),
              static_cast<int>(result.genres.size()), qUtf8Printable(userId));
    return result;
}

std::vector<FranchisePreference> PreferenceLearner::learnFranchises(
    const QString& userId, MediaType type, const std::vector<WatchedItem>& watched,
    const QHash<QString, int>& franchiseSizes, double nowEpoch) const
{
    struct Group {
        int items = 0;
        int plays = 0;
        double lastPlayed = 0.0;
        RatingAccumulator ratings;
    };

    // QMap keeps the output ordered by franchise name
    QMap<QString, Group> groups;
    for (const WatchedItem& item : watched) {
        const QString name = item.franchise.trimmed();
        if (name.isEmpty()) {
            continue;
        }
        Group& group = groups[name];
        ++group.items;
        group.plays += std::max(item.playCount, 1);
        group.lastPlayed = std::max(group.lastPlayed, item.lastPlayedAt);
        group.ratings.add(item.userRating);
    }

    std::vector<FranchisePreference> prefs;
    for (auto it = groups.cbegin(); it != groups.cend(); ++it) {
        const Group& group = it.value();
        const int catalogSize = std::max(franchiseSizes.value(it.key(), 0), group.items);
        if (group.items < m_options.minFranchiseItems
            || catalogSize < m_options.minFranchiseSize) {
            continue;
        }

        const double completion = std::min(1.0, static_cast<double>(group.items) / catalogSize);
        const double avgPlays = static_cast<double>(group.plays) / group.items;
        double score = completion * kCompletionWeight
            + (avgPlays >= kRepeatPlayThreshold ? kHighEngagementBonus : kLowEngagementBonus)
            + group.ratings.adjustment();
        score = std::clamp(score, -1.0, 1.0) * ageFactor(group.lastPlayed, nowEpoch);

        FranchisePreference pref;
        pref.userId = userId;
        pref.franchiseName = it.key();
        pref.mediaType = type;
        pref.preferenceScore = score;
        pref.itemsWatched = group.items;
        pref.totalEngagement = group.plays;
        prefs.push_back(std::move(pref));
    }
    return prefs;
}

std::vector<GenreWeight> PreferenceLearner::learnGenres(const QString& userId,
                                                        const std::vector<WatchedItem>& watched,
                                                        double nowEpoch) const
{
    struct Group {
        int occurrences = 0;
        bool hasFavorite = false;
        double lastPlayed = 0.0;
        RatingAccumulator ratings;
    };

    QMap<QString, Group> groups;
    int totalOccurrences = 0;
    for (const WatchedItem& item : watched) {
        for (const QString& raw : item.genres) {
            const QString genre = raw.trimmed();
            if (genre.isEmpty()) {
                continue;
            }
            Group& group = groups[genre];
            ++group.occurrences;
            ++totalOccurrences;
            group.hasFavorite = group.hasFavorite || item.isFavorite;
            group.lastPlayed = std::max(group.lastPlayed, item.lastPlayedAt);
            group.ratings.add(item.userRating);
        }
    }

    std::vector<GenreWeight> weights;
    if (totalOccurrences == 0) {
        return weights;
    }

    const double distinct = static_cast<double>(groups.size());
    for (auto it = groups.cbegin(); it != groups.cend(); ++it) {
        const Group& group = it.value();
        const double share = static_cast<double>(group.occurrences) / totalOccurrences;
        const double relative = std::clamp(share * distinct, 0.5, 2.0);

        double weight = kGenreBase + (relative - 0.5) * kGenreFrequencySpan
            + group.ratings.adjustment()
            + (group.hasFavorite ? kFavoriteGenreBonus : 0.0);
        weight = std::clamp(weight, 0.0, 2.0);
        weight = 1.0 + (weight - 1.0) * ageFactor(group.lastPlayed, nowEpoch);

        GenreWeight genreWeight;
        genreWeight.userId = userId;
        genreWeight.genre = it.key();
        genreWeight.weight = weight;
        weights.push_back(std::move(genreWeight));
    }
    return weights;
}

} // namespace rp
