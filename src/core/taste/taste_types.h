#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

namespace rp {

// A watched catalog item joined with the user's engagement on it.
struct WatchedItem {
    int64_t itemId = 0;
    QString title;
    int year = 0;
    MediaType mediaType = MediaType::Movie;
    QStringList genres;
    QString franchise;

    int playCount = 1;
    double lastPlayedAt = 0.0;
    double completion = 1.0;
    int episodesWatched = 0;
    bool isFavorite = false;
    std::optional<double> userRating;  // 0-10
};

enum class ProfileState {
    Missing,
    Fresh,
    Expired,  // older than its refresh interval
    Stale,    // built under a model other than the active one
};

QString profileStateToString(ProfileState state);

struct TasteProfile {
    QString userId;
    MediaType mediaType = MediaType::Movie;
    EmbeddingVector embedding;
    bool isLocked = false;
    int refreshIntervalDays = 7;
    int minFranchiseItems = 2;
    int minFranchiseSize = 2;
    double autoUpdatedAt = 0.0;    // epoch seconds, 0 = never
    double userModifiedAt = 0.0;

    const std::string& embeddingModel() const { return embedding.modelId; }

    ProfileState state(const std::string& activeModel, int activeDims, double nowEpoch) const;
};

// Franchise preferences can target one media type or both.
struct FranchisePreference {
    QString userId;
    QString franchiseName;
    std::optional<MediaType> mediaType;  // nullopt = both
    double preferenceScore = 0.0;        // [-1, 1]
    int itemsWatched = 0;
    double totalEngagement = 0.0;
    bool isUserSet = false;
};

struct GenreWeight {
    QString userId;
    QString genre;
    double weight = 1.0;  // [0, 2]: 0 avoid, 1 neutral, 2 boost
    bool isUserSet = false;
};

struct CustomInterest {
    int64_t id = 0;
    QString userId;
    MediaType mediaType = MediaType::Movie;
    QString text;
    std::optional<EmbeddingVector> embedding;
    double weight = 1.0;
};

} // namespace rp
