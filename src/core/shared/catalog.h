#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

namespace rp {

struct CatalogItem {
    int64_t id = 0;
    QString title;
    int year = 0;
    MediaType mediaType = MediaType::Movie;
    QStringList genres;
    QString franchise;
    std::optional<double> communityRating;   // 0-10
    double popularity = 0.0;                 // global play count prior, >= 0
    QString officialRating;
    std::optional<int> parentalRatingValue;  // resolved from parental_rating_values
    QString libraryId;
    QString network;  // broadcaster or studio, series only
};

struct UserRecord {
    QString id;
    QString name;
    bool enabled = true;
    bool moviesEnabled = true;
    bool seriesEnabled = true;
    std::optional<int> maxParentalRating;

};

struct LibraryConfig {
    QString libraryId;
    QString name;
    MediaType mediaType = MediaType::Movie;
    bool enabled = true;
};

struct WatchRecord {
    QString userId;
    int64_t itemId = 0;
    int playCount = 1;
    double lastPlayedAt = 0.0;      // epoch seconds
    bool isFavorite = false;
    std::optional<double> userRating;  // 0-10
    double completion = 1.0;        // 0-1
    int episodesWatched = 0;        // series only
};

} // namespace rp
