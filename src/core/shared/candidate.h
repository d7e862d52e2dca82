#pragma once

#include "core/shared/scoring_types.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

namespace rp {

// One catalog item under consideration in a single run. Never persisted
// outside the run that produced it.
struct Candidate {
    int64_t itemId = 0;

    // Denormalized from the catalog for scoring and display
    QString title;
    int year = 0;
    QStringList genres;
    QString franchise;
    std::optional<double> communityRating;
    double popularity = 0.0;
    QString network;

    double similarity = 0.0;
    ScoreBreakdown score;
    double diversityScore = 1.0;
    int rank = 0;           // 1-based among selected, 0 when not selected
    bool isSelected = false;

    // Key used to detect the same title appearing twice (e.g. re-releases).
    QString duplicateKey() const
    {
        return title.trimmed().toLower() + QLatin1Char('|') + QString::number(year);
    }
};

} // namespace rp
