#pragma once

#include "core/shared/types.h"

namespace rp {

// Weights of the independent per-candidate signals. Need not sum to 1.
struct ScoringConfig {
    double similarityWeight = 0.4;
    double ratingWeight = 0.2;
    double noveltyWeight = 0.2;

    double ratingScale = 10.0;
    double neutralRatingScore = 0.4;   // for unrated catalog items
    bool neutralFromUserMean = false;  // use the user's mean rating instead, when known
    RatingCurve ratingCurve = RatingCurve::Linear;
};

// Closed set of score components carried by every candidate.
struct ScoreBreakdown {
    double similarity = 0.0;
    double rating = 0.0;
    double novelty = 0.0;
    double diversityPenalty = 0.0;
    double base = 0.0;
    double final = 0.0;
};

} // namespace rp
