#include "core/ranking/scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace rp {

namespace {

// Tiered curve on a 0-10 scale: separates 6-9 ratings, compresses the
// bottom half.
double tieredCurve(double r)
{
    if (r >= 8.0) {
        return 0.8 + (r - 8.0) * 0.1;
    }
    if (r >= 7.0) {
        return 0.6 + (r - 7.0) * 0.2;
    }
    if (r >= 6.0) {
        return 0.4 + (r - 6.0) * 0.2;
    }
    if (r >= 5.0) {
        return 0.2 + (r - 5.0) * 0.2;
    }
    return r / 25.0;
}

bool validWeight(double w)
{
    return std::isfinite(w) && w >= 0.0;
}

} // namespace

Scorer::Scorer(const ScoringConfig& config)
    : m_config(config)
{
}

QString Scorer::validate(const ScoringConfig& config)
{
    if (!validWeight(config.similarityWeight)) {
        return QStringLiteral("similarityWeight must be a non-negative number");
    }
    if (!validWeight(config.ratingWeight)) {
        return QStringLiteral("ratingWeight must be a non-negative number");
    }
    if (!validWeight(config.noveltyWeight)) {
        return QStringLiteral("noveltyWeight must be a non-negative number");
    }
    if (!std::isfinite(config.ratingScale) || config.ratingScale <= 0.0) {
        return QStringLiteral("ratingScale must be positive");
    }
    if (!std::isfinite(config.neutralRatingScore) || config.neutralRatingScore < 0.0
        || config.neutralRatingScore > 1.0) {
        return QStringLiteral("neutralRatingScore must be within [0, 1]");
    }
    return {};
}

double Scorer::normalizeRating(double rating) const
{
    const double clamped = std::clamp(rating, 0.0, m_config.ratingScale);
    if (m_config.ratingCurve == RatingCurve::Tiered) {
        return std::clamp(tieredCurve(clamped * 10.0 / m_config.ratingScale), 0.0, 1.0);
    }
    return clamped / m_config.ratingScale;
}

double Scorer::computeRatingScore(const std::optional<double>& rating,
                                  const ScoringContext& context) const
{
    if (rating.has_value() && std::isfinite(*rating)) {
        return normalizeRating(*rating);
    }
    if (m_config.neutralFromUserMean && context.userMeanRating.has_value()) {
        return normalizeRating(*context.userMeanRating);
    }
    return m_config.neutralRatingScore;
}

double Scorer::computeNovelty(double popularity, double maxPopularity)
{
    if (!(maxPopularity > 0.0)) {
        return 1.0;
    }
    const double ratio = std::log1p(std::max(popularity, 0.0)) / std::log1p(maxPopularity);
    return std::clamp(1.0 - ratio, 0.0, 1.0);
}

double Scorer::computeBaseScore(const ScoreBreakdown& breakdown) const
{
    return m_config.similarityWeight * breakdown.similarity
        + m_config.ratingWeight * breakdown.rating
        + m_config.noveltyWeight * breakdown.novelty;
}

RecError Scorer::scoreAll(std::vector<Candidate>& candidates,
                          const ScoringContext& context) const
{
    const QString problem = validate(m_config);
    if (!problem.isEmpty()) {
        return RecError::make(RecErrorCode::InvalidConfig, problem);
    }

    for (Candidate& candidate : candidates) {
        ScoreBreakdown& score = candidate.score;
        score.similarity = candidate.similarity;
        score.rating = computeRatingScore(candidate.communityRating, context);
        score.novelty = computeNovelty(candidate.popularity, context.maxPopularity);
        score.diversityPenalty = 0.0;
        score.base = computeBaseScore(score);
        score.final = score.base;
        candidate.diversityScore = 1.0;
    }

    LOG_DEBUG(rpRanking, "Scored %d candidates", static_cast<int>(candidates.size()));
    return RecError::none();
}

} // namespace rp
