#pragma once

#include "core/shared/candidate.h"
#include "core/shared/errors.h"
#include "core/shared/scoring_types.h"

#include <optional>
#include <vector>

namespace rp {

// Run-wide inputs the per-candidate signals are normalised against.
struct ScoringContext {
    double maxPopularity = 0.0;
    std::optional<double> userMeanRating;  // on the config's rating scale
};

class Scorer {
public:
    explicit Scorer(const ScoringConfig& config = {});

    // Empty string when usable, otherwise why not.
    static QString validate(const ScoringConfig& config);

    // Fill score.{similarity, rating, novelty, base} and reset final to base.
    // Fails with InvalidConfig before touching any candidate.
    RecError scoreAll(std::vector<Candidate>& candidates, const ScoringContext& context) const;

    // Rating normalised to [0, 1] along the configured curve.
    double computeRatingScore(const std::optional<double>& rating,
                              const ScoringContext& context) const;

    // 1 - log1p(popularity) / log1p(maxPopularity), clamped to [0, 1].
    static double computeNovelty(double popularity, double maxPopularity);

    double computeBaseScore(const ScoreBreakdown& breakdown) const;

    const ScoringConfig& config() const { return m_config; }

private:
    double normalizeRating(double rating) const;

    ScoringConfig m_config;
};

} // namespace rp
