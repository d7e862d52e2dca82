#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/taste/taste_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rp {

// Everything the aggregator reads. Callers load it; the aggregator itself
// performs no I/O.
struct AggregatorInput {
    MediaType mediaType = MediaType::Movie;
    std::string modelId;
    int dimensions = 0;
    double nowEpoch = 0.0;

    std::vector<WatchedItem> watched;
    std::unordered_map<int64_t, EmbeddingVector> watchedEmbeddings;
    std::vector<FranchisePreference> franchisePreferences;
    std::vector<GenreWeight> genreWeights;
    std::vector<CustomInterest> customInterests;
};

struct AggregationResult {
    std::optional<EmbeddingVector> embedding;
    RecError error;
    int watchedContributions = 0;
    int interestContributions = 0;
    int skippedIncompatible = 0;
};

// Folds a user's watch history into one unit-length taste vector.
class TasteAggregator {
public:
    explicit TasteAggregator(const AggregatorSettings& settings);

    AggregationResult aggregate(const AggregatorInput& input) const;

    // Individual weight factors, exposed for tests.
    double engagementWeight(const WatchedItem& item) const;
    double recencyWeight(double lastPlayedAt, double nowEpoch) const;
    static double ratingWeight(const std::optional<double>& userRating);

private:
    AggregatorSettings m_settings;
};

} // namespace rp
