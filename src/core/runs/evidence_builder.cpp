#include "core/runs/evidence_builder.h"

#include <algorithm>

namespace rp {

EvidenceBuilder::EvidenceBuilder(int topN)
    : m_topN(std::max(topN, 0))
{
}

EvidenceType EvidenceBuilder::classify(const WatchedItem& item)
{
    if (item.isFavorite) {
        return EvidenceType::Favorite;
    }
    if (item.userRating.has_value() && *item.userRating >= kHighlyRatedThreshold) {
        return EvidenceType::HighlyRated;
    }
    return EvidenceType::Watched;
}

std::vector<Evidence> EvidenceBuilder::build(
    const EmbeddingVector& candidateEmbedding, const std::vector<WatchedItem>& watched,
    const std::unordered_map<int64_t, EmbeddingVector>& watchedEmbeddings) const
{
    std::vector<Evidence> evidence;
    if (m_topN == 0 || !candidateEmbedding.isValid()) {
        return evidence;
    }

    for (const WatchedItem& item : watched) {
        auto it = watchedEmbeddings.find(item.itemId);
        if (it == watchedEmbeddings.end()) {
            continue;
        }
        const std::optional<double> similarity = cosineSimilarity(candidateEmbedding, it->second);
        if (!similarity.has_value()) {
            continue;
        }
        evidence.push_back(Evidence{item.itemId, *similarity, classify(item)});
    }

    std::sort(evidence.begin(), evidence.end(), [](const Evidence& a, const Evidence& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.similarItemId < b.similarItemId;
    });
    if (evidence.size() > static_cast<size_t>(m_topN)) {
        evidence.resize(static_cast<size_t>(m_topN));
    }
    return evidence;
}

} // namespace rp
