#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/runs/run_types.h"
#include "core/taste/taste_types.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace rp {

// Explains a recommendation by the watched items closest to it.
class EvidenceBuilder {
public:
    static constexpr double kHighlyRatedThreshold = 8.0;

    explicit EvidenceBuilder(int topN);

    // Top-N watched items by cosine similarity to the candidate's own
    // embedding, ties broken by item id. Watched items without a
    // compatible embedding are skipped.
    std::vector<Evidence> build(const EmbeddingVector& candidateEmbedding,
                                const std::vector<WatchedItem>& watched,
                                const std::unordered_map<int64_t, EmbeddingVector>& watchedEmbeddings) const;

    static EvidenceType classify(const WatchedItem& item);

private:
    int m_topN = 3;
};

} // namespace rp
