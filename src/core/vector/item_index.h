#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/vector/candidate_filter.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rp {

struct Neighbor {
    int64_t itemId = 0;
    double similarity = 0.0;
};

// Nearest-neighbour lookup over catalog item embeddings. Implementations
// must be safe to call from several pipeline threads at once.
class ItemIndex {
public:
    virtual ~ItemIndex() = default;

    // Model whose vectors the index holds. Queries from any other model
    // are rejected.
    virtual std::string modelId() const = 0;
    virtual int dimensions() const = 0;

    // Up to limit items accepted by filter, by descending similarity.
    // An empty vector is a valid answer; nullopt means the lookup failed.
    virtual std::optional<std::vector<Neighbor>> nearestNeighbors(
        const EmbeddingVector& query, const CandidateFilter& filter, int limit) = 0;

    // True when excludeItems clauses are honoured inside the lookup rather
    // than left to the caller.
    virtual bool supportsExclusion() const = 0;

    virtual int vectorCount() const = 0;
};

} // namespace rp
