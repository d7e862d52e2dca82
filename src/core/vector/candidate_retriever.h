#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/shared/candidate.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

namespace rp {

class ItemIndex;
class SQLiteStore;

struct RetrievalRequest {
    EmbeddingVector taste;
    MediaType mediaType = MediaType::Movie;
    std::unordered_set<int64_t> watchedIds;
    int limit = 0;
    bool includeWatched = false;
    std::optional<int> maxParentalRating;
    std::optional<std::vector<QString>> libraryScope;  // nullopt = whole catalog
    bool pushDownExclusion = false;
};

struct RetrievalResult {
    std::vector<Candidate> candidates;
    RecError error;
    int requested = 0;       // neighbours asked of the index
    int excludedWatched = 0;
};

// Turns a taste vector into hydrated candidates, nearest first.
//
// When watched exclusion is not pushed into the index, it over-fetches
// limit + |watched| neighbours and drops watched ones afterwards. Result
// may then hold fewer than limit items even though more unwatched items
// exist further down the ranking.
class CandidateRetriever {
public:
    CandidateRetriever(ItemIndex& index, SQLiteStore& store);

    RetrievalResult retrieve(const RetrievalRequest& request);

private:
    ItemIndex& m_index;
    SQLiteStore& m_store;
};

} // namespace rp
