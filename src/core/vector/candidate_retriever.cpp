#include "core/vector/candidate_retriever.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"
#include "core/vector/candidate_filter.h"
#include "core/vector/item_index.h"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace rp {

CandidateRetriever::CandidateRetriever(ItemIndex& index, SQLiteStore& store)
    : m_index(index)
    , m_store(store)
{
}

RetrievalResult CandidateRetriever::retrieve(const RetrievalRequest& request)
{
    RetrievalResult result;
    if (!request.taste.isValid()) {
        result.error = RecError::make(RecErrorCode::InsufficientData,
                                      QStringLiteral("no taste vector to retrieve with"));
        return result;
    }
    if (!request.taste.matchesModel(m_index.modelId(), m_index.dimensions())) {
        result.error = RecError::make(
            RecErrorCode::ProfileStale,
            QStringLiteral("taste vector from %1 cannot query %2 index")
                .arg(QString::fromStdString(request.taste.modelId),
                     QString::fromStdString(m_index.modelId())));
        return result;
    }
    if (request.limit <= 0) {
        return result;
    }

    CandidateFilter filter = CandidateFilter::mediaType(request.mediaType);
    if (request.libraryScope.has_value()) {
        filter = filter && CandidateFilter::libraryScope(*request.libraryScope);
    }
    if (request.maxParentalRating.has_value()) {
        filter = filter && CandidateFilter::parentalCeiling(*request.maxParentalRating);
    }

    const bool excludeWatched = !request.includeWatched && !request.watchedIds.empty();
    const bool pushDown = excludeWatched && request.pushDownExclusion
        && m_index.supportsExclusion();

    int64_t fetch = request.limit;
    if (pushDown) {
        filter = filter && CandidateFilter::excludeItems(request.watchedIds);
    } else if (excludeWatched) {
        fetch += static_cast<int64_t>(request.watchedIds.size());
    }
    result.requested = static_cast<int>(
        std::min<int64_t>(fetch, std::numeric_limits<int>::max()));

    const std::optional<std::vector<Neighbor>> neighbors =
        m_index.nearestNeighbors(request.taste, filter, result.requested);
    if (!neighbors.has_value()) {
        result.error = RecError::make(RecErrorCode::StorageFailure,
                                      QStringLiteral("item index lookup failed"));
        return result;
    }

    std::vector<Neighbor> kept;
    std::unordered_set<int64_t> seen;
    kept.reserve(std::min<size_t>(neighbors->size(), static_cast<size_t>(request.limit)));
    for (const Neighbor& neighbor : *neighbors) {
        if (excludeWatched && request.watchedIds.count(neighbor.itemId) > 0) {
            ++result.excludedWatched;
            continue;
        }
        if (!seen.insert(neighbor.itemId).second) {
            continue;
        }
        kept.push_back(neighbor);
        if (static_cast<int>(kept.size()) >= request.limit) {
            break;
        }
    }

    std::vector<int64_t> ids;
    ids.reserve(kept.size());
    for (const Neighbor& neighbor : kept) {
        ids.push_back(neighbor.itemId);
    }
    const std::unordered_map<int64_t, CatalogItem> items = m_store.getItems(ids);

    result.candidates.reserve(kept.size());
    for (const Neighbor& neighbor : kept) {
        auto it = items.find(neighbor.itemId);
        if (it == items.end()) {
            LOG_DEBUG(rpRetrieval, "Item %lld has a vector but no catalog row",
                      static_cast<long long>(neighbor.itemId));
            continue;
        }
        const CatalogItem& item = it->second;
        Candidate candidate;
        candidate.itemId = item.id;
        candidate.title = item.title;
        candidate.year = item.year;
        candidate.genres = item.genres;
        candidate.franchise = item.franchise;
        candidate.network = item.network;
        candidate.communityRating = item.communityRating;
        candidate.popularity = item.popularity;
        candidate.similarity = neighbor.similarity;
        candidate.score.similarity = neighbor.similarity;
        result.candidates.push_back(std::move(candidate));
    }

    if (static_cast<int>(result.candidates.size()) < request.limit && excludeWatched && !pushDown
        && static_cast<int>(neighbors->size()) >= result.requested) {
        LOG_DEBUG(rpRetrieval, "Over-fetch returned %d of %d candidates after excluding %d watched",
                  static_cast<int>(result.candidates.size()), request.limit,
                  result.excludedWatched);
    }
    return result;
}

} // namespace rp
