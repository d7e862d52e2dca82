#pragma once

#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/taste/taste_types.h"

#include <QString>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace rp {

class EmbeddingClient;
class SQLiteStore;
class TasteStore;

// What a run needs from the user's side: the profile it retrieves with and
// the recent history it cites as evidence.
struct TasteSnapshot {
    TasteProfile profile;
    std::vector<WatchedItem> recentWatched;
    std::unordered_map<int64_t, EmbeddingVector> watchedEmbeddings;
    bool rebuilt = false;
};

// Decides whether a stored profile can be reused and rebuilds it when not.
// Borrows every collaborator; one instance per pipeline execution.
class TasteProfileService {
public:
    TasteProfileService(SQLiteStore& store, TasteStore& tasteStore,
                        EmbeddingClient* embeddingClient,
                        const RecommendationSettings& settings);

    // Returns a profile built under the active model, or an error.
    // force rebuilds even a locked or fresh profile.
    RecError ensureProfile(const QString& userId, MediaType type, bool force,
                           double nowEpoch, TasteSnapshot& out);

    // Rebuild unconditionally; the lock flag is kept as stored.
    RecError rebuild(const QString& userId, MediaType type, double nowEpoch,
                     TasteSnapshot& out);

private:
    void loadHistory(const QString& userId, MediaType type, TasteSnapshot& out);
    RecError embedMissingInterests(std::vector<CustomInterest>& interests);

    SQLiteStore& m_store;
    TasteStore& m_tasteStore;
    EmbeddingClient* m_embeddingClient = nullptr;
    const RecommendationSettings& m_settings;
};

} // namespace rp
