#pragma once

#include "core/taste/taste_types.h"

#include <QString>

#include <optional>
#include <vector>

struct sqlite3;

namespace rp {

// Persistence for taste profiles and the preference rows feeding them.
// Rows flagged is_user_set are only written through the setUser* methods;
// the auto-computed upserts leave them untouched.
class TasteStore {
public:
    explicit TasteStore(sqlite3* db);

    TasteStore(const TasteStore&) = delete;
    TasteStore& operator=(const TasteStore&) = delete;

    // ── Profiles ────────────────────────────────────────────

    std::optional<TasteProfile> getProfile(const QString& userId, MediaType type);

    // Writes the embedding and stamps auto_updated_at; lock flag and
    // thresholds are preserved when the row already exists.
    bool saveAutoProfile(const TasteProfile& profile, double nowEpoch);

    // User-driven edit (lock, thresholds, interval). Stamps user_modified_at.
    bool saveUserSettings(const TasteProfile& profile, double nowEpoch);

    bool setLocked(const QString& userId, MediaType type, bool locked, double nowEpoch);

    // ── Franchise preferences ───────────────────────────────

    // Rows for the media type plus rows targeting both types.
    std::vector<FranchisePreference> franchisePreferences(const QString& userId, MediaType type);
    bool upsertAutoFranchisePreferences(const std::vector<FranchisePreference>& prefs,
                                        double nowEpoch);
    bool setUserFranchisePreference(const FranchisePreference& pref, double nowEpoch);

    // ── Genre weights ───────────────────────────────────────

    std::vector<GenreWeight> genreWeights(const QString& userId);
    bool upsertAutoGenreWeights(const std::vector<GenreWeight>& weights, double nowEpoch);
    bool setUserGenreWeight(const GenreWeight& weight, double nowEpoch);

    // Drops the user-set flag so the next rebuild recomputes these rows.
    bool clearUserOverrides(const QString& userId);

    // ── Custom interests ────────────────────────────────────

    std::vector<CustomInterest> customInterests(const QString& userId, MediaType type);
    std::optional<int64_t> addCustomInterest(const CustomInterest& interest, double nowEpoch);
    bool updateInterestEmbedding(int64_t interestId, const EmbeddingVector& embedding);
    bool removeCustomInterest(int64_t interestId);

private:
    bool exec(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace rp
