#include "core/taste/taste_store.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <algorithm>
#include <utility>

namespace rp {

namespace {

constexpr const char* kGetProfileSql = R"(
    SELECT embedding, embedding_model, dimensions, is_locked, refresh_interval_days,
           min_franchise_items, min_franchise_size, auto_updated_at, user_modified_at
    FROM taste_profiles
    WHERE user_id = ?1 AND media_type = ?2
)";

constexpr const char* kSaveAutoProfileSql = R"(
    INSERT INTO taste_profiles (user_id, media_type, embedding, embedding_model, dimensions,
                                is_locked, refresh_interval_days, min_franchise_items,
                                min_franchise_size, auto_updated_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
    ON CONFLICT(user_id, media_type) DO UPDATE SET
        embedding = excluded.embedding,
        embedding_model = excluded.embedding_model,
        dimensions = excluded.dimensions,
        auto_updated_at = excluded.auto_updated_at
)";

constexpr const char* kSaveUserSettingsSql = R"(
    INSERT INTO taste_profiles (user_id, media_type, is_locked, refresh_interval_days,
                                min_franchise_items, min_franchise_size, user_modified_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    ON CONFLICT(user_id, media_type) DO UPDATE SET
        is_locked = excluded.is_locked,
        refresh_interval_days = excluded.refresh_interval_days,
        min_franchise_items = excluded.min_franchise_items,
        min_franchise_size = excluded.min_franchise_size,
        user_modified_at = excluded.user_modified_at
)";

constexpr const char* kFranchisePrefsSql = R"(
    SELECT franchise_name, media_type, preference_score, items_watched, total_engagement,
           is_user_set
    FROM franchise_preferences
    WHERE user_id = ?1 AND media_type IN (?2, 'both')
    ORDER BY franchise_name ASC, media_type ASC
)";

constexpr const char* kUpsertAutoFranchiseSql = R"(
    INSERT INTO franchise_preferences (user_id, franchise_name, media_type, preference_score,
                                       items_watched, total_engagement, is_user_set, updated_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, 0, ?7)
    ON CONFLICT(user_id, franchise_name, media_type) DO UPDATE SET
        preference_score = excluded.preference_score,
        items_watched = excluded.items_watched,
        total_engagement = excluded.total_engagement,
        updated_at = excluded.updated_at
    WHERE franchise_preferences.is_user_set = 0
)";

constexpr const char* kSetUserFranchiseSql = R"(
    INSERT INTO franchise_preferences (user_id, franchise_name, media_type, preference_score,
                                       items_watched, total_engagement, is_user_set, updated_at)
    VALUES (?1, ?2, ?3, ?4, 0, 0, 1, ?5)
    ON CONFLICT(user_id, franchise_name, media_type) DO UPDATE SET
        preference_score = excluded.preference_score,
        is_user_set = 1,
        updated_at = excluded.updated_at
)";

constexpr const char* kGenreWeightsSql = R"(
    SELECT genre, weight, is_user_set FROM genre_weights
    WHERE user_id = ?1
    ORDER BY genre ASC
)";

constexpr const char* kUpsertAutoGenreSql = R"(
    INSERT INTO genre_weights (user_id, genre, weight, is_user_set, updated_at)
    VALUES (?1, ?2, ?3, 0, ?4)
    ON CONFLICT(user_id, genre) DO UPDATE SET
        weight = excluded.weight,
        updated_at = excluded.updated_at
    WHERE genre_weights.is_user_set = 0
)";

constexpr const char* kSetUserGenreSql = R"(
    INSERT INTO genre_weights (user_id, genre, weight, is_user_set, updated_at)
    VALUES (?1, ?2, ?3, 1, ?4)
    ON CONFLICT(user_id, genre) DO UPDATE SET
        weight = excluded.weight,
        is_user_set = 1,
        updated_at = excluded.updated_at
)";

constexpr const char* kCustomInterestsSql = R"(
    SELECT id, interest_text, embedding, embedding_model, weight
    FROM custom_interests
    WHERE user_id = ?1 AND media_type = ?2
    ORDER BY id ASC
)";

void bindString(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

QString columnString(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

QString franchiseMediaKey(const std::optional<MediaType>& type)
{
    return type.has_value() ? mediaTypeToString(*type) : QStringLiteral("both");
}

} // namespace

TasteStore::TasteStore(sqlite3* db)
    : m_db(db)
{
}

bool TasteStore::exec(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        qWarning() << "TasteStore SQL failed:" << (errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Profiles ────────────────────────────────────────────────

std::optional<TasteProfile> TasteStore::getProfile(const QString& userId, MediaType type)
{
    if (!m_db) {
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kGetProfileSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::getProfile prepare failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }
    bindString(stmt, 1, userId);
    bindString(stmt, 2, mediaTypeToString(type));

    std::optional<TasteProfile> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        TasteProfile profile;
        profile.userId = userId;
        profile.mediaType = type;
        if (sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            std::vector<float> values = vectorFromBlob(sqlite3_column_blob(stmt, 0),
                                                       sqlite3_column_bytes(stmt, 0));
            const int dims = sqlite3_column_int(stmt, 2);
            if (static_cast<int>(values.size()) == dims) {
                profile.embedding = EmbeddingVector(columnString(stmt, 1).toStdString(),
                                                    std::move(values));
            }
        }
        profile.isLocked = sqlite3_column_int(stmt, 3) != 0;
        profile.refreshIntervalDays = sqlite3_column_int(stmt, 4);
        profile.minFranchiseItems = sqlite3_column_int(stmt, 5);
        profile.minFranchiseSize = sqlite3_column_int(stmt, 6);
        profile.autoUpdatedAt = sqlite3_column_double(stmt, 7);
        profile.userModifiedAt = sqlite3_column_double(stmt, 8);
        result = std::move(profile);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool TasteStore::saveAutoProfile(const TasteProfile& profile, double nowEpoch)
{
    if (!m_db || !profile.embedding.isValid()) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSaveAutoProfileSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::saveAutoProfile prepare failed:" << sqlite3_errmsg(m_db);
        return false;
    }

    const QByteArray blob = vectorToBlob(profile.embedding.values);
    bindString(stmt, 1, profile.userId);
    bindString(stmt, 2, mediaTypeToString(profile.mediaType));
    sqlite3_bind_blob(stmt, 3, blob.constData(), blob.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, profile.embedding.modelId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, profile.embedding.dimension);
    sqlite3_bind_int(stmt, 6, profile.isLocked ? 1 : 0);
    sqlite3_bind_int(stmt, 7, profile.refreshIntervalDays);
    sqlite3_bind_int(stmt, 8, profile.minFranchiseItems);
    sqlite3_bind_int(stmt, 9, profile.minFranchiseSize);
    sqlite3_bind_double(stmt, 10, nowEpoch);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        qWarning() << "TasteStore::saveAutoProfile failed:" << sqlite3_errmsg(m_db);
        return false;
    }
    return true;
}

bool TasteStore::saveUserSettings(const TasteProfile& profile, double nowEpoch)
{
    if (!m_db) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSaveUserSettingsSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::saveUserSettings prepare failed:" << sqlite3_errmsg(m_db);
        return false;
    }
    bindString(stmt, 1, profile.userId);
    bindString(stmt, 2, mediaTypeToString(profile.mediaType));
    sqlite3_bind_int(stmt, 3, profile.isLocked ? 1 : 0);
    sqlite3_bind_int(stmt, 4, std::max(profile.refreshIntervalDays, 0));
    sqlite3_bind_int(stmt, 5, std::max(profile.minFranchiseItems, 1));
    sqlite3_bind_int(stmt, 6, std::max(profile.minFranchiseSize, 1));
    sqlite3_bind_double(stmt, 7, nowEpoch);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool TasteStore::setLocked(const QString& userId, MediaType type, bool locked, double nowEpoch)
{
    TasteProfile profile = getProfile(userId, type).value_or(TasteProfile{});
    profile.userId = userId;
    profile.mediaType = type;
    profile.isLocked = locked;
    return saveUserSettings(profile, nowEpoch);
}

// ── Franchise preferences ───────────────────────────────────

std::vector<FranchisePreference> TasteStore::franchisePreferences(const QString& userId,
                                                                  MediaType type)
{
    std::vector<FranchisePreference> prefs;
    if (!m_db) {
        return prefs;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kFranchisePrefsSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::franchisePreferences prepare failed:" << sqlite3_errmsg(m_db);
        return prefs;
    }
    bindString(stmt, 1, userId);
    bindString(stmt, 2, mediaTypeToString(type));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        FranchisePreference pref;
        pref.userId = userId;
        pref.franchiseName = columnString(stmt, 0);
        pref.mediaType = mediaTypeFromString(columnString(stmt, 1));
        pref.preferenceScore = std::clamp(sqlite3_column_double(stmt, 2), -1.0, 1.0);
        pref.itemsWatched = sqlite3_column_int(stmt, 3);
        pref.totalEngagement = sqlite3_column_double(stmt, 4);
        pref.isUserSet = sqlite3_column_int(stmt, 5) != 0;
        prefs.push_back(std::move(pref));
    }
    sqlite3_finalize(stmt);
    return prefs;
}

bool TasteStore::upsertAutoFranchisePreferences(const std::vector<FranchisePreference>& prefs,
                                                double nowEpoch)
{
    if (!m_db) {
        return false;
    }
    if (prefs.empty()) {
        return true;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertAutoFranchiseSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::upsertAutoFranchisePreferences prepare failed:"
                   << sqlite3_errmsg(m_db);
        return false;
    }

    if (!exec("SAVEPOINT franchise_prefs")) {
        sqlite3_finalize(stmt);
        return false;
    }

    bool ok = true;
    for (const FranchisePreference& pref : prefs) {
        bindString(stmt, 1, pref.userId);
        bindString(stmt, 2, pref.franchiseName);
        bindString(stmt, 3, franchiseMediaKey(pref.mediaType));
        sqlite3_bind_double(stmt, 4, std::clamp(pref.preferenceScore, -1.0, 1.0));
        sqlite3_bind_int(stmt, 5, pref.itemsWatched);
        sqlite3_bind_double(stmt, 6, pref.totalEngagement);
        sqlite3_bind_double(stmt, 7, nowEpoch);
        if (stepWithRetry(stmt) != SQLITE_DONE) {
            qWarning() << "TasteStore::upsertAutoFranchisePreferences failed:"
                       << sqlite3_errmsg(m_db);
            ok = false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (!ok) {
            break;
        }
    }
    sqlite3_finalize(stmt);

    if (!ok) {
        exec("ROLLBACK TO SAVEPOINT franchise_prefs");
        exec("RELEASE SAVEPOINT franchise_prefs");
        return false;
    }
    return exec("RELEASE SAVEPOINT franchise_prefs");
}

bool TasteStore::setUserFranchisePreference(const FranchisePreference& pref, double nowEpoch)
{
    if (!m_db) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSetUserFranchiseSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindString(stmt, 1, pref.userId);
    bindString(stmt, 2, pref.franchiseName);
    bindString(stmt, 3, franchiseMediaKey(pref.mediaType));
    sqlite3_bind_double(stmt, 4, std::clamp(pref.preferenceScore, -1.0, 1.0));
    sqlite3_bind_double(stmt, 5, nowEpoch);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Genre weights ───────────────────────────────────────────

std::vector<GenreWeight> TasteStore::genreWeights(const QString& userId)
{
    std::vector<GenreWeight> weights;
    if (!m_db) {
        return weights;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kGenreWeightsSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::genreWeights prepare failed:" << sqlite3_errmsg(m_db);
        return weights;
    }
    bindString(stmt, 1, userId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        GenreWeight weight;
        weight.userId = userId;
        weight.genre = columnString(stmt, 0);
        weight.weight = std::clamp(sqlite3_column_double(stmt, 1), 0.0, 2.0);
        weight.isUserSet = sqlite3_column_int(stmt, 2) != 0;
        weights.push_back(std::move(weight));
    }
    sqlite3_finalize(stmt);
    return weights;
}

bool TasteStore::upsertAutoGenreWeights(const std::vector<GenreWeight>& weights, double nowEpoch)
{
    if (!m_db) {
        return false;
    }
    if (weights.empty()) {
        return true;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertAutoGenreSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::upsertAutoGenreWeights prepare failed:" << sqlite3_errmsg(m_db);
        return false;
    }

    if (!exec("SAVEPOINT genre_weights")) {
        sqlite3_finalize(stmt);
        return false;
    }

    bool ok = true;
    for (const GenreWeight& weight : weights) {
        bindString(stmt, 1, weight.userId);
        bindString(stmt, 2, weight.genre);
        sqlite3_bind_double(stmt, 3, std::clamp(weight.weight, 0.0, 2.0));
        sqlite3_bind_double(stmt, 4, nowEpoch);
        if (stepWithRetry(stmt) != SQLITE_DONE) {
            qWarning() << "TasteStore::upsertAutoGenreWeights failed:" << sqlite3_errmsg(m_db);
            ok = false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (!ok) {
            break;
        }
    }
    sqlite3_finalize(stmt);

    if (!ok) {
        exec("ROLLBACK TO SAVEPOINT genre_weights");
        exec("RELEASE SAVEPOINT genre_weights");
        return false;
    }
    return exec("RELEASE SAVEPOINT genre_weights");
}

bool TasteStore::setUserGenreWeight(const GenreWeight& weight, double nowEpoch)
{
    if (!m_db) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSetUserGenreSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindString(stmt, 1, weight.userId);
    bindString(stmt, 2, weight.genre);
    sqlite3_bind_double(stmt, 3, std::clamp(weight.weight, 0.0, 2.0));
    sqlite3_bind_double(stmt, 4, nowEpoch);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool TasteStore::clearUserOverrides(const QString& userId)
{
    if (!m_db) {
        return false;
    }
    const char* franchiseSql = "UPDATE franchise_preferences SET is_user_set = 0 WHERE user_id = ?1";
    const char* genreSql = "UPDATE genre_weights SET is_user_set = 0 WHERE user_id = ?1";

    for (const char* statement : {franchiseSql, genreSql}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, statement, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bindString(stmt, 1, userId);
        const int rc = stepWithRetry(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }
    }
    return true;
}

// ── Custom interests ────────────────────────────────────────

std::vector<CustomInterest> TasteStore::customInterests(const QString& userId, MediaType type)
{
    std::vector<CustomInterest> interests;
    if (!m_db) {
        return interests;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kCustomInterestsSql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::customInterests prepare failed:" << sqlite3_errmsg(m_db);
        return interests;
    }
    bindString(stmt, 1, userId);
    bindString(stmt, 2, mediaTypeToString(type));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CustomInterest interest;
        interest.id = sqlite3_column_int64(stmt, 0);
        interest.userId = userId;
        interest.mediaType = type;
        interest.text = columnString(stmt, 1);
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
            std::vector<float> values = vectorFromBlob(sqlite3_column_blob(stmt, 2),
                                                       sqlite3_column_bytes(stmt, 2));
            if (!values.empty()) {
                interest.embedding = EmbeddingVector(columnString(stmt, 3).toStdString(),
                                                     std::move(values));
            }
        }
        interest.weight = sqlite3_column_double(stmt, 4);
        interests.push_back(std::move(interest));
    }
    sqlite3_finalize(stmt);
    return interests;
}

std::optional<int64_t> TasteStore::addCustomInterest(const CustomInterest& interest,
                                                     double nowEpoch)
{
    if (!m_db || interest.text.trimmed().isEmpty()) {
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO custom_interests (user_id, media_type, interest_text, embedding,
                                      embedding_model, weight, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        qWarning() << "TasteStore::addCustomInterest prepare failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }
    bindString(stmt, 1, interest.userId);
    bindString(stmt, 2, mediaTypeToString(interest.mediaType));
    bindString(stmt, 3, interest.text.trimmed());
    QByteArray blob;
    if (interest.embedding.has_value() && interest.embedding->isValid()) {
        blob = vectorToBlob(interest.embedding->values);
        sqlite3_bind_blob(stmt, 4, blob.constData(), blob.size(), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, interest.embedding->modelId.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 4);
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_double(stmt, 6, std::max(interest.weight, 0.0));
    sqlite3_bind_double(stmt, 7, nowEpoch);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        qWarning() << "TasteStore::addCustomInterest failed:" << sqlite3_errmsg(m_db);
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_db));
}

bool TasteStore::updateInterestEmbedding(int64_t interestId, const EmbeddingVector& embedding)
{
    if (!m_db || !embedding.isValid()) {
        return false;
    }
    const char* sql = R"(
        UPDATE custom_interests SET embedding = ?1, embedding_model = ?2 WHERE id = ?3
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray blob = vectorToBlob(embedding.values);
    sqlite3_bind_blob(stmt, 1, blob.constData(), blob.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, embedding.modelId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, interestId);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

bool TasteStore::removeCustomInterest(int64_t interestId)
{
    if (!m_db) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM custom_interests WHERE id = ?1", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, interestId);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

} // namespace rp
