#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/index/migration.h"
#include "core/shared/logging.h"
#include "core/vector/candidate_filter.h"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>
#include <QThread>

#include <algorithm>

namespace rp {

namespace {

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

QString idList(const std::vector<int64_t>& ids)
{
    QStringList parts;
    parts.reserve(static_cast<int>(ids.size()));
    for (int64_t id : ids) {
        parts.append(QString::number(id));
    }
    return parts.join(QLatin1Char(','));
}

// Ids are inlined in batches so large candidate sets stay under SQLite's
// host-parameter limit.
constexpr size_t kIdBatchSize = 500;

constexpr const char* kItemColumns =
    "i.id, i.title, i.year, i.media_type, i.genres, i.franchise, i.community_rating, "
    "i.popularity, i.official_rating, p.value, i.library_id, i.network";

} // namespace

int stepWithRetry(sqlite3_stmt* stmt)
{
    // Retry loop: sqlite3_busy_timeout's handler is NOT invoked when SQLite
    // detects a potential WAL deadlock (e.g. reader snapshot + writer conflict
    // during auto-checkpoint).  In that case sqlite3_step() returns SQLITE_BUSY
    // immediately, so we retry at the application level.
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
        }
        rc = sqlite3_step(stmt);
    }
    return rc;
}

void bindVariants(sqlite3_stmt* stmt, const QVariantList& binds, int firstIndex)
{
    int index = firstIndex;
    for (const QVariant& value : binds) {
        switch (value.typeId()) {
        case QMetaType::Int:
        case QMetaType::LongLong:
        case QMetaType::UInt:
        case QMetaType::ULongLong:
        case QMetaType::Bool:
            sqlite3_bind_int64(stmt, index, value.toLongLong());
            break;
        case QMetaType::Double:
        case QMetaType::Float:
            sqlite3_bind_double(stmt, index, value.toDouble());
            break;
        default:
            if (value.isNull()) {
                sqlite3_bind_null(stmt, index);
            } else {
                bindText(stmt, index, value.toString());
            }
            break;
        }
        ++index;
    }
}

QString genresToJson(const QStringList& genres)
{
    return QString::fromUtf8(
        QJsonDocument(QJsonArray::fromStringList(genres)).toJson(QJsonDocument::Compact));
}

QStringList genresFromJson(const QString& json)
{
    QStringList genres;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isArray()) {
        return genres;
    }
    for (const QJsonValue& value : doc.array()) {
        const QString genre = value.toString().trimmed();
        if (!genre.isEmpty()) {
            genres.append(genre);
        }
    }
    return genres;
}

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    SQLiteStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rpStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(rpStore, "Failed to set connection pragmas");
        return false;
    }

    // Skipping schema creation when it already exists avoids contending for
    // the write lock when a worker opens a second connection mid-run.
    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='recommendation_runs'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(rpStore, "Failed to set database pragmas");
            return false;
        }

        if (!execSql(kSchemaV1)) {
            LOG_ERROR(rpStore, "Failed to create schema");
            return false;
        }

        if (!execSql(kDefaultSettings)) {
            LOG_ERROR(rpStore, "Failed to insert default settings");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(rpStore, "Migration failed");
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        // Restrict database file permissions to owner-only (0600)
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(rpStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rpStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Catalog ─────────────────────────────────────────────────

bool SQLiteStore::upsertItem(const CatalogItem& item)
{
    const char* sql = R"(
        INSERT INTO items (id, title, year, media_type, genres, franchise,
                           community_rating, popularity, official_rating, library_id,
                           network)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
        ON CONFLICT(id) DO UPDATE SET
            title = excluded.title,
            year = excluded.year,
            media_type = excluded.media_type,
            genres = excluded.genres,
            franchise = excluded.franchise,
            community_rating = excluded.community_rating,
            popularity = excluded.popularity,
            official_rating = excluded.official_rating,
            library_id = excluded.library_id,
            network = excluded.network
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "upsertItem prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_bind_int64(stmt, 1, item.id);
    bindText(stmt, 2, item.title);
    sqlite3_bind_int(stmt, 3, item.year);
    bindText(stmt, 4, mediaTypeToString(item.mediaType));
    bindText(stmt, 5, genresToJson(item.genres));
    bindOptionalText(stmt, 6, item.franchise);
    if (item.communityRating.has_value()) {
        sqlite3_bind_double(stmt, 7, *item.communityRating);
    } else {
        sqlite3_bind_null(stmt, 7);
    }
    sqlite3_bind_double(stmt, 8, item.popularity);
    bindOptionalText(stmt, 9, item.officialRating);
    bindOptionalText(stmt, 10, item.libraryId);
    bindOptionalText(stmt, 11, item.network);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(rpStore, "upsertItem step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

CatalogItem SQLiteStore::readItemRow(sqlite3_stmt* stmt) const
{
    CatalogItem item;
    item.id = sqlite3_column_int64(stmt, 0);
    item.title = columnText(stmt, 1);
    item.year = sqlite3_column_int(stmt, 2);
    item.mediaType = mediaTypeFromString(columnText(stmt, 3)).value_or(MediaType::Movie);
    item.genres = genresFromJson(columnText(stmt, 4));
    item.franchise = columnText(stmt, 5);
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        item.communityRating = sqlite3_column_double(stmt, 6);
    }
    item.popularity = sqlite3_column_double(stmt, 7);
    item.officialRating = columnText(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        item.parentalRatingValue = sqlite3_column_int(stmt, 9);
    }
    item.libraryId = columnText(stmt, 10);
    item.network = columnText(stmt, 11);
    return item;
}

std::optional<CatalogItem> SQLiteStore::getItem(int64_t id)
{
    auto items = getItems({id});
    auto it = items.find(id);
    if (it == items.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::unordered_map<int64_t, CatalogItem> SQLiteStore::getItems(const std::vector<int64_t>& ids)
{
    std::unordered_map<int64_t, CatalogItem> result;
    if (ids.empty()) {
        return result;
    }
    result.reserve(ids.size());

    for (size_t offset = 0; offset < ids.size(); offset += kIdBatchSize) {
        const size_t end = std::min(ids.size(), offset + kIdBatchSize);
        const std::vector<int64_t> batch(ids.begin() + static_cast<std::ptrdiff_t>(offset),
                                         ids.begin() + static_cast<std::ptrdiff_t>(end));
        const QByteArray sql = QStringLiteral(
            "SELECT %1 FROM items i "
            "LEFT JOIN parental_rating_values p ON p.rating = i.official_rating "
            "WHERE i.id IN (%2)")
            .arg(QString::fromLatin1(kItemColumns), idList(batch))
            .toUtf8();

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(rpStore, "getItems prepare failed: %s", sqlite3_errmsg(m_db));
            return {};
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            CatalogItem item = readItemRow(stmt);
            result.emplace(item.id, std::move(item));
        }
        sqlite3_finalize(stmt);
    }
    return result;
}

double SQLiteStore::maxPopularity(MediaType type)
{
    const char* sql = "SELECT COALESCE(MAX(popularity), 0) FROM items WHERE media_type = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0.0;
    }
    bindText(stmt, 1, mediaTypeToString(type));
    double value = 0.0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_double(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

QHash<QString, int> SQLiteStore::franchiseSizes(MediaType type)
{
    QHash<QString, int> sizes;
    const char* sql = R"(
        SELECT franchise, COUNT(*) FROM items
        WHERE media_type = ?1 AND franchise IS NOT NULL AND franchise != ''
        GROUP BY franchise
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "franchiseSizes prepare failed: %s", sqlite3_errmsg(m_db));
        return sizes;
    }
    bindText(stmt, 1, mediaTypeToString(type));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sizes.insert(columnText(stmt, 0), sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return sizes;
}

std::vector<int64_t> SQLiteStore::itemIdsMatching(const CandidateFilter& filter)
{
    std::vector<int64_t> ids;
    const CandidateFilter::SqlPredicate predicate = filter.toSql();
    const QByteArray sql = QStringLiteral(
        "SELECT i.id FROM items i "
        "LEFT JOIN parental_rating_values p ON p.rating = i.official_rating "
        "WHERE %1 ORDER BY i.id")
        .arg(predicate.sql)
        .toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "itemIdsMatching prepare failed: %s", sqlite3_errmsg(m_db));
        return ids;
    }
    bindVariants(stmt, predicate.binds);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

// ── Item embeddings ─────────────────────────────────────────

bool SQLiteStore::upsertItemEmbedding(int64_t itemId, const EmbeddingVector& vector)
{
    if (!vector.isValid()) {
        LOG_WARN(rpStore, "upsertItemEmbedding rejected invalid vector for item %lld",
                 static_cast<long long>(itemId));
        return false;
    }

    const char* sql = R"(
        INSERT INTO item_embeddings (item_id, model_id, dimensions, embedding, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(item_id, model_id) DO UPDATE SET
            dimensions = excluded.dimensions,
            embedding = excluded.embedding,
            updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "upsertItemEmbedding prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray blob = vectorToBlob(vector.values);
    sqlite3_bind_int64(stmt, 1, itemId);
    sqlite3_bind_text(stmt, 2, vector.modelId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, vector.dimension);
    sqlite3_bind_blob(stmt, 4, blob.constData(), blob.size(), SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 5, static_cast<double>(QDateTime::currentSecsSinceEpoch()));

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rpStore, "upsertItemEmbedding step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::unordered_map<int64_t, EmbeddingVector> SQLiteStore::getItemEmbeddings(
    const std::vector<int64_t>& ids, const std::string& modelId)
{
    std::unordered_map<int64_t, EmbeddingVector> result;
    if (ids.empty()) {
        return result;
    }

    for (size_t offset = 0; offset < ids.size(); offset += kIdBatchSize) {
        const size_t end = std::min(ids.size(), offset + kIdBatchSize);
        const std::vector<int64_t> batch(ids.begin() + static_cast<std::ptrdiff_t>(offset),
                                         ids.begin() + static_cast<std::ptrdiff_t>(end));
        const QByteArray sql = QStringLiteral(
            "SELECT item_id, dimensions, embedding FROM item_embeddings "
            "WHERE model_id = ?1 AND item_id IN (%1)")
            .arg(idList(batch))
            .toUtf8();

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(rpStore, "getItemEmbeddings prepare failed: %s", sqlite3_errmsg(m_db));
            return {};
        }
        sqlite3_bind_text(stmt, 1, modelId.c_str(), -1, SQLITE_TRANSIENT);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const int64_t itemId = sqlite3_column_int64(stmt, 0);
            const int dims = sqlite3_column_int(stmt, 1);
            std::vector<float> values = vectorFromBlob(sqlite3_column_blob(stmt, 2),
                                                       sqlite3_column_bytes(stmt, 2));
            if (static_cast<int>(values.size()) != dims) {
                LOG_WARN(rpStore, "Embedding for item %lld has corrupt blob, skipping",
                         static_cast<long long>(itemId));
                continue;
            }
            result.emplace(itemId, EmbeddingVector(modelId, std::move(values)));
        }
        sqlite3_finalize(stmt);
    }
    return result;
}

std::vector<std::pair<int64_t, std::vector<float>>> SQLiteStore::listItemEmbeddings(
    const std::string& modelId, int dimensions)
{
    std::vector<std::pair<int64_t, std::vector<float>>> rows;
    const char* sql = R"(
        SELECT item_id, embedding FROM item_embeddings
        WHERE model_id = ?1 AND dimensions = ?2
        ORDER BY item_id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "listItemEmbeddings prepare failed: %s", sqlite3_errmsg(m_db));
        return rows;
    }
    sqlite3_bind_text(stmt, 1, modelId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, dimensions);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::vector<float> values = vectorFromBlob(sqlite3_column_blob(stmt, 1),
                                                   sqlite3_column_bytes(stmt, 1));
        if (static_cast<int>(values.size()) != dimensions) {
            continue;
        }
        rows.emplace_back(sqlite3_column_int64(stmt, 0), std::move(values));
    }
    sqlite3_finalize(stmt);
    return rows;
}

int SQLiteStore::countItemEmbeddings(const std::string& modelId)
{
    const char* sql = "SELECT COUNT(*) FROM item_embeddings WHERE model_id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_text(stmt, 1, modelId.c_str(), -1, SQLITE_TRANSIENT);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Users, libraries, parental ratings ──────────────────────

bool SQLiteStore::upsertUser(const UserRecord& user)
{
    const char* sql = R"(
        INSERT INTO users (id, name, is_enabled, max_parental_rating, movies_enabled,
                           series_enabled)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            is_enabled = excluded.is_enabled,
            max_parental_rating = excluded.max_parental_rating,
            movies_enabled = excluded.movies_enabled,
            series_enabled = excluded.series_enabled
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "upsertUser prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, user.id);
    bindText(stmt, 2, user.name);
    sqlite3_bind_int(stmt, 3, user.enabled ? 1 : 0);
    if (user.maxParentalRating.has_value()) {
        sqlite3_bind_int(stmt, 4, *user.maxParentalRating);
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_int(stmt, 5, user.moviesEnabled ? 1 : 0);
    sqlite3_bind_int(stmt, 6, user.seriesEnabled ? 1 : 0);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::optional<UserRecord> SQLiteStore::getUser(const QString& userId)
{
    const char* sql = R"(
        SELECT id, name, is_enabled, max_parental_rating, movies_enabled, series_enabled
        FROM users WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, userId);

    std::optional<UserRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        UserRecord user;
        user.id = columnText(stmt, 0);
        user.name = columnText(stmt, 1);
        user.enabled = sqlite3_column_int(stmt, 2) != 0;
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            user.maxParentalRating = sqlite3_column_int(stmt, 3);
        }
        user.moviesEnabled = sqlite3_column_int(stmt, 4) != 0;
        user.seriesEnabled = sqlite3_column_int(stmt, 5) != 0;
        result = user;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<UserRecord> SQLiteStore::listEligibleUsers(MediaType type, int minWatchedItems)
{
    std::vector<UserRecord> users;
    const char* sql = R"(
        SELECT u.id, u.name, u.is_enabled, u.max_parental_rating, u.movies_enabled,
               u.series_enabled
        FROM users u
        WHERE u.is_enabled = 1
          AND (CASE ?1 WHEN 'series' THEN u.series_enabled ELSE u.movies_enabled END) = 1
          AND (SELECT COUNT(*) FROM watch_history wh
               JOIN items i ON i.id = wh.item_id
               WHERE wh.user_id = u.id AND i.media_type = ?1) >= ?2
        ORDER BY u.id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "listEligibleUsers prepare failed: %s", sqlite3_errmsg(m_db));
        return users;
    }
    bindText(stmt, 1, mediaTypeToString(type));
    sqlite3_bind_int(stmt, 2, std::max(minWatchedItems, 0));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        UserRecord user;
        user.id = columnText(stmt, 0);
        user.name = columnText(stmt, 1);
        user.enabled = true;
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            user.maxParentalRating = sqlite3_column_int(stmt, 3);
        }
        user.moviesEnabled = sqlite3_column_int(stmt, 4) != 0;
        user.seriesEnabled = sqlite3_column_int(stmt, 5) != 0;
        users.push_back(std::move(user));
    }
    sqlite3_finalize(stmt);
    return users;
}

bool SQLiteStore::upsertLibrary(const LibraryConfig& library)
{
    const char* sql = R"(
        INSERT INTO library_config (library_id, name, media_type, is_enabled)
        VALUES (?1, ?2, ?3, ?4)
        ON CONFLICT(library_id) DO UPDATE SET
            name = excluded.name,
            media_type = excluded.media_type,
            is_enabled = excluded.is_enabled
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "upsertLibrary prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, library.libraryId);
    bindText(stmt, 2, library.name);
    bindText(stmt, 3, mediaTypeToString(library.mediaType));
    sqlite3_bind_int(stmt, 4, library.enabled ? 1 : 0);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool SQLiteStore::libraryScope(MediaType type, std::optional<std::vector<QString>>& scope)
{
    scope.reset();
    const char* sql = R"(
        SELECT library_id, is_enabled FROM library_config
        WHERE media_type = ?1
        ORDER BY library_id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "libraryScope prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, mediaTypeToString(type));

    bool anyConfigured = false;
    std::vector<QString> enabled;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        anyConfigured = true;
        if (sqlite3_column_int(stmt, 1) != 0) {
            enabled.push_back(columnText(stmt, 0));
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rpStore, "libraryScope step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    if (anyConfigured) {
        scope = std::move(enabled);
    }
    return true;
}

bool SQLiteStore::setParentalRatingValue(const QString& rating, int value)
{
    const char* sql = R"(
        INSERT INTO parental_rating_values (rating, value) VALUES (?1, ?2)
        ON CONFLICT(rating) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, rating);
    sqlite3_bind_int(stmt, 2, value);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Watch history ───────────────────────────────────────────

bool SQLiteStore::upsertWatch(const WatchRecord& record)
{
    const char* sql = R"(
        INSERT INTO watch_history (user_id, item_id, play_count, last_played_at, is_favorite,
                                   user_rating, completion, episodes_watched)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        ON CONFLICT(user_id, item_id) DO UPDATE SET
            play_count = excluded.play_count,
            last_played_at = excluded.last_played_at,
            is_favorite = excluded.is_favorite,
            user_rating = excluded.user_rating,
            completion = excluded.completion,
            episodes_watched = excluded.episodes_watched
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "upsertWatch prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, record.userId);
    sqlite3_bind_int64(stmt, 2, record.itemId);
    sqlite3_bind_int(stmt, 3, record.playCount);
    sqlite3_bind_double(stmt, 4, record.lastPlayedAt);
    sqlite3_bind_int(stmt, 5, record.isFavorite ? 1 : 0);
    if (record.userRating.has_value()) {
        sqlite3_bind_double(stmt, 6, *record.userRating);
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_double(stmt, 7, record.completion);
    sqlite3_bind_int(stmt, 8, record.episodesWatched);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rpStore, "upsertWatch step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::vector<WatchedItem> SQLiteStore::watchedItems(const QString& userId, MediaType type, int limit)
{
    std::vector<WatchedItem> items;
    const char* sql = R"(
        SELECT i.id, i.title, i.year, i.media_type, i.genres, i.franchise,
               wh.play_count, wh.last_played_at, wh.completion, wh.episodes_watched,
               wh.is_favorite, wh.user_rating
        FROM watch_history wh
        JOIN items i ON i.id = wh.item_id
        WHERE wh.user_id = ?1 AND i.media_type = ?2
        ORDER BY wh.last_played_at DESC, i.id ASC
        LIMIT ?3
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "watchedItems prepare failed: %s", sqlite3_errmsg(m_db));
        return items;
    }
    bindText(stmt, 1, userId);
    bindText(stmt, 2, mediaTypeToString(type));
    sqlite3_bind_int(stmt, 3, limit > 0 ? limit : -1);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        WatchedItem item;
        item.itemId = sqlite3_column_int64(stmt, 0);
        item.title = columnText(stmt, 1);
        item.year = sqlite3_column_int(stmt, 2);
        item.mediaType = mediaTypeFromString(columnText(stmt, 3)).value_or(type);
        item.genres = genresFromJson(columnText(stmt, 4));
        item.franchise = columnText(stmt, 5);
        item.playCount = sqlite3_column_int(stmt, 6);
        item.lastPlayedAt = sqlite3_column_double(stmt, 7);
        item.completion = sqlite3_column_double(stmt, 8);
        item.episodesWatched = sqlite3_column_int(stmt, 9);
        item.isFavorite = sqlite3_column_int(stmt, 10) != 0;
        if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) {
            item.userRating = sqlite3_column_double(stmt, 11);
        }
        items.push_back(std::move(item));
    }
    sqlite3_finalize(stmt);
    return items;
}

std::vector<int64_t> SQLiteStore::watchedItemIds(const QString& userId, MediaType type)
{
    std::vector<int64_t> ids;
    const char* sql = R"(
        SELECT wh.item_id FROM watch_history wh
        JOIN items i ON i.id = wh.item_id
        WHERE wh.user_id = ?1 AND i.media_type = ?2
        ORDER BY wh.item_id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rpStore, "watchedItemIds prepare failed: %s", sqlite3_errmsg(m_db));
        return ids;
    }
    bindText(stmt, 1, userId);
    bindText(stmt, 2, mediaTypeToString(type));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, key);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, key);
    bindText(stmt, 2, value);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Transactions ────────────────────────────────────────────

bool SQLiteStore::beginTransaction()
{
    return execSql("BEGIN IMMEDIATE TRANSACTION");
}

bool SQLiteStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool SQLiteStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

// ── Maintenance ─────────────────────────────────────────────

bool SQLiteStore::integrityCheck() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = result && QString::fromUtf8(result) == QLatin1String("ok");
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace rp
