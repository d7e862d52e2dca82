#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/shared/catalog.h"
#include "core/shared/types.h"
#include "core/taste/taste_types.h"
#include <QHash>
#include <QString>
#include <QVariantList>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cstdint>

#include <sqlite3.h>

namespace rp {

class CandidateFilter;

// SQLiteStore: owner of one SQLite connection.
// Holds the catalog, users, library configuration, watch history and item
// embeddings, plus the settings table and schema lifecycle. Other stores
// (TasteStore, RunStore, VectorStore) borrow rawDb() and must not outlive it.
//
// A connection is used by one thread at a time. Concurrent runs open their
// own connection on the same file (WAL).
class SQLiteStore {
public:
    ~SQLiteStore();

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open, then migrates.
    static std::optional<SQLiteStore> open(const QString& dbPath);

    // ── Catalog ─────────────────────────────────────────────

    bool upsertItem(const CatalogItem& item);
    std::optional<CatalogItem> getItem(int64_t id);

    // Batch fetch; ids missing from the catalog are absent from the map.
    std::unordered_map<int64_t, CatalogItem> getItems(const std::vector<int64_t>& ids);

    // Largest popularity among items of the media type (0 when empty).
    double maxPopularity(MediaType type);

    // Number of catalog items per franchise name.
    QHash<QString, int> franchiseSizes(MediaType type);

    // Item ids satisfying the filter, evaluated in SQL.
    std::vector<int64_t> itemIdsMatching(const CandidateFilter& filter);

    // ── Item embeddings ─────────────────────────────────────

    bool upsertItemEmbedding(int64_t itemId, const EmbeddingVector& vector);
    std::unordered_map<int64_t, EmbeddingVector> getItemEmbeddings(
        const std::vector<int64_t>& ids, const std::string& modelId);
    std::vector<std::pair<int64_t, std::vector<float>>> listItemEmbeddings(
        const std::string& modelId, int dimensions);
    int countItemEmbeddings(const std::string& modelId);

    // ── Users, libraries, parental ratings ──────────────────

    bool upsertUser(const UserRecord& user);
    std::optional<UserRecord> getUser(const QString& userId);

    // Enabled users opted in to the media type with at least minWatchedItems
    // watched items of it, ordered by id.
    std::vector<UserRecord> listEligibleUsers(MediaType type, int minWatchedItems);

    bool upsertLibrary(const LibraryConfig& library);

    // Enabled library ids for the media type. scope is left nullopt when no
    // library of that type is configured at all (the whole catalog is in
    // scope). Returns false when the configuration cannot be read.
    bool libraryScope(MediaType type, std::optional<std::vector<QString>>& scope);

    bool setParentalRatingValue(const QString& rating, int value);

    // ── Watch history ───────────────────────────────────────

    bool upsertWatch(const WatchRecord& record);

    // Most recently played first. limit <= 0 returns everything.
    std::vector<WatchedItem> watchedItems(const QString& userId, MediaType type, int limit = 0);
    std::vector<int64_t> watchedItemIds(const QString& userId, MediaType type);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // ── Maintenance ─────────────────────────────────────────

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    // Raw handle shared with the other stores
    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    CatalogItem readItemRow(sqlite3_stmt* stmt) const;

    sqlite3* m_db = nullptr;
};

// Step a prepared statement, retrying SQLITE_BUSY with a short backoff.
int stepWithRetry(sqlite3_stmt* stmt);

// Bind QVariant values positionally starting at index 1.
void bindVariants(sqlite3_stmt* stmt, const QVariantList& binds, int firstIndex = 1);

QString genresToJson(const QStringList& genres);
QStringList genresFromJson(const QString& json);

} // namespace rp
