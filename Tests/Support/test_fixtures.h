#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/embedding_vector.h"
#include "core/index/sqlite_store.h"
#include "core/shared/catalog.h"
#include "core/vector/item_index.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <atomic>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rp::test {

constexpr const char* kModel = "test-model";
constexpr int kDims = 4;

// Unit-length vector of kDims components.
std::vector<float> unit(std::initializer_list<float> components);
EmbeddingVector embedding(std::initializer_list<float> components,
                          const std::string& model = kModel);

CatalogItem makeItem(int64_t id, const QString& title, const QStringList& genres,
                     MediaType type = MediaType::Movie);

WatchRecord makeWatch(const QString& userId, int64_t itemId, double lastPlayedAt,
                      std::optional<double> rating = std::nullopt, bool favorite = false);

// Brute-force ItemIndex over in-memory items. Exclusion clauses are left
// to the caller, like an index that cannot push them down.
class FakeItemIndex : public ItemIndex {
public:
    explicit FakeItemIndex(std::string modelId = kModel, int dimensions = kDims);

    void add(const CatalogItem& item, const EmbeddingVector& vector);
    void setFailing(bool failing);

    int lastLimit() const { return m_lastLimit.load(); }
    int queryCount() const { return m_queries.load(); }

    std::string modelId() const override { return m_modelId; }
    int dimensions() const override { return m_dimensions; }

    std::optional<std::vector<Neighbor>> nearestNeighbors(
        const EmbeddingVector& query, const CandidateFilter& filter, int limit) override;

    bool supportsExclusion() const override { return false; }
    int vectorCount() const override;

private:
    struct Entry {
        CatalogItem item;
        EmbeddingVector vector;
    };

    std::string m_modelId;
    int m_dimensions = 0;
    std::map<int64_t, Entry> m_entries;
    bool m_failing = false;
    std::atomic<int> m_lastLimit{0};
    std::atomic<int> m_queries{0};
    mutable std::mutex m_mutex;
};

// Provider that answers from a text -> vector table, optionally failing a
// scripted number of calls first.
class FakeEmbeddingProvider : public EmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(std::string modelId = kModel, int dimensions = kDims);

    void setVector(const QString& text, std::vector<float> values);
    void failNext(ProviderErrorKind kind, int times = 1);

    int calls() const { return m_calls.load(); }

    std::string modelId() const override { return m_modelId; }
    int dimensions() const override { return m_dimensions; }

    EmbedResult embed(const QString& text) override;
    EmbedResult embedBatch(const std::vector<QString>& texts) override;

private:
    std::string m_modelId;
    int m_dimensions = 0;
    QHash<QString, std::vector<float>> m_vectors;
    std::deque<ProviderErrorKind> m_failures;
    std::atomic<int> m_calls{0};
    std::mutex m_mutex;
};

// Writes the item and its embedding to the store, and to the index when
// one is given.
bool seedItem(SQLiteStore& store, const CatalogItem& item, const EmbeddingVector& vector,
              FakeItemIndex* index = nullptr);

bool seedUser(SQLiteStore& store, const QString& userId,
              std::optional<int> maxParentalRating = std::nullopt);

} // namespace rp::test
