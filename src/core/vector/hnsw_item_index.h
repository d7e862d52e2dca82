#pragma once

#include "core/index/sqlite_store.h"
#include "core/vector/item_index.h"
#include "core/vector/vector_index.h"

#include <QString>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rp {

// ItemIndex backed by an hnswlib graph over item_embeddings. Filters are
// evaluated in SQL against a private connection and pushed into the graph
// walk as an allowed-label set.
class HnswItemIndex : public ItemIndex {
public:
    // Allowed sets up to this size are scanned exactly instead of walking
    // the graph, which can miss neighbours when most labels are filtered.
    static constexpr int kExactScanThreshold = 4096;

    HnswItemIndex(std::string modelId, int dimensions);
    ~HnswItemIndex() override;

    HnswItemIndex(const HnswItemIndex&) = delete;
    HnswItemIndex& operator=(const HnswItemIndex&) = delete;

    // Opens the catalog connection used for filter pushdown.
    bool open(const QString& dbPath);

    // Load a previously saved graph from indexDir, or rebuild it from the
    // item_embeddings table when none is usable. Not safe to call while
    // other threads are querying.
    bool loadOrRebuild(const QString& indexDir);
    bool rebuildFromStore();
    bool save(const QString& indexDir);

    bool upsert(int64_t itemId, const EmbeddingVector& vector);
    bool remove(int64_t itemId);

    std::string modelId() const override { return m_modelId; }
    int dimensions() const override { return m_dimensions; }

    std::optional<std::vector<Neighbor>> nearestNeighbors(
        const EmbeddingVector& query, const CandidateFilter& filter, int limit) override;

    bool supportsExclusion() const override { return true; }
    int vectorCount() const override;

private:
    QString indexPath(const QString& indexDir) const;
    QString metaPath(const QString& indexDir) const;

    std::string m_modelId;
    int m_dimensions = 0;
    std::unique_ptr<VectorIndex> m_index;
    std::optional<SQLiteStore> m_store;
    std::mutex m_storeMutex;
};

} // namespace rp
