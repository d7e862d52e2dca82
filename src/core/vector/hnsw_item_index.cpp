#include "core/vector/hnsw_item_index.h"
#include "core/shared/logging.h"

#include <QDir>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace rp {

HnswItemIndex::HnswItemIndex(std::string modelId, int dimensions)
    : m_modelId(std::move(modelId))
    , m_dimensions(dimensions)
{
    VectorIndex::IndexMetadata metadata;
    metadata.modelId = m_modelId;
    metadata.dimensions = m_dimensions;
    m_index = std::make_unique<VectorIndex>(metadata);
}

HnswItemIndex::~HnswItemIndex() = default;

bool HnswItemIndex::open(const QString& dbPath)
{
    std::lock_guard<std::mutex> lock(m_storeMutex);
    m_store = SQLiteStore::open(dbPath);
    if (!m_store) {
        LOG_ERROR(rpRetrieval, "Failed to open catalog at %s", qUtf8Printable(dbPath));
        return false;
    }
    return true;
}

QString HnswItemIndex::indexPath(const QString& indexDir) const
{
    return QDir(indexDir).filePath(
        QStringLiteral("items-%1.hnsw").arg(QString::fromStdString(m_modelId)));
}

QString HnswItemIndex::metaPath(const QString& indexDir) const
{
    return QDir(indexDir).filePath(
        QStringLiteral("items-%1.meta.json").arg(QString::fromStdString(m_modelId)));
}

bool HnswItemIndex::loadOrRebuild(const QString& indexDir)
{
    if (!indexDir.isEmpty()
        && m_index->load(indexPath(indexDir).toStdString(), metaPath(indexDir).toStdString())) {
        LOG_INFO(rpRetrieval, "Loaded item index (%d vectors)", m_index->totalElements());
        return true;
    }
    return rebuildFromStore();
}

bool HnswItemIndex::rebuildFromStore()
{
    std::vector<std::pair<int64_t, std::vector<float>>> rows;
    {
        std::lock_guard<std::mutex> lock(m_storeMutex);
        if (!m_store) {
            LOG_ERROR(rpRetrieval, "Item index rebuild requires an open catalog");
            return false;
        }
        rows = m_store->listItemEmbeddings(m_modelId, m_dimensions);
    }

    auto fresh = std::make_unique<VectorIndex>(m_index->metadata());
    const int capacity = std::max(static_cast<int>(rows.size()) * 2,
                                  VectorIndex::kInitialCapacity);
    if (!fresh->create(capacity)) {
        return false;
    }

    int added = 0;
    for (auto& row : rows) {
        normalizeInPlace(row.second);
        if (fresh->addVector(static_cast<uint64_t>(row.first), row.second.data())) {
            ++added;
        }
    }
    m_index = std::move(fresh);
    LOG_INFO(rpRetrieval, "Rebuilt item index for %s: %d/%d vectors",
             m_modelId.c_str(), added, static_cast<int>(rows.size()));
    return added == static_cast<int>(rows.size());
}

bool HnswItemIndex::save(const QString& indexDir)
{
    if (!QDir().mkpath(indexDir)) {
        LOG_WARN(rpRetrieval, "Cannot create index directory %s", qUtf8Printable(indexDir));
        return false;
    }
    return m_index->save(indexPath(indexDir).toStdString(), metaPath(indexDir).toStdString());
}

bool HnswItemIndex::upsert(int64_t itemId, const EmbeddingVector& vector)
{
    if (!vector.matchesModel(m_modelId, m_dimensions)) {
        LOG_WARN(rpRetrieval, "Refusing %s vector for item %lld in %s index",
                 vector.modelId.c_str(), static_cast<long long>(itemId), m_modelId.c_str());
        return false;
    }
    if (!m_index->isAvailable() && !m_index->create()) {
        return false;
    }
    const EmbeddingVector unit = vector.normalized();
    return m_index->addVector(static_cast<uint64_t>(itemId), unit.values.data());
}

bool HnswItemIndex::remove(int64_t itemId)
{
    return m_index->deleteVector(static_cast<uint64_t>(itemId));
}

int HnswItemIndex::vectorCount() const
{
    return m_index->totalElements();
}

std::optional<std::vector<Neighbor>> HnswItemIndex::nearestNeighbors(
    const EmbeddingVector& query, const CandidateFilter& filter, int limit)
{
    if (!query.matchesModel(m_modelId, m_dimensions)) {
        LOG_WARN(rpRetrieval, "Query vector from %s does not match index model %s",
                 query.modelId.c_str(), m_modelId.c_str());
        return std::nullopt;
    }

    std::vector<Neighbor> neighbors;
    if (limit <= 0 || !m_index->isAvailable()) {
        return neighbors;
    }

    const EmbeddingVector unit = query.normalized();
    std::vector<VectorIndex::KnnResult> hits;

    if (filter.isUnconstrained()) {
        hits = m_index->search(unit.values.data(), limit);
    } else {
        std::unordered_set<uint64_t> allowed;
        {
            std::lock_guard<std::mutex> lock(m_storeMutex);
            if (!m_store) {
                LOG_ERROR(rpRetrieval, "Filtered lookup requires an open catalog");
                return std::nullopt;
            }
            for (int64_t id : m_store->itemIdsMatching(filter)) {
                allowed.insert(static_cast<uint64_t>(id));
            }
        }
        if (allowed.empty()) {
            return neighbors;
        }

        if (static_cast<int>(allowed.size()) <= kExactScanThreshold) {
            hits = m_index->exactSearch(unit.values.data(), limit, allowed);
        } else {
            hits = m_index->search(unit.values.data(), limit, [&allowed](uint64_t label) {
                return allowed.count(label) > 0;
            });
        }
    }

    neighbors.reserve(hits.size());
    for (const VectorIndex::KnnResult& hit : hits) {
        neighbors.push_back(Neighbor{static_cast<int64_t>(hit.label),
                                     1.0 - static_cast<double>(hit.distance)});
    }
    return neighbors;
}

} // namespace rp
