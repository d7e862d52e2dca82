#include "core/vector/vector_index.h"

#include "hnswlib/hnswlib.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <limits>

namespace rp {

namespace {

constexpr int kMetaVersion = 1;

class LabelFilterFunctor : public hnswlib::BaseFilterFunctor {
public:
    explicit LabelFilterFunctor(const VectorIndex::LabelFilter& filter)
        : m_filter(filter)
    {
    }

    bool operator()(hnswlib::labeltype label) override
    {
        return m_filter(static_cast<uint64_t>(label));
    }

private:
    const VectorIndex::LabelFilter& m_filter;
};

float innerProductDistance(const float* a, const float* b, int dims)
{
    float dot = 0.0f;
    for (int i = 0; i < dims; ++i) {
        dot += a[i] * b[i];
    }
    return 1.0f - dot;
}

void sortByDistance(std::vector<VectorIndex::KnnResult>& results)
{
    std::sort(results.begin(), results.end(),
              [](const VectorIndex::KnnResult& a, const VectorIndex::KnnResult& b) {
                  if (a.distance != b.distance) {
                      return a.distance < b.distance;
                  }
                  return a.label < b.label;
              });
}

QJsonArray labelsToJson(const std::unordered_set<uint64_t>& labels)
{
    std::vector<uint64_t> sorted(labels.begin(), labels.end());
    std::sort(sorted.begin(), sorted.end());
    QJsonArray array;
    for (uint64_t label : sorted) {
        array.append(static_cast<qint64>(label));
    }
    return array;
}

std::unordered_set<uint64_t> labelsFromJson(const QJsonValue& value)
{
    std::unordered_set<uint64_t> labels;
    const QJsonArray array = value.toArray();
    labels.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& entry : array) {
        labels.insert(static_cast<uint64_t>(entry.toVariant().toULongLong()));
    }
    return labels;
}

} // namespace

VectorIndex::VectorIndex()
{
}

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex()
{
}

bool VectorIndex::configure(const IndexMetadata& metadata)
{
    if (m_index) {
        qWarning() << "VectorIndex::configure ignored: index already initialized";
        return false;
    }
    if (metadata.dimensions <= 0) {
        qWarning() << "VectorIndex::configure rejected invalid dimensions:" << metadata.dimensions;
        return false;
    }
    m_metadata = metadata;
    return true;
}

bool VectorIndex::create(int initialCapacity)
{
    if (m_metadata.dimensions <= 0) {
        qCritical() << "VectorIndex::create requires a positive runtime dimension";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_liveLabels.clear();
        m_deletedLabels.clear();
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::create failed:" << e.what();
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    QFileInfo indexInfo(QString::fromStdString(indexPath));
    if (!indexInfo.exists() || !indexInfo.isFile()) {
        qWarning() << "VectorIndex::load missing index file:" << indexInfo.filePath();
        return false;
    }

    // Truncated payloads make hnswlib read past the buffer; reject them up front.
    constexpr qint64 kMinSerializedIndexBytes = 96;
    if (indexInfo.size() < kMinSerializedIndexBytes) {
        qCritical() << "VectorIndex::load index payload too small:" << indexInfo.size();
        return false;
    }

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::ReadOnly)) {
        qCritical() << "VectorIndex::load failed to open meta file:" << metaFile.fileName();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        qCritical() << "VectorIndex::load invalid meta JSON:" << parseError.errorString();
        return false;
    }

    const QJsonObject meta = metaDoc.object();
    const int dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions <= 0) {
        qCritical() << "VectorIndex::load missing/invalid dimensions in metadata";
        return false;
    }
    if (m_metadata.dimensions > 0 && dimensions != m_metadata.dimensions) {
        qCritical() << "VectorIndex::load dimension mismatch:" << dimensions
                    << "expected" << m_metadata.dimensions;
        return false;
    }
    const std::string modelId =
        meta.value(QStringLiteral("model_id")).toString(QStringLiteral("unknown")).toStdString();
    if (m_metadata.modelId != "unknown" && modelId != m_metadata.modelId) {
        qWarning() << "VectorIndex::load model mismatch:" << QString::fromStdString(modelId)
                   << "expected" << QString::fromStdString(m_metadata.modelId);
        return false;
    }

    m_metadata.dimensions = dimensions;
    m_metadata.modelId = modelId;
    m_metadata.schemaVersion = meta.value(QStringLiteral("version")).toInt(kMetaVersion);

    std::unordered_set<uint64_t> labels = labelsFromJson(meta.value(QStringLiteral("labels")));
    std::unordered_set<uint64_t> deletedLabels =
        labelsFromJson(meta.value(QStringLiteral("deleted_labels")));

    uint64_t targetCapacity = static_cast<uint64_t>(kInitialCapacity);
    targetCapacity = std::max(
        targetCapacity, static_cast<uint64_t>(labels.size() + deletedLabels.size()) * 2);
    if (targetCapacity > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        qCritical() << "VectorIndex::load target capacity too large:" << targetCapacity;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_space.get());
        m_index->loadIndex(indexPath, m_space.get(), static_cast<size_t>(targetCapacity));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_liveLabels = std::move(labels);
        m_deletedLabels = std::move(deletedLabels);
        m_deletedCount = static_cast<int>(m_deletedLabels.size());
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::load failed:" << e.what();
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        qWarning() << "VectorIndex::save called with unavailable index";
        return false;
    }

    try {
        m_index->saveIndex(indexPath);
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::save failed to persist index:" << e.what();
        return false;
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("model_id"), QString::fromStdString(m_metadata.modelId));
    meta.insert(QStringLiteral("dimensions"), m_metadata.dimensions);
    meta.insert(QStringLiteral("labels"), labelsToJson(m_liveLabels));
    meta.insert(QStringLiteral("deleted_labels"), labelsToJson(m_deletedLabels));
    meta.insert(QStringLiteral("ef_construction"), kEfConstruction);
    meta.insert(QStringLiteral("m"), kM);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCritical() << "VectorIndex::save failed to open meta file for write:" << metaFile.fileName();
        return false;
    }

    const qint64 written = metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Compact));
    metaFile.close();
    if (written < 0) {
        qCritical() << "VectorIndex::save failed writing meta file:" << metaFile.fileName();
        return false;
    }
    return true;
}

bool VectorIndex::addVector(uint64_t label, const float* embedding)
{
    if (embedding == nullptr) {
        qWarning() << "VectorIndex::addVector called with null embedding";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        qWarning() << "VectorIndex::addVector called with unavailable index";
        return false;
    }
    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        // addPoint on a known label updates it in place and clears its delete mark
        const bool revived = m_deletedLabels.erase(label) > 0;
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        m_liveLabels.insert(label);
        if (revived) {
            --m_deletedCount;
        }
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::addVector failed:" << e.what();
        return false;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        qWarning() << "VectorIndex::deleteVector called with unavailable index";
        return false;
    }
    if (m_liveLabels.count(label) == 0) {
        return true;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        m_liveLabels.erase(label);
        m_deletedLabels.insert(label);
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::deleteVector failed:" << e.what();
        return false;
    }
}

bool VectorIndex::contains(uint64_t label) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_liveLabels.count(label) > 0;
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const float* queryVector, int k,
                                                        const LabelFilter& allowed)
{
    std::vector<KnnResult> results;
    if (queryVector == nullptr || k <= 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || m_liveLabels.empty()) {
        return results;
    }

    try {
        const size_t wanted = std::min(static_cast<size_t>(k), m_liveLabels.size());
        m_index->setEf(std::max(static_cast<size_t>(kEfSearch), wanted));

        std::priority_queue<std::pair<float, hnswlib::labeltype>> queue;
        if (allowed) {
            LabelFilterFunctor functor(allowed);
            queue = m_index->searchKnn(queryVector, wanted, &functor);
        } else {
            queue = m_index->searchKnn(queryVector, wanted);
        }

        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        sortByDistance(results);
        return results;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::search failed:" << e.what();
        return {};
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::exactSearch(
    const float* queryVector, int k, const std::unordered_set<uint64_t>& labels)
{
    std::vector<KnnResult> results;
    if (queryVector == nullptr || k <= 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        return results;
    }

    try {
        results.reserve(labels.size());
        for (uint64_t label : labels) {
            if (m_liveLabels.count(label) == 0) {
                continue;
            }
            const std::vector<float> stored =
                m_index->getDataByLabel<float>(static_cast<hnswlib::labeltype>(label));
            results.push_back(KnnResult{
                label, innerProductDistance(queryVector, stored.data(), m_metadata.dimensions)});
        }
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::exactSearch failed:" << e.what();
        return {};
    }

    sortByDistance(results);
    if (results.size() > static_cast<size_t>(k)) {
        results.resize(static_cast<size_t>(k));
    }
    return results;
}

int VectorIndex::totalElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_liveLabels.size());
}

int VectorIndex::deletedElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deletedCount;
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        qCritical() << "VectorIndex has zero max elements";
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        qCritical() << "VectorIndex resize overflow";
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        qDebug() << "VectorIndex resized to capacity" << static_cast<qulonglong>(newCapacity);
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex resize failed:" << e.what();
        return false;
    }
}

} // namespace rp
