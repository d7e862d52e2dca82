#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace rp {

// Thread-safe wrapper around an hnswlib inner-product graph. Labels are
// catalog item ids; vectors are expected to be unit length, so
// similarity = 1 - distance.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;
        std::string modelId = "unknown";
    };

    using LabelFilter = std::function<bool(uint64_t)>;

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool configure(const IndexMetadata& metadata);
    bool create(int initialCapacity = kInitialCapacity);
    bool load(const std::string& indexPath, const std::string& metaPath);
    bool save(const std::string& indexPath, const std::string& metaPath);

    // Insert or replace the vector stored under label.
    bool addVector(uint64_t label, const float* embedding);
    bool deleteVector(uint64_t label);
    bool contains(uint64_t label) const;

    // Approximate k nearest neighbours, closest first. When allowed is set,
    // only labels it accepts are visited.
    std::vector<KnnResult> search(const float* queryVector, int k,
                                  const LabelFilter& allowed = nullptr);

    // Exact scan over the given labels, closest first. Labels not in the
    // index are skipped.
    std::vector<KnnResult> exactSearch(const float* queryVector, int k,
                                       const std::unordered_set<uint64_t>& labels);

    int totalElements() const;
    int deletedElements() const;
    bool isAvailable() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

private:
    bool ensureCapacityForOneMore();

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::unordered_set<uint64_t> m_liveLabels;
    std::unordered_set<uint64_t> m_deletedLabels;
    int m_deletedCount = 0;
    mutable std::mutex m_mutex;
};

} // namespace rp
