#pragma once

#include <QByteArray>

#include <optional>
#include <string>
#include <vector>

namespace rp {

// A vector tagged with the model that produced it. Vectors from different
// models (or with different dimensions) are never compared.
struct EmbeddingVector {
    std::string modelId;
    int dimension = 0;
    std::vector<float> values;

    EmbeddingVector() = default;
    EmbeddingVector(std::string model, std::vector<float> data);

    bool isValid() const;
    bool isCompatibleWith(const EmbeddingVector& other) const;
    bool matchesModel(const std::string& model, int dims) const;

    double norm() const;
    EmbeddingVector normalized() const;
};

// Cosine similarity in [-1, 1]. nullopt when the vectors are incompatible
// or either has zero norm.
std::optional<double> cosineSimilarity(const EmbeddingVector& a, const EmbeddingVector& b);

// Scale to unit L2 norm. A zero vector is returned unchanged.
void normalizeInPlace(std::vector<float>& values);

// Raw little-endian float32 blob, as stored in SQLite.
QByteArray vectorToBlob(const std::vector<float>& values);
std::vector<float> vectorFromBlob(const void* data, int bytes);

} // namespace rp
