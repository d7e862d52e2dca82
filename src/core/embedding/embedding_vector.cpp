#include "core/embedding/embedding_vector.h"

#include <cmath>
#include <cstring>
#include <utility>

namespace rp {

EmbeddingVector::EmbeddingVector(std::string model, std::vector<float> data)
    : modelId(std::move(model))
    , dimension(static_cast<int>(data.size()))
    , values(std::move(data))
{
}

bool EmbeddingVector::isValid() const
{
    return !modelId.empty() && dimension > 0
        && static_cast<int>(values.size()) == dimension;
}

bool EmbeddingVector::isCompatibleWith(const EmbeddingVector& other) const
{
    return isValid() && other.isValid()
        && modelId == other.modelId && dimension == other.dimension;
}

bool EmbeddingVector::matchesModel(const std::string& model, int dims) const
{
    return isValid() && modelId == model && dimension == dims;
}

double EmbeddingVector::norm() const
{
    double sumSq = 0.0;
    for (float v : values) {
        sumSq += static_cast<double>(v) * static_cast<double>(v);
    }
    return std::sqrt(sumSq);
}

EmbeddingVector EmbeddingVector::normalized() const
{
    EmbeddingVector copy = *this;
    normalizeInPlace(copy.values);
    return copy;
}

std::optional<double> cosineSimilarity(const EmbeddingVector& a, const EmbeddingVector& b)
{
    if (!a.isCompatibleWith(b)) {
        return std::nullopt;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.values.size(); ++i) {
        const double x = a.values[i];
        const double y = b.values[i];
        dot += x * y;
        normA += x * x;
        normB += y * y;
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return std::nullopt;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

void normalizeInPlace(std::vector<float>& values)
{
    double sumSq = 0.0;
    for (float v : values) {
        sumSq += static_cast<double>(v) * static_cast<double>(v);
    }
    const double norm = std::sqrt(sumSq);
    if (norm <= 0.0 || !std::isfinite(norm)) {
        return;
    }
    for (float& v : values) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
}

QByteArray vectorToBlob(const std::vector<float>& values)
{
    return QByteArray(reinterpret_cast<const char*>(values.data()),
                      static_cast<int>(values.size() * sizeof(float)));
}

std::vector<float> vectorFromBlob(const void* data, int bytes)
{
    if (data == nullptr || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) {
        return {};
    }
    std::vector<float> values(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(values.data(), data, static_cast<size_t>(bytes));
    return values;
}

} // namespace rp
