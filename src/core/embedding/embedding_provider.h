#pragma once

#include <QString>

#include <optional>
#include <string>
#include <vector>

namespace rp {

enum class ProviderErrorKind {
    RateLimit,
    Auth,
    Validation,
    Outage,
};

QString providerErrorKindToString(ProviderErrorKind kind);

// Only rate limits and outages are worth another attempt.
bool isRetryable(ProviderErrorKind kind);

struct ProviderError {
    ProviderErrorKind kind = ProviderErrorKind::Outage;
    QString message;
};

struct EmbedResult {
    std::vector<std::vector<float>> vectors;
    std::optional<ProviderError> error;

    bool ok() const { return !error.has_value(); }

    static EmbedResult failure(ProviderErrorKind kind, const QString& message)
    {
        EmbedResult result;
        result.error = ProviderError{kind, message};
        return result;
    }
};

// External embedding model. Implementations may block on the network and
// are called from worker threads.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::string modelId() const = 0;
    virtual int dimensions() const = 0;

    virtual EmbedResult embed(const QString& text) = 0;
    virtual EmbedResult embedBatch(const std::vector<QString>& texts) = 0;
};

// Used when no provider is configured. Every call fails with a validation
// error, so runs that need a fresh embedding fail without retrying.
class DisabledEmbeddingProvider : public EmbeddingProvider {
public:
    DisabledEmbeddingProvider(std::string modelId, int dimensions);

    std::string modelId() const override { return m_modelId; }
    int dimensions() const override { return m_dimensions; }

    EmbedResult embed(const QString& text) override;
    EmbedResult embedBatch(const std::vector<QString>& texts) override;

private:
    std::string m_modelId;
    int m_dimensions = 0;
};

} // namespace rp
