#include "core/embedding/embedding_provider.h"

#include <utility>

namespace rp {

QString providerErrorKindToString(ProviderErrorKind kind)
{
    switch (kind) {
    case ProviderErrorKind::RateLimit:  return QStringLiteral("rate_limit");
    case ProviderErrorKind::Auth:       return QStringLiteral("auth");
    case ProviderErrorKind::Validation: return QStringLiteral("validation");
    case ProviderErrorKind::Outage:     return QStringLiteral("outage");
    }
    return QStringLiteral("outage");
}

bool isRetryable(ProviderErrorKind kind)
{
    return kind == ProviderErrorKind::RateLimit || kind == ProviderErrorKind::Outage;
}

DisabledEmbeddingProvider::DisabledEmbeddingProvider(std::string modelId, int dimensions)
    : m_modelId(std::move(modelId))
    , m_dimensions(dimensions)
{
}

EmbedResult DisabledEmbeddingProvider::embed(const QString& text)
{
    Q_UNUSED(text);
    return EmbedResult::failure(ProviderErrorKind::Validation,
                                QStringLiteral("no embedding provider configured"));
}

EmbedResult DisabledEmbeddingProvider::embedBatch(const std::vector<QString>& texts)
{
    Q_UNUSED(texts);
    return EmbedResult::failure(ProviderErrorKind::Validation,
                                QStringLiteral("no embedding provider configured"));
}

} // namespace rp
