#include "core/embedding/embedding_client.h"
#include "core/shared/logging.h"

#include <QThread>

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <utility>

namespace rp {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool ProviderCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open: allow a half-open probe once the delay has passed
    if (steadyNowMs() - lastFailureTime.load() >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void ProviderCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void ProviderCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

EmbeddingClient::EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider,
                                 const Options& options)
    : m_provider(std::move(provider))
    , m_options(options)
    , m_outstanding(std::make_shared<std::atomic<int>>(0))
{
    m_options.maxAttempts = std::max(m_options.maxAttempts, 1);
    m_options.maxOutstandingCalls = std::max(m_options.maxOutstandingCalls, 1);
}

EmbeddingClient::~EmbeddingClient() = default;

std::string EmbeddingClient::modelId() const
{
    return m_provider ? m_provider->modelId() : std::string();
}

int EmbeddingClient::dimensions() const
{
    return m_provider ? m_provider->dimensions() : 0;
}

EmbedResult EmbeddingClient::embed(const QString& text)
{
    return callWithRetry({text});
}

EmbedResult EmbeddingClient::embedBatch(const std::vector<QString>& texts)
{
    if (texts.empty()) {
        return {};
    }
    return callWithRetry(texts);
}

uint32_t EmbeddingClient::backoffDelayMs(int retry) const
{
    uint64_t delay = m_options.backoffBaseMs;
    for (int i = 1; i < retry && delay < m_options.backoffMaxMs; ++i) {
        delay *= 2;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(delay, m_options.backoffMaxMs));
}

EmbedResult EmbeddingClient::callWithRetry(const std::vector<QString>& texts)
{
    if (!m_provider) {
        return EmbedResult::failure(ProviderErrorKind::Validation,
                                    QStringLiteral("embedding provider missing"));
    }

    EmbedResult last;
    for (int attempt = 1; attempt <= m_options.maxAttempts; ++attempt) {
        if (m_circuitBreaker.isOpen()) {
            LOG_WARN(rpTaste, "Embedding circuit open, skipping provider call");
            return EmbedResult::failure(ProviderErrorKind::Outage,
                                        QStringLiteral("embedding provider circuit open"));
        }

        last = checkShape(callOnce(texts), texts.size());
        if (last.ok()) {
            m_circuitBreaker.recordSuccess();
            return last;
        }

        const ProviderError& err = *last.error;
        if (!isRetryable(err.kind)) {
            LOG_WARN(rpTaste, "Embedding provider error (%s), not retrying: %s",
                     qUtf8Printable(providerErrorKindToString(err.kind)),
                     qUtf8Printable(err.message));
            return last;
        }

        m_circuitBreaker.recordFailure();
        if (attempt < m_options.maxAttempts) {
            const uint32_t delay = backoffDelayMs(attempt);
            LOG_INFO(rpTaste, "Embedding provider %s (attempt %d/%d), retrying in %u ms",
                     qUtf8Printable(providerErrorKindToString(err.kind)),
                     attempt, m_options.maxAttempts, delay);
            QThread::msleep(delay);
        }
    }

    LOG_WARN(rpTaste, "Embedding provider failed after %d attempts: %s",
             m_options.maxAttempts, qUtf8Printable(last.error->message));
    return last;
}

EmbedResult EmbeddingClient::callOnce(const std::vector<QString>& texts)
{
    // The call runs on its own thread so a hung provider cannot block the run
    // past the timeout. The thread keeps the provider alive until it returns.
    const int inFlight = m_outstanding->fetch_add(1);
    if (inFlight >= m_options.maxOutstandingCalls) {
        m_outstanding->fetch_sub(1);
        LOG_WARN(rpTaste, "Embedding provider has %d calls outstanding, not starting another",
                 inFlight);
        return EmbedResult::failure(
            ProviderErrorKind::Outage,
            QStringLiteral("embedding provider has %1 calls outstanding").arg(inFlight));
    }

    std::shared_ptr<EmbeddingProvider> provider = m_provider;
    auto task = std::make_shared<std::packaged_task<EmbedResult()>>([provider, texts]() {
        if (texts.size() == 1) {
            return provider->embed(texts.front());
        }
        return provider->embedBatch(texts);
    });
    std::future<EmbedResult> future = task->get_future();
    std::shared_ptr<std::atomic<int>> outstanding = m_outstanding;
    std::thread([task, outstanding]() {
        (*task)();
        outstanding->fetch_sub(1);
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(m_options.timeoutMs))
        != std::future_status::ready) {
        LOG_WARN(rpTaste, "Embedding provider timed out after %u ms (%d calls outstanding)",
                 m_options.timeoutMs, m_outstanding->load());
        return EmbedResult::failure(
            ProviderErrorKind::Outage,
            QStringLiteral("embedding provider timed out after %1 ms").arg(m_options.timeoutMs));
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return EmbedResult::failure(ProviderErrorKind::Outage,
                                    QStringLiteral("embedding provider threw: %1")
                                        .arg(QString::fromUtf8(e.what())));
    }
}

EmbedResult EmbeddingClient::checkShape(EmbedResult result, size_t expected) const
{
    if (!result.ok()) {
        return result;
    }
    if (result.vectors.size() != expected) {
        return EmbedResult::failure(
            ProviderErrorKind::Validation,
            QStringLiteral("provider returned %1 vectors for %2 inputs")
                .arg(result.vectors.size())
                .arg(expected));
    }
    const size_t dims = static_cast<size_t>(m_provider->dimensions());
    for (const auto& v : result.vectors) {
        if (v.size() != dims) {
            return EmbedResult::failure(
                ProviderErrorKind::Validation,
                QStringLiteral("provider returned dimension %1, expected %2")
                    .arg(v.size())
                    .arg(dims));
        }
    }
    return result;
}

RecError toRecError(const ProviderError& error)
{
    switch (error.kind) {
    case ProviderErrorKind::RateLimit:
        return RecError::make(RecErrorCode::ProviderRateLimit, error.message);
    case ProviderErrorKind::Auth:
        return RecError::make(RecErrorCode::ProviderAuth, error.message);
    case ProviderErrorKind::Validation:
        return RecError::make(RecErrorCode::ProviderValidation, error.message);
    case ProviderErrorKind::Outage:
        return RecError::make(RecErrorCode::ProviderOutage, error.message);
    }
    return RecError::make(RecErrorCode::ProviderOutage, error.message);
}

} // namespace rp
