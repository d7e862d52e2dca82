#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/shared/errors.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace rp {

struct ProviderCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Wraps an EmbeddingProvider with a per-call timeout, exponential backoff
// for retryable errors and a circuit breaker. Safe to share across threads.
//
// A call that times out keeps running on its own thread until the provider
// returns. At most maxOutstandingCalls such threads exist per client; past
// that, calls fail fast with an outage instead of spawning more.
class EmbeddingClient {
public:
    struct Options {
        uint32_t timeoutMs = 30000;
        int maxAttempts = 4;
        uint32_t backoffBaseMs = 500;
        uint32_t backoffMaxMs = 8000;
        int maxOutstandingCalls = 4;
    };

    EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider, const Options& options);
    ~EmbeddingClient();

    EmbeddingClient(const EmbeddingClient&) = delete;
    EmbeddingClient& operator=(const EmbeddingClient&) = delete;

    EmbedResult embed(const QString& text);
    EmbedResult embedBatch(const std::vector<QString>& texts);

    std::string modelId() const;
    int dimensions() const;

    // Delay before the given retry (1-based), capped at backoffMaxMs.
    uint32_t backoffDelayMs(int retry) const;

    // Provider calls started and not yet returned, timed out ones included.
    int outstandingCalls() const { return m_outstanding->load(); }

    // Expose for testing
    ProviderCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    EmbedResult callWithRetry(const std::vector<QString>& texts);
    EmbedResult callOnce(const std::vector<QString>& texts);
    EmbedResult checkShape(EmbedResult result, size_t expected) const;

    std::shared_ptr<EmbeddingProvider> m_provider;
    Options m_options;
    ProviderCircuitBreaker m_circuitBreaker;
    // Shared with the call threads, which may outlive the client
    std::shared_ptr<std::atomic<int>> m_outstanding;
};

RecError toRecError(const ProviderError& error);

} // namespace rp
