#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace rp {

class RunRegistry;

// Holds the in-flight slot for one (user, media type) until destroyed.
class RunSlot {
public:
    RunSlot(RunSlot&& other) noexcept;
    RunSlot& operator=(RunSlot&& other) noexcept;
    RunSlot(const RunSlot&) = delete;
    RunSlot& operator=(const RunSlot&) = delete;
    ~RunSlot();

    const QString& key() const { return m_key; }
    bool cancelRequested() const;

private:
    friend class RunRegistry;
    RunSlot(RunRegistry* registry, QString key, std::shared_ptr<std::atomic<bool>> cancel);

    RunRegistry* m_registry = nullptr;
    QString m_key;
    std::shared_ptr<std::atomic<bool>> m_cancel;
};

// Process-wide guard allowing at most one run per (user, media type), plus
// the cancellation flags those runs poll.
class RunRegistry {
public:
    RunRegistry() = default;
    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;

    static QString key(const QString& userId, MediaType type);

    // nullopt when the key is already held.
    std::optional<RunSlot> tryAcquire(const QString& userId, MediaType type);

    // Blocks up to timeoutMs for the current holder to finish.
    std::optional<RunSlot> acquire(const QString& userId, MediaType type, uint32_t timeoutMs);

    // Returns false when nothing is running for the key.
    bool requestCancel(const QString& userId, MediaType type);

    bool isActive(const QString& userId, MediaType type) const;
    int activeCount() const;

private:
    friend class RunSlot;
    void release(const QString& key);

    mutable std::mutex m_mutex;
    std::condition_variable m_released;
    QHash<QString, std::shared_ptr<std::atomic<bool>>> m_active;
};

} // namespace rp
