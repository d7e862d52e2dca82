#include "core/runs/run_registry.h"

#include <chrono>
#include <utility>

namespace rp {

RunSlot::RunSlot(RunRegistry* registry, QString key, std::shared_ptr<std::atomic<bool>> cancel)
    : m_registry(registry)
    , m_key(std::move(key))
    , m_cancel(std::move(cancel))
{
}

RunSlot::RunSlot(RunSlot&& other) noexcept
    : m_registry(other.m_registry)
    , m_key(std::move(other.m_key))
    , m_cancel(std::move(other.m_cancel))
{
    other.m_registry = nullptr;
}

RunSlot& RunSlot::operator=(RunSlot&& other) noexcept
{
    if (this != &other) {
        if (m_registry) {
            m_registry->release(m_key);
        }
        m_registry = other.m_registry;
        m_key = std::move(other.m_key);
        m_cancel = std::move(other.m_cancel);
        other.m_registry = nullptr;
    }
    return *this;
}

RunSlot::~RunSlot()
{
    if (m_registry) {
        m_registry->release(m_key);
    }
}

bool RunSlot::cancelRequested() const
{
    return m_cancel && m_cancel->load();
}

QString RunRegistry::key(const QString& userId, MediaType type)
{
    return userId + QLatin1Char('|') + mediaTypeToString(type);
}

std::optional<RunSlot> RunRegistry::tryAcquire(const QString& userId, MediaType type)
{
    const QString k = key(userId, type);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active.contains(k)) {
        return std::nullopt;
    }
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    m_active.insert(k, cancel);
    return RunSlot(this, k, cancel);
}

std::optional<RunSlot> RunRegistry::acquire(const QString& userId, MediaType type,
                                            uint32_t timeoutMs)
{
    const QString k = key(userId, type);
    std::unique_lock<std::mutex> lock(m_mutex);
    const bool free = m_released.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                          [this, &k] { return !m_active.contains(k); });
    if (!free) {
        return std::nullopt;
    }
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    m_active.insert(k, cancel);
    return RunSlot(this, k, cancel);
}

bool RunRegistry::requestCancel(const QString& userId, MediaType type)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(key(userId, type));
    if (it == m_active.end()) {
        return false;
    }
    it.value()->store(true);
    return true;
}

bool RunRegistry::isActive(const QString& userId, MediaType type) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.contains(key(userId, type));
}

int RunRegistry::activeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_active.size());
}

void RunRegistry::release(const QString& k)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.remove(k);
    }
    m_released.notify_all();
}

} // namespace rp
