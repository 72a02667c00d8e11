#include <ECS/EntityManager.hpp>

#include <mutex>

#include <raylib.h>

namespace Lumina::ECS {

EntityManager::EntityManager(size_t initialCapacity)
{
    if (initialCapacity > 0) {
        m_freeList.reserve(initialCapacity);
        m_generations.reserve(initialCapacity);
        m_alive.Resize(initialCapacity);
    }
}

Entity EntityManager::Create()
{
    // Recycled index: the free-list lock is held until the index is marked
    // alive, so Clear() cannot run in between.
    {
        std::unique_lock<std::shared_mutex> freeLk(m_freeMutex);
        if (!m_freeList.empty()) {
            const uint32_t idx = m_freeList.back();
            m_freeList.pop_back();
            return MarkAlive(idx);
        }
    }

    // Fresh index: same for the counter lock.
    std::unique_lock<std::shared_mutex> nextLk(m_nextMutex);
    if (m_nextIndex == INVALID_INDEX) {
        // Index space exhausted; INVALID_INDEX belongs to NULL_ENTITY.
        TraceLog(LOG_FATAL, "ECS: entity index space exhausted");
        return NULL_ENTITY;
    }
    return MarkAlive(m_nextIndex++);
}

Entity EntityManager::MarkAlive(uint32_t idx)
{
    std::unique_lock<std::shared_mutex> lk(m_aliveMutex);
    if (idx >= m_generations.size())
        m_generations.resize(static_cast<size_t>(idx) + 1, 0u);
    m_alive.Set(idx);
    return Entity(idx, m_generations[idx]);
}

bool EntityManager::Destroy(Entity entity)
{
    const uint32_t idx = entity.Index();

    std::unique_lock<std::shared_mutex> freeLk (m_freeMutex);
    std::unique_lock<std::shared_mutex> aliveLk(m_aliveMutex);
    if (!m_alive.Get(idx) || m_generations[idx] != entity.Generation())
        return false;
    m_alive.Clear(idx);
    // Bump generation so the old handle becomes stale
    ++m_generations[idx];
    m_freeList.push_back(idx);
    return true;
}

bool EntityManager::IsAlive(Entity entity) const
{
    const uint32_t idx = entity.Index();
    std::shared_lock<std::shared_mutex> lk(m_aliveMutex);
    return m_alive.Get(idx) && m_generations[idx] == entity.Generation();
}

size_t EntityManager::AliveCount() const
{
    std::shared_lock<std::shared_mutex> lk(m_aliveMutex);
    return m_alive.Count();
}

std::vector<Entity> EntityManager::IterAlive() const
{
    std::shared_lock<std::shared_mutex> lk(m_aliveMutex);
    std::vector<Entity> out;
    out.reserve(m_alive.Count());
    m_alive.ForEachSetBit([&](size_t idx) {
        out.emplace_back(static_cast<uint32_t>(idx), m_generations[idx]);
    });
    return out;
}

void EntityManager::Clear()
{
    std::unique_lock<std::shared_mutex> nextLk (m_nextMutex);
    std::unique_lock<std::shared_mutex> freeLk (m_freeMutex);
    std::unique_lock<std::shared_mutex> aliveLk(m_aliveMutex);

    m_nextIndex = 0;
    m_freeList.clear();
    m_alive.ClearAll();
    m_generations.clear();
}

} // namespace Lumina::ECS
