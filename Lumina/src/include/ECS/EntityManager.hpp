#pragma once

#include <ECS/BitSet.hpp>
#include <ECS/Entity.hpp>

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace Lumina::ECS {

// ---------------------------------------------------------------------------
// EntityManager: allocates, recycles and tracks entity handles.
//
// State
// -----
//   m_nextIndex   : high-water mark: the next never-used index
//   m_freeList    : freed indices, reused last-in-first-out
//   m_alive       : liveness bitset, one bit per index
//   m_generations : generations[index], bumped on every Destroy
//
// Each of the three groups (counter, free list, liveness + generations) has
// its own reader/writer lock. Whenever a method holds more than one, it takes
// them in declaration order: counter, free list, liveness. Create() keeps the
// lock it drew the index from until the index is marked alive, and Destroy()
// clears the bit and pushes the index under both of its locks, so Clear()
// never observes an index that is in flight.
//
// Indices run up to UINT32_MAX - 1; the last value is NULL_ENTITY's.
// ---------------------------------------------------------------------------
class EntityManager {
public:
    explicit EntityManager(size_t initialCapacity = 0);

    EntityManager(const EntityManager&)            = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    // Reuse the most recently freed index if any, otherwise allocate a new one.
    [[nodiscard]] Entity Create();

    // Returns false (no-op) if the entity is not alive, stale handles included.
    bool Destroy(Entity entity);

    [[nodiscard]] bool IsAlive(Entity entity) const;

    [[nodiscard]] size_t AliveCount() const;

    // Snapshot of every live entity, ascending by index. Later Create/Destroy
    // calls never affect a returned vector.
    [[nodiscard]] std::vector<Entity> IterAlive() const;

    // Back to the empty state: index 0, no free list, no live entities.
    void Clear();

private:
    // Caller holds the free-list or counter lock that produced idx.
    Entity MarkAlive(uint32_t idx);

    mutable std::shared_mutex m_nextMutex;
    uint32_t                  m_nextIndex = 0;

    mutable std::shared_mutex m_freeMutex;
    std::vector<uint32_t>     m_freeList;

    mutable std::shared_mutex m_aliveMutex;
    BitSet                    m_alive;
    std::vector<uint32_t>     m_generations;
};

} // namespace Lumina::ECS
