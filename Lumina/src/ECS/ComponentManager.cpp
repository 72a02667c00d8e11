#include <ECS/ComponentManager.hpp>

#include <vector>

namespace Lumina::ECS {

namespace {

// Pools are never destroyed while the manager lives, so the raw pointers
// stay valid after the map lock is released. Pool locks must only be taken
// once the map lock is gone.
std::vector<IPool*> SnapshotPools(
    std::shared_mutex& mapMutex,
    const std::unordered_map<std::type_index, std::unique_ptr<IPool>>& pools)
{
    std::shared_lock<std::shared_mutex> lk(mapMutex);
    std::vector<IPool*> out;
    out.reserve(pools.size());
    for (const auto& [type, pool] : pools) out.push_back(pool.get());
    return out;
}

} // anonymous namespace

void ComponentManager::RemoveAllComponents(Entity entity)
{
    for (IPool* pool : SnapshotPools(m_poolsMutex, m_pools)) {
        std::unique_lock<std::shared_mutex> lk(pool->Mutex());
        pool->Remove(entity);
    }
}

void ComponentManager::Clear()
{
    for (IPool* pool : SnapshotPools(m_poolsMutex, m_pools)) {
        std::unique_lock<std::shared_mutex> lk(pool->Mutex());
        pool->Clear();
    }
}

size_t ComponentManager::RegisteredTypeCount() const
{
    std::shared_lock<std::shared_mutex> lk(m_poolsMutex);
    return m_pools.size();
}

} // namespace Lumina::ECS
