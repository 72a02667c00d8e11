#include <ECS/ResourceManager.hpp>

namespace Lumina::ECS {

void ResourceManager::Clear()
{
    std::unordered_map<std::type_index, std::shared_ptr<IResourceSlot>> dropped;
    {
        std::unique_lock<std::shared_mutex> lk(m_mutex);
        dropped.swap(m_resources);
    }
    // Resource destructors run here, outside the map lock.
}

size_t ResourceManager::Count() const
{
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return m_resources.size();
}

} // namespace Lumina::ECS
