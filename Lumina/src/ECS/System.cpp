#include <ECS/System.hpp>
#include <ECS/World.hpp>
#include <raylib.h>

namespace Lumina::ECS {

System& SystemSchedule::Add(std::unique_ptr<System> system)
{
    TraceLog(LOG_DEBUG, "ECS: scheduled system '%s' at slot %zu", system->Name(), m_systems.size());
    m_systems.push_back(std::move(system));
    return *m_systems.back();
}

void SystemSchedule::Init(World& world)
{
    for (auto& sys : m_systems) sys->Init(world);
}

void SystemSchedule::Run(World& world, float dt)
{
    for (auto& sys : m_systems) {
        if (!sys->IsEnabled()) continue;
        sys->Update(world, dt);
    }
}

void SystemSchedule::Shutdown(World& world)
{
    for (auto it = m_systems.rbegin(); it != m_systems.rend(); ++it)
        (*it)->Shutdown(world);
}

System* SystemSchedule::Find(const std::string& name) const
{
    for (const auto& sys : m_systems)
        if (name == sys->Name()) return sys.get();
    return nullptr;
}

} // namespace Lumina::ECS
