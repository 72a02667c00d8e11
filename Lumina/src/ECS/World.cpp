#include <ECS/World.hpp>
#include <raylib.h>

namespace Lumina::ECS {

// ── EntityBuilder ────────────────────────────────────────────────────────────

Entity EntityBuilder::Build()
{
    for (auto& pending : m_pending)
        pending->Apply(*m_world, m_entity);
    m_pending.clear();
    return m_entity;
}

// ── World ────────────────────────────────────────────────────────────────────

World::World(const Core::WorldConfig& config)
    : m_config(config)
    , m_entities(std::make_shared<EntityManager>(config.initialEntityCapacity))
    , m_components(std::make_shared<ComponentManager>())
    , m_resources(std::make_shared<ResourceManager>())
{
    TraceLog(LOG_DEBUG, "ECS: world created (capacity %u)", config.initialEntityCapacity);
}

World::~World() = default;

Entity World::CreateEntity()
{
    const Entity e = m_entities->Create();
    if (m_config.logLifecycle)
        TraceLog(LOG_DEBUG, "ECS: spawned entity %u (gen %u)", e.Index(), e.Generation());
    return e;
}

EntityBuilder World::Spawn()
{
    return EntityBuilder(*this, CreateEntity());
}

bool World::Despawn(Entity entity)
{
    if (!m_entities->Destroy(entity)) return false;
    m_components->RemoveAllComponents(entity);
    if (m_config.logLifecycle)
        TraceLog(LOG_DEBUG, "ECS: despawned entity %u (gen %u)", entity.Index(), entity.Generation());
    return true;
}

void World::Clear()
{
    const size_t dropped = m_entities->AliveCount();
    m_entities->Clear();
    m_components->Clear();
    m_resources->Clear();
    TraceLog(LOG_INFO, "ECS: world cleared (%zu entities dropped)", dropped);
}

} // namespace Lumina::ECS
