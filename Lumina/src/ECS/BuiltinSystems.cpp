#include <ECS/BuiltinSystems.hpp>
#include <ECS/Components.hpp>
#include <ECS/World.hpp>
#include <Core/Time.hpp>
#include <raymath.h>
#include <vector>

namespace Lumina::ECS {

// ── Movement ─────────────────────────────────────────────────────────────────

void MovementSystem::Update(World& world, float dt)
{
    // Snapshot velocities first, then write transforms one entity at a time:
    // never holds two tables at once.
    for (const auto& row : world.Query<VelocityComponent>()) {
        const Vector3 step = Vector3Scale(row.second.linear, dt);
        world.WithComponentMut<TransformComponent>(row.first, [&step](TransformComponent* t) {
            if (t) t->position = Vector3Add(t->position, step);
        });
    }
}

// ── Lifetime ─────────────────────────────────────────────────────────────────

void LifetimeSystem::Update(World& world, float dt)
{
    std::vector<Entity> expired;
    world.Each<LifetimeComponent>([&](Entity e, LifetimeComponent& lt) {
        lt.remaining -= dt;
        if (lt.remaining <= 0.0f) expired.push_back(e);
    });
    for (const Entity e : expired) world.Despawn(e);
}

// ── Time ─────────────────────────────────────────────────────────────────────

void TimeSystem::Init(World& world)
{
    if (!world.HasResource<Core::Time>()) world.AddResource(Core::Time{});
}

void TimeSystem::Update(World& world, float dt)
{
    world.WithResourceMut<Core::Time>([dt](Core::Time* t) {
        if (t) t->Advance(dt);
    });
}

} // namespace Lumina::ECS
