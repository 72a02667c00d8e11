#pragma once

#include <Core/Config.hpp>
#include <ECS/ComponentManager.hpp>
#include <ECS/Entity.hpp>
#include <ECS/EntityManager.hpp>
#include <ECS/ResourceManager.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Lumina::ECS {

class World;

// ---------------------------------------------------------------------------
// EntityBuilder: returned by World::Spawn().
//
// The entity is already alive when the builder is handed out; components
// given to With() are boxed and attached by Build(), in call order:
//
//   Entity e = world.Spawn()
//                   .With(TransformComponent{})
//                   .With(TagComponent{"crate"})
//                   .Build();
//
// Dropping a builder without Build() leaves a live entity with no components.
// ---------------------------------------------------------------------------
class EntityBuilder {
public:
    EntityBuilder(World& world, Entity entity) : m_world(&world), m_entity(entity) {}

    EntityBuilder(EntityBuilder&&) noexcept            = default;
    EntityBuilder& operator=(EntityBuilder&&) noexcept = default;

    template<typename T>
    EntityBuilder& With(T component) {
        m_pending.push_back(std::make_unique<PendingComponentOf<T>>(std::move(component)));
        return *this;
    }

    // Attach every pending component and return the entity.
    Entity Build();

    [[nodiscard]] Entity GetEntity()    const noexcept { return m_entity; }
    [[nodiscard]] size_t PendingCount() const noexcept { return m_pending.size(); }

private:
    struct PendingComponent {
        virtual ~PendingComponent() = default;
        virtual void Apply(World& world, Entity entity) = 0;
    };

    template<typename T>
    struct PendingComponentOf final : PendingComponent {
        explicit PendingComponentOf(T v) : value(std::move(v)) {}
        void Apply(World& world, Entity entity) override;
        T value;
    };

    World*                                         m_world;
    Entity                                         m_entity;
    std::vector<std::unique_ptr<PendingComponent>> m_pending;
};

// ---------------------------------------------------------------------------
// World: the only ECS object outer code talks to.
//
// Owns one EntityManager, ComponentManager and ResourceManager through
// shared_ptr; the World itself is usually held in a shared_ptr (WorldPtr)
// and handed to every system, including ones running on worker threads.
//
// Liveness invariant
// ------------------
//   Components exist only on live entities. Every entity-keyed call checks
//   IsAlive() first and, for a dead entity, behaves as if the component were
//   absent without touching the component manager. Despawn() destroys the
//   entity and then strips all its components.
//
// Absence is data
// ---------------
//   Missing entities, components and resources come back as nullptr,
//   nullopt or false. Nothing here throws.
//
// Concurrency
// -----------
//   Each table and each resource has its own lock (see ComponentManager and
//   ResourceManager). A closure passed to WithComponentMut<T> / Each<T> runs
//   under T's write lock: it must not touch T again and must not Despawn.
//   Touching other component types or resources from inside is fine.
// ---------------------------------------------------------------------------
class World {
public:
    explicit World(const Core::WorldConfig& config = {});
    ~World();

    World(const World&)            = delete;
    World& operator=(const World&) = delete;

    // -----------------------------------------------------------------------
    // Entity lifecycle
    // -----------------------------------------------------------------------

    [[nodiscard]] EntityBuilder Spawn();

    // Spawn and attach a single component.
    template<typename T>
    Entity SpawnWith(T component) {
        const Entity e = CreateEntity();
        m_components->AddComponent<T>(e, std::move(component));
        return e;
    }

    // Destroy entity and drop all its components. False if it was not alive.
    bool Despawn(Entity entity);

    [[nodiscard]] bool IsAlive(Entity entity) const { return m_entities->IsAlive(entity); }

    // -----------------------------------------------------------------------
    // Component API (liveness-gated)
    // -----------------------------------------------------------------------

    // Insert or overwrite. Returns false (no-op) for a dead entity.
    template<typename T>
    bool AddComponent(Entity entity, T component) {
        if (!m_entities->IsAlive(entity)) return false;
        m_components->AddComponent<T>(entity, std::move(component));
        return true;
    }

    template<typename T>
    [[nodiscard]] std::optional<T> GetComponent(Entity entity) const {
        if (!m_entities->IsAlive(entity)) return std::nullopt;
        return m_components->GetComponent<T>(entity);
    }

    template<typename T, typename Fn>
    auto WithComponent(Entity entity, Fn&& fn) const -> std::invoke_result_t<Fn, const T*> {
        if (!m_entities->IsAlive(entity)) return fn(static_cast<const T*>(nullptr));
        return m_components->WithComponent<T>(entity, std::forward<Fn>(fn));
    }

    template<typename T, typename Fn>
    auto WithComponentMut(Entity entity, Fn&& fn) -> std::invoke_result_t<Fn, T*> {
        if (!m_entities->IsAlive(entity)) return fn(static_cast<T*>(nullptr));
        return m_components->WithComponentMut<T>(entity, std::forward<Fn>(fn));
    }

    template<typename T>
    std::optional<T> RemoveComponent(Entity entity) {
        if (!m_entities->IsAlive(entity)) return std::nullopt;
        return m_components->RemoveComponent<T>(entity);
    }

    template<typename T>
    [[nodiscard]] bool HasComponent(Entity entity) const {
        return m_entities->IsAlive(entity) && m_components->HasComponent<T>(entity);
    }

    // -----------------------------------------------------------------------
    // Resources (no entity, no liveness)
    // -----------------------------------------------------------------------

    template<typename T>
    void AddResource(T resource) { m_resources->Add<T>(std::move(resource)); }

    template<typename T, typename Fn>
    auto WithResource(Fn&& fn) const -> std::invoke_result_t<Fn, const T*> {
        return m_resources->WithResource<T>(std::forward<Fn>(fn));
    }

    template<typename T, typename Fn>
    auto WithResourceMut(Fn&& fn) -> std::invoke_result_t<Fn, T*> {
        return m_resources->WithResourceMut<T>(std::forward<Fn>(fn));
    }

    template<typename T>
    [[nodiscard]] std::optional<T> GetResource() const { return m_resources->Get<T>(); }

    template<typename T>
    std::optional<T> RemoveResource() { return m_resources->Remove<T>(); }

    template<typename T>
    [[nodiscard]] bool HasResource() const { return m_resources->Has<T>(); }

    // -----------------------------------------------------------------------
    // Querying
    // -----------------------------------------------------------------------

    // Query<T>(): copy of every (entity, T) whose entity is alive right now.
    // Holds T's read lock only while copying.
    template<typename T>
    [[nodiscard]] std::vector<std::pair<Entity, T>> Query() const {
        return m_components->WithStorage<T>([this](const ComponentPool<T>* pool) {
            std::vector<std::pair<Entity, T>> out;
            if (!pool) return out;
            out.reserve(pool->Size());
            pool->ForEach([&](Entity e, const T& c) {
                if (m_entities->IsAlive(e)) out.emplace_back(e, c);
            });
            return out;
        });
    }

    // QueryAll<A, B, ...>(): entities that hold every listed type, built by
    // intersecting single-type snapshots. Each type is locked on its own, so
    // the rows can come from slightly different moments.
    template<typename First, typename Second, typename... Rest>
    [[nodiscard]] std::vector<std::tuple<Entity, First, Second, Rest...>> QueryAll() const {
        auto lookups = std::make_tuple(QueryMap<Second>(), QueryMap<Rest>()...);
        std::vector<std::tuple<Entity, First, Second, Rest...>> out;

        for (auto& row : Query<First>()) {
            const Entity e = row.first;
            const bool inAll = std::apply([e](const auto&... m) {
                return ((m.find(e) != m.end()) && ...);
            }, lookups);
            if (!inAll) continue;

            std::apply([&](auto&... m) {
                out.emplace_back(e, std::move(row.second), std::move(m.find(e)->second)...);
            }, lookups);
        }
        return out;
    }

    // Each<T>(fn): calls fn(Entity, T&) for every live entity holding T,
    // under T's write lock. Collect entities to despawn and do it afterwards.
    template<typename T, typename Fn>
    void Each(Fn&& fn) {
        m_components->WithStorageMut<T>([&](ComponentPool<T>* pool) {
            if (!pool) return;
            pool->ForEach([&](Entity e, T& c) {
                if (m_entities->IsAlive(e)) fn(e, c);
            });
        });
    }

    // Number of live entities holding T.
    template<typename T>
    [[nodiscard]] size_t CountOf() const {
        return m_components->WithStorage<T>([this](const ComponentPool<T>* pool) {
            size_t n = 0;
            if (!pool) return n;
            for (const Entity e : pool->Entities())
                if (m_entities->IsAlive(e)) ++n;
            return n;
        });
    }

    // -----------------------------------------------------------------------
    // Whole-world
    // -----------------------------------------------------------------------

    [[nodiscard]] size_t              EntityCount()  const { return m_entities->AliveCount(); }
    [[nodiscard]] std::vector<Entity> IterEntities() const { return m_entities->IterAlive(); }

    // Drop every entity, component row and resource.
    void Clear();

    [[nodiscard]] EntityManager&          Entities()         noexcept { return *m_entities; }
    [[nodiscard]] const EntityManager&    Entities()   const noexcept { return *m_entities; }
    [[nodiscard]] ComponentManager&       Components()       noexcept { return *m_components; }
    [[nodiscard]] const ComponentManager& Components() const noexcept { return *m_components; }
    [[nodiscard]] ResourceManager&        Resources()        noexcept { return *m_resources; }
    [[nodiscard]] const ResourceManager&  Resources()  const noexcept { return *m_resources; }
    [[nodiscard]] const Core::WorldConfig& Config()    const noexcept { return m_config; }

private:
    [[nodiscard]] Entity CreateEntity();

    template<typename T>
    [[nodiscard]] std::unordered_map<Entity, T> QueryMap() const {
        std::unordered_map<Entity, T> out;
        for (auto& row : Query<T>()) out.emplace(row.first, std::move(row.second));
        return out;
    }

    Core::WorldConfig                 m_config;
    std::shared_ptr<EntityManager>    m_entities;
    std::shared_ptr<ComponentManager> m_components;
    std::shared_ptr<ResourceManager>  m_resources;
};

using WorldPtr = std::shared_ptr<World>;

template<typename T>
void EntityBuilder::PendingComponentOf<T>::Apply(World& world, Entity entity)
{
    world.AddComponent<T>(entity, std::move(value));
}

} // namespace Lumina::ECS
