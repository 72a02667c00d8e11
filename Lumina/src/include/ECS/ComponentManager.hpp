#pragma once

#include <ECS/ComponentPool.hpp>
#include <ECS/Entity.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace Lumina::ECS {

// ---------------------------------------------------------------------------
// ComponentManager: one ComponentPool per component type, keyed by
// std::type_index and created lazily on first use.
//
// Locking
// -------
//   m_poolsMutex guards the type → pool map. Each pool has its own lock.
//   Pools are never removed or replaced once created, so finding a pool only
//   needs a shared lock on the map even when the operation then writes to
//   the pool. Operations on different component types never contend.
//
// Scoped access
// -------------
//   WithComponent / WithComponentMut run the closure while holding the
//   pool's lock. The closure may touch other component types and resources,
//   but must NOT touch the same component type again: that deadlocks.
//
// Liveness
// --------
//   Nothing here checks whether an entity is alive. The World does that.
// ---------------------------------------------------------------------------
class ComponentManager {
public:
    ComponentManager() = default;

    ComponentManager(const ComponentManager&)            = delete;
    ComponentManager& operator=(const ComponentManager&) = delete;

    // Make sure a pool exists for T. No-op if it already does.
    template<typename T>
    void Register() {
        (void)EnsurePool<T>();
    }

    // Insert or overwrite entity's T. The null entity is ignored: its index
    // would size the sparse array to the whole index space.
    template<typename T>
    void AddComponent(Entity entity, T component) {
        if (!entity.IsValid()) return;
        ComponentPool<T>& pool = EnsurePool<T>();
        std::unique_lock<std::shared_mutex> lk(pool.Mutex());
        pool.Insert(entity, std::move(component));
    }

    // A copy of entity's T, or nullopt.
    template<typename T>
    [[nodiscard]] std::optional<T> GetComponent(Entity entity) const {
        return WithComponent<T>(entity, [](const T* c) -> std::optional<T> {
            if (!c) return std::nullopt;
            return *c;
        });
    }

    // fn(const T*) with nullptr when T is unregistered or absent.
    template<typename T, typename Fn>
    auto WithComponent(Entity entity, Fn&& fn) const
        -> std::invoke_result_t<Fn, const T*>
    {
        const ComponentPool<T>* pool = FindPool<T>();
        if (!pool) return fn(static_cast<const T*>(nullptr));
        std::shared_lock<std::shared_mutex> lk(pool->Mutex());
        return fn(pool->Find(entity));
    }

    // fn(T*) with nullptr when T is unregistered or absent. Holds T's write lock.
    template<typename T, typename Fn>
    auto WithComponentMut(Entity entity, Fn&& fn)
        -> std::invoke_result_t<Fn, T*>
    {
        ComponentPool<T>* pool = FindPool<T>();
        if (!pool) return fn(static_cast<T*>(nullptr));
        std::unique_lock<std::shared_mutex> lk(pool->Mutex());
        return fn(pool->Find(entity));
    }

    // Remove and return entity's T.
    template<typename T>
    std::optional<T> RemoveComponent(Entity entity) {
        ComponentPool<T>* pool = FindPool<T>();
        if (!pool) return std::nullopt;
        std::unique_lock<std::shared_mutex> lk(pool->Mutex());
        return pool->Take(entity);
    }

    template<typename T>
    [[nodiscard]] bool HasComponent(Entity entity) const {
        const ComponentPool<T>* pool = FindPool<T>();
        if (!pool) return false;
        std::shared_lock<std::shared_mutex> lk(pool->Mutex());
        return pool->Has(entity);
    }

    // Strip entity from every pool. Used by World::Despawn.
    void RemoveAllComponents(Entity entity);

    // fn(const ComponentPool<T>*) under T's read lock; nullptr if unregistered.
    template<typename T, typename Fn>
    auto WithStorage(Fn&& fn) const
        -> std::invoke_result_t<Fn, const ComponentPool<T>*>
    {
        const ComponentPool<T>* pool = FindPool<T>();
        if (!pool) return fn(static_cast<const ComponentPool<T>*>(nullptr));
        std::shared_lock<std::shared_mutex> lk(pool->Mutex());
        return fn(pool);
    }

    // fn(ComponentPool<T>*) under T's write lock; nullptr if unregistered.
    template<typename T, typename Fn>
    auto WithStorageMut(Fn&& fn)
        -> std::invoke_result_t<Fn, ComponentPool<T>*>
    {
        ComponentPool<T>* pool = FindPool<T>();
        if (!pool) return fn(static_cast<ComponentPool<T>*>(nullptr));
        std::unique_lock<std::shared_mutex> lk(pool->Mutex());
        return fn(pool);
    }

    // Clear every pool's rows. Pools stay registered.
    void Clear();

    [[nodiscard]] size_t RegisteredTypeCount() const;

private:
    // Returns the typed pool, or nullptr if T was never registered.
    template<typename T>
    [[nodiscard]] ComponentPool<T>* FindPool() const {
        std::shared_lock<std::shared_mutex> lk(m_poolsMutex);
        const auto it = m_pools.find(std::type_index(typeid(T)));
        return it != m_pools.end() ? it->second->template As<T>() : nullptr;
    }

    // Returns the typed pool, creating it if it does not exist yet.
    template<typename T>
    [[nodiscard]] ComponentPool<T>& EnsurePool() {
        if (ComponentPool<T>* existing = FindPool<T>()) return *existing;

        std::unique_lock<std::shared_mutex> lk(m_poolsMutex);
        auto [it, inserted] = m_pools.try_emplace(std::type_index(typeid(T)));
        if (inserted) it->second = std::make_unique<ComponentPool<T>>();
        return *it->second->template As<T>();
    }

    mutable std::shared_mutex m_poolsMutex;

    // One pool per component type, keyed by std::type_index.
    std::unordered_map<std::type_index, std::unique_ptr<IPool>> m_pools;
};

} // namespace Lumina::ECS
