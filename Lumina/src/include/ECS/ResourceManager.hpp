#pragma once

#include <cstddef>
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
// IResourceSlot: type-erased holder for one resource value.
//
// Each slot has its own reader/writer lock. The value is kept in an
// optional so Remove() can move it out while a reader that already grabbed
// the slot sees an empty one instead of a dangling value.
// ---------------------------------------------------------------------------
struct IResourceSlot {
    virtual ~IResourceSlot() = default;
    virtual std::type_index Type() const = 0;

    [[nodiscard]] std::shared_mutex& Mutex() const noexcept { return m_mutex; }

private:
    mutable std::shared_mutex m_mutex;
};

template<typename T>
struct ResourceSlot final : IResourceSlot {
    explicit ResourceSlot(T v) : value(std::move(v)) {}

    [[nodiscard]] std::type_index Type() const override {
        return std::type_index(typeid(T));
    }

    std::optional<T> value;
};

// ---------------------------------------------------------------------------
// ResourceManager: at most one value per type, shared by the whole World.
//
// Typical residents: frame timing, input state, configuration, renderer or
// window handles owned by outer code.
//
// Add() silently replaces an existing resource of the same type. Systems
// that share a resource type must agree on who owns it.
//
// The map lock is held only to find / swap slots, never while a closure
// runs, so a WithResource closure may touch other resources and component
// tables. It must not touch the same resource again from inside a
// WithResourceMut closure (deadlock).
// ---------------------------------------------------------------------------
class ResourceManager {
public:
    ResourceManager() = default;

    ResourceManager(const ResourceManager&)            = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // Insert T, replacing any previous T.
    template<typename T>
    void Add(T resource) {
        auto slot = std::make_shared<ResourceSlot<T>>(std::move(resource));
        std::shared_ptr<IResourceSlot> previous; // destroyed after the lock drops
        {
            std::unique_lock<std::shared_mutex> lk(m_mutex);
            auto& entry = m_resources[std::type_index(typeid(T))];
            previous = std::move(entry);
            entry    = std::move(slot);
        }
    }

    // fn(const T*) with nullptr when there is no T.
    template<typename T, typename Fn>
    auto WithResource(Fn&& fn) const -> std::invoke_result_t<Fn, const T*> {
        const std::shared_ptr<ResourceSlot<T>> slot = FindSlot<T>();
        if (!slot) return fn(static_cast<const T*>(nullptr));
        std::shared_lock<std::shared_mutex> lk(slot->Mutex());
        const T* value = slot->value ? &*slot->value : nullptr;
        return fn(value);
    }

    // fn(T*) with nullptr when there is no T. Holds T's write lock.
    template<typename T, typename Fn>
    auto WithResourceMut(Fn&& fn) -> std::invoke_result_t<Fn, T*> {
        const std::shared_ptr<ResourceSlot<T>> slot = FindSlot<T>();
        if (!slot) return fn(static_cast<T*>(nullptr));
        std::unique_lock<std::shared_mutex> lk(slot->Mutex());
        T* value = slot->value ? &*slot->value : nullptr;
        return fn(value);
    }

    // A copy of the current T, or nullopt.
    template<typename T>
    [[nodiscard]] std::optional<T> Get() const {
        return WithResource<T>([](const T* r) -> std::optional<T> {
            if (!r) return std::nullopt;
            return *r;
        });
    }

    // Remove and return T.
    template<typename T>
    std::optional<T> Remove() {
        std::shared_ptr<IResourceSlot> erased;
        {
            std::unique_lock<std::shared_mutex> lk(m_mutex);
            auto it = m_resources.find(std::type_index(typeid(T)));
            if (it == m_resources.end()) return std::nullopt;
            erased = std::move(it->second);
            m_resources.erase(it);
        }

        auto slot = std::static_pointer_cast<ResourceSlot<T>>(erased);
        std::unique_lock<std::shared_mutex> lk(slot->Mutex());
        std::optional<T> out = std::move(slot->value);
        slot->value.reset();
        return out;
    }

    template<typename T>
    [[nodiscard]] bool Has() const {
        std::shared_lock<std::shared_mutex> lk(m_mutex);
        return m_resources.find(std::type_index(typeid(T))) != m_resources.end();
    }

    // Drop every resource.
    void Clear();

    [[nodiscard]] size_t Count() const;

private:
    template<typename T>
    [[nodiscard]] std::shared_ptr<ResourceSlot<T>> FindSlot() const {
        std::shared_lock<std::shared_mutex> lk(m_mutex);
        const auto it = m_resources.find(std::type_index(typeid(T)));
        if (it == m_resources.end() || it->second->Type() != std::type_index(typeid(T)))
            return nullptr;
        return std::static_pointer_cast<ResourceSlot<T>>(it->second);
    }

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::type_index, std::shared_ptr<IResourceSlot>> m_resources;
};

} // namespace Lumina::ECS
