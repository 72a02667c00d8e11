#pragma once

#include <ECS/Entity.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace Lumina::ECS {

template<typename T> class ComponentPool;

// ---------------------------------------------------------------------------
// IPool: type-erased base for ComponentPool<T>.
//
// Held by the ComponentManager so it can call Remove / Clear on any pool
// without knowing the concrete component type at compile time, and cast
// back to the typed pool once the caller names T.
//
// Each pool carries its own reader/writer lock. The pool methods do not
// take it; the ComponentManager does, around every access.
// ---------------------------------------------------------------------------
struct IPool {
    virtual ~IPool() = default;

    // Remove the row owned by entity (no-op if absent). True if a row went.
    virtual bool Remove(Entity entity) = 0;

    // Wipe all rows.
    virtual void Clear() = 0;

    // Number of rows in the pool, orphaned rows included.
    virtual size_t Size() const = 0;

    // Dynamic type of the stored components.
    virtual std::type_index Type() const = 0;

    // Checked downcast: nullptr if this pool does not store T.
    template<typename T>
    [[nodiscard]] ComponentPool<T>* As() noexcept {
        return Type() == std::type_index(typeid(T))
            ? static_cast<ComponentPool<T>*>(this)
            : nullptr;
    }
    template<typename T>
    [[nodiscard]] const ComponentPool<T>* As() const noexcept {
        return Type() == std::type_index(typeid(T))
            ? static_cast<const ComponentPool<T>*>(this)
            : nullptr;
    }

    [[nodiscard]] std::shared_mutex& Mutex() const noexcept { return m_mutex; }

private:
    mutable std::shared_mutex m_mutex;
};

// ---------------------------------------------------------------------------
// ComponentPool<T>: sparse-set storage for a single component type.
//
// Internals
// ---------
//   m_sparse : indexed by entity index; stores the dense position or EMPTY.
//   m_dense  : packed array of full entity handles (parallel to m_data).
//   m_data   : packed array of T (parallel to m_dense).
//
// A slot holds at most one row per entity index. The dense array keeps the
// generation, so a row written for an older generation of an index is not
// reported for the newer one; inserting for the newer one overwrites it.
//
// Complexity
// ----------
//   Has   O(1)    Find   O(1)
//   Insert O(1)   Remove O(1)  (swap-with-last trick)
//   Iterate O(n)  over all rows: tight, cache-friendly loop.
// ---------------------------------------------------------------------------
template<typename T>
class ComponentPool final : public IPool {
public:
    // ---- IPool interface ------------------------------------------------

    bool Remove(Entity entity) override {
        if (!Has(entity)) return false;
        EraseAt(m_sparse[entity.Index()]);
        return true;
    }

    void Clear() override {
        m_sparse.clear();
        m_dense .clear();
        m_data  .clear();
    }

    [[nodiscard]] size_t Size() const override { return m_dense.size(); }

    [[nodiscard]] std::type_index Type() const override {
        return std::type_index(typeid(T));
    }

    // ---- Typed interface ------------------------------------------------

    [[nodiscard]] bool Has(Entity entity) const noexcept {
        const uint32_t idx = entity.Index();
        return idx < m_sparse.size()
            && m_sparse[idx] != EMPTY
            && m_dense[m_sparse[idx]] == entity;
    }

    // Insert or overwrite the row for entity. Returns the stored value.
    T& Insert(Entity entity, T value) {
        const uint32_t idx = entity.Index();
        if (idx >= m_sparse.size())
            m_sparse.resize(static_cast<size_t>(idx) + 1, EMPTY);

        if (m_sparse[idx] != EMPTY) {
            // Same slot: either the same entity or an older generation of it.
            const uint32_t denseIdx = m_sparse[idx];
            m_dense[denseIdx] = entity;
            m_data[denseIdx]  = std::move(value);
            return m_data[denseIdx];
        }

        m_sparse[idx] = static_cast<uint32_t>(m_dense.size());
        m_dense.push_back(entity);
        m_data .push_back(std::move(value));
        return m_data.back();
    }

    // Pointer to the component owned by entity, or nullptr.
    [[nodiscard]] T* Find(Entity entity) noexcept {
        return Has(entity) ? &m_data[m_sparse[entity.Index()]] : nullptr;
    }
    [[nodiscard]] const T* Find(Entity entity) const noexcept {
        return Has(entity) ? &m_data[m_sparse[entity.Index()]] : nullptr;
    }

    // Remove and return the component owned by entity.
    std::optional<T> Take(Entity entity) {
        if (!Has(entity)) return std::nullopt;
        const uint32_t denseIdx = m_sparse[entity.Index()];
        std::optional<T> out(std::move(m_data[denseIdx]));
        EraseAt(denseIdx);
        return out;
    }

    // fn(Entity, T&) / fn(Entity, const T&) for every row. Do not insert or
    // remove from inside fn.
    template<typename Fn>
    void ForEach(Fn&& fn) {
        for (size_t i = 0; i < m_dense.size(); ++i) fn(m_dense[i], m_data[i]);
    }
    template<typename Fn>
    void ForEach(Fn&& fn) const {
        for (size_t i = 0; i < m_dense.size(); ++i) fn(m_dense[i], m_data[i]);
    }

    // Dense arrays directly (for raw iteration).
    [[nodiscard]] const std::vector<Entity>& Entities()   const noexcept { return m_dense; }
    [[nodiscard]] std::vector<T>&             Components()       noexcept { return m_data; }
    [[nodiscard]] const std::vector<T>&       Components() const noexcept { return m_data; }

private:
    static constexpr uint32_t EMPTY = ~0u;

    void EraseAt(uint32_t denseIdx) {
        const uint32_t removedIdx = m_dense[denseIdx].Index();
        const uint32_t last       = static_cast<uint32_t>(m_dense.size()) - 1u;

        if (denseIdx != last) {
            // Swap the target with the last element so we keep the array packed.
            const Entity lastEntity        = m_dense[last];
            m_dense[denseIdx]              = lastEntity;
            m_data [denseIdx]              = std::move(m_data[last]);
            m_sparse[lastEntity.Index()]   = denseIdx;
        }

        m_dense.pop_back();
        m_data .pop_back();
        m_sparse[removedIdx] = EMPTY;
    }

    std::vector<uint32_t> m_sparse; // sparse[entityIndex] → denseIdx or EMPTY
    std::vector<Entity>   m_dense;  // dense[i] → owning entity
    std::vector<T>        m_data;   // data[i]  → component for dense[i]
};

} // namespace Lumina::ECS
