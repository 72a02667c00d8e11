#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>

namespace Lumina::ECS {

// ---------------------------------------------------------------------------
// Id: opaque 64-bit identifier, randomly generated.
//
// Used for things that need a process-unique name without an allocator
// (assets, scenes, editor objects). Collisions are possible in theory but
// negligible for the id counts an engine deals with.
// ---------------------------------------------------------------------------
class Id {
public:
    constexpr Id() noexcept = default;

    // A fresh random id. Never returns the zero id.
    [[nodiscard]] static Id Generate();

    [[nodiscard]] static constexpr Id FromU64(uint64_t value) noexcept { return Id(value); }
    [[nodiscard]] constexpr uint64_t AsU64() const noexcept { return m_value; }

    [[nodiscard]] constexpr bool IsNull() const noexcept { return m_value == 0; }

    constexpr bool operator==(const Id& o) const noexcept { return m_value == o.m_value; }
    constexpr bool operator!=(const Id& o) const noexcept { return m_value != o.m_value; }
    constexpr bool operator< (const Id& o) const noexcept { return m_value <  o.m_value; }

private:
    constexpr explicit Id(uint64_t value) noexcept : m_value(value) {}

    uint64_t m_value = 0;
};

std::ostream& operator<<(std::ostream& os, const Id& id);

// ---------------------------------------------------------------------------
// Handle<Tag>: strongly typed 32-bit index.
//
// Declare one per resource family so handles never mix:
//
//   using TextureHandle = Handle<struct TextureTag>;
//   using MeshHandle    = Handle<struct MeshTag>;
//
// A default-constructed handle is invalid.
// ---------------------------------------------------------------------------
template<typename Tag>
class Handle {
public:
    static constexpr uint32_t INVALID = std::numeric_limits<uint32_t>::max();

    constexpr Handle() noexcept = default;
    constexpr explicit Handle(uint32_t index) noexcept : m_index(index) {}

    [[nodiscard]] constexpr uint32_t Index()   const noexcept { return m_index; }
    [[nodiscard]] constexpr bool     IsValid() const noexcept { return m_index != INVALID; }

    constexpr explicit operator uint32_t() const noexcept { return m_index; }

    constexpr bool operator==(const Handle& o) const noexcept { return m_index == o.m_index; }
    constexpr bool operator!=(const Handle& o) const noexcept { return m_index != o.m_index; }
    constexpr bool operator< (const Handle& o) const noexcept { return m_index <  o.m_index; }

private:
    uint32_t m_index = INVALID;
};

// Hands out Handle<Tag> values 0, 1, 2, ... Safe to call from any thread.
template<typename Tag>
class HandleAllocator {
public:
    [[nodiscard]] Handle<Tag> Next() noexcept {
        return Handle<Tag>(m_next.fetch_add(1u, std::memory_order_relaxed));
    }

    // Number of handles handed out so far.
    [[nodiscard]] uint32_t Issued() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

    void Reset() noexcept { m_next.store(0u, std::memory_order_relaxed); }

private:
    std::atomic<uint32_t> m_next{0u};
};

} // namespace Lumina::ECS

namespace std {

template<>
struct hash<Lumina::ECS::Id> {
    size_t operator()(const Lumina::ECS::Id& id) const noexcept {
        return hash<uint64_t>{}(id.AsU64());
    }
};

template<typename Tag>
struct hash<Lumina::ECS::Handle<Tag>> {
    size_t operator()(const Lumina::ECS::Handle<Tag>& h) const noexcept {
        return hash<uint32_t>{}(h.Index());
    }
};

} // namespace std
