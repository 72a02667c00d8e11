#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace Lumina::ECS {

// ---------------------------------------------------------------------------
// Entity: a handle made of a 32-bit index and a 32-bit generation counter.
//
//   index       →  slot in the liveness set / sparse arrays
//   generation  →  bumped every time the slot is freed
//
// When a slot is recycled the generation is bumped, so old Entity handles
// become stale: IsAlive() returns false and they compare unequal to the
// entity now living in the slot.
//
// For scripting the handle packs into 64 bits:
//   bits  0-31  →  index
//   bits 32-63  →  generation
// ---------------------------------------------------------------------------

inline constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

class Entity {
public:
    constexpr Entity() noexcept = default;
    constexpr explicit Entity(uint32_t index, uint32_t generation = 0) noexcept
        : m_index(index), m_generation(generation) {}

    [[nodiscard]] constexpr uint32_t Index()      const noexcept { return m_index; }
    [[nodiscard]] constexpr uint32_t Generation() const noexcept { return m_generation; }

    // False only for the null entity.
    [[nodiscard]] constexpr bool IsValid() const noexcept { return m_index != INVALID_INDEX; }

    [[nodiscard]] constexpr uint64_t ToBits() const noexcept {
        return (static_cast<uint64_t>(m_generation) << 32) | m_index;
    }

    [[nodiscard]] static constexpr Entity FromBits(uint64_t bits) noexcept {
        return Entity(static_cast<uint32_t>(bits & 0xFFFFFFFFull),
                      static_cast<uint32_t>(bits >> 32));
    }

    constexpr bool operator==(const Entity& o) const noexcept {
        return m_index == o.m_index && m_generation == o.m_generation;
    }
    constexpr bool operator!=(const Entity& o) const noexcept { return !(*this == o); }

    // Orders by index first so sorted entity lists read naturally.
    constexpr bool operator<(const Entity& o) const noexcept {
        return m_index != o.m_index ? m_index < o.m_index : m_generation < o.m_generation;
    }

private:
    uint32_t m_index      = INVALID_INDEX;
    uint32_t m_generation = 0;
};

// Sentinel value representing a null / invalid entity.
inline constexpr Entity NULL_ENTITY{};

} // namespace Lumina::ECS

namespace std {
template<>
struct hash<Lumina::ECS::Entity> {
    size_t operator()(const Lumina::ECS::Entity& e) const noexcept {
        return hash<uint64_t>{}(e.ToBits());
    }
};
} // namespace std
