#pragma once

#include <raylib.h>
#include <raymath.h>
#include <string>
#include <cstdint>

// ---------------------------------------------------------------------------
// Components.hpp: built-in ECS components for the Lumina engine.
//
// All structs are plain aggregates (no virtual, no heap ownership by default)
// so they can live directly in the dense component arrays without indirection.
//
// Add new game-specific components freely in your own headers; you do NOT
// need to register them anywhere: the ComponentManager creates a pool at
// first use via std::type_index.
// ---------------------------------------------------------------------------

namespace Lumina::ECS {

// ---- Spatial --------------------------------------------------------------

/// World-space position, orientation, and non-uniform scale.
/// Use raymath helpers (QuaternionFromEuler, etc.) to manipulate rotation.
struct TransformComponent {
    Vector3    position = { 0.0f, 0.0f, 0.0f };
    Quaternion rotation = { 0.0f, 0.0f, 0.0f, 1.0f }; // identity
    Vector3    scale    = { 1.0f, 1.0f, 1.0f };

    /// Convenience: return a Matrix suitable for shader uniforms.
    [[nodiscard]] Matrix ToMatrix() const {
        return MatrixMultiply(
            MatrixMultiply(
                MatrixScale(scale.x, scale.y, scale.z),
                QuaternionToMatrix(rotation)),
            MatrixTranslate(position.x, position.y, position.z));
    }
};

/// Linear and angular velocity (units per second).
struct VelocityComponent {
    Vector3 linear  = { 0.0f, 0.0f, 0.0f };
    Vector3 angular = { 0.0f, 0.0f, 0.0f }; // Euler rates, radians/s
};

// ---- Identity / tagging ---------------------------------------------------

/// Human-readable name for the entity (debug UIs / Lua lookups).
struct TagComponent {
    std::string name;
};

/// Integer group / layer / team tag.
struct GroupComponent {
    uint32_t groupId = 0;
};

// ---- Gameplay -------------------------------------------------------------

/// Simple health model. Systems should check IsDead() after applying damage.
struct HealthComponent {
    float current = 100.0f;
    float max     = 100.0f;

    [[nodiscard]] bool  IsDead()     const noexcept { return current <= 0.0f; }
    [[nodiscard]] float Normalised() const noexcept { return max > 0.0f ? current / max : 0.0f; }

    void ApplyDamage(float dmg) noexcept { current -= dmg; if (current < 0.0f) current = 0.0f; }
    void Heal       (float hp)  noexcept { current += hp;  if (current > max)  current = max;  }
};

/// Countdown lifetime. LifetimeSystem despawns the entity when remaining
/// reaches zero.
struct LifetimeComponent {
    float remaining = 1.0f; // seconds
};

} // namespace Lumina::ECS
