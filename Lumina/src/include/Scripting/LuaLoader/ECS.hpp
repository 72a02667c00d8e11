#pragma once

struct lua_State;

namespace Lumina::ECS { class World; }

namespace Lumina::Scripting::LuaLoader {

// ── Lifetime setter ──────────────────────────────────────────────────────────
// Call whenever the active world changes. Safe to call before or after
// registerECS().

/// Set the World the `ecs.*` Lua functions operate on.
/// Pass nullptr to disable ECS calls (e.g. during scene transitions).
void setECSWorld(ECS::World* world);

// ── Registration ─────────────────────────────────────────────────────────────
/// Register the `ecs` global table into the given Lua state.
///
/// Entity ids are the packed 64-bit handle (generation << 32 | index); a
/// stale id (entity despawned, slot reused) reads as dead.
///
/// Entity management
/// -----------------
///   ecs.create()                    → id          -- spawn a blank entity
///   ecs.destroy(id)                 → bool        -- despawn + strip all components
///   ecs.isAlive(id)                 → bool
///   ecs.count()                     → integer     -- live entities
///
/// Transform  (auto-created on first setPos / setScale)
/// ---------
///   ecs.setPos(id, x, y, z)
///   ecs.getPos(id)                  → x, y, z
///   ecs.setScale(id, sx, sy, sz)
///   ecs.setVelocity(id, vx, vy, vz)
///   ecs.getVelocity(id)             → vx, vy, vz
///
/// Tag
/// ---
///   ecs.setTag(id, name)
///   ecs.getTag(id)                  → string (or "")
///
/// Health
/// ------
///   ecs.addHealth(id, maxHp)        -- adds HealthComponent; current = max
///   ecs.getHealth(id)               → current, max  (0, 0 if absent)
///   ecs.damage(id, amount)
///   ecs.heal(id, amount)
///   ecs.isDead(id)                  → bool
///
/// Lifetime
/// --------
///   ecs.setLifetime(id, seconds)    -- add/replace LifetimeComponent
///   ecs.getLifetime(id)             → remaining  (0 if absent)
void registerECS(lua_State* L);

} // namespace Lumina::Scripting::LuaLoader
