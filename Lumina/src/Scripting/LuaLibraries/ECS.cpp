#include <lua.hpp>
#include <ECS/Components.hpp>
#include <ECS/World.hpp>
#include <Scripting/LuaLoader/ECS.hpp>
#include <raylib.h>

// ── Module-level state ────────────────────────────────────────────────────────
// Set by the owner of the active world. All Lua bindings below check for
// nullptr.

namespace Lumina::Scripting::LuaLoader {

namespace {
    ECS::World* g_world = nullptr;
} // anonymous namespace

void setECSWorld(ECS::World* world) { g_world = world; }

// ── Helpers ───────────────────────────────────────────────────────────────────

static inline bool worldReady()
{
    if (g_world) return true;
    TraceLog(LOG_WARNING, "[ecs] World not set, call ignored");
    return false;
}

static inline ECS::Entity toEntity(lua_State* L, int idx)
{
    return ECS::Entity::FromBits(static_cast<uint64_t>(luaL_checkinteger(L, idx)));
}

static inline void pushEntity(lua_State* L, ECS::Entity e)
{
    lua_pushinteger(L, static_cast<lua_Integer>(e.ToBits()));
}

static inline float checkFloat(lua_State* L, int idx)
{
    return static_cast<float>(luaL_checknumber(L, idx));
}

// Three zeros for missing-component fallbacks.
static inline int push3zeros(lua_State* L)
{
    lua_pushnumber(L, 0.0); lua_pushnumber(L, 0.0); lua_pushnumber(L, 0.0);
    return 3;
}

static inline int push3(lua_State* L, Vector3 v)
{
    lua_pushnumber(L, v.x); lua_pushnumber(L, v.y); lua_pushnumber(L, v.z);
    return 3;
}

// Run fn on entity's T, adding a default T first if it has none.
template<typename T, typename Fn>
static void withOrAdd(ECS::Entity e, Fn&& fn)
{
    if (!g_world->HasComponent<T>(e)) g_world->AddComponent<T>(e, T{});
    g_world->WithComponentMut<T>(e, [&](T* c) { if (c) fn(*c); });
}

// ── Entity management ─────────────────────────────────────────────────────────

// ecs.create() → id
static int l_create(lua_State* L)
{
    if (!worldReady()) { pushEntity(L, ECS::NULL_ENTITY); return 1; }
    pushEntity(L, g_world->Spawn().Build());
    return 1;
}

// ecs.destroy(id) → bool
static int l_destroy(lua_State* L)
{
    if (!worldReady()) { lua_pushboolean(L, 0); return 1; }
    lua_pushboolean(L, g_world->Despawn(toEntity(L, 1)) ? 1 : 0);
    return 1;
}

// ecs.isAlive(id) → bool
static int l_isAlive(lua_State* L)
{
    if (!g_world) { lua_pushboolean(L, 0); return 1; }
    lua_pushboolean(L, g_world->IsAlive(toEntity(L, 1)) ? 1 : 0);
    return 1;
}

// ecs.count() → integer
static int l_count(lua_State* L)
{
    lua_pushinteger(L, g_world ? static_cast<lua_Integer>(g_world->EntityCount()) : 0);
    return 1;
}

// ── Transform ────────────────────────────────────────────────────────────────

// ecs.setPos(id, x, y, z)
static int l_setPos(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto    id  = toEntity(L, 1);
    const Vector3 pos = { checkFloat(L, 2), checkFloat(L, 3), checkFloat(L, 4) };
    if (!g_world->IsAlive(id)) return 0;
    withOrAdd<ECS::TransformComponent>(id, [&](ECS::TransformComponent& t) { t.position = pos; });
    return 0;
}

// ecs.getPos(id) → x, y, z
static int l_getPos(lua_State* L)
{
    if (!g_world) return push3zeros(L);
    auto t = g_world->GetComponent<ECS::TransformComponent>(toEntity(L, 1));
    return t ? push3(L, t->position) : push3zeros(L);
}

// ecs.setScale(id, sx, sy, sz)
static int l_setScale(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto    id    = toEntity(L, 1);
    const Vector3 scale = { checkFloat(L, 2), checkFloat(L, 3), checkFloat(L, 4) };
    if (!g_world->IsAlive(id)) return 0;
    withOrAdd<ECS::TransformComponent>(id, [&](ECS::TransformComponent& t) { t.scale = scale; });
    return 0;
}

// ecs.setVelocity(id, vx, vy, vz)
static int l_setVelocity(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto    id  = toEntity(L, 1);
    const Vector3 vel = { checkFloat(L, 2), checkFloat(L, 3), checkFloat(L, 4) };
    if (!g_world->IsAlive(id)) return 0;
    withOrAdd<ECS::VelocityComponent>(id, [&](ECS::VelocityComponent& v) { v.linear = vel; });
    return 0;
}

// ecs.getVelocity(id) → vx, vy, vz
static int l_getVelocity(lua_State* L)
{
    if (!g_world) return push3zeros(L);
    auto v = g_world->GetComponent<ECS::VelocityComponent>(toEntity(L, 1));
    return v ? push3(L, v->linear) : push3zeros(L);
}

// ── Tag ───────────────────────────────────────────────────────────────────────

// ecs.setTag(id, name)
static int l_setTag(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto  id   = toEntity(L, 1);
    const char* name = luaL_checkstring(L, 2);
    g_world->AddComponent(id, ECS::TagComponent{ name });
    return 0;
}

// ecs.getTag(id) → string  (empty string if no tag)
static int l_getTag(lua_State* L)
{
    if (!g_world) { lua_pushstring(L, ""); return 1; }
    // Copy out first: a Lua error in lua_pushstring must not unwind past the
    // pool lock.
    const auto tag = g_world->GetComponent<ECS::TagComponent>(toEntity(L, 1));
    lua_pushstring(L, tag ? tag->name.c_str() : "");
    return 1;
}

// ── Health ────────────────────────────────────────────────────────────────────

// ecs.addHealth(id, maxHp) : creates or resets HealthComponent; current = max
static int l_addHealth(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto  id    = toEntity(L, 1);
    const float maxHp = checkFloat(L, 2);
    g_world->AddComponent(id, ECS::HealthComponent{ maxHp, maxHp });
    return 0;
}

// ecs.getHealth(id) → current, max  (0, 0 if absent)
static int l_getHealth(lua_State* L)
{
    if (!g_world) { lua_pushnumber(L, 0); lua_pushnumber(L, 0); return 2; }
    auto h = g_world->GetComponent<ECS::HealthComponent>(toEntity(L, 1));
    lua_pushnumber(L, h ? h->current : 0.0f);
    lua_pushnumber(L, h ? h->max     : 0.0f);
    return 2;
}

// ecs.damage(id, amount)
static int l_damage(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto  id  = toEntity(L, 1);
    const float amt = checkFloat(L, 2);
    g_world->WithComponentMut<ECS::HealthComponent>(id, [amt](ECS::HealthComponent* h) {
        if (h) h->ApplyDamage(amt);
    });
    return 0;
}

// ecs.heal(id, amount)
static int l_heal(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto  id  = toEntity(L, 1);
    const float amt = checkFloat(L, 2);
    g_world->WithComponentMut<ECS::HealthComponent>(id, [amt](ECS::HealthComponent* h) {
        if (h) h->Heal(amt);
    });
    return 0;
}

// ecs.isDead(id) → bool  (false when the entity has no health)
static int l_isDead(lua_State* L)
{
    if (!g_world) { lua_pushboolean(L, 0); return 1; }
    const bool dead = g_world->WithComponent<ECS::HealthComponent>(toEntity(L, 1),
        [](const ECS::HealthComponent* h) { return h && h->IsDead(); });
    lua_pushboolean(L, dead ? 1 : 0);
    return 1;
}

// ── Lifetime ──────────────────────────────────────────────────────────────────

// ecs.setLifetime(id, seconds)
static int l_setLifetime(lua_State* L)
{
    if (!worldReady()) return 0;
    const auto  id  = toEntity(L, 1);
    const float sec = checkFloat(L, 2);
    g_world->AddComponent(id, ECS::LifetimeComponent{ sec });
    return 0;
}

// ecs.getLifetime(id) → remaining seconds  (0 if absent)
static int l_getLifetime(lua_State* L)
{
    if (!g_world) { lua_pushnumber(L, 0); return 1; }
    auto lt = g_world->GetComponent<ECS::LifetimeComponent>(toEntity(L, 1));
    lua_pushnumber(L, lt ? lt->remaining : 0.0f);
    return 1;
}

// ── Registration ─────────────────────────────────────────────────────────────

void registerECS(lua_State* L)
{
    static const luaL_Reg funcs[] = {
        // Entity lifecycle
        {"create",          l_create},
        {"destroy",         l_destroy},
        {"isAlive",         l_isAlive},
        {"count",           l_count},
        // Transform
        {"setPos",          l_setPos},
        {"getPos",          l_getPos},
        {"setScale",        l_setScale},
        {"setVelocity",     l_setVelocity},
        {"getVelocity",     l_getVelocity},
        // Tag
        {"setTag",          l_setTag},
        {"getTag",          l_getTag},
        // Health
        {"addHealth",       l_addHealth},
        {"getHealth",       l_getHealth},
        {"damage",          l_damage},
        {"heal",            l_heal},
        {"isDead",          l_isDead},
        // Lifetime
        {"setLifetime",     l_setLifetime},
        {"getLifetime",     l_getLifetime},
        {nullptr, nullptr}
    };

    luaL_newlib(L, funcs);
    lua_setglobal(L, "ecs");
}

} // namespace Lumina::Scripting::LuaLoader
