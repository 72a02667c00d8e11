#include <catch2/catch.hpp>

#include <lua.hpp>
#include <ECS/Components.hpp>
#include <ECS/World.hpp>
#include <Scripting/LuaLoader/ECS.hpp>

#include <cstdlib>
#include <string>

using namespace Lumina::ECS;
namespace LuaLoader = Lumina::Scripting::LuaLoader;

namespace {

// A Lua state with the `ecs` library bound to a fresh world.
struct LuaFixture {
    LuaFixture() : L(luaL_newstate()) {
        luaL_openlibs(L);
        LuaLoader::registerECS(L);
        LuaLoader::setECSWorld(&world);
    }
    ~LuaFixture() {
        LuaLoader::setECSWorld(nullptr);
        lua_close(L);
    }

    bool Run(const std::string& code) {
        if (luaL_dostring(L, code.c_str()) == LUA_OK) return true;
        UNSCOPED_INFO(lua_tostring(L, -1));
        lua_pop(L, 1);
        return false;
    }

    lua_Integer Integer(const char* global) {
        lua_getglobal(L, global);
        const lua_Integer v = lua_tointeger(L, -1);
        lua_pop(L, 1);
        return v;
    }

    double Number(const char* global) {
        lua_getglobal(L, global);
        const double v = lua_tonumber(L, -1);
        lua_pop(L, 1);
        return v;
    }

    bool Boolean(const char* global) {
        lua_getglobal(L, global);
        const bool v = lua_toboolean(L, -1) != 0;
        lua_pop(L, 1);
        return v;
    }

    std::string String(const char* global) {
        lua_getglobal(L, global);
        const char* s = lua_tostring(L, -1);
        std::string v = s ? s : "";
        lua_pop(L, 1);
        return v;
    }

    World      world;
    lua_State* L;
};

// Refuses any growing allocation above 1 KiB while *ud is true.
void* limitedAlloc(void* ud, void* ptr, size_t osize, size_t nsize)
{
    if (nsize == 0) {
        std::free(ptr);
        return nullptr;
    }
    const bool   failLarge = *static_cast<bool*>(ud);
    const size_t current   = ptr ? osize : 0;
    if (failLarge && nsize > 1024 && nsize > current) return nullptr;
    return std::realloc(ptr, nsize);
}

} // namespace

TEST_CASE("ecs.create spawns a live entity the host can see", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE(lua.Run("e = ecs.create(); alive = ecs.isAlive(e); n = ecs.count()"));

    const Entity e = Entity::FromBits(static_cast<uint64_t>(lua.Integer("e")));
    REQUIRE(lua.world.IsAlive(e));
    REQUIRE(lua.Boolean("alive"));
    REQUIRE(lua.Integer("n") == 1);
}

TEST_CASE("ecs.destroy despawns once and stale ids read as dead", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE(lua.Run(R"(
        e      = ecs.create()
        first  = ecs.destroy(e)
        second = ecs.destroy(e)
        reborn = ecs.create()
        stale  = ecs.isAlive(e)
        fresh  = ecs.isAlive(reborn)
        same   = (e == reborn)
    )"));

    REQUIRE(lua.Boolean("first"));
    REQUIRE_FALSE(lua.Boolean("second"));
    REQUIRE_FALSE(lua.Boolean("stale"));
    REQUIRE(lua.Boolean("fresh"));
    REQUIRE_FALSE(lua.Boolean("same"));
}

TEST_CASE("ecs transform setters create the component on demand", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE(lua.Run(R"(
        e = ecs.create()
        ecs.setPos(e, 1, 2, 3)
        ecs.setScale(e, 2, 2, 2)
        ecs.setVelocity(e, 0, -1, 0)
        px, py, pz = ecs.getPos(e)
        vx, vy, vz = ecs.getVelocity(e)
    )"));

    REQUIRE(lua.Number("px") == Approx(1.0));
    REQUIRE(lua.Number("pz") == Approx(3.0));
    REQUIRE(lua.Number("vy") == Approx(-1.0));

    const Entity e = Entity::FromBits(static_cast<uint64_t>(lua.Integer("e")));
    const auto t = lua.world.GetComponent<TransformComponent>(e);
    REQUIRE(t);
    REQUIRE(t->position.y == Approx(2.0f));
    REQUIRE(t->scale.x == Approx(2.0f));
}

TEST_CASE("ecs getters fall back to zero and empty values", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE(lua.Run(R"(
        e = ecs.create()
        x, y, z = ecs.getPos(e)
        tag = ecs.getTag(e)
        cur, max = ecs.getHealth(e)
        life = ecs.getLifetime(e)
        dead = ecs.isDead(e)
    )"));

    REQUIRE(lua.Number("x") == 0.0);
    REQUIRE(lua.String("tag").empty());
    REQUIRE(lua.Number("max") == 0.0);
    REQUIRE(lua.Number("life") == 0.0);
    REQUIRE_FALSE(lua.Boolean("dead"));
}

TEST_CASE("ecs tag, health and lifetime round trip", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE(lua.Run(R"(
        e = ecs.create()
        ecs.setTag(e, "crate")
        ecs.addHealth(e, 80)
        ecs.damage(e, 30)
        ecs.heal(e, 10)
        ecs.setLifetime(e, 4.5)

        tag      = ecs.getTag(e)
        cur, max = ecs.getHealth(e)
        life     = ecs.getLifetime(e)

        ecs.damage(e, 1000)
        dead = ecs.isDead(e)
    )"));

    REQUIRE(lua.String("tag") == "crate");
    REQUIRE(lua.Number("cur") == Approx(60.0));
    REQUIRE(lua.Number("max") == Approx(80.0));
    REQUIRE(lua.Number("life") == Approx(4.5));
    REQUIRE(lua.Boolean("dead"));
}

TEST_CASE("ecs writes to a despawned entity are dropped", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE(lua.Run(R"(
        e = ecs.create()
        ecs.destroy(e)
        ecs.setPos(e, 5, 5, 5)
        ecs.setTag(e, "ghost")
        n = ecs.count()
    )"));
    REQUIRE(lua.Integer("n") == 0);
    REQUIRE(lua.world.Query<TransformComponent>().empty());
    REQUIRE(lua.world.Query<TagComponent>().empty());
}

TEST_CASE("ecs calls without a world are ignored", "[Lua][ECS]") {
    LuaFixture lua;
    LuaLoader::setECSWorld(nullptr);
    REQUIRE(lua.Run(R"(
        e = ecs.create()
        ecs.setPos(e, 1, 1, 1)
        alive = ecs.isAlive(e)
        n = ecs.count()
    )"));
    REQUIRE_FALSE(lua.Boolean("alive"));
    REQUIRE(lua.Integer("n") == 0);
    REQUIRE(lua.world.EntityCount() == 0);
}

TEST_CASE("ecs argument errors surface as Lua errors", "[Lua][ECS]") {
    LuaFixture lua;
    REQUIRE_FALSE(lua.Run("ecs.setPos(ecs.create(), 'x', 0, 0)"));
    REQUIRE_FALSE(lua.Run("ecs.isAlive('nope')"));
}

TEST_CASE("ecs.getTag releases the tag table before touching Lua", "[Lua][ECS]") {
    World world;
    const Entity e = world.SpawnWith(TagComponent{ std::string(4096, 'x') });

    bool failLarge = false;
    lua_State* L = lua_newstate(limitedAlloc, &failLarge);
    REQUIRE(L != nullptr);
    luaL_openlibs(L);
    LuaLoader::registerECS(L);
    LuaLoader::setECSWorld(&world);

    lua_getglobal(L, "ecs");
    lua_getfield(L, -1, "getTag");
    lua_pushinteger(L, static_cast<lua_Integer>(e.ToBits()));
    failLarge = true;
    const int status = lua_pcall(L, 1, 1, 0);
    failLarge = false;
    REQUIRE(status == LUA_ERRMEM);

    // The table lock must be free again: a writer can get in.
    const ComponentPool<TagComponent>* pool = world.Components().WithStorage<TagComponent>(
        [](const ComponentPool<TagComponent>* p) { return p; });
    REQUIRE(pool != nullptr);
    REQUIRE(pool->Mutex().try_lock());
    pool->Mutex().unlock();

    REQUIRE(world.AddComponent(e, TagComponent{ "after" }));
    REQUIRE(world.GetComponent<TagComponent>(e)->name == "after");

    LuaLoader::setECSWorld(nullptr);
    lua_close(L);
}
