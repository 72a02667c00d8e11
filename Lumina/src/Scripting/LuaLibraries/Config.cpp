#include <lua.hpp>
#include <Scripting/LuaLoader/Config.hpp>
#include <raylib.h>

#include <cstdint>
#include <memory>
#include <string>

namespace Lumina::Scripting::LuaLoader {

namespace {

struct LuaStateDeleter {
    void operator()(lua_State* L) const { if (L) lua_close(L); }
};
using LuaStatePtr = std::unique_ptr<lua_State, LuaStateDeleter>;

// Reads the table at the top of the stack into cfg. Returns false (after
// logging) on the first mistyped value.
bool readConfigTable(lua_State* L, const char* source, Core::WorldConfig& cfg)
{
    lua_pushnil(L);
    while (lua_next(L, -2) != 0) {
        // key at -2, value at -1
        if (lua_type(L, -2) != LUA_TSTRING) {
            TraceLog(LOG_WARNING, "[config] %s: ignoring non-string key", source);
            lua_pop(L, 1);
            continue;
        }
        const std::string key = lua_tostring(L, -2);

        if (key == "initialEntityCapacity") {
            int isInt = 0;
            const lua_Integer n = lua_tointegerx(L, -1, &isInt);
            if (lua_type(L, -1) != LUA_TNUMBER || !isInt || n < 0 || n > static_cast<lua_Integer>(UINT32_MAX)) {
                TraceLog(LOG_ERROR, "[config] %s: initialEntityCapacity must be a non-negative integer", source);
                lua_pop(L, 2);
                return false;
            }
            cfg.initialEntityCapacity = static_cast<uint32_t>(n);
        } else if (key == "logLifecycle") {
            if (lua_type(L, -1) != LUA_TBOOLEAN) {
                TraceLog(LOG_ERROR, "[config] %s: logLifecycle must be a boolean", source);
                lua_pop(L, 2);
                return false;
            }
            cfg.logLifecycle = lua_toboolean(L, -1) != 0;
        } else if (key == "logLevel") {
            if (lua_type(L, -1) != LUA_TSTRING) {
                TraceLog(LOG_ERROR, "[config] %s: logLevel must be a string", source);
                lua_pop(L, 2);
                return false;
            }
            const char* name  = lua_tostring(L, -1);
            const auto  level = Core::ParseLogLevel(name);
            if (!level) {
                TraceLog(LOG_ERROR, "[config] %s: unknown logLevel '%s'", source, name);
                lua_pop(L, 2);
                return false;
            }
            cfg.logLevel = *level;
        } else {
            TraceLog(LOG_WARNING, "[config] %s: unknown key '%s' ignored", source, key.c_str());
        }
        lua_pop(L, 1);
    }
    return true;
}

// Runs the chunk loaded at the top of the stack and applies its result.
bool runConfigChunk(lua_State* L, int loadStatus, const char* source, Core::WorldConfig& out)
{
    if (loadStatus != LUA_OK) {
        TraceLog(LOG_ERROR, "[config] %s: %s", source, lua_tostring(L, -1));
        return false;
    }
    if (lua_pcall(L, 0, 1, 0) != LUA_OK) {
        TraceLog(LOG_ERROR, "[config] %s: %s", source, lua_tostring(L, -1));
        return false;
    }
    if (!lua_istable(L, -1)) {
        TraceLog(LOG_ERROR, "[config] %s: chunk must return a table (got %s)",
                 source, luaL_typename(L, -1));
        return false;
    }

    Core::WorldConfig cfg = out;
    if (!readConfigTable(L, source, cfg)) return false;

    out = cfg;
    TraceLog(LOG_INFO, "[config] Loaded %s (capacity %u, lifecycle log %s)",
             source, cfg.initialEntityCapacity, cfg.logLifecycle ? "on" : "off");
    return true;
}

} // anonymous namespace

bool loadWorldConfigFile(const std::string& path, Core::WorldConfig& out)
{
    LuaStatePtr L(luaL_newstate());
    if (!L) {
        TraceLog(LOG_ERROR, "[config] Could not create Lua state");
        return false;
    }
    luaL_openlibs(L.get());
    return runConfigChunk(L.get(), luaL_loadfile(L.get(), path.c_str()), path.c_str(), out);
}

bool loadWorldConfigString(const std::string& chunk, Core::WorldConfig& out)
{
    LuaStatePtr L(luaL_newstate());
    if (!L) {
        TraceLog(LOG_ERROR, "[config] Could not create Lua state");
        return false;
    }
    luaL_openlibs(L.get());
    const int status = luaL_loadbuffer(L.get(), chunk.data(), chunk.size(), "=config");
    return runConfigChunk(L.get(), status, "<string>", out);
}

} // namespace Lumina::Scripting::LuaLoader
