#pragma once

#include <raylib.h>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Lumina::Core {

// ---------------------------------------------------------------------------
// WorldConfig: knobs read once when a World is built.
//
// Usually loaded from a Lua file via Scripting::LuaLoader::loadWorldConfigFile,
// e.g. world.lua:
//
//   return {
//       initialEntityCapacity = 4096,
//       logLifecycle          = true,
//       logLevel              = "debug",
//   }
// ---------------------------------------------------------------------------
struct WorldConfig {
    /// Entity slots reserved up front (liveness set, generations, free list).
    uint32_t initialEntityCapacity = 0;

    /// Log every spawn / despawn at LOG_DEBUG.
    bool logLifecycle = false;

    /// raylib TraceLogLevel applied by ApplyLogLevel().
    int logLevel = LOG_INFO;
};

/// Forward config.logLevel to raylib's SetTraceLogLevel.
void ApplyLogLevel(const WorldConfig& config);

/// "debug" → LOG_DEBUG etc. Case-insensitive; nullopt for unknown names.
[[nodiscard]] std::optional<int> ParseLogLevel(std::string_view name);

} // namespace Lumina::Core
