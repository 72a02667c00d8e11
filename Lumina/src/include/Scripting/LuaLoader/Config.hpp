#pragma once

#include <Core/Config.hpp>
#include <string>

namespace Lumina::Scripting::LuaLoader {

// ── World configuration ──────────────────────────────────────────────────────
// The chunk must return a table; recognised keys:
//
//   initialEntityCapacity   integer >= 0
//   logLifecycle            boolean
//   logLevel                "all" | "trace" | "debug" | "info" |
//                           "warning" | "error" | "fatal" | "none"
//
// Keys missing from the table keep their current value in `out`. Unknown
// keys are ignored with a warning. On any error (unreadable file, syntax or
// runtime error, non-table result, mistyped value) the reason is logged,
// `out` is left untouched and false is returned.

bool loadWorldConfigFile(const std::string& path, Core::WorldConfig& out);
bool loadWorldConfigString(const std::string& chunk, Core::WorldConfig& out);

} // namespace Lumina::Scripting::LuaLoader
