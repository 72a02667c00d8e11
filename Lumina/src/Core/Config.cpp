#include <Core/Config.hpp>

#include <cctype>
#include <string>

namespace Lumina::Core {

void ApplyLogLevel(const WorldConfig& config)
{
    SetTraceLogLevel(config.logLevel);
}

std::optional<int> ParseLogLevel(std::string_view name)
{
    std::string lower(name);
    for (auto& ch : lower) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (lower == "all")     return LOG_ALL;
    if (lower == "trace")   return LOG_TRACE;
    if (lower == "debug")   return LOG_DEBUG;
    if (lower == "info")    return LOG_INFO;
    if (lower == "warning") return LOG_WARNING;
    if (lower == "error")   return LOG_ERROR;
    if (lower == "fatal")   return LOG_FATAL;
    if (lower == "none")    return LOG_NONE;
    return std::nullopt;
}

} // namespace Lumina::Core
