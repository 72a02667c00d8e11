#include <ECS/Handle.hpp>

#include <random>

namespace Lumina::ECS {

Id Id::Generate()
{
    // One engine per thread: no locking, and ids from different threads
    // still come from independently seeded streams.
    thread_local std::mt19937_64 engine{
        (static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}()
    };
    uint64_t value = 0;
    while (value == 0) value = engine();
    return Id(value);
}

std::ostream& operator<<(std::ostream& os, const Id& id)
{
    return os << id.AsU64();
}

} // namespace Lumina::ECS
