#include <Core/Time.hpp>

namespace Lumina::Core {

Time::Time()
    : m_startup(Clock::now())
    , m_lastUpdate(m_startup)
{
}

void Time::Update()
{
    const Clock::time_point now = Clock::now();
    m_delta      = std::chrono::duration<double>(now - m_lastUpdate).count();
    m_elapsed    = std::chrono::duration<double>(now - m_startup).count();
    m_lastUpdate = now;
    ++m_frameCount;
}

void Time::Advance(float dtSeconds)
{
    m_delta      = dtSeconds > 0.0f ? static_cast<double>(dtSeconds) : 0.0;
    m_elapsed   += m_delta;
    m_lastUpdate = Clock::now();
    ++m_frameCount;
}

} // namespace Lumina::Core
