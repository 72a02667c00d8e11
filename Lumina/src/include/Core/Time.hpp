#pragma once

#include <chrono>
#include <cstdint>

namespace Lumina::Core {

// ---------------------------------------------------------------------------
// Time: frame timing resource.
//
// Lives in the World as a resource:
//
//   world.AddResource(Core::Time{});
//   world.WithResource<Core::Time>([](const Core::Time* t) { ... });
//
// Drive it with either Update() (samples a steady clock) or Advance(dt)
// (frame delta from outer code, e.g. raylib's GetFrameTime()), not both.
// ---------------------------------------------------------------------------
class Time {
public:
    using Clock = std::chrono::steady_clock;

    Time();

    // Sample the clock: delta = now - last update, elapsed = now - startup.
    void Update();

    // Step by an externally measured delta (seconds, negative treated as 0).
    void Advance(float dtSeconds);

    // Delta multiplied by the time scale.
    [[nodiscard]] float  DeltaSeconds()    const noexcept { return static_cast<float>(m_delta) * m_timeScale; }
    [[nodiscard]] double DeltaSecondsF64() const noexcept { return m_delta * static_cast<double>(m_timeScale); }
    [[nodiscard]] float  RawDeltaSeconds() const noexcept { return static_cast<float>(m_delta); }

    [[nodiscard]] double ElapsedSeconds() const noexcept { return m_elapsed; }

    [[nodiscard]] float TimeScale() const noexcept { return m_timeScale; }
    // Clamped to >= 0; 0 pauses scaled time.
    void SetTimeScale(float scale) noexcept { m_timeScale = scale > 0.0f ? scale : 0.0f; }

    [[nodiscard]] uint64_t FrameCount() const noexcept { return m_frameCount; }

    // 1 / raw delta, 0 before the first non-zero delta.
    [[nodiscard]] float Fps() const noexcept {
        return m_delta > 0.0 ? static_cast<float>(1.0 / m_delta) : 0.0f;
    }

private:
    Clock::time_point m_startup;
    Clock::time_point m_lastUpdate;
    double            m_delta      = 0.0; // seconds, unscaled
    double            m_elapsed    = 0.0; // seconds, unscaled
    float             m_timeScale  = 1.0f;
    uint64_t          m_frameCount = 0;
};

} // namespace Lumina::Core
