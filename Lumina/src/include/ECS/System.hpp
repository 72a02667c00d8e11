#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Lumina::ECS {

class World;

// ---------------------------------------------------------------------------
// System: base class for all ECS systems.
//
// A System encapsulates logic that runs on a set of entities each frame
// (or tick). Derive from this class and implement Update to process
// components from the World.
//
// Usage
// -----
//   class MovementSystem : public System {
//   public:
//       void Update(World& world, float dt) override {
//           for (const auto& row : world.Query<VelocityComponent>())
//               world.WithComponentMut<TransformComponent>(row.first,
//                   [&](TransformComponent* t) { if (t) ... });
//       }
//   };
//
// Systems are plain sequential calls driven by a SystemSchedule (or any
// outer loop). A system may spin up its own worker threads internally; the
// World's per-table locks make that safe.
// ---------------------------------------------------------------------------

class System {
public:
    virtual ~System() = default;

    // Called once per frame / tick.
    // dt: delta time in seconds.
    virtual void Update(World& world, float dt) = 0;

    // Optional: called once before the first Update.
    virtual void Init(World& /*world*/) {}

    // Optional: called once on teardown to release what Init acquired.
    virtual void Shutdown(World& /*world*/) {}

    // Used in logs.
    [[nodiscard]] virtual const char* Name() const { return "System"; }

    // Systems can be individually paused without removing them.
    void  SetEnabled(bool enabled) noexcept { m_enabled = enabled; }
    [[nodiscard]] bool IsEnabled() const noexcept { return m_enabled; }

private:
    bool m_enabled = true;
};

// ---------------------------------------------------------------------------
// FunctionSystem: wraps a callable so small systems need no subclass.
//
//   schedule.Add(MakeSystem("Gravity", [](World& w, float dt) { ... }));
// ---------------------------------------------------------------------------
class FunctionSystem final : public System {
public:
    using UpdateFn = std::function<void(World&, float)>;

    FunctionSystem(std::string name, UpdateFn fn)
        : m_name(std::move(name)), m_fn(std::move(fn)) {}

    void Update(World& world, float dt) override { if (m_fn) m_fn(world, dt); }

    [[nodiscard]] const char* Name() const override { return m_name.c_str(); }

private:
    std::string m_name;
    UpdateFn    m_fn;
};

template<typename Fn>
[[nodiscard]] std::unique_ptr<System> MakeSystem(std::string name, Fn&& fn) {
    return std::make_unique<FunctionSystem>(std::move(name),
                                            FunctionSystem::UpdateFn(std::forward<Fn>(fn)));
}

// ---------------------------------------------------------------------------
// SystemSchedule: owns systems and runs them in insertion order.
//
//   Init()    : every system, insertion order
//   Run()     : every enabled system, insertion order
//   Shutdown(): every system, reverse insertion order
//
// No dependency analysis and no parallelism: the schedule is a list.
// ---------------------------------------------------------------------------
class SystemSchedule {
public:
    // Takes ownership; returns the stored system for later tweaking.
    System& Add(std::unique_ptr<System> system);

    template<typename S, typename... Args>
    S& Emplace(Args&&... args) {
        auto sys = std::make_unique<S>(std::forward<Args>(args)...);
        S&   ref = *sys;
        Add(std::move(sys));
        return ref;
    }

    void Init(World& world);
    void Run(World& world, float dt);
    void Shutdown(World& world);

    // nullptr if no system has that name.
    [[nodiscard]] System* Find(const std::string& name) const;

    [[nodiscard]] size_t Size() const noexcept { return m_systems.size(); }
    void Clear() noexcept { m_systems.clear(); }

private:
    std::vector<std::unique_ptr<System>> m_systems;
};

} // namespace Lumina::ECS
