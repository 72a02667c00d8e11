#pragma once

#include <ECS/System.hpp>

namespace Lumina::ECS {

// position += velocity.linear * dt for every entity holding both.
class MovementSystem final : public System {
public:
    void Update(World& world, float dt) override;
    [[nodiscard]] const char* Name() const override { return "Movement"; }
};

// Counts LifetimeComponent::remaining down and despawns expired entities
// once the pass over the lifetime table is done.
class LifetimeSystem final : public System {
public:
    void Update(World& world, float dt) override;
    [[nodiscard]] const char* Name() const override { return "Lifetime"; }
};

// Advances the Core::Time resource by dt. Adds one in Init if missing.
class TimeSystem final : public System {
public:
    void Init(World& world) override;
    void Update(World& world, float dt) override;
    [[nodiscard]] const char* Name() const override { return "Time"; }
};

} // namespace Lumina::ECS
