#pragma once

#include <ECS/System.hpp>

namespace Lumina::Input {

// ---------------------------------------------------------------------------
// InputSystem: samples raylib input into the InputState resource.
//
// Schedule it first so every later system in the frame sees the same
// snapshot. Each Update starts a new input frame (EndFrame on the previous
// one) before polling. Needs a raylib window opened by outer code.
// ---------------------------------------------------------------------------
class InputSystem final : public ECS::System {
public:
    // Adds an InputState resource if the world has none.
    void Init(ECS::World& world) override;
    void Update(ECS::World& world, float dt) override;
    [[nodiscard]] const char* Name() const override { return "Input"; }
};

} // namespace Lumina::Input
