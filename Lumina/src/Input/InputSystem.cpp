#include <Input/InputSystem.hpp>
#include <Input/InputState.hpp>
#include <ECS/World.hpp>
#include <raylib.h>
#include <vector>

namespace Lumina::Input {

void InputSystem::Init(ECS::World& world)
{
    if (!world.HasResource<InputState>()) world.AddResource(InputState{});
}

void InputSystem::Update(ECS::World& world, float /*dt*/)
{
    world.WithResourceMut<InputState>([](InputState* in) {
        if (!in) return;
        in->EndFrame();

        // Newly pressed keys come from raylib's key queue (0 when empty).
        int key;
        while ((key = ::GetKeyPressed()) != 0) in->PressKey(key);

        // Held keys that went up since last frame.
        const std::vector<int> held(in->KeysDown().begin(), in->KeysDown().end());
        for (int k : held)
            if (::IsKeyUp(k)) in->ReleaseKey(k);

        for (int btn = MOUSE_BUTTON_LEFT; btn <= MOUSE_BUTTON_BACK; ++btn) {
            if (::IsMouseButtonPressed(btn))  in->PressMouseButton(btn);
            if (::IsMouseButtonReleased(btn)) in->ReleaseMouseButton(btn);
        }

        in->SetMousePosition(::GetMousePosition());
        in->AddMouseDelta(::GetMouseDelta());
        in->AddMouseWheel(::GetMouseWheelMove());
    });
}

} // namespace Lumina::Input
