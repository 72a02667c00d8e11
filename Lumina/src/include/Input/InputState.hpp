#pragma once

#include <raylib.h>
#include <unordered_set>

namespace Lumina::Input {

// ---------------------------------------------------------------------------
// InputState: per-frame keyboard / mouse state, kept as a World resource.
//
// Keys and buttons are raylib codes (KEY_W, MOUSE_BUTTON_LEFT, ...).
//
// Whoever owns the event loop feeds it (InputSystem does that from raylib);
// every other system reads it:
//
//   world.AddResource(Input::InputState{});
//   world.WithResourceMut<Input::InputState>([](Input::InputState* in) {
//       if (in) in->PressKey(KEY_SPACE);
//   });
//   world.WithResource<Input::InputState>([](const Input::InputState* in) {
//       if (in && in->IsKeyJustPressed(KEY_SPACE)) { /* jump */ }
//   });
//
// Call EndFrame() once all systems have read the frame's input.
// ---------------------------------------------------------------------------
class InputState {
public:
    // ── Keyboard ──────────────────────────────────────────────────────────────
    void PressKey(int key);
    void ReleaseKey(int key);

    [[nodiscard]] bool IsKeyDown(int key)         const { return m_keysDown.count(key) != 0; }
    [[nodiscard]] bool IsKeyJustPressed(int key)  const { return m_keysPressed.count(key) != 0; }
    [[nodiscard]] bool IsKeyJustReleased(int key) const { return m_keysReleased.count(key) != 0; }

    // ── Mouse ─────────────────────────────────────────────────────────────────
    void PressMouseButton(int btn);
    void ReleaseMouseButton(int btn);

    [[nodiscard]] bool IsMouseDown(int btn)         const { return m_buttonsDown.count(btn) != 0; }
    [[nodiscard]] bool IsMouseJustPressed(int btn)  const { return m_buttonsPressed.count(btn) != 0; }
    [[nodiscard]] bool IsMouseJustReleased(int btn) const { return m_buttonsReleased.count(btn) != 0; }

    void SetMousePosition(Vector2 pos) { m_mousePos = pos; }
    // Accumulates until EndFrame().
    void AddMouseDelta(Vector2 delta);
    void AddMouseWheel(float move) { m_mouseWheel += move; }

    [[nodiscard]] Vector2 MousePosition() const { return m_mousePos; }
    [[nodiscard]] Vector2 MouseDelta()    const { return m_mouseDelta; }
    [[nodiscard]] float   MouseWheel()    const { return m_mouseWheel; }

    // Clear the just-pressed / just-released sets, the mouse delta and wheel.
    // Held keys and buttons stay held.
    void EndFrame();

    // Everything released.
    void Reset();

    [[nodiscard]] const std::unordered_set<int>& KeysDown() const { return m_keysDown; }

private:
    std::unordered_set<int> m_keysDown;
    std::unordered_set<int> m_keysPressed;
    std::unordered_set<int> m_keysReleased;

    std::unordered_set<int> m_buttonsDown;
    std::unordered_set<int> m_buttonsPressed;
    std::unordered_set<int> m_buttonsReleased;

    Vector2 m_mousePos   { 0.0f, 0.0f };
    Vector2 m_mouseDelta { 0.0f, 0.0f };
    float   m_mouseWheel { 0.0f };
};

} // namespace Lumina::Input
