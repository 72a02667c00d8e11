#include <Input/InputState.hpp>

namespace Lumina::Input {

void InputState::PressKey(int key)
{
    // Only a transition counts as "just pressed"; OS key repeat does not.
    if (m_keysDown.insert(key).second) m_keysPressed.insert(key);
}

void InputState::ReleaseKey(int key)
{
    m_keysDown.erase(key);
    m_keysReleased.insert(key);
}

void InputState::PressMouseButton(int btn)
{
    if (m_buttonsDown.insert(btn).second) m_buttonsPressed.insert(btn);
}

void InputState::ReleaseMouseButton(int btn)
{
    m_buttonsDown.erase(btn);
    m_buttonsReleased.insert(btn);
}

void InputState::AddMouseDelta(Vector2 delta)
{
    m_mouseDelta.x += delta.x;
    m_mouseDelta.y += delta.y;
}

void InputState::EndFrame()
{
    m_keysPressed.clear();
    m_keysReleased.clear();
    m_buttonsPressed.clear();
    m_buttonsReleased.clear();
    m_mouseDelta = { 0.0f, 0.0f };
    m_mouseWheel = 0.0f;
}

void InputState::Reset()
{
    EndFrame();
    m_keysDown.clear();
    m_buttonsDown.clear();
    m_mousePos = { 0.0f, 0.0f };
}

} // namespace Lumina::Input
