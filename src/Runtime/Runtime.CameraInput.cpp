module;
#include <cstdint>

module Runtime:CameraInput.Impl;
import :CameraInput;
import Core;
import Graphics;

namespace Runtime
{
    void CameraInput::OnKey(int keyCode, bool pressed)
    {
        using namespace Core::Input;

        switch (keyCode)
        {
            case Key::W:
            case Key::Up:        m_Forward = pressed; break;
            case Key::S:
            case Key::Down:      m_Backward = pressed; break;
            case Key::A:
            case Key::Left:      m_Left = pressed; break;
            case Key::D:
            case Key::Right:     m_Right = pressed; break;
            case Key::Space:     m_Up = pressed; break;
            case Key::LeftShift: m_Down = pressed; break;
            default: break;
        }
    }

    void CameraInput::OnMouseButton(int button, bool pressed)
    {
        if (button != Core::Input::MouseButton::Right) return;
        m_Looking = pressed;
        // Re-anchor on the next cursor event so the press itself does not rotate.
        m_HasCursor = false;
    }

    void CameraInput::OnCursor(double x, double y)
    {
        if (m_Looking && m_HasCursor)
        {
            // Dragging right turns right (yaw decreases), dragging up looks up.
            m_PendingYaw -= static_cast<float>(x - m_LastX) * m_Config.LookSensitivity;
            m_PendingPitch -= static_cast<float>(y - m_LastY) * m_Config.LookSensitivity;
        }
        m_LastX = x;
        m_LastY = y;
        m_HasCursor = true;
    }

    void CameraInput::OnScroll(double yOffset)
    {
        // Scrolling up narrows the field of view.
        m_PendingFov -= static_cast<float>(yOffset) * m_Config.ZoomSensitivity;
    }

    Graphics::CameraDelta CameraInput::Consume(float dt)
    {
        const float step = m_Config.MoveSpeed * dt;

        Graphics::CameraDelta delta;
        delta.Forward = (static_cast<float>(m_Forward) - static_cast<float>(m_Backward)) * step;
        delta.Right = (static_cast<float>(m_Right) - static_cast<float>(m_Left)) * step;
        delta.Up = (static_cast<float>(m_Up) - static_cast<float>(m_Down)) * step;
        delta.Yaw = m_PendingYaw;
        delta.Pitch = m_PendingPitch;
        delta.Fov = m_PendingFov;

        m_PendingYaw = 0.0f;
        m_PendingPitch = 0.0f;
        m_PendingFov = 0.0f;
        return delta;
    }
}
