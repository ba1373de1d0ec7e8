module;
#include <cstdint>

export module Runtime:CameraInput;

import Core;
import Graphics;

export namespace Runtime
{
    struct CameraInputConfig
    {
        float MoveSpeed = 5.0f;         // world units per second
        float LookSensitivity = 0.2f;   // degrees per pixel of drag
        float ZoomSensitivity = 1.0f;   // fov degrees per scroll step
    };

    // Translates key/mouse events into camera deltas. Holds no window handle; the
    // scene driver forwards events from Core::Windowing::Window.
    //   WASD / arrows: move, Space / LeftShift: up / down,
    //   right mouse drag: look, scroll: zoom.
    class CameraInput
    {
    public:
        explicit CameraInput(CameraInputConfig config = {}) : m_Config(config) {}

        void OnKey(int keyCode, bool pressed);
        void OnMouseButton(int button, bool pressed);
        void OnCursor(double x, double y);
        void OnScroll(double yOffset);

        // Movement for dt seconds plus the rotation/zoom gathered since the last call.
        [[nodiscard]] Graphics::CameraDelta Consume(float dt);

    private:
        CameraInputConfig m_Config;

        bool m_Forward = false;
        bool m_Backward = false;
        bool m_Left = false;
        bool m_Right = false;
        bool m_Up = false;
        bool m_Down = false;

        bool m_Looking = false;
        bool m_HasCursor = false;
        double m_LastX = 0.0;
        double m_LastY = 0.0;

        float m_PendingYaw = 0.0f;
        float m_PendingPitch = 0.0f;
        float m_PendingFov = 0.0f;
    };
}
