export module Core:Input;

// Key and button codes as delivered by Core::Windowing key/mouse events.
// Values match GLFW so the window layer forwards them untranslated.
export namespace Core::Input
{
    namespace Key
    {
        constexpr int Space = 32;
        constexpr int A = 65;
        constexpr int D = 68;
        constexpr int S = 83;
        constexpr int W = 87;
        constexpr int Escape = 256;
        constexpr int Right = 262;
        constexpr int Left = 263;
        constexpr int Down = 264;
        constexpr int Up = 265;
        constexpr int LeftShift = 340;
    }

    namespace MouseButton
    {
        constexpr int Left = 0;
        constexpr int Right = 1;
    }
}
