module;
#include <cstdint>
#include <string>
#include <functional>
#include <variant>

export module Core:Window;

export namespace Core::Windowing
{
    struct WindowProps
    {
        std::string Title = "Tessera";
        int WindowWidth = 1280;
        int WindowHeight = 720;
    };

    struct WindowCloseEvent
    {
    };

    // Framebuffer size in pixels. Zero on either axis means minimized.
    struct WindowResizeEvent
    {
        int Width;
        int Height;
    };

    struct KeyEvent
    {
        int KeyCode;
        bool IsPressed;
    };

    struct MouseButtonEvent
    {
        int ButtonCode;
        bool IsPressed;
    };

    struct ScrollEvent
    {
        double XOffset;
        double YOffset;
    };

    struct CursorEvent
    {
        double XPos;
        double YPos;
    };

    // Type-safe variant
    using Event = std::variant<
        WindowCloseEvent,
        WindowResizeEvent,
        KeyEvent,
        MouseButtonEvent,
        ScrollEvent,
        CursorEvent
    >;

    using EventCallbackFn = std::function<void(const Event&)>;

    class Window
    {
    public:
        explicit Window(const WindowProps& props);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        // Polls pending events; call once per tick.
        void OnUpdate();

        // Blocks until at least one event arrives. Used while the framebuffer is zero-sized.
        void WaitEvents();

        [[nodiscard]] bool ShouldClose() const;
        [[nodiscard]] int GetFramebufferWidth() const;
        [[nodiscard]] int GetFramebufferHeight() const;
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        void SetEventCallback(const EventCallbackFn& callback) { m_Data.Callback = callback; }

        void SetTitle(const std::string& title) const;

        // Vulkan types erased so the interface stays free of vulkan.h:
        // instance is a VkInstance, allocator a VkAllocationCallbacks*, surfaceOut a VkSurfaceKHR*.
        [[nodiscard]] bool CreateSurface(void* instance, void* allocator, void* surfaceOut);

        // Instance extensions the platform surface needs (VK_KHR_surface + platform one).
        [[nodiscard]] static const char** GetRequiredInstanceExtensions(uint32_t* count);

        // State reachable from the GLFW callbacks through the window user pointer.
        struct WindowData
        {
            std::string Title;
            int FramebufferWidth = 0;
            int FramebufferHeight = 0;
            EventCallbackFn Callback;
        };

    private:
        void* m_Window = nullptr;
        bool m_IsValid = false;
        WindowData m_Data;

        void Init(const WindowProps& props);
        void Shutdown();
    };
}
