module;
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <cstdint>
#include <string>

module Core:Window.Impl;
import :Logging;
import :Window;

namespace Core::Windowing
{
    namespace
    {
        // GLFW is initialized by the first window and terminated with the last one.
        int s_LiveWindows = 0;

        void GLFWErrorCallback(int error, const char* description)
        {
            Log::Error("GLFW error {}: {}", error, description);
        }

        bool AcquireGLFW()
        {
            if (s_LiveWindows == 0)
            {
                glfwSetErrorCallback(GLFWErrorCallback);
                if (!glfwInit())
                {
                    Log::Error("Window: glfwInit failed.");
                    return false;
                }
            }
            ++s_LiveWindows;
            return true;
        }

        void ReleaseGLFW()
        {
            if (s_LiveWindows > 0 && --s_LiveWindows == 0) glfwTerminate();
        }

        template <typename E>
        void Dispatch(GLFWwindow* window, const E& event)
        {
            auto* data = static_cast<Window::WindowData*>(glfwGetWindowUserPointer(window));
            if (data && data->Callback) data->Callback(Event{event});
        }

        bool IsEdge(int action)
        {
            return action == GLFW_PRESS || action == GLFW_RELEASE;
        }
    }

    Window::Window(const WindowProps& props)
    {
        Init(props);
    }

    Window::~Window()
    {
        Shutdown();
    }

    void Window::Init(const WindowProps& props)
    {
        m_Data.Title = props.Title;
        Log::Info("Window: creating '{}' ({}x{}).", props.Title, props.WindowWidth, props.WindowHeight);

        if (!AcquireGLFW()) return;

        // Rendering goes through Vulkan; no GL context.
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        GLFWwindow* window = glfwCreateWindow(props.WindowWidth, props.WindowHeight, m_Data.Title.c_str(), nullptr,
                                              nullptr);
        if (!window)
        {
            Log::Error("Window: glfwCreateWindow failed for '{}'.", props.Title);
            ReleaseGLFW();
            return;
        }

        m_Window = window;
        m_IsValid = true;
        glfwGetFramebufferSize(window, &m_Data.FramebufferWidth, &m_Data.FramebufferHeight);
        glfwSetWindowUserPointer(window, &m_Data);

        glfwSetFramebufferSizeCallback(window, [](GLFWwindow* w, int width, int height)
        {
            auto* data = static_cast<WindowData*>(glfwGetWindowUserPointer(w));
            data->FramebufferWidth = width;
            data->FramebufferHeight = height;
            Dispatch(w, WindowResizeEvent{width, height});
        });
        glfwSetWindowCloseCallback(window, [](GLFWwindow* w)
        {
            Dispatch(w, WindowCloseEvent{});
        });
        glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int, int action, int)
        {
            if (IsEdge(action)) Dispatch(w, KeyEvent{key, action == GLFW_PRESS});
        });
        glfwSetMouseButtonCallback(window, [](GLFWwindow* w, int button, int action, int)
        {
            if (IsEdge(action)) Dispatch(w, MouseButtonEvent{button, action == GLFW_PRESS});
        });
        glfwSetScrollCallback(window, [](GLFWwindow* w, double x, double y)
        {
            Dispatch(w, ScrollEvent{x, y});
        });
        glfwSetCursorPosCallback(window, [](GLFWwindow* w, double x, double y)
        {
            Dispatch(w, CursorEvent{x, y});
        });
    }

    void Window::Shutdown()
    {
        if (!m_Window) return;
        glfwDestroyWindow(static_cast<GLFWwindow*>(m_Window));
        m_Window = nullptr;
        m_IsValid = false;
        ReleaseGLFW();
    }

    void Window::OnUpdate()
    {
        if (m_IsValid) glfwPollEvents();
    }

    void Window::WaitEvents()
    {
        if (m_IsValid) glfwWaitEvents();
    }

    int Window::GetFramebufferWidth() const
    {
        return m_Data.FramebufferWidth;
    }

    int Window::GetFramebufferHeight() const
    {
        return m_Data.FramebufferHeight;
    }

    bool Window::ShouldClose() const
    {
        if (!m_IsValid) return true;
        return glfwWindowShouldClose(static_cast<GLFWwindow*>(m_Window));
    }

    bool Window::CreateSurface(void* instance, void* allocator, void* surfaceOut)
    {
        if (!m_IsValid) return false;
        const VkResult result = glfwCreateWindowSurface(static_cast<VkInstance>(instance),
                                                        static_cast<GLFWwindow*>(m_Window),
                                                        static_cast<const VkAllocationCallbacks*>(allocator),
                                                        static_cast<VkSurfaceKHR*>(surfaceOut));
        if (result != VK_SUCCESS)
        {
            Log::Error("Window: glfwCreateWindowSurface failed (VkResult {}).", static_cast<int>(result));
            return false;
        }
        return true;
    }

    const char** Window::GetRequiredInstanceExtensions(uint32_t* count)
    {
        return glfwGetRequiredInstanceExtensions(count);
    }

    void Window::SetTitle(const std::string& title) const
    {
        if (m_IsValid) glfwSetWindowTitle(static_cast<GLFWwindow*>(m_Window), title.c_str());
    }
}
