module;
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

export module Runtime:SceneDriver;

import :CameraInput;
import Core;
import RHI;
import Graphics;

export namespace Runtime
{
    struct SceneDriverConfig
    {
        Core::Windowing::WindowProps Window{};
        RHI::GpuContextConfig Gpu{};
        bool Headless = false;

        // Empty: assets/models/cube.obj
        std::filesystem::path ModelPath;
        // Empty: the directory the build compiled the shaders into.
        std::filesystem::path ShaderDirectory;

        uint32_t InstancesPerRow = 10;
        float InstanceSpacing = 3.0f;

        Graphics::Camera InitialCamera{.Position = {-16.0f, 8.0f, -16.0f}, .Yaw = -45.0f, .Pitch = -20.0f};
        Graphics::Light InitialLight{};
        float LightOrbitDegreesPerTick = 1.0f;

        CameraInputConfig Input{};
        Graphics::FrameRendererConfig Renderer{};

        // 0 runs until the window closes.
        uint64_t MaxFrames = 0;
    };

    // -------------------------------------------------------------------------
    // SceneDriver
    // -------------------------------------------------------------------------
    // Owns the window, the GPU context and every scene component, and runs the
    // per-tick sequence:
    //   poll events -> apply resize -> camera delta -> update mirrors ->
    //   write mirrors for this slot -> render one frame.
    class SceneDriver
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<SceneDriver>> Create(const SceneDriverConfig& config);
        ~SceneDriver();

        SceneDriver(const SceneDriver&) = delete;
        SceneDriver& operator=(const SceneDriver&) = delete;

        // Returns the process exit code: 0 on a normal close, 1 after a fatal error.
        int Run();

        [[nodiscard]] Core::Expected<Graphics::FrameStats> Tick(float dt);

        // Applied at the start of the next tick. Zero on either axis pauses rendering.
        void RequestResize(uint32_t width, uint32_t height);
        void ApplyCameraDelta(const Graphics::CameraDelta& delta);
        void SetInstances(const std::vector<Graphics::Instance>& instances);
        void Stop() { m_Running = false; }

        [[nodiscard]] RHI::GpuContext& GetGpuContext() { return *m_Gpu; }
        [[nodiscard]] Graphics::ResourceUploader& GetUploader() { return *m_Uploader; }
        [[nodiscard]] const Graphics::Camera& GetCamera() const { return m_Camera; }
        [[nodiscard]] const Graphics::Light& GetLight() const { return m_Light; }
        [[nodiscard]] const Graphics::InstanceBuffer& GetInstances() const { return *m_Instances; }
        [[nodiscard]] const std::vector<Graphics::DrawItem>& GetDraws() const { return m_Draws; }
        [[nodiscard]] uint64_t GetTickCount() const { return m_TickCount; }

    private:
        explicit SceneDriver(const SceneDriverConfig& config);

        SceneDriverConfig m_Config;

        // Declaration order is destruction order in reverse: GPU objects die before the context.
        std::unique_ptr<Core::Windowing::Window> m_Window;
        std::unique_ptr<RHI::GpuContext> m_Gpu;
        std::unique_ptr<Graphics::ResourceUploader> m_Uploader;
        std::unique_ptr<Graphics::CameraUniform> m_CameraUniform;
        std::unique_ptr<Graphics::LightUniform> m_LightUniform;
        std::unique_ptr<Graphics::InstanceBuffer> m_Instances;
        std::unique_ptr<Graphics::RenderPipelineSet> m_Pipelines;
        std::unique_ptr<Graphics::FrameRenderer> m_Renderer;

        std::vector<Graphics::DrawItem> m_Draws;
        Graphics::Camera m_Camera;
        Graphics::Light m_Light;
        CameraInput m_Input;

        std::optional<VkExtent2D> m_PendingResize;
        bool m_CameraDirty = true;
        bool m_Running = true;
        uint64_t m_TickCount = 0;

        void OnEvent(const Core::Windowing::Event& event);
        [[nodiscard]] Core::Result ApplyPendingResize();
        void AdvanceLight();
    };
}
