module;
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include "RHI.Vulkan.hpp"

module Runtime:SceneDriver.Impl;
import :SceneDriver;
import :CameraInput;
import Core;
import RHI;
import Graphics;

namespace Runtime
{
    SceneDriver::SceneDriver(const SceneDriverConfig& config)
        : m_Config(config), m_Camera(config.InitialCamera), m_Light(config.InitialLight), m_Input(config.Input)
    {
    }

    SceneDriver::~SceneDriver()
    {
        if (m_Gpu) m_Gpu->WaitIdle();
    }

    Core::Expected<std::unique_ptr<SceneDriver>> SceneDriver::Create(const SceneDriverConfig& config)
    {
        std::unique_ptr<SceneDriver> driver(new SceneDriver(config));

        if (!config.Headless)
        {
            driver->m_Window = std::make_unique<Core::Windowing::Window>(config.Window);
            if (!driver->m_Window->IsValid())
            {
                Core::Log::Error("SceneDriver: window creation failed.");
                return std::unexpected(Core::ErrorCode::DeviceInitFailed);
            }
            driver->m_Window->SetEventCallback([ptr = driver.get()](const Core::Windowing::Event& e)
            {
                ptr->OnEvent(e);
            });
        }

        auto gpu = RHI::GpuContext::Create(config.Gpu, driver->m_Window.get());
        if (!gpu)
        {
            Core::Log::Error("SceneDriver: GPU initialization failed ({}).", Core::ErrorCodeToString(gpu.error()));
            return std::unexpected(gpu.error());
        }
        driver->m_Gpu = std::move(*gpu);
        RHI::GpuContext& ctx = *driver->m_Gpu;

        const VkExtent2D extent = ctx.GetExtent();
        driver->m_Camera.SetAspect(extent.width, extent.height);

        driver->m_Uploader = std::make_unique<Graphics::ResourceUploader>(ctx);
        driver->m_CameraUniform = std::make_unique<Graphics::CameraUniform>(ctx);
        driver->m_LightUniform = std::make_unique<Graphics::LightUniform>(ctx);
        driver->m_Instances = std::make_unique<Graphics::InstanceBuffer>(ctx);
        if (!driver->m_Uploader->IsValid() || !driver->m_CameraUniform->IsValid() ||
            !driver->m_LightUniform->IsValid() || !driver->m_Instances->IsValid())
        {
            Core::Log::Error("SceneDriver: scene GPU resources could not be created.");
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
        }

        const std::filesystem::path shaderDir = config.ShaderDirectory.empty()
                                                    ? Core::Filesystem::GetShaderDirectory()
                                                    : config.ShaderDirectory;
        Graphics::PipelineSetLayouts layouts;
        layouts.Camera = &driver->m_CameraUniform->GetMirror().GetLayout();
        layouts.Light = &driver->m_LightUniform->GetMirror().GetLayout();
        layouts.Material = &driver->m_Uploader->GetMaterialLayout();
        layouts.Instance = &driver->m_Instances->GetLayout();

        auto pipelines = Graphics::RenderPipelineSet::Build(ctx, ctx.GetSurfaceCapabilities().ColorFormat, layouts,
                                                            shaderDir);
        if (!pipelines)
        {
            Core::Log::Error("SceneDriver: pipeline build failed ({}).", Core::ErrorCodeToString(pipelines.error()));
            return std::unexpected(pipelines.error());
        }
        driver->m_Pipelines = std::move(*pipelines);
        driver->m_Renderer = std::make_unique<Graphics::FrameRenderer>(ctx, *driver->m_Uploader,
                                                                       *driver->m_Pipelines, config.Renderer);

        const std::filesystem::path modelPath = config.ModelPath.empty()
                                                    ? std::filesystem::path(Core::Filesystem::GetAssetPath("models/cube.obj"))
                                                    : config.ModelPath;
        if (auto model = Graphics::ModelLoader::Load(modelPath, *driver->m_Uploader))
        {
            driver->m_Draws = std::move(model->Draws);
        }
        else
        {
            // The scene still renders (clear color only) without its model.
            Core::Log::Error("SceneDriver: model {} not loaded ({}, {}).", modelPath.string(),
                             Graphics::AssetErrorToString(model.error()),
                             Core::ErrorCodeToString(Graphics::ToErrorCode(model.error())));
        }

        driver->SetInstances(Graphics::MakeInstanceGrid(config.InstancesPerRow, config.InstanceSpacing));
        driver->m_LightUniform->Update(driver->m_Light);

        return driver;
    }

    void SceneDriver::OnEvent(const Core::Windowing::Event& e)
    {
        std::visit([this](auto&& event)
        {
            using T = std::decay_t<decltype(event)>;

            if constexpr (std::is_same_v<T, Core::Windowing::WindowCloseEvent>)
            {
                m_Running = false;
            }
            else if constexpr (std::is_same_v<T, Core::Windowing::WindowResizeEvent>)
            {
                RequestResize(static_cast<uint32_t>(event.Width), static_cast<uint32_t>(event.Height));
            }
            else if constexpr (std::is_same_v<T, Core::Windowing::KeyEvent>)
            {
                if (event.IsPressed && event.KeyCode == Core::Input::Key::Escape) m_Running = false;
                m_Input.OnKey(event.KeyCode, event.IsPressed);
            }
            else if constexpr (std::is_same_v<T, Core::Windowing::MouseButtonEvent>)
            {
                m_Input.OnMouseButton(event.ButtonCode, event.IsPressed);
            }
            else if constexpr (std::is_same_v<T, Core::Windowing::ScrollEvent>)
            {
                m_Input.OnScroll(event.YOffset);
            }
            else if constexpr (std::is_same_v<T, Core::Windowing::CursorEvent>)
            {
                m_Input.OnCursor(event.XPos, event.YPos);
            }
        }, e);
    }

    void SceneDriver::RequestResize(uint32_t width, uint32_t height)
    {
        m_PendingResize = VkExtent2D{width, height};
    }

    void SceneDriver::ApplyCameraDelta(const Graphics::CameraDelta& delta)
    {
        if (delta.IsZero()) return;
        m_Camera.ApplyDelta(delta);
        m_CameraDirty = true;
    }

    void SceneDriver::SetInstances(const std::vector<Graphics::Instance>& instances)
    {
        m_Instances->SetInstances(instances);
    }

    Core::Result SceneDriver::ApplyPendingResize()
    {
        if (!m_PendingResize) return Core::Ok(Core::Unit{});

        const VkExtent2D extent = *m_PendingResize;
        auto resized = m_Gpu->Resize(extent.width, extent.height);
        if (!resized)
        {
            // Stays pending and is retried next tick.
            Core::Log::Warn("Resize to {}x{} failed ({}), retrying next tick.", extent.width, extent.height,
                            Core::ErrorCodeToString(resized.error()));
            return resized;
        }

        m_PendingResize.reset();
        if (extent.width > 0 && extent.height > 0)
        {
            m_Camera.SetAspect(extent.width, extent.height);
            m_CameraDirty = true;
        }
        return resized;
    }

    void SceneDriver::AdvanceLight()
    {
        if (m_Config.LightOrbitDegreesPerTick == 0.0f) return;

        const glm::mat4 orbit = glm::rotate(glm::mat4(1.0f), glm::radians(m_Config.LightOrbitDegreesPerTick),
                                            glm::vec3(0.0f, 1.0f, 0.0f));
        m_Light.Position = glm::vec3(orbit * glm::vec4(m_Light.Position, 1.0f));
        m_LightUniform->Update(m_Light);
    }

    Core::Expected<Graphics::FrameStats> SceneDriver::Tick(float dt)
    {
        ++m_TickCount;
        if (m_Window) m_Window->OnUpdate();

        if (auto resized = ApplyPendingResize(); !resized)
        {
            if (resized.error() != Core::ErrorCode::SurfaceConfigFailed) return std::unexpected(resized.error());
        }

        ApplyCameraDelta(m_Input.Consume(dt));
        AdvanceLight();

        if (m_CameraDirty)
        {
            m_CameraUniform->Update(m_Camera);
            m_CameraDirty = false;
        }

        // Each write waits for this slot to retire and is skipped when the slot is current.
        if (auto r = m_CameraUniform->WriteToGpu(); !r) return std::unexpected(r.error());
        if (auto r = m_LightUniform->WriteToGpu(); !r) return std::unexpected(r.error());
        if (auto r = m_Instances->WriteToGpu(); !r) return std::unexpected(r.error());

        Graphics::SceneView scene;
        scene.Draws = m_Draws;
        scene.Camera = m_CameraUniform.get();
        scene.Light = m_LightUniform.get();
        scene.Instances = m_Instances.get();
        return m_Renderer->RenderFrame(scene);
    }

    int SceneDriver::Run()
    {
        auto lastTime = std::chrono::high_resolution_clock::now();
        auto titleTime = lastTime;
        uint64_t frames = 0;
        uint32_t titleFrames = 0;

        while (m_Running && !(m_Window && m_Window->ShouldClose()))
        {
            auto currentTime = std::chrono::high_resolution_clock::now();
            float dt = std::chrono::duration<float>(currentTime - lastTime).count();
            lastTime = currentTime;

            auto stats = Tick(dt);
            if (!stats)
            {
                const Core::ErrorCode error = stats.error();
                if (Core::IsTransientSurfaceError(error) || error == Core::ErrorCode::SurfaceConfigFailed)
                {
                    Core::Log::Warn("Frame {} dropped ({}).", m_Gpu->GetFrameNumber(),
                                    Core::ErrorCodeToString(error));
                    continue;
                }
                Core::Log::Error("Fatal error in frame {}: {}. Stopping.", m_Gpu->GetFrameNumber(),
                                 Core::ErrorCodeToString(error));
                m_Gpu->WaitIdle();
                return 1;
            }

            if (stats->Skipped)
            {
                // Minimized: nothing to present until the next resize event.
                if (m_Window) m_Window->WaitEvents();
                continue;
            }

            ++frames;
            ++titleFrames;
            const float titleElapsed = std::chrono::duration<float>(currentTime - titleTime).count();
            if (m_Window && titleElapsed >= 1.0f)
            {
                m_Window->SetTitle(std::format("{} | {:.0f} fps", m_Config.Window.Title,
                                               static_cast<float>(titleFrames) / titleElapsed));
                titleTime = currentTime;
                titleFrames = 0;
            }

            if (m_Config.MaxFrames != 0 && frames >= m_Config.MaxFrames) break;
        }

        m_Gpu->WaitIdle();
        Core::Log::Info("SceneDriver stopped after {} frames.", frames);
        return 0;
    }
}
