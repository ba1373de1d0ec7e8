module;
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

export module Graphics:FrameRenderer;

import :CameraUniform;
import :LightUniform;
import :InstanceBuffer;
import :ResourceUploader;
import :RenderPipelineSet;
import :FrameStateMachine;
import RHI;
import Core;

export namespace Graphics
{
    struct FrameRendererConfig
    {
        glm::vec4 ClearColor{0.1f, 0.2f, 0.3f, 1.0f};
        bool DrawLightMarker = true;
    };

    struct DrawItem
    {
        MeshHandle Mesh;
        MaterialHandle Material;
    };

    // Everything one frame reads. The mirrors must have been written for the current
    // frame slot; the renderer checks but never writes them itself.
    struct SceneView
    {
        std::span<const DrawItem> Draws;
        const CameraUniform* Camera = nullptr;
        const LightUniform* Light = nullptr;
        const InstanceBuffer* Instances = nullptr;
    };

    enum class BindPoint : uint8_t
    {
        Camera,
        Light,
        Material,
        Instance
    };

    struct DrawRecord
    {
        MeshHandle Mesh;
        uint32_t IndexCount = 0;
        uint32_t InstanceCount = 0;
    };

    struct FrameStats
    {
        std::vector<DrawRecord> Draws;   // Indexed mesh draws, marker excluded
        std::vector<BindPoint> BindOrder;
        uint64_t SubmissionCount = 0;    // GpuContext total after this frame
        uint32_t ImageIndex = 0;
        uint32_t SkippedDraws = 0;       // Draw items whose mesh/material handle did not resolve
        bool Skipped = false;            // Surface minimized, nothing acquired
        bool MarkerDrawn = false;
    };

    // -------------------------------------------------------------------------
    // FrameRenderer
    // -------------------------------------------------------------------------
    // Idle -> FrameAcquired -> CommandsRecorded -> Submitted -> Presented -> Idle.
    // Acquisition gets one reconfigure-and-retry; anything failing from submission on
    // is returned as is and treated as fatal by the caller.
    class FrameRenderer
    {
    public:
        FrameRenderer(RHI::GpuContext& context, const ResourceUploader& uploader, RenderPipelineSet& pipelines,
                      FrameRendererConfig config = {});
        ~FrameRenderer();

        FrameRenderer(const FrameRenderer&) = delete;
        FrameRenderer& operator=(const FrameRenderer&) = delete;

        // StaleGpuMirror when a mirror was updated but not written for the current slot.
        [[nodiscard]] Core::Expected<FrameStats> RenderFrame(const SceneView& scene);

        [[nodiscard]] FrameState GetState() const { return m_State; }
        [[nodiscard]] const FrameRendererConfig& GetConfig() const { return m_Config; }
        void SetDrawLightMarker(bool enabled) { m_Config.DrawLightMarker = enabled; }

    private:
        RHI::GpuContext& m_Context;
        const ResourceUploader& m_Uploader;
        RenderPipelineSet& m_Pipelines;
        FrameRendererConfig m_Config;

        std::unique_ptr<RHI::VulkanImage> m_DepthImage;
        FrameState m_State = FrameState::Idle;

        void Transition(FrameState next);
        [[nodiscard]] Core::Result EnsureDepthTarget(VkExtent2D extent);
        // Pipelines and depth target matching the current surface. Runs while no image is held.
        [[nodiscard]] Core::Result PrepareSurfaceTargets();
        [[nodiscard]] Core::Result CheckMirrors(const SceneView& scene) const;
        void RecordCommands(VkCommandBuffer cmd, const RHI::FrameImage& frame, const SceneView& scene,
                            FrameStats& stats);
    };
}
