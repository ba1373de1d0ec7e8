module;
#include <cassert>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

module Graphics:FrameRenderer.Impl;
import :FrameRenderer;
import :CameraUniform;
import :LightUniform;
import :InstanceBuffer;
import :ResourceUploader;
import :RenderPipelineSet;
import :FrameStateMachine;
import RHI;
import Core;

namespace Graphics
{
    namespace
    {
        VkImageAspectFlags DepthAspect(VkFormat format)
        {
            if (format == VK_FORMAT_D32_SFLOAT_S8_UINT || format == VK_FORMAT_D24_UNORM_S8_UINT)
                return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;
            return VK_IMAGE_ASPECT_DEPTH_BIT;
        }
    }

    FrameRenderer::FrameRenderer(RHI::GpuContext& context, const ResourceUploader& uploader,
                                 RenderPipelineSet& pipelines, FrameRendererConfig config)
        : m_Context(context), m_Uploader(uploader), m_Pipelines(pipelines), m_Config(config)
    {
    }

    FrameRenderer::~FrameRenderer() = default;

    void FrameRenderer::Transition(FrameState next)
    {
        assert(IsValidTransition(m_State, next) && "illegal frame state transition");
        m_State = next;
    }

    Core::Result FrameRenderer::CheckMirrors(const SceneView& scene) const
    {
        if (!scene.Camera || !scene.Light || !scene.Instances)
        {
            Core::Log::Error("RenderFrame: scene view is missing its camera, light or instance mirror.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        const uint32_t slot = m_Context.GetFrameIndex();
        const bool cameraOk = scene.Camera->GetMirror().IsSynchronized(slot);
        const bool lightOk = scene.Light->GetMirror().IsSynchronized(slot);
        const bool instancesOk = scene.Instances->IsSynchronized(slot);
        if (!cameraOk || !lightOk || !instancesOk)
        {
            Core::Log::Error("RenderFrame: stale GPU mirror for frame slot {} (camera={}, light={}, instances={}). "
                             "Call WriteToGpu() after every update.", slot, cameraOk, lightOk, instancesOk);
            return std::unexpected(Core::ErrorCode::StaleGpuMirror);
        }
        return Core::Ok(Core::Unit{});
    }

    Core::Result FrameRenderer::EnsureDepthTarget(VkExtent2D extent)
    {
        const VkFormat depthFormat = m_Pipelines.GetDepthFormat();
        if (m_DepthImage && m_DepthImage->GetWidth() == extent.width && m_DepthImage->GetHeight() == extent.height &&
            m_DepthImage->GetFormat() == depthFormat)
        {
            return Core::Ok(Core::Unit{});
        }

        // The previous image is released once the frames using it have retired.
        m_DepthImage = std::make_unique<RHI::VulkanImage>(m_Context.GetDevice(), extent.width, extent.height, 1,
                                                          depthFormat, VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
                                                          VK_IMAGE_ASPECT_DEPTH_BIT);
        if (!m_DepthImage->IsValid())
        {
            Core::Log::Error("FrameRenderer: depth target {}x{} could not be created.", extent.width, extent.height);
            m_DepthImage.reset();
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
        }
        return Core::Ok(Core::Unit{});
    }

    Core::Result FrameRenderer::PrepareSurfaceTargets()
    {
        const VkFormat format = m_Context.GetSurfaceCapabilities().ColorFormat;
        if (!m_Pipelines.IsCompatible(format))
        {
            Core::Log::Info("Surface format changed to {}, rebuilding pipelines.", static_cast<int>(format));
            if (auto rebuilt = m_Pipelines.Rebuild(format); !rebuilt) return rebuilt;
        }
        return EnsureDepthTarget(m_Context.GetExtent());
    }

    Core::Expected<FrameStats> FrameRenderer::RenderFrame(const SceneView& scene)
    {
        FrameStats stats;

        if (m_Context.IsMinimized())
        {
            Transition(FrameState::Idle);
            stats.Skipped = true;
            stats.SubmissionCount = m_Context.GetSubmissionCount();
            return stats;
        }

        if (auto mirrors = CheckMirrors(scene); !mirrors)
        {
            return std::unexpected(mirrors.error());
        }

        if (auto prepared = PrepareSurfaceTargets(); !prepared)
        {
            return std::unexpected(prepared.error());
        }

        // --- Idle -> FrameAcquired ---
        // A reconfigure may change format or extent, so targets are re-prepared before the retry.
        auto frame = AcquireWithRetry([&] { return m_Context.AcquireFrame(); },
                                      [&]() -> Core::Result
                                      {
                                          if (auto r = m_Context.Reconfigure(); !r) return r;
                                          return PrepareSurfaceTargets();
                                      });
        if (!frame)
        {
            Transition(FrameState::Idle);
            if (frame.error() == Core::ErrorCode::SurfaceMinimized)
            {
                stats.Skipped = true;
                stats.SubmissionCount = m_Context.GetSubmissionCount();
                return stats;
            }
            return std::unexpected(frame.error());
        }
        Transition(FrameState::FrameAcquired);
        stats.ImageIndex = frame->ImageIndex;

        // --- FrameAcquired -> CommandsRecorded ---
        VkCommandBuffer cmd = m_Context.GetFrameCommandBuffer();
        VK_CHECK(vkResetCommandBuffer(cmd, 0));

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        VK_CHECK(vkBeginCommandBuffer(cmd, &beginInfo));

        RecordCommands(cmd, *frame, scene, stats);

        VK_CHECK(vkEndCommandBuffer(cmd));
        Transition(FrameState::CommandsRecorded);

        // --- CommandsRecorded -> Submitted ---
        if (auto submitted = m_Context.Submit(cmd); !submitted)
        {
            Core::Log::Error("RenderFrame: submission of frame {} failed ({}).", m_Context.GetFrameNumber(),
                             Core::ErrorCodeToString(submitted.error()));
            m_State = FrameState::Idle;
            return std::unexpected(submitted.error());
        }
        Transition(FrameState::Submitted);
        stats.SubmissionCount = m_Context.GetSubmissionCount();

        // --- Submitted -> Presented -> Idle ---
        if (auto presented = m_Context.Present(*frame); !presented)
        {
            Core::Log::Error("RenderFrame: present failed ({}).", Core::ErrorCodeToString(presented.error()));
            m_State = FrameState::Idle;
            return std::unexpected(presented.error());
        }
        Transition(FrameState::Presented);
        Transition(FrameState::Idle);

        return stats;
    }

    void FrameRenderer::RecordCommands(VkCommandBuffer cmd, const RHI::FrameImage& frame, const SceneView& scene,
                                       FrameStats& stats)
    {
        const uint32_t slot = frame.FrameSlot;
        const VkImageAspectFlags depthAspect = DepthAspect(m_DepthImage->GetFormat());

        // The acquire semaphore is waited at COLOR_ATTACHMENT_OUTPUT; the layout change must follow it.
        RHI::CommandUtils::ImageBarrier(cmd, {.Image = frame.Image,
                                              .OldLayout = VK_IMAGE_LAYOUT_UNDEFINED,
                                              .NewLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                                              .SrcStage = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                                              .SrcAccess = 0,
                                              .DstStage = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                                              .DstAccess = VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT});

        // One depth image serves both frame slots: order against the previous frame's depth writes.
        constexpr VkPipelineStageFlags2 depthStages =
            VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT;
        RHI::CommandUtils::ImageBarrier(cmd, {.Image = m_DepthImage->GetHandle(),
                                              .Aspect = depthAspect,
                                              .OldLayout = VK_IMAGE_LAYOUT_UNDEFINED,
                                              .NewLayout = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL,
                                              .SrcStage = depthStages,
                                              .SrcAccess = VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
                                              .DstStage = depthStages,
                                              .DstAccess = VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT |
                                                           VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT});

        VkRenderingAttachmentInfo colorAttachment{};
        colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        colorAttachment.imageView = frame.View;
        colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        colorAttachment.clearValue.color = {{m_Config.ClearColor.r, m_Config.ClearColor.g,
                                             m_Config.ClearColor.b, m_Config.ClearColor.a}};

        VkRenderingAttachmentInfo depthAttachment{};
        depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        depthAttachment.imageView = m_DepthImage->GetView();
        depthAttachment.imageLayout = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL;
        depthAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        depthAttachment.clearValue.depthStencil = {1.0f, 0};

        VkRenderingInfo renderInfo{};
        renderInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
        renderInfo.renderArea = {{0, 0}, frame.Extent};
        renderInfo.layerCount = 1;
        renderInfo.colorAttachmentCount = 1;
        renderInfo.pColorAttachments = &colorAttachment;
        renderInfo.pDepthAttachment = &depthAttachment;

        vkCmdBeginRendering(cmd, &renderInfo);

        VkViewport viewport{};
        viewport.width = static_cast<float>(frame.Extent.width);
        viewport.height = static_cast<float>(frame.Extent.height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;
        vkCmdSetViewport(cmd, 0, 1, &viewport);

        VkRect2D scissor{{0, 0}, frame.Extent};
        vkCmdSetScissor(cmd, 0, 1, &scissor);

        const RHI::GraphicsPipeline& meshPipeline = m_Pipelines.GetMeshPipeline();
        const VkPipelineLayout layout = meshPipeline.GetLayout();
        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, meshPipeline.GetHandle());

        auto bind = [&](VkPipelineLayout pipelineLayout, uint32_t set, VkDescriptorSet descriptorSet, BindPoint point)
        {
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipelineLayout, set, 1, &descriptorSet, 0,
                                    nullptr);
            stats.BindOrder.push_back(point);
        };

        bind(layout, kCameraSet, scene.Camera->GetMirror().GetDescriptorSet(slot), BindPoint::Camera);
        bind(layout, kLightSet, scene.Light->GetMirror().GetDescriptorSet(slot), BindPoint::Light);

        const uint32_t instanceCount = scene.Instances->GetGpuInstanceCount(slot);
        const GpuMesh* firstMesh = nullptr;

        for (const DrawItem& item : scene.Draws)
        {
            auto mesh = m_Uploader.GetMesh(item.Mesh);
            auto material = m_Uploader.GetMaterial(item.Material);
            if (!mesh || !material)
            {
                Core::Log::Warn("RenderFrame: skipping draw with unknown mesh {} / material {}.", item.Mesh,
                                item.Material);
                ++stats.SkippedDraws;
                continue;
            }

            const GpuMesh& gpuMesh = **mesh;
            if (!firstMesh) firstMesh = &gpuMesh;
            if (instanceCount == 0) continue;

            bind(layout, kMaterialSet, (*material)->DescriptorSet, BindPoint::Material);
            bind(layout, kInstanceSet, scene.Instances->GetDescriptorSet(slot), BindPoint::Instance);

            VkBuffer vertexBuffer = gpuMesh.VertexBuffer->GetHandle();
            VkDeviceSize offset = 0;
            vkCmdBindVertexBuffers(cmd, 0, 1, &vertexBuffer, &offset);
            vkCmdBindIndexBuffer(cmd, gpuMesh.IndexBuffer->GetHandle(), 0, VK_INDEX_TYPE_UINT32);
            vkCmdDrawIndexed(cmd, gpuMesh.IndexCount, instanceCount, 0, 0, 0);

            stats.Draws.push_back({item.Mesh, gpuMesh.IndexCount, instanceCount});
        }

        // Marker: the first mesh, scaled down at the light position, in the light color.
        if (m_Config.DrawLightMarker && firstMesh)
        {
            const RHI::GraphicsPipeline& markerPipeline = m_Pipelines.GetMarkerPipeline();
            vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, markerPipeline.GetHandle());

            VkDescriptorSet markerSets[] = {scene.Camera->GetMirror().GetDescriptorSet(slot),
                                            scene.Light->GetMirror().GetDescriptorSet(slot)};
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, markerPipeline.GetLayout(), kCameraSet, 2,
                                    markerSets, 0, nullptr);

            VkBuffer vertexBuffer = firstMesh->VertexBuffer->GetHandle();
            VkDeviceSize offset = 0;
            vkCmdBindVertexBuffers(cmd, 0, 1, &vertexBuffer, &offset);
            vkCmdBindIndexBuffer(cmd, firstMesh->IndexBuffer->GetHandle(), 0, VK_INDEX_TYPE_UINT32);
            vkCmdDrawIndexed(cmd, firstMesh->IndexCount, 1, 0, 0, 0);
            stats.MarkerDrawn = true;
        }

        vkCmdEndRendering(cmd);

        const RHI::SurfaceCapabilities& caps = m_Context.GetSurfaceCapabilities();
        const bool toTransfer = caps.FinalLayout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        RHI::CommandUtils::ImageBarrier(cmd, {.Image = frame.Image,
                                              .OldLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                                              .NewLayout = caps.FinalLayout,
                                              .SrcStage = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                                              .SrcAccess = VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
                                              .DstStage = toTransfer ? VK_PIPELINE_STAGE_2_TRANSFER_BIT
                                                                     : VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT,
                                              .DstAccess = toTransfer ? VK_ACCESS_2_TRANSFER_READ_BIT
                                                                      : VK_ACCESS_2_NONE});
    }
}
