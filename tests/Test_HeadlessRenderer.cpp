#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

import Core;
import RHI;
import Graphics;

// ===========================================================================
// Headless renderer tests
//
// Real Vulkan device, offscreen color images instead of a swapchain. Skipped
// when no Vulkan 1.3 device is present.
// ===========================================================================

class HeadlessRendererTest : public ::testing::Test
{
protected:
    static constexpr VkExtent2D kExtent{64, 64};

    void SetUp() override
    {
        RHI::GpuContextConfig config;
        config.Instance.AppName = "HeadlessRendererTest";
        config.HeadlessExtent = kExtent;

        auto gpu = RHI::GpuContext::Create(config, nullptr);
        if (!gpu)
        {
            GTEST_SKIP() << "No usable Vulkan device: " << Core::ErrorCodeToString(gpu.error());
        }
        m_Gpu = std::move(*gpu);

        m_Uploader = std::make_unique<Graphics::ResourceUploader>(*m_Gpu);
        m_CameraUniform = std::make_unique<Graphics::CameraUniform>(*m_Gpu);
        m_LightUniform = std::make_unique<Graphics::LightUniform>(*m_Gpu);
        m_Instances = std::make_unique<Graphics::InstanceBuffer>(*m_Gpu);
        ASSERT_TRUE(m_Uploader->IsValid());
        ASSERT_TRUE(m_CameraUniform->IsValid());
        ASSERT_TRUE(m_LightUniform->IsValid());
        ASSERT_TRUE(m_Instances->IsValid());

        Graphics::PipelineSetLayouts layouts;
        layouts.Camera = &m_CameraUniform->GetMirror().GetLayout();
        layouts.Light = &m_LightUniform->GetMirror().GetLayout();
        layouts.Material = &m_Uploader->GetMaterialLayout();
        layouts.Instance = &m_Instances->GetLayout();

        auto pipelines = Graphics::RenderPipelineSet::Build(*m_Gpu, m_Gpu->GetSurfaceCapabilities().ColorFormat,
                                                            layouts, Core::Filesystem::GetShaderDirectory());
        ASSERT_TRUE(pipelines.has_value()) << Core::ErrorCodeToString(pipelines.error());
        m_Pipelines = std::move(*pipelines);

        m_Renderer = std::make_unique<Graphics::FrameRenderer>(*m_Gpu, *m_Uploader, *m_Pipelines,
                                                               Graphics::FrameRendererConfig{.DrawLightMarker = false});

        // Looking down -Z at the origin from z = 2.
        m_Camera.Position = {0.0f, 0.0f, 2.0f};
        m_Camera.Yaw = 90.0f;
        m_Camera.Pitch = 0.0f;
        m_Camera.SetAspect(kExtent.width, kExtent.height);

        m_Light.Position = {0.0f, 0.0f, 2.0f};
        m_Light.Color = {1.0f, 1.0f, 1.0f};
    }

    void TearDown() override
    {
        if (m_Gpu) m_Gpu->WaitIdle();
        m_Renderer.reset();
        m_Pipelines.reset();
        m_Instances.reset();
        m_LightUniform.reset();
        m_CameraUniform.reset();
        m_Uploader.reset();
        m_Gpu.reset();
    }

    // Triangle in the XY plane facing +Z, covering the image center.
    Graphics::MeshHandle UploadTriangle()
    {
        std::vector<Graphics::ModelVertex> vertices(3);
        vertices[0].Position = {-1.0f, -1.0f, 0.0f}; vertices[0].TexCoord = {0.0f, 1.0f};
        vertices[1].Position = { 1.0f, -1.0f, 0.0f}; vertices[1].TexCoord = {1.0f, 1.0f};
        vertices[2].Position = { 0.0f,  1.0f, 0.0f}; vertices[2].TexCoord = {0.5f, 0.0f};
        const std::vector<uint32_t> indices = {0, 1, 2};
        Graphics::ComputeTangents(vertices, indices);

        auto mesh = m_Uploader->UploadMesh(vertices, indices, "triangle");
        EXPECT_TRUE(mesh.has_value());
        return mesh.value_or(Graphics::MeshHandle{});
    }

    Graphics::MaterialHandle BuildSolidMaterial(std::array<uint8_t, 4> rgba)
    {
        auto texture = m_Uploader->UploadTexture(rgba, 1, 1, Graphics::TextureFormat::Rgba8Srgb, "solid");
        EXPECT_TRUE(texture.has_value());

        auto material = m_Uploader->BuildMaterial({.Name = "solid", .Diffuse = texture.value_or(Graphics::TextureHandle{})});
        EXPECT_TRUE(material.has_value());
        return material.value_or(Graphics::MaterialHandle{});
    }

    Core::Result WriteMirrors()
    {
        m_CameraUniform->Update(m_Camera);
        m_LightUniform->Update(m_Light);
        if (auto r = m_CameraUniform->WriteToGpu(); !r) return r;
        if (auto r = m_LightUniform->WriteToGpu(); !r) return r;
        return m_Instances->WriteToGpu();
    }

    Graphics::SceneView MakeView() const
    {
        Graphics::SceneView view;
        view.Draws = m_Draws;
        view.Camera = m_CameraUniform.get();
        view.Light = m_LightUniform.get();
        view.Instances = m_Instances.get();
        return view;
    }

    std::unique_ptr<RHI::GpuContext> m_Gpu;
    std::unique_ptr<Graphics::ResourceUploader> m_Uploader;
    std::unique_ptr<Graphics::CameraUniform> m_CameraUniform;
    std::unique_ptr<Graphics::LightUniform> m_LightUniform;
    std::unique_ptr<Graphics::InstanceBuffer> m_Instances;
    std::unique_ptr<Graphics::RenderPipelineSet> m_Pipelines;
    std::unique_ptr<Graphics::FrameRenderer> m_Renderer;

    Graphics::Camera m_Camera;
    Graphics::Light m_Light;
    std::vector<Graphics::DrawItem> m_Draws;
};

TEST_F(HeadlessRendererTest, NegotiatesOffscreenSurface)
{
    const auto& caps = m_Gpu->GetSurfaceCapabilities();
    EXPECT_EQ(caps.Kind, RHI::SurfaceKind::Headless);
    EXPECT_TRUE(caps.SupportsReadback);
    EXPECT_NE(caps.ColorFormat, VK_FORMAT_UNDEFINED);
    EXPECT_NE(caps.DepthFormat, VK_FORMAT_UNDEFINED);
    EXPECT_EQ(m_Gpu->GetExtent().width, kExtent.width);
    EXPECT_EQ(m_Gpu->GetExtent().height, kExtent.height);
}

TEST_F(HeadlessRendererTest, DefaultTexturesExist)
{
    EXPECT_TRUE(m_Uploader->GetTexture(m_Uploader->GetDefaultDiffuse()).has_value());
    EXPECT_TRUE(m_Uploader->GetTexture(m_Uploader->GetDefaultNormal()).has_value());
}

TEST_F(HeadlessRendererTest, UploadRejectsBadInput)
{
    const std::vector<Graphics::ModelVertex> vertices(3);
    const std::vector<uint32_t> outOfRange = {0, 1, 7};
    auto mesh = m_Uploader->UploadMesh(vertices, outOfRange);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::InvalidArgument);

    const std::array<uint8_t, 3> shortPixels{255, 0, 0};
    auto texture = m_Uploader->UploadTexture(shortPixels, 1, 1, Graphics::TextureFormat::Rgba8Srgb);
    ASSERT_FALSE(texture.has_value());
    EXPECT_EQ(texture.error(), Core::ErrorCode::InvalidArgument);

    auto material = m_Uploader->BuildMaterial({.Name = "bad", .Diffuse = Graphics::TextureHandle(999, 1)});
    ASSERT_FALSE(material.has_value());
    EXPECT_EQ(material.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(HeadlessRendererTest, UnwrittenMirrorIsRejectedBeforeAcquire)
{
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    const uint64_t submissions = m_Gpu->GetSubmissionCount();

    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), Core::ErrorCode::StaleGpuMirror);
    EXPECT_EQ(m_Gpu->GetSubmissionCount(), submissions);
    EXPECT_EQ(m_Renderer->GetState(), Graphics::FrameState::Idle);
}

TEST_F(HeadlessRendererTest, UpdateWithoutWriteIsStale)
{
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    m_CameraUniform->Update(m_Camera);
    m_LightUniform->Update(m_Light);

    // One frame per slot so both slots hold the current values.
    for (uint32_t i = 0; i < RHI::MAX_FRAMES_IN_FLIGHT; ++i)
    {
        ASSERT_TRUE(m_CameraUniform->WriteToGpu().has_value());
        ASSERT_TRUE(m_LightUniform->WriteToGpu().has_value());
        ASSERT_TRUE(m_Instances->WriteToGpu().has_value());
        ASSERT_TRUE(m_Renderer->RenderFrame(MakeView()).has_value());
    }

    // Every slot is current: rendering again needs no write.
    ASSERT_TRUE(m_Renderer->RenderFrame(MakeView()).has_value());

    m_Camera.Position.x += 1.0f;
    m_CameraUniform->Update(m_Camera);

    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), Core::ErrorCode::StaleGpuMirror);
}

TEST_F(HeadlessRendererTest, MissingSceneComponentIsInvalid)
{
    Graphics::SceneView view = MakeView();
    view.Light = nullptr;

    auto frame = m_Renderer->RenderFrame(view);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(HeadlessRendererTest, RepeatedWriteIsIdempotent)
{
    EXPECT_FALSE(m_Gpu->IsSlotWaited());
    m_CameraUniform->Update(m_Camera);
    const uint64_t generation = m_CameraUniform->GetMirror().GetSyncState().GetGeneration();
    ASSERT_TRUE(m_CameraUniform->WriteToGpu().has_value());
    EXPECT_TRUE(m_Gpu->IsSlotWaited());
    const uint64_t writes = m_CameraUniform->GetMirror().GetWriteCount();

    // Same value again: the slot is already current, nothing is written.
    ASSERT_TRUE(m_CameraUniform->WriteToGpu().has_value());
    EXPECT_EQ(m_CameraUniform->GetMirror().GetWriteCount(), writes);

    // Writing stamps the slot without advancing the generation; other slots still lag.
    const uint32_t slot = m_Gpu->GetFrameIndex();
    const Graphics::MirrorSyncState& sync = m_CameraUniform->GetMirror().GetSyncState();
    EXPECT_EQ(sync.GetGeneration(), generation);
    EXPECT_FALSE(sync.NeedsWrite(slot));
    EXPECT_TRUE(sync.NeedsWrite((slot + 1) % RHI::MAX_FRAMES_IN_FLIGHT));
    auto gpuCopy = m_CameraUniform->GetMirror().ReadMirror(slot);
    ASSERT_TRUE(gpuCopy.has_value());

    const Graphics::CameraUniformData expected = Graphics::BuildCameraUniformData(m_Camera);
    EXPECT_EQ(std::memcmp(&*gpuCopy, &expected, sizeof(expected)), 0);
}

TEST_F(HeadlessRendererTest, HundredInstancesInOneDraw)
{
    m_Draws.push_back({UploadTriangle(), BuildSolidMaterial({255, 255, 255, 255})});
    m_Instances->SetInstances(Graphics::MakeInstanceGrid(10, 3.0f));
    ASSERT_TRUE(WriteMirrors().has_value());

    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value()) << Core::ErrorCodeToString(frame.error());

    ASSERT_EQ(frame->Draws.size(), 1u);
    EXPECT_EQ(frame->Draws[0].InstanceCount, 100u);
    EXPECT_EQ(frame->Draws[0].IndexCount, 3u);
    EXPECT_EQ(frame->SkippedDraws, 0u);
    EXPECT_FALSE(frame->MarkerDrawn);

    // Frame-constant sets first, then per-draw sets.
    ASSERT_GE(frame->BindOrder.size(), 4u);
    EXPECT_EQ(frame->BindOrder[0], Graphics::BindPoint::Camera);
    EXPECT_EQ(frame->BindOrder[1], Graphics::BindPoint::Light);
    EXPECT_EQ(frame->BindOrder[2], Graphics::BindPoint::Material);
    EXPECT_EQ(frame->BindOrder[3], Graphics::BindPoint::Instance);

    EXPECT_EQ(m_Renderer->GetState(), Graphics::FrameState::Idle);
}

TEST_F(HeadlessRendererTest, UnresolvedDrawIsSkipped)
{
    m_Draws.push_back({Graphics::MeshHandle(42, 1), Graphics::MaterialHandle{}});
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    ASSERT_TRUE(WriteMirrors().has_value());

    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->Draws.empty());
    EXPECT_EQ(frame->SkippedDraws, 1u);
}

TEST_F(HeadlessRendererTest, InstanceBufferGrowsOnlyWhenNeeded)
{
    const uint32_t slot = m_Gpu->GetFrameIndex();
    const uint32_t initialCapacity = m_Instances->GetCapacity(slot);

    m_Instances->SetInstances(Graphics::MakeInstanceGrid(10, 3.0f));
    ASSERT_TRUE(m_Instances->WriteToGpu().has_value());
    EXPECT_GE(m_Instances->GetCapacity(slot), 100u);
    EXPECT_GT(m_Instances->GetCapacity(slot), initialCapacity);
    EXPECT_EQ(m_Instances->GetGpuInstanceCount(slot), 100u);
    const uint64_t reallocations = m_Instances->GetReallocationCount();
    EXPECT_GE(reallocations, 1u);

    // Shrinking keeps the buffer.
    m_Instances->SetInstances(Graphics::MakeInstanceGrid(5, 3.0f));
    ASSERT_TRUE(m_Instances->WriteToGpu().has_value());
    EXPECT_EQ(m_Instances->GetReallocationCount(), reallocations);
    EXPECT_EQ(m_Instances->GetGpuInstanceCount(slot), 25u);

    auto contents = m_Instances->ReadMirror(slot);
    ASSERT_TRUE(contents.has_value());
    ASSERT_EQ(contents->size(), 25u);
    EXPECT_EQ(std::memcmp(contents->data(), m_Instances->GetPackedInstances().data(),
                          25 * sizeof(Graphics::GpuInstance)), 0);
}

TEST_F(HeadlessRendererTest, MinimizedSurfaceSkipsFrames)
{
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    ASSERT_TRUE(WriteMirrors().has_value());

    ASSERT_TRUE(m_Gpu->Resize(0, 0).has_value());
    EXPECT_TRUE(m_Gpu->IsMinimized());

    const uint64_t submissions = m_Gpu->GetSubmissionCount();
    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->Skipped);
    EXPECT_EQ(m_Gpu->GetSubmissionCount(), submissions);

    // Restored at a size different from the one before minimizing.
    constexpr VkExtent2D restored{96, 48};
    ASSERT_TRUE(m_Gpu->Resize(restored.width, restored.height).has_value());
    EXPECT_FALSE(m_Gpu->IsMinimized());
    EXPECT_EQ(m_Gpu->GetExtent().width, restored.width);
    EXPECT_EQ(m_Gpu->GetExtent().height, restored.height);

    m_Camera.SetAspect(restored.width, restored.height);
    ASSERT_TRUE(WriteMirrors().has_value());
    frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value()) << Core::ErrorCodeToString(frame.error());
    EXPECT_FALSE(frame->Skipped);
    EXPECT_EQ(m_Gpu->GetSubmissionCount(), submissions + 1);

    auto pixels = m_Gpu->ReadbackImage(frame->ImageIndex);
    ASSERT_TRUE(pixels.has_value());
    EXPECT_EQ(pixels->size(), static_cast<size_t>(restored.width) * restored.height * 4);
}

TEST_F(HeadlessRendererTest, ResizeKeepsPipelinesForSameFormat)
{
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    const uint32_t builds = m_Pipelines->GetBuildCount();
    EXPECT_EQ(builds, 1u);

    for (const VkExtent2D size : {VkExtent2D{80, 40}, VkExtent2D{40, 80}})
    {
        ASSERT_TRUE(m_Gpu->Resize(size.width, size.height).has_value());
        ASSERT_TRUE(WriteMirrors().has_value());
        auto frame = m_Renderer->RenderFrame(MakeView());
        ASSERT_TRUE(frame.has_value()) << Core::ErrorCodeToString(frame.error());
        EXPECT_EQ(m_Renderer->GetState(), Graphics::FrameState::Idle);
    }

    EXPECT_TRUE(m_Pipelines->IsCompatible(m_Gpu->GetSurfaceCapabilities().ColorFormat));
    EXPECT_EQ(m_Pipelines->GetBuildCount(), builds);
}

TEST_F(HeadlessRendererTest, ReplacedDepthTargetIsRetiredAfterItsSlot)
{
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});

    // Enough frames for every slot to retire the setup uploads.
    for (uint32_t i = 0; i < 2 * RHI::MAX_FRAMES_IN_FLIGHT; ++i)
    {
        ASSERT_TRUE(WriteMirrors().has_value());
        ASSERT_TRUE(m_Renderer->RenderFrame(MakeView()).has_value());
    }
    const RHI::VulkanDevice& device = m_Gpu->GetDevice();
    const size_t steady = device.GetPendingDeletionCount();

    ASSERT_TRUE(m_Gpu->Resize(48, 48).has_value());
    ASSERT_TRUE(WriteMirrors().has_value());
    ASSERT_TRUE(m_Renderer->RenderFrame(MakeView()).has_value());

    // The old depth image waits for the slot that last used it.
    EXPECT_GT(device.GetPendingDeletionCount(), steady);

    for (uint32_t i = 0; i < RHI::MAX_FRAMES_IN_FLIGHT; ++i)
    {
        ASSERT_TRUE(WriteMirrors().has_value());
        ASSERT_TRUE(m_Renderer->RenderFrame(MakeView()).has_value());
    }
    EXPECT_EQ(device.GetPendingDeletionCount(), steady);
}

TEST_F(HeadlessRendererTest, LightMarkerIsDrawnWhenEnabled)
{
    m_Draws.push_back({UploadTriangle(), BuildSolidMaterial({255, 255, 255, 255})});
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    ASSERT_TRUE(WriteMirrors().has_value());

    m_Renderer->SetDrawLightMarker(true);
    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value()) << Core::ErrorCodeToString(frame.error());
    EXPECT_TRUE(frame->MarkerDrawn);

    m_Renderer->SetDrawLightMarker(false);
    ASSERT_TRUE(WriteMirrors().has_value());
    frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame->MarkerDrawn);
}

TEST_F(HeadlessRendererTest, ResizeSequenceKeepsRendering)
{
    m_Draws.push_back({UploadTriangle(), BuildSolidMaterial({255, 255, 255, 255})});
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});

    const std::array<VkExtent2D, 4> sizes{{{128, 96}, {32, 32}, {32, 32}, {200, 50}}};
    for (const VkExtent2D& size : sizes)
    {
        ASSERT_TRUE(m_Gpu->Resize(size.width, size.height).has_value());
        EXPECT_EQ(m_Gpu->GetExtent().width, size.width);
        EXPECT_EQ(m_Gpu->GetExtent().height, size.height);

        m_Camera.SetAspect(size.width, size.height);
        ASSERT_TRUE(WriteMirrors().has_value());

        auto frame = m_Renderer->RenderFrame(MakeView());
        ASSERT_TRUE(frame.has_value()) << Core::ErrorCodeToString(frame.error());

        auto pixels = m_Gpu->ReadbackImage(frame->ImageIndex);
        ASSERT_TRUE(pixels.has_value());
        EXPECT_EQ(pixels->size(), static_cast<size_t>(size.width) * size.height * 4);
    }
}

TEST_F(HeadlessRendererTest, TexturedTriangleReadback)
{
    m_Draws.push_back({UploadTriangle(), BuildSolidMaterial({255, 0, 0, 255})});
    m_Instances->SetInstances(std::vector<Graphics::Instance>{Graphics::Instance{}});
    ASSERT_TRUE(WriteMirrors().has_value());

    auto frame = m_Renderer->RenderFrame(MakeView());
    ASSERT_TRUE(frame.has_value()) << Core::ErrorCodeToString(frame.error());

    auto pixels = m_Gpu->ReadbackImage(frame->ImageIndex);
    ASSERT_TRUE(pixels.has_value());

    const size_t center = (static_cast<size_t>(kExtent.height / 2) * kExtent.width + kExtent.width / 2) * 4;
    const uint8_t r = (*pixels)[center + 0];
    const uint8_t g = (*pixels)[center + 1];
    const uint8_t b = (*pixels)[center + 2];
    EXPECT_GT(r, 200);
    EXPECT_LT(g, 30);
    EXPECT_LT(b, 30);

    // A corner pixel is outside the triangle and keeps the clear color.
    const uint8_t cornerR = (*pixels)[0];
    EXPECT_LT(cornerR, 100);
}

TEST_F(HeadlessRendererTest, ReadbackOfUnpresentedImageFails)
{
    auto pixels = m_Gpu->ReadbackImage(0);
    ASSERT_FALSE(pixels.has_value());
}
