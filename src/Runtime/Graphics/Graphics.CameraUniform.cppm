module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module Graphics:CameraUniform;

import :Camera;
import :GpuMirror;
import RHI;
import Core;

export namespace Graphics
{
    // View-projection matrix + its per-slot GPU mirror (set 0).
    // Update() must be followed by WriteToGpu() before the next frame is recorded;
    // FrameRenderer refuses to record against a stale slot.
    class CameraUniform
    {
    public:
        explicit CameraUniform(RHI::GpuContext& context)
            : m_Mirror(context, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT, "CameraUniform")
        {
        }

        void Update(const Camera& camera) { m_Mirror.Set(BuildCameraUniformData(camera)); }
        [[nodiscard]] Core::Result WriteToGpu() { return m_Mirror.WriteToGpu(); }

        [[nodiscard]] const CameraUniformData& GetData() const { return m_Mirror.Get(); }
        [[nodiscard]] bool IsValid() const { return m_Mirror.IsValid(); }

        [[nodiscard]] UniformMirror<CameraUniformData>& GetMirror() { return m_Mirror; }
        [[nodiscard]] const UniformMirror<CameraUniformData>& GetMirror() const { return m_Mirror; }

    private:
        UniformMirror<CameraUniformData> m_Mirror;
    };
}
