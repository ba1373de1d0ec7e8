module;
#include <cstdint>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

export module Graphics:LightUniform;

import :GpuMirror;
import RHI;
import Core;

export namespace Graphics
{
    struct Light
    {
        glm::vec3 Position{2.0f, 2.0f, 2.0f};
        glm::vec3 Color{1.0f, 1.0f, 1.0f};
    };

    // std140 layout of the light block (set 1, binding 0).
    struct LightUniformData
    {
        glm::vec3 Position{0.0f};
        float Padding0 = 0.0f;
        glm::vec3 Color{1.0f};
        float Padding1 = 0.0f;
    };

    // Same write-then-draw contract as CameraUniform.
    class LightUniform
    {
    public:
        explicit LightUniform(RHI::GpuContext& context)
            : m_Mirror(context, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT, "LightUniform")
        {
        }

        void Update(const Light& light)
        {
            LightUniformData data;
            data.Position = light.Position;
            data.Color = light.Color;
            m_Mirror.Set(data);
        }

        [[nodiscard]] Core::Result WriteToGpu() { return m_Mirror.WriteToGpu(); }

        [[nodiscard]] const LightUniformData& GetData() const { return m_Mirror.Get(); }
        [[nodiscard]] bool IsValid() const { return m_Mirror.IsValid(); }

        [[nodiscard]] UniformMirror<LightUniformData>& GetMirror() { return m_Mirror; }
        [[nodiscard]] const UniformMirror<LightUniformData>& GetMirror() const { return m_Mirror; }

    private:
        UniformMirror<LightUniformData> m_Mirror;
    };
}
