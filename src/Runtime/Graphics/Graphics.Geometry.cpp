module;
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

module Graphics:Geometry.Impl;
import :Geometry;

namespace Graphics
{
    namespace
    {
        // Orthonormal tangent frame around the vertex normal (+Z when the normal is zero).
        // Used where UVs give no tangent direction.
        void BuildFallbackFrame(ModelVertex& v)
        {
            glm::vec3 n = v.Normal;
            if (glm::dot(n, n) < 1e-12f)
                n = glm::vec3(0.0f, 0.0f, 1.0f);
            else
                n = glm::normalize(n);

            const glm::vec3 reference = std::abs(n.y) < 0.99f ? glm::vec3(0.0f, 1.0f, 0.0f)
                                                              : glm::vec3(1.0f, 0.0f, 0.0f);
            v.Tangent = glm::normalize(glm::cross(reference, n));
            v.Bitangent = glm::cross(n, v.Tangent);
        }
    }

    void ComputeTangents(std::span<ModelVertex> vertices, std::span<const uint32_t> indices)
    {
        std::vector<uint32_t> trianglesIncluded(vertices.size(), 0);

        for (ModelVertex& v : vertices)
        {
            v.Tangent = glm::vec3(0.0f);
            v.Bitangent = glm::vec3(0.0f);
        }

        for (size_t i = 0; i + 2 < indices.size(); i += 3)
        {
            const uint32_t i0 = indices[i];
            const uint32_t i1 = indices[i + 1];
            const uint32_t i2 = indices[i + 2];

            const glm::vec3 deltaPos1 = vertices[i1].Position - vertices[i0].Position;
            const glm::vec3 deltaPos2 = vertices[i2].Position - vertices[i0].Position;
            const glm::vec2 deltaUV1 = vertices[i1].TexCoord - vertices[i0].TexCoord;
            const glm::vec2 deltaUV2 = vertices[i2].TexCoord - vertices[i0].TexCoord;

            const float det = deltaUV1.x * deltaUV2.y - deltaUV1.y * deltaUV2.x;
            if (std::abs(det) < 1e-12f) continue;

            const float r = 1.0f / det;
            const glm::vec3 tangent = (deltaPos1 * deltaUV2.y - deltaPos2 * deltaUV1.y) * r;
            const glm::vec3 bitangent = (deltaPos2 * deltaUV1.x - deltaPos1 * deltaUV2.x) * r;

            for (uint32_t idx : {i0, i1, i2})
            {
                vertices[idx].Tangent += tangent;
                vertices[idx].Bitangent += bitangent;
                ++trianglesIncluded[idx];
            }
        }

        for (size_t i = 0; i < vertices.size(); ++i)
        {
            ModelVertex& v = vertices[i];
            if (trianglesIncluded[i] > 0)
            {
                const float inv = 1.0f / static_cast<float>(trianglesIncluded[i]);
                v.Tangent *= inv;
                v.Bitangent *= inv;
            }

            if (glm::dot(v.Tangent, v.Tangent) < 1e-12f || glm::dot(v.Bitangent, v.Bitangent) < 1e-12f)
            {
                BuildFallbackFrame(v);
            }
        }
    }

    VkVertexInputBindingDescription GetVertexBindingDescription()
    {
        VkVertexInputBindingDescription binding{};
        binding.binding = 0;
        binding.stride = sizeof(ModelVertex);
        binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
        return binding;
    }

    std::array<VkVertexInputAttributeDescription, kVertexAttributeCount> GetVertexAttributeDescriptions()
    {
        std::array<VkVertexInputAttributeDescription, kVertexAttributeCount> attributes{};

        attributes[0] = {0, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(ModelVertex, Position))};
        attributes[1] = {1, 0, VK_FORMAT_R32G32_SFLOAT, static_cast<uint32_t>(offsetof(ModelVertex, TexCoord))};
        attributes[2] = {2, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(ModelVertex, Normal))};
        attributes[3] = {3, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(ModelVertex, Tangent))};
        attributes[4] = {4, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(ModelVertex, Bitangent))};

        return attributes;
    }
}
