// src/Runtime/Graphics/Graphics.Geometry.cppm
module;
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

export module Graphics:Geometry;

export namespace Graphics
{
    // --- Data Structures ---

    // Interleaved vertex consumed by the mesh pipeline (locations 0..4).
    struct ModelVertex
    {
        glm::vec3 Position{0.0f};
        glm::vec2 TexCoord{0.0f};
        glm::vec3 Normal{0.0f, 0.0f, 1.0f};
        glm::vec3 Tangent{0.0f};
        glm::vec3 Bitangent{0.0f};
    };

    inline constexpr uint32_t kVertexAttributeCount = 5;

    // Parsed, CPU-side mesh. MaterialIndex points into the material list it was parsed with.
    struct MeshData
    {
        std::string Name;
        std::vector<ModelVertex> Vertices;
        std::vector<uint32_t> Indices;
        uint32_t MaterialIndex = 0;
    };

    // Accumulates the per-triangle tangent frame onto its vertices and averages by the
    // number of triangles touching each vertex. Triangles with degenerate UVs contribute nothing;
    // a vertex left without a tangent gets an orthonormal frame built around its normal.
    // Indices are assumed to be in range.
    void ComputeTangents(std::span<ModelVertex> vertices, std::span<const uint32_t> indices);

    [[nodiscard]] VkVertexInputBindingDescription GetVertexBindingDescription();
    [[nodiscard]] std::array<VkVertexInputAttributeDescription, kVertexAttributeCount> GetVertexAttributeDescriptions();
}
