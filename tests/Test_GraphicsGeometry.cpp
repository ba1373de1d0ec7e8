#include <gtest/gtest.h>
#include <cstddef>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

import Graphics;

namespace
{
    // Unit quad in the XY plane with UVs aligned to X/Y.
    std::vector<Graphics::ModelVertex> MakeQuad()
    {
        std::vector<Graphics::ModelVertex> v(4);
        v[0].Position = {0, 0, 0}; v[0].TexCoord = {0, 0};
        v[1].Position = {1, 0, 0}; v[1].TexCoord = {1, 0};
        v[2].Position = {1, 1, 0}; v[2].TexCoord = {1, 1};
        v[3].Position = {0, 1, 0}; v[3].TexCoord = {0, 1};
        return v;
    }
}

TEST(ComputeTangents, AxisAlignedQuad)
{
    auto vertices = MakeQuad();
    const std::vector<uint32_t> indices = {0, 1, 2, 0, 2, 3};

    Graphics::ComputeTangents(vertices, indices);

    for (const auto& v : vertices)
    {
        EXPECT_NEAR(v.Tangent.x, 1.0f, 1e-5f);
        EXPECT_NEAR(v.Tangent.y, 0.0f, 1e-5f);
        EXPECT_NEAR(v.Bitangent.x, 0.0f, 1e-5f);
        EXPECT_NEAR(v.Bitangent.y, 1.0f, 1e-5f);
    }
}

TEST(ComputeTangents, SharedVerticesAreAveraged)
{
    auto vertices = MakeQuad();
    // Second triangle has a stretched UV so its tangent differs in length.
    vertices[3].TexCoord = {0, 0.5f};
    const std::vector<uint32_t> indices = {0, 1, 2, 0, 2, 3};

    Graphics::ComputeTangents(vertices, indices);

    // Vertex 1 touches only the first triangle; vertex 3 only the second.
    EXPECT_NEAR(vertices[1].Bitangent.y, 1.0f, 1e-5f);
    EXPECT_GT(vertices[3].Bitangent.y, 1.0f);
    // Vertex 0 averages both.
    EXPECT_GT(vertices[0].Bitangent.y, vertices[1].Bitangent.y);
    EXPECT_LT(vertices[0].Bitangent.y, vertices[3].Bitangent.y);
}

TEST(ComputeTangents, DegenerateUVsFallBackToNormalFrame)
{
    auto vertices = MakeQuad();
    for (auto& v : vertices)
    {
        v.TexCoord = {0.5f, 0.5f};
        v.Normal = {0, 0, 1};
    }
    const std::vector<uint32_t> indices = {0, 1, 2};

    Graphics::ComputeTangents(vertices, indices);
    for (const auto& v : vertices)
    {
        EXPECT_NEAR(glm::length(v.Tangent), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::length(v.Bitangent), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::dot(v.Tangent, v.Normal), 0.0f, 1e-5f);
        EXPECT_NEAR(glm::dot(v.Bitangent, v.Normal), 0.0f, 1e-5f);
        EXPECT_NEAR(glm::dot(v.Tangent, v.Bitangent), 0.0f, 1e-5f);
    }
}

TEST(ComputeTangents, NormalAlongYUsesXReference)
{
    std::vector<Graphics::ModelVertex> vertices(3);
    vertices[0].Position = {0, 0, 0};
    vertices[1].Position = {1, 0, 0};
    vertices[2].Position = {0, 0, 1};
    for (auto& v : vertices) v.Normal = {0, 1, 0};
    const std::vector<uint32_t> indices = {0, 1, 2};

    Graphics::ComputeTangents(vertices, indices);
    for (const auto& v : vertices)
    {
        EXPECT_NEAR(glm::length(v.Tangent), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::dot(v.Tangent, v.Normal), 0.0f, 1e-5f);
    }
}

TEST(VertexLayout, FiveAttributesAtLocationsZeroToFour)
{
    const auto attributes = Graphics::GetVertexAttributeDescriptions();
    ASSERT_EQ(attributes.size(), 5u);

    for (uint32_t i = 0; i < attributes.size(); ++i)
    {
        EXPECT_EQ(attributes[i].location, i);
        EXPECT_EQ(attributes[i].binding, 0u);
    }
    EXPECT_EQ(attributes[0].offset, offsetof(Graphics::ModelVertex, Position));
    EXPECT_EQ(attributes[1].format, VK_FORMAT_R32G32_SFLOAT);
    EXPECT_EQ(attributes[4].offset, offsetof(Graphics::ModelVertex, Bitangent));
}

TEST(VertexLayout, BindingStrideMatchesVertex)
{
    const auto binding = Graphics::GetVertexBindingDescription();
    EXPECT_EQ(binding.stride, sizeof(Graphics::ModelVertex));
    EXPECT_EQ(binding.inputRate, VK_VERTEX_INPUT_RATE_VERTEX);
}
