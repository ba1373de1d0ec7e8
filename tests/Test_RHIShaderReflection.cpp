#include <gtest/gtest.h>
#include <cstdint>
#include <initializer_list>
#include <vector>

#include "RHI.Vulkan.hpp"

import Core;
import RHI;
import Graphics;

namespace
{
    // Minimal SPIR-V word stream: header plus raw instructions.
    class SpirvBuilder
    {
    public:
        SpirvBuilder() { m_Words = {0x07230203u, 0x00010000u, 0u, 100u, 0u}; }

        SpirvBuilder& Op(uint32_t opcode, std::initializer_list<uint32_t> operands)
        {
            m_Words.push_back((static_cast<uint32_t>(operands.size() + 1) << 16) | opcode);
            m_Words.insert(m_Words.end(), operands);
            return *this;
        }

        // OpDecorate %target <decoration> <value>
        SpirvBuilder& Decorate(uint32_t target, uint32_t decoration, uint32_t value)
        {
            return Op(71, {target, decoration, value});
        }

        SpirvBuilder& DecorateFlag(uint32_t target, uint32_t decoration) { return Op(71, {target, decoration}); }

        // OpTypePointer %ptr <storage> %pointee, OpVariable %ptr %var <storage>
        SpirvBuilder& Variable(uint32_t var, uint32_t ptr, uint32_t storage, uint32_t pointee)
        {
            Op(32, {ptr, storage, pointee});
            return Op(59, {ptr, var, storage});
        }

        [[nodiscard]] const std::vector<uint32_t>& Words() const { return m_Words; }

    private:
        std::vector<uint32_t> m_Words;
    };

    constexpr uint32_t kLocation = 30;
    constexpr uint32_t kBinding = 33;
    constexpr uint32_t kSet = 34;
    constexpr uint32_t kBuiltIn = 11;
    constexpr uint32_t kBlock = 2;

    constexpr uint32_t kStorageUniformConstant = 0;
    constexpr uint32_t kStorageInput = 1;
    constexpr uint32_t kStorageUniform = 2;
    constexpr uint32_t kStorageStorageBuffer = 12;

    // A vertex stage shaped like mesh.vert: inputs 0 and 2, gl_InstanceIndex, camera UBO
    // at (0,0) and instance SSBO at (3,0).
    std::vector<uint32_t> MakeVertexModule()
    {
        SpirvBuilder b;
        b.Decorate(10, kLocation, 0)
         .Decorate(11, kLocation, 2)
         .Decorate(12, kBuiltIn, 43)
         .Decorate(13, kSet, 0).Decorate(13, kBinding, 0)
         .Decorate(14, kSet, 3).Decorate(14, kBinding, 0)
         .DecorateFlag(20, kBlock)
         .DecorateFlag(21, kBlock)
         .Op(30, {20, 5})  // OpTypeStruct
         .Op(30, {21, 5})
         .Variable(10, 40, kStorageInput, 5)
         .Variable(11, 41, kStorageInput, 5)
         .Variable(12, 42, kStorageInput, 5)
         .Variable(13, 43, kStorageUniform, 20)
         .Variable(14, 44, kStorageStorageBuffer, 21);
        return b.Words();
    }

    // Fragment stage with a separate texture2D (2,0) and sampler (2,1).
    std::vector<uint32_t> MakeFragmentModule()
    {
        SpirvBuilder b;
        b.Decorate(10, kSet, 2).Decorate(10, kBinding, 0)
         .Decorate(11, kSet, 2).Decorate(11, kBinding, 1)
         .Op(25, {30, 5, 1, 0, 0, 0, 1, 0}) // OpTypeImage 2D, sampled
         .Op(26, {31})                       // OpTypeSampler
         .Variable(10, 40, kStorageUniformConstant, 30)
         .Variable(11, 41, kStorageUniformConstant, 31);
        return b.Words();
    }

    VkDescriptorSetLayoutBinding MakeBinding(uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages)
    {
        VkDescriptorSetLayoutBinding b{};
        b.binding = binding;
        b.descriptorType = type;
        b.descriptorCount = 1;
        b.stageFlags = stages;
        return b;
    }

    std::vector<std::vector<VkDescriptorSetLayoutBinding>> MakeMatchingSets()
    {
        return {
            {MakeBinding(0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT)},
            {MakeBinding(0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT)},
            {MakeBinding(0, VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE, VK_SHADER_STAGE_FRAGMENT_BIT),
             MakeBinding(1, VK_DESCRIPTOR_TYPE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT)},
            {MakeBinding(0, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, VK_SHADER_STAGE_VERTEX_BIT)},
        };
    }

    std::vector<VkVertexInputAttributeDescription> MakeAttributes(std::initializer_list<uint32_t> locations)
    {
        std::vector<VkVertexInputAttributeDescription> attributes;
        for (uint32_t location : locations)
            attributes.push_back({location, 0, VK_FORMAT_R32G32B32_SFLOAT, 0});
        return attributes;
    }
}

// -----------------------------------------------------------------------------
// ReflectShaderInterface
// -----------------------------------------------------------------------------

TEST(ShaderReflection, VertexInputsSkipBuiltIns)
{
    auto reflected = RHI::ReflectShaderInterface(MakeVertexModule());
    ASSERT_TRUE(reflected.has_value());

    EXPECT_EQ(reflected->InputLocations, (std::vector<uint32_t>{0, 2}));
    EXPECT_TRUE(reflected->HasInput(2));
    EXPECT_FALSE(reflected->HasInput(1));
}

TEST(ShaderReflection, BufferKinds)
{
    auto reflected = RHI::ReflectShaderInterface(MakeVertexModule());
    ASSERT_TRUE(reflected.has_value());
    ASSERT_EQ(reflected->Resources.size(), 2u);

    auto camera = reflected->FindResource(0, 0);
    ASSERT_TRUE(camera.has_value());
    EXPECT_EQ(camera->Kind, RHI::DescriptorKind::UniformBuffer);

    auto instances = reflected->FindResource(3, 0);
    ASSERT_TRUE(instances.has_value());
    EXPECT_EQ(instances->Kind, RHI::DescriptorKind::StorageBuffer);

    EXPECT_FALSE(reflected->FindResource(1, 0).has_value());
}

TEST(ShaderReflection, SeparateImageAndSampler)
{
    auto reflected = RHI::ReflectShaderInterface(MakeFragmentModule());
    ASSERT_TRUE(reflected.has_value());
    EXPECT_TRUE(reflected->InputLocations.empty());

    auto image = reflected->FindResource(2, 0);
    auto sampler = reflected->FindResource(2, 1);
    ASSERT_TRUE(image.has_value());
    ASSERT_TRUE(sampler.has_value());
    EXPECT_EQ(image->Kind, RHI::DescriptorKind::SampledImage);
    EXPECT_EQ(sampler->Kind, RHI::DescriptorKind::Sampler);
}

TEST(ShaderReflection, RejectsBadMagic)
{
    std::vector<uint32_t> words = MakeVertexModule();
    words[0] = 0xDEADBEEF;

    auto reflected = RHI::ReflectShaderInterface(words);
    ASSERT_FALSE(reflected.has_value());
    EXPECT_EQ(reflected.error(), Core::ErrorCode::InvalidFormat);
}

TEST(ShaderReflection, RejectsTruncatedInstruction)
{
    std::vector<uint32_t> words = MakeVertexModule();
    words.push_back((10u << 16) | 71u); // claims 10 words, has 1

    auto reflected = RHI::ReflectShaderInterface(words);
    ASSERT_FALSE(reflected.has_value());
    EXPECT_EQ(reflected.error(), Core::ErrorCode::InvalidFormat);
}

// -----------------------------------------------------------------------------
// ValidatePipelineInterface
// -----------------------------------------------------------------------------

class PipelineInterfaceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto vs = RHI::ReflectShaderInterface(MakeVertexModule());
        auto fs = RHI::ReflectShaderInterface(MakeFragmentModule());
        ASSERT_TRUE(vs.has_value());
        ASSERT_TRUE(fs.has_value());
        m_Vertex = *vs;
        m_Fragment = *fs;
        m_Sets = MakeMatchingSets();
    }

    RHI::ShaderInterface m_Vertex;
    RHI::ShaderInterface m_Fragment;
    std::vector<std::vector<VkDescriptorSetLayoutBinding>> m_Sets;
};

TEST_F(PipelineInterfaceTest, MatchingLayoutsPass)
{
    const auto attributes = MakeAttributes({0, 2});
    EXPECT_TRUE(Graphics::ValidatePipelineInterface(m_Vertex, m_Fragment, attributes, m_Sets).has_value());
}

TEST_F(PipelineInterfaceTest, ShaderInputWithoutAttributeFails)
{
    const auto attributes = MakeAttributes({0});
    auto result = Graphics::ValidatePipelineInterface(m_Vertex, m_Fragment, attributes, m_Sets);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ShaderInterfaceMismatch);
}

TEST_F(PipelineInterfaceTest, UnconsumedAttributeFails)
{
    const auto attributes = MakeAttributes({0, 1, 2});
    auto result = Graphics::ValidatePipelineInterface(m_Vertex, m_Fragment, attributes, m_Sets);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ShaderInterfaceMismatch);
}

TEST_F(PipelineInterfaceTest, DescriptorTypeMismatchFails)
{
    m_Sets[3][0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    const auto attributes = MakeAttributes({0, 2});
    auto result = Graphics::ValidatePipelineInterface(m_Vertex, m_Fragment, attributes, m_Sets);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ShaderInterfaceMismatch);
}

TEST_F(PipelineInterfaceTest, MissingStageFlagFails)
{
    m_Sets[2][0].stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
    const auto attributes = MakeAttributes({0, 2});
    auto result = Graphics::ValidatePipelineInterface(m_Vertex, m_Fragment, attributes, m_Sets);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ShaderInterfaceMismatch);
}

TEST_F(PipelineInterfaceTest, MissingSetFails)
{
    m_Sets.pop_back();
    const auto attributes = MakeAttributes({0, 2});
    auto result = Graphics::ValidatePipelineInterface(m_Vertex, m_Fragment, attributes, m_Sets);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ShaderInterfaceMismatch);
}

TEST_F(PipelineInterfaceTest, MeshVertexLayoutMatchesFiveLocations)
{
    RHI::ShaderInterface vertex = m_Vertex;
    vertex.InputLocations = {0, 1, 2, 3, 4};
    const auto attributes = Graphics::GetVertexAttributeDescriptions();
    EXPECT_TRUE(Graphics::ValidatePipelineInterface(vertex, m_Fragment, attributes, m_Sets).has_value());
}
