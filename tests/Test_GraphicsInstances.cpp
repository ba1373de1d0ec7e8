#include <gtest/gtest.h>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import Graphics;

TEST(PackInstance, IdentityRotationIsPureTranslation)
{
    Graphics::Instance instance;
    instance.Position = {1.0f, 2.0f, 3.0f};

    const Graphics::GpuInstance gpu = Graphics::PackInstance(instance);
    EXPECT_FLOAT_EQ(gpu.Model[3][0], 1.0f);
    EXPECT_FLOAT_EQ(gpu.Model[3][1], 2.0f);
    EXPECT_FLOAT_EQ(gpu.Model[3][2], 3.0f);
    EXPECT_EQ(gpu.Normal, glm::mat4(1.0f));
}

TEST(PackInstance, RotationAppliesBeforeTranslation)
{
    Graphics::Instance instance;
    instance.Position = {10.0f, 0.0f, 0.0f};
    instance.Rotation = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));

    const Graphics::GpuInstance gpu = Graphics::PackInstance(instance);
    const glm::vec4 p = gpu.Model * glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);

    // +X rotated 90 degrees about +Y is -Z, then moved by the position.
    EXPECT_NEAR(p.x, 10.0f, 1e-5f);
    EXPECT_NEAR(p.z, -1.0f, 1e-5f);

    // Normal matrix carries rotation only.
    EXPECT_NEAR(gpu.Normal[3][0], 0.0f, 1e-6f);
}

TEST(PackInstance, GpuLayoutIsTwoMatrices)
{
    static_assert(sizeof(Graphics::GpuInstance) == 128);
    SUCCEED();
}

TEST(InstanceGrid, DefaultGridHasOneHundredInstances)
{
    const auto grid = Graphics::MakeInstanceGrid(10, 3.0f);
    ASSERT_EQ(grid.size(), 100u);

    EXPECT_FLOAT_EQ(grid.front().Position.x, -15.0f);
    EXPECT_FLOAT_EQ(grid.front().Position.z, -15.0f);
    EXPECT_FLOAT_EQ(grid.back().Position.x, 12.0f);
    EXPECT_FLOAT_EQ(grid.back().Position.z, 12.0f);

    for (const auto& instance : grid) EXPECT_FLOAT_EQ(instance.Position.y, 0.0f);
}

TEST(InstanceGrid, OriginInstanceIsNotRotated)
{
    const auto grid = Graphics::MakeInstanceGrid(10, 3.0f);

    // Row 5, column 5 sits on the origin.
    const Graphics::Instance& origin = grid[5 * 10 + 5];
    EXPECT_FLOAT_EQ(glm::length(origin.Position), 0.0f);
    EXPECT_FLOAT_EQ(origin.Rotation.w, 1.0f);
}

TEST(InstanceGrid, OtherInstancesRotate45AboutTheirPosition)
{
    const auto grid = Graphics::MakeInstanceGrid(4, 2.0f);
    for (const auto& instance : grid)
    {
        if (glm::length(instance.Position) == 0.0f) continue;
        EXPECT_NEAR(glm::degrees(glm::angle(instance.Rotation)), 45.0f, 1e-3f);

        const glm::vec3 axis = glm::axis(instance.Rotation);
        const glm::vec3 expected = glm::normalize(instance.Position);
        EXPECT_NEAR(glm::dot(axis, expected), 1.0f, 1e-4f);
    }
}

TEST(InstanceGrid, EmptyGrid)
{
    EXPECT_TRUE(Graphics::MakeInstanceGrid(0, 3.0f).empty());
}
