#include <gtest/gtest.h>
#include <cstring>

#include <glm/glm.hpp>

import Graphics;

namespace
{
    constexpr float kEps = 1e-4f;

    void ExpectVecNear(const glm::vec3& a, const glm::vec3& b)
    {
        EXPECT_NEAR(a.x, b.x, kEps);
        EXPECT_NEAR(a.y, b.y, kEps);
        EXPECT_NEAR(a.z, b.z, kEps);
    }
}

TEST(Camera, ForwardFollowsYawAndPitch)
{
    Graphics::Camera cam;
    cam.Yaw = 0.0f;
    cam.Pitch = 0.0f;
    ExpectVecNear(cam.GetForward(), {1.0f, 0.0f, 0.0f});

    cam.Yaw = 90.0f;
    ExpectVecNear(cam.GetForward(), {0.0f, 0.0f, -1.0f});

    cam.Pitch = 89.0f;
    EXPECT_GT(cam.GetForward().y, 0.99f);
}

TEST(Camera, RightIsPerpendicularToForwardAndUp)
{
    Graphics::Camera cam;
    cam.Yaw = 30.0f;
    cam.Pitch = 20.0f;
    EXPECT_NEAR(glm::dot(cam.GetRight(), cam.GetForward()), 0.0f, kEps);
    EXPECT_NEAR(glm::dot(cam.GetRight(), cam.GetUp()), 0.0f, kEps);
    EXPECT_NEAR(glm::length(cam.GetRight()), 1.0f, kEps);
}

TEST(Camera, PitchIsClamped)
{
    Graphics::Camera cam;
    cam.ApplyDelta({.Pitch = 500.0f});
    EXPECT_FLOAT_EQ(cam.Pitch, Graphics::Camera::kMaxPitch);

    cam.ApplyDelta({.Pitch = -1000.0f});
    EXPECT_FLOAT_EQ(cam.Pitch, -Graphics::Camera::kMaxPitch);
}

TEST(Camera, FovIsClamped)
{
    Graphics::Camera cam;
    cam.ApplyDelta({.Fov = 100.0f});
    EXPECT_FLOAT_EQ(cam.Fov, Graphics::Camera::kMaxFov);

    cam.ApplyDelta({.Fov = -100.0f});
    EXPECT_FLOAT_EQ(cam.Fov, Graphics::Camera::kMinFov);
}

TEST(Camera, MovementUsesCameraBasis)
{
    Graphics::Camera cam;
    cam.Position = {0.0f, 0.0f, 0.0f};
    cam.Yaw = 90.0f;
    cam.Pitch = 0.0f;

    cam.ApplyDelta({.Forward = 2.0f});
    ExpectVecNear(cam.Position, {0.0f, 0.0f, -2.0f});

    cam.ApplyDelta({.Up = 1.0f});
    ExpectVecNear(cam.Position, {0.0f, 1.0f, -2.0f});
}

TEST(Camera, ZeroDeltaChangesNothing)
{
    Graphics::Camera cam;
    const Graphics::Camera before = cam;
    Graphics::CameraDelta delta;
    EXPECT_TRUE(delta.IsZero());

    cam.ApplyDelta(delta);
    ExpectVecNear(cam.Position, before.Position);
    EXPECT_FLOAT_EQ(cam.Yaw, before.Yaw);
    EXPECT_FLOAT_EQ(cam.Pitch, before.Pitch);
    EXPECT_FLOAT_EQ(cam.Fov, before.Fov);
}

TEST(Camera, SetAspectIgnoresZeroHeight)
{
    Graphics::Camera cam;
    cam.SetAspect(1280, 720);
    EXPECT_NEAR(cam.AspectRatio, 1280.0f / 720.0f, kEps);

    cam.SetAspect(1280, 0);
    EXPECT_NEAR(cam.AspectRatio, 1280.0f / 720.0f, kEps);
}

TEST(Camera, ProjectionTargetsVulkanClipSpace)
{
    Graphics::Camera cam;
    cam.Position = {0.0f, 0.0f, 0.0f};
    cam.Yaw = 90.0f; // looking down -Z
    cam.Near = 0.1f;
    cam.Far = 100.0f;

    const glm::mat4 vp = cam.GetViewProjection();

    // A point above the view axis lands in the upper half of the image (negative clip Y).
    glm::vec4 above = vp * glm::vec4(0.0f, 1.0f, -5.0f, 1.0f);
    EXPECT_LT(above.y / above.w, 0.0f);

    glm::vec4 nearPoint = vp * glm::vec4(0.0f, 0.0f, -0.1f, 1.0f);
    glm::vec4 farPoint = vp * glm::vec4(0.0f, 0.0f, -100.0f, 1.0f);
    EXPECT_NEAR(nearPoint.z / nearPoint.w, 0.0f, 1e-3f);
    EXPECT_NEAR(farPoint.z / farPoint.w, 1.0f, 1e-3f);
}

TEST(CameraUniformData, BuildIsDeterministic)
{
    Graphics::Camera cam;
    cam.Position = {1.0f, 2.0f, 3.0f};

    const Graphics::CameraUniformData a = Graphics::BuildCameraUniformData(cam);
    const Graphics::CameraUniformData b = Graphics::BuildCameraUniformData(cam);

    EXPECT_EQ(std::memcmp(&a, &b, sizeof(a)), 0);
    EXPECT_FLOAT_EQ(a.ViewPosition.x, 1.0f);
    EXPECT_FLOAT_EQ(a.ViewPosition.w, 1.0f);
}

TEST(CameraUniformData, Std140Layout)
{
    static_assert(sizeof(Graphics::CameraUniformData) == 80);
    static_assert(sizeof(Graphics::LightUniformData) == 32);
    SUCCEED();
}
