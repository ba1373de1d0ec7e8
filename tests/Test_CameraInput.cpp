#include <gtest/gtest.h>

import Core;
import Graphics;
import Runtime;

using namespace Core::Input;

TEST(CameraInput, NoInputProducesZeroDelta)
{
    Runtime::CameraInput input;
    EXPECT_TRUE(input.Consume(0.016f).IsZero());
}

TEST(CameraInput, HeldKeysMoveProportionallyToDt)
{
    Runtime::CameraInput input({.MoveSpeed = 10.0f});
    input.OnKey(Key::W, true);
    input.OnKey(Key::D, true);

    auto delta = input.Consume(0.5f);
    EXPECT_FLOAT_EQ(delta.Forward, 5.0f);
    EXPECT_FLOAT_EQ(delta.Right, 5.0f);
    EXPECT_FLOAT_EQ(delta.Up, 0.0f);

    // Still held: movement continues next tick.
    EXPECT_FLOAT_EQ(input.Consume(0.5f).Forward, 5.0f);

    input.OnKey(Key::W, false);
    EXPECT_FLOAT_EQ(input.Consume(0.5f).Forward, 0.0f);
}

TEST(CameraInput, OpposingKeysCancel)
{
    Runtime::CameraInput input;
    input.OnKey(Key::Space, true);
    input.OnKey(Key::LeftShift, true);
    EXPECT_FLOAT_EQ(input.Consume(1.0f).Up, 0.0f);
}

TEST(CameraInput, ArrowKeysAliasWasd)
{
    Runtime::CameraInput input({.MoveSpeed = 1.0f});
    input.OnKey(Key::Down, true);
    input.OnKey(Key::Left, true);

    auto delta = input.Consume(1.0f);
    EXPECT_FLOAT_EQ(delta.Forward, -1.0f);
    EXPECT_FLOAT_EQ(delta.Right, -1.0f);
}

TEST(CameraInput, CursorOnlyRotatesWhileRightButtonHeld)
{
    Runtime::CameraInput input({.LookSensitivity = 0.5f});

    input.OnCursor(100.0, 100.0);
    input.OnCursor(120.0, 100.0);
    EXPECT_TRUE(input.Consume(0.0f).IsZero());

    input.OnMouseButton(MouseButton::Right, true);
    input.OnCursor(130.0, 110.0); // anchors
    input.OnCursor(140.0, 100.0);

    auto delta = input.Consume(0.0f);
    EXPECT_FLOAT_EQ(delta.Yaw, -5.0f);
    EXPECT_FLOAT_EQ(delta.Pitch, 5.0f);

    // Rotation is consumed once.
    EXPECT_TRUE(input.Consume(0.0f).IsZero());
}

TEST(CameraInput, ScrollZooms)
{
    Runtime::CameraInput input({.ZoomSensitivity = 2.0f});
    input.OnScroll(1.0);
    input.OnScroll(0.5);
    EXPECT_FLOAT_EQ(input.Consume(0.0f).Fov, -3.0f);
}

TEST(CameraInput, DeltaAppliesToCamera)
{
    Runtime::CameraInput input({.MoveSpeed = 1.0f});
    input.OnScroll(100.0);

    Graphics::Camera cam;
    cam.ApplyDelta(input.Consume(0.0f));
    EXPECT_FLOAT_EQ(cam.Fov, Graphics::Camera::kMinFov);
}
