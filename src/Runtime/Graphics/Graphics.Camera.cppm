// src/Runtime/Graphics/Graphics.Camera.cppm
module;

#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:Camera;

export namespace Graphics
{
    // Discrete movement/rotation request. Movement is in world units along the camera
    // basis; angles are in degrees.
    struct CameraDelta
    {
        float Forward = 0.0f;
        float Right = 0.0f;
        float Up = 0.0f;
        float Yaw = 0.0f;
        float Pitch = 0.0f;
        float Fov = 0.0f;

        [[nodiscard]] bool IsZero() const
        {
            return Forward == 0.0f && Right == 0.0f && Up == 0.0f && Yaw == 0.0f && Pitch == 0.0f && Fov == 0.0f;
        }
    };

    // --- Fly camera ---
    // Right-handed, +Y up. Yaw 0 looks down +X, yaw 90 looks down -Z.
    struct Camera
    {
        static constexpr float kMaxPitch = 89.0f;
        static constexpr float kMinFov = 1.0f;
        static constexpr float kMaxFov = 45.0f;

        glm::vec3 Position{0.0f, 0.0f, 4.0f};
        float Yaw = -45.0f;
        float Pitch = 0.0f;

        float Fov = 45.0f;
        float AspectRatio = 1.0f;
        float Near = 0.001f;
        float Far = 10000.0f;

        [[nodiscard]] glm::vec3 GetForward() const;
        [[nodiscard]] glm::vec3 GetRight() const;
        [[nodiscard]] glm::vec3 GetUp() const { return {0.0f, 1.0f, 0.0f}; }

        [[nodiscard]] glm::mat4 GetViewMatrix() const;
        // Vulkan clip space: depth 0..1, Y flipped.
        [[nodiscard]] glm::mat4 GetProjectionMatrix() const;
        [[nodiscard]] glm::mat4 GetViewProjection() const { return GetProjectionMatrix() * GetViewMatrix(); }

        void ApplyDelta(const CameraDelta& delta);

        // Ignored while height is zero (minimized).
        void SetAspect(uint32_t width, uint32_t height);
    };

    // std140 layout of the camera block (set 0, binding 0).
    struct CameraUniformData
    {
        glm::vec4 ViewPosition{0.0f, 0.0f, 0.0f, 1.0f};
        glm::mat4 ViewProj{1.0f};
    };

    [[nodiscard]] CameraUniformData BuildCameraUniformData(const Camera& camera);
}
